#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  Validation,
  NotFound,
  Conflict,
  FatalIo,
  Cancelled
};

inline const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::NotFound: return "not-found";
    case ErrorKind::Conflict: return "conflict";
    case ErrorKind::FatalIo: return "fatal-io";
    case ErrorKind::Cancelled: return "cancelled";
  }
  return "unknown";
}

class PolyglotError : public std::runtime_error {
public:
  PolyglotError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

struct ValidationResult {
  bool valid = true;
  std::string error;

  static ValidationResult ok() { return {}; }
  static ValidationResult fail(std::string message) {
    ValidationResult r;
    r.valid = false;
    r.error = std::move(message);
    return r;
  }
};
