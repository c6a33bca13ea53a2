#pragma once

#include <atomic>
#include <functional>

#include "errors.hpp"

class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  void reset() { cancelled_.store(false, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  void throw_if_cancelled() const {
    if(cancelled()) throw PolyglotError(ErrorKind::Cancelled, "Operation cancelled");
  }

private:
  std::atomic<bool> cancelled_{false};
};

inline bool is_cancelled(const CancellationToken* token) {
  return token && token->cancelled();
}

inline void throw_if_cancelled(const CancellationToken* token) {
  if(token) token->throw_if_cancelled();
}

// Percent complete, 0..100.
using ProgressCallback = std::function<void(double)>;
