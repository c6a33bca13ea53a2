#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "configuration_store.hpp"
#include "host_directory.hpp"
#include "log.hpp"
#include "mirror_service.hpp"

struct OrphanCleanupResult {
  std::vector<std::string> cleaned;
  std::vector<std::string> failed;
  std::vector<std::string> sources_without_mirrors;

  std::size_t total_cleaned() const { return cleaned.size(); }
};

// Removes mirrors whose source or target library vanished from the host,
// and ghosts of create attempts that never produced a library.
class OrphanReconciler {
public:
  OrphanReconciler(std::shared_ptr<ConfigurationStore> store,
                   std::shared_ptr<LibraryDirectory> libraries,
                   std::shared_ptr<MirrorService> mirrors,
                   std::shared_ptr<Logger> logger = nullptr);

  OrphanCleanupResult cleanup(const CancellationToken* cancel = nullptr);

private:
  enum class Reason { SourceDeleted, MirrorDeleted, Ghost };
  static const char* reason_text(Reason reason);

  bool is_ghost(const Mirror& mirror, Timestamp now, std::chrono::minutes threshold) const;

  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<LibraryDirectory> libraries_;
  std::shared_ptr<MirrorService> mirrors_;
  std::shared_ptr<Logger> logger_;
};
