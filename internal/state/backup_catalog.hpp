#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "coord/v1/report.pb.h"
#include "internal/util/time.hpp"

namespace coord::state {

/*
  Backup files: <prefix>-<CompactUtc>-v<version>-<label>.json

  The timestamp sorts lexicographically, so directory order is creation order.
*/
class BackupCatalog {
 public:
  BackupCatalog(std::filesystem::path dir, std::string prefix);

  // Copies content verbatim into a new backup; never overwrites an existing one.
  coord::v1::BackupInfo Create(const std::string& content, uint64_t version, const std::string& label);

  // Newest first.
  std::vector<coord::v1::BackupInfo> List() const;

  // Keeps the newest retention_count; of those, drops any older than retention_age
  // except the newest one. Returns removed paths.
  std::vector<std::string> Prune(uint32_t retention_count, std::chrono::milliseconds retention_age) const;

  std::optional<coord::v1::BackupInfo> Parse(const std::filesystem::path& path) const;

  const std::filesystem::path& Dir() const {
    return dir_;
  }

 private:
  std::filesystem::path dir_;
  std::string           prefix_;
};

} // namespace coord::state
