#include "backup_catalog.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/path_utils.hpp"

namespace coord::state {

BackupCatalog::BackupCatalog(std::filesystem::path dir, std::string prefix) : dir_(std::move(dir)), prefix_(std::move(prefix)) {
}

coord::v1::BackupInfo BackupCatalog::Create(const std::string& content, uint64_t version, const std::string& label) {
  util::EnsureDirectory(dir_);

  auto clean = util::Sanitize(label);
  if (clean.empty()) clean = "manual";

  const auto now  = util::Now();
  const auto base = prefix_ + "-" + util::CompactUtc(now) + "-v" + std::to_string(version) + "-" + clean;

  for (int attempt = 0;; ++attempt) {
    const auto name = attempt == 0 ? base + ".json" : base + "-" + std::to_string(attempt) + ".json";
    const auto path = dir_ / name;
    if (util::CreateExclusive(path, content)) {
      auto info = Parse(path);
      return *info;
    }
  }
}

std::optional<coord::v1::BackupInfo> BackupCatalog::Parse(const std::filesystem::path& path) const {
  const auto name = path.filename().string();
  const auto head = prefix_ + "-";
  if (name.rfind(head, 0) != 0 || name.size() <= head.size() + 5 || name.compare(name.size() - 5, 5, ".json") != 0) {
    return std::nullopt;
  }

  const auto id   = name.substr(0, name.size() - 5);
  const auto rest = id.substr(head.size());

  const auto ts_end = rest.find('-');
  if (ts_end == std::string::npos) return std::nullopt;
  const auto created = util::ParseCompactUtc(rest.substr(0, ts_end));
  if (!created) return std::nullopt;

  if (ts_end + 2 >= rest.size() || rest[ts_end + 1] != 'v') return std::nullopt;
  const auto version_end = rest.find('-', ts_end + 2);
  if (version_end == std::string::npos) return std::nullopt;

  uint64_t version = 0;
  try {
    version = std::stoull(rest.substr(ts_end + 2, version_end - ts_end - 2));
  } catch (const std::exception&) {
    return std::nullopt;
  }

  coord::v1::BackupInfo info;
  info.set_id(id);
  info.set_label(rest.substr(version_end + 1));
  info.set_version(version);
  *info.mutable_created_at() = util::ToProto(*created);
  info.set_path(path.string());
  return info;
}

std::vector<coord::v1::BackupInfo> BackupCatalog::List() const {
  std::vector<coord::v1::BackupInfo> out;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
    if (auto info = Parse(entry.path())) {
      out.push_back(std::move(*info));
    }
  }

  std::sort(out.begin(), out.end(), [](const coord::v1::BackupInfo& a, const coord::v1::BackupInfo& b) {
    if (a.created_at().seconds() != b.created_at().seconds()) return a.created_at().seconds() > b.created_at().seconds();
    if (a.created_at().nanos() != b.created_at().nanos()) return a.created_at().nanos() > b.created_at().nanos();
    if (a.version() != b.version()) return a.version() > b.version();
    return a.id() > b.id();
  });
  return out;
}

std::vector<std::string> BackupCatalog::Prune(uint32_t retention_count, std::chrono::milliseconds retention_age) const {
  const auto backups = List();
  const auto now     = util::Now();

  std::vector<std::string> removed;
  for (size_t i = 0; i < backups.size(); ++i) {
    const auto& backup    = backups[i];
    const bool  over_count = i >= retention_count;
    const bool  too_old    = i > 0 && now - util::FromProto(backup.created_at()) > retention_age;
    if (!over_count && !too_old) continue;

    if (util::RemoveFile(backup.path())) {
      removed.push_back(backup.path());
    }
  }

  if (!removed.empty()) {
    COORD_LOG_DEBUG("pruned backups", {observability::StringField("dir", dir_.string()), observability::IntField("removed", static_cast<int64_t>(removed.size()))});
  }
  return removed;
}

} // namespace coord::state
