#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backup_catalog.hpp"
#include "coord/v1/report.pb.h"
#include "document_schema.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace coord::state {

struct DocumentStoreOptions {
  std::string                              name; // lock resource and audit component
  std::filesystem::path                    file;
  std::filesystem::path                    backup_dir;
  std::string                              backup_prefix;
  uint32_t                                 retention_count = 5;
  std::chrono::milliseconds                retention_age{std::chrono::hours(24 * 7)};
  std::optional<std::chrono::milliseconds> lock_timeout;
  bool                                     fsync = true;
};

template <typename Document>
struct ReadOutcome {
  Document    document;
  bool        exists    = false;
  bool        recovered = false;
  std::string recovered_from;
};

/*
  DocumentStore

  Owns every access to one JSON document on disk.

  Write path:
      lock → read (recover if corrupt) → mutate copy → stamp → validate
           → back up previous → tmp + fsync + rename → unlock

  Readers never lock: the canonical file is only ever replaced by rename, so
  a read sees either the old or the new document in full. A read that finds
  an unparsable or invalid file escalates to the lock and restores the newest
  valid backup.

  Document must expose version(), metadata() and last_change_label() like
  StateDocument and WorkspaceIndex do.
*/
template <typename Document>
class DocumentStore {
 public:
  using Mutator = std::function<void(Document*)>;

  DocumentStore(DocumentStoreOptions                              options,
                std::shared_ptr<const DocumentSchema<Document>>   schema,
                std::shared_ptr<lock::LockManager>                locks,
                std::shared_ptr<audit::AuditTrail>                audit)
      : options_(std::move(options)),
        schema_(std::move(schema)),
        locks_(std::move(locks)),
        audit_(audit ? std::move(audit) : std::make_shared<audit::NullAuditTrail>()),
        backups_(options_.backup_dir, options_.backup_prefix) {
  }

  // Writes the default document when none exists; repairs a corrupt one.
  ReadOutcome<Document> Init() {
    util::EnsureDirectory(options_.file.parent_path());
    util::EnsureDirectory(options_.backup_dir);
    util::RemoveStaleTempFiles(options_.file.parent_path(), std::chrono::hours(1));

    lock::ScopedLease guard(*locks_, AcquireLock());

    auto current = LoadLocked();
    if (current.exists) {
      return current;
    }

    auto doc = schema_->Default();
    Stamp(&doc, 0, "init");
    schema_->Validate(doc);
    Commit(doc);
    Audit("init", "created", doc.version());
    COORD_LOG_INFO("document initialized", {observability::StringField("document", options_.name), observability::StringField("path", options_.file.string())});

    current.document = std::move(doc);
    current.exists   = true;
    return current;
  }

  ReadOutcome<Document> Read() {
    ReadOutcome<Document> out;

    std::string body;
    try {
      body = util::ReadFile(options_.file);
    } catch (const util::NotFound&) {
      out.document = schema_->Default();
      return out;
    }

    if (auto doc = ParseValid(body)) {
      out.document = std::move(*doc);
      out.exists   = true;
      return out;
    }

    lock::ScopedLease guard(*locks_, AcquireLock());
    return LoadLocked();
  }

  // Applies mutator to a copy of the current document and commits it as version + 1.
  Document Write(const Mutator& mutator, const std::string& label) {
    const auto started = util::Now();

    lock::ScopedLease guard(*locks_, AcquireLock());

    auto current = LoadLocked();
    auto next    = current.document;
    mutator(&next);

    if (schema_->NeedsMigration(next)) {
      schema_->Migrate(&next);
    }
    Stamp(&next, current.document.version(), label);
    schema_->Validate(next);
    if (next.version() != current.document.version() + 1) {
      throw util::ValidationFailed(options_.name + ": version must advance by one");
    }

    if (current.exists) {
      BackupLocked(current.document, label);
    }
    Commit(next);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - started).count();
    Audit("write", label, next.version(), elapsed);
    COORD_LOG_DEBUG("document written", {observability::StringField("document", options_.name), observability::StringField("label", label),
                                         observability::IntField("version", static_cast<int64_t>(next.version()))});
    return next;
  }

  void Validate(const Document& doc) const {
    schema_->Validate(doc);
  }

  coord::v1::BackupInfo Backup(const std::string& label) {
    {
      lock::ScopedLease guard(*locks_, AcquireLock(coord::v1::LOCK_MODE_SHARED));

      std::string body;
      try {
        body = util::ReadFile(options_.file);
      } catch (const util::NotFound&) {
        throw util::NotFound(options_.name + ": nothing to back up, " + options_.file.string() + " does not exist");
      }
      if (auto doc = ParseValid(body)) {
        return BackupLocked(*doc, label);
      }
    }

    // Corrupt: recover under the exclusive lock first, then back up the result.
    auto recovered = Read();
    lock::ScopedLease guard(*locks_, AcquireLock(coord::v1::LOCK_MODE_SHARED));
    return BackupLocked(recovered.document, label);
  }

  // Newest backup whose id contains selector (newest overall when empty), committed verbatim.
  Document Restore(const std::string& selector) {
    lock::ScopedLease guard(*locks_, AcquireLock());

    std::optional<coord::v1::BackupInfo> chosen;
    std::optional<Document>              restored;
    std::string                          content;
    for (const auto& backup : backups_.List()) {
      if (!selector.empty() && backup.id().find(selector) == std::string::npos) continue;
      chosen = backup;
      break;
    }
    if (!chosen) {
      throw util::NotFound(options_.name + ": no backup matches '" + selector + "'");
    }

    content  = util::ReadFile(chosen->path());
    restored = ParseValid(content);
    if (!restored) {
      throw util::ValidationFailed(options_.name + ": backup " + chosen->id() + " is not a valid document");
    }

    std::string body;
    try {
      body = util::ReadFile(options_.file);
    } catch (const util::NotFound&) {
      body.clear(); // nothing to preserve
    }
    if (!body.empty()) {
      if (auto doc = ParseValid(body)) {
        BackupLocked(*doc, "pre-restore");
      } else {
        PreserveCorrupt(body);
      }
    }

    util::AtomicWriteFile(options_.file, content, options_.fsync);
    Audit("restore", chosen->id(), restored->version());
    COORD_LOG_INFO("document restored from backup", {observability::StringField("document", options_.name), observability::StringField("backup", chosen->id())});
    return *restored;
  }

  std::vector<coord::v1::BackupInfo> ListBackups() const {
    return backups_.List();
  }

  std::vector<std::string> PruneBackups() const {
    return backups_.Prune(options_.retention_count, options_.retention_age);
  }

  // Rewrites the document in the current schema if it is older. Returns true when migrated.
  bool Migrate() {
    lock::ScopedLease guard(*locks_, AcquireLock());

    auto current = LoadLocked();
    if (!current.exists || !schema_->NeedsMigration(current.document)) {
      return false;
    }

    BackupLocked(current.document, "pre-migration");
    auto next = current.document;
    schema_->Migrate(&next);
    Stamp(&next, current.document.version(), "migrate");
    schema_->Validate(next);
    Commit(next);
    Audit("migrate", "migrated", next.version());
    COORD_LOG_INFO("document migrated", {observability::StringField("document", options_.name), observability::IntField("version", static_cast<int64_t>(next.version()))});
    return true;
  }

  const DocumentStoreOptions& Options() const {
    return options_;
  }

  const DocumentSchema<Document>& Schema() const {
    return *schema_;
  }

 private:
  lock::Lease AcquireLock(coord::v1::LockMode mode = coord::v1::LOCK_MODE_EXCLUSIVE) {
    return locks_->Acquire(options_.name, mode, options_.lock_timeout, {{"document", options_.file.string()}});
  }

  std::optional<Document> ParseValid(const std::string& body) const {
    Document doc;
    try {
      util::ParseJson(body, &doc);
      schema_->Validate(doc);
    } catch (const util::ValidationFailed& e) {
      COORD_LOG_DEBUG("document rejected", {observability::StringField("document", options_.name), observability::StringField("error", e.what())});
      return std::nullopt;
    }
    return doc;
  }

  // Caller holds the lock. Missing file → default (exists=false). Corrupt file → newest valid backup.
  ReadOutcome<Document> LoadLocked() {
    ReadOutcome<Document> out;

    std::string body;
    try {
      body = util::ReadFile(options_.file);
    } catch (const util::NotFound&) {
      out.document = schema_->Default();
      return out;
    }

    if (auto doc = ParseValid(body)) {
      out.document = std::move(*doc);
      out.exists   = true;
      return out;
    }

    return RecoverLocked(body);
  }

  ReadOutcome<Document> RecoverLocked(const std::string& corrupt_body) {
    PreserveCorrupt(corrupt_body);

    ReadOutcome<Document> out;
    out.exists    = true;
    out.recovered = true;

    for (const auto& backup : backups_.List()) {
      std::string content;
      try {
        content = util::ReadFile(backup.path());
      } catch (const util::NotFound&) {
        continue;
      }
      auto doc = ParseValid(content);
      if (!doc) {
        COORD_LOG_WARN("skipping invalid backup", {observability::StringField("document", options_.name), observability::StringField("backup", backup.id())});
        continue;
      }

      util::AtomicWriteFile(options_.file, content, options_.fsync);
      COORD_LOG_ERROR("corrupt document recovered from backup",
                      {observability::StringField("document", options_.name), observability::StringField("backup", backup.id()),
                       observability::IntField("version", static_cast<int64_t>(doc->version()))});
      Audit("recover", backup.id(), doc->version());
      out.document       = std::move(*doc);
      out.recovered_from = backup.id();
      return out;
    }

    auto doc = schema_->Default();
    (*doc.mutable_metadata())["recovered"] = "true";
    Stamp(&doc, 0, "recovered-default");
    schema_->Validate(doc);
    Commit(doc);
    COORD_LOG_ERROR("corrupt document had no valid backup; reset to default",
                    {observability::StringField("document", options_.name), observability::StringField("path", options_.file.string())});
    Audit("recover", "default", doc.version());
    out.document       = std::move(doc);
    out.recovered_from = "default";
    return out;
  }

  void PreserveCorrupt(const std::string& body) {
    const auto path = options_.file.string() + ".corrupt-" + util::CompactUtc(util::Now());
    util::AtomicWriteFile(path, body, false);
    COORD_LOG_WARN("preserved corrupt document", {observability::StringField("document", options_.name), observability::StringField("path", path)});
  }

  coord::v1::BackupInfo BackupLocked(const Document& doc, const std::string& label) {
    auto info = backups_.Create(util::ToJson(doc), doc.version(), label);
    backups_.Prune(options_.retention_count, options_.retention_age);
    return info;
  }

  void Stamp(Document* doc, uint64_t previous_version, const std::string& label) const {
    const auto now = util::IsoUtc(util::Now());
    auto&      md  = *doc->mutable_metadata();
    if (md.find("created") == md.end()) md["created"] = now;
    md["lastModified"] = now;
    doc->set_version(previous_version + 1);
    doc->set_last_change_label(label);
    schema_->Stamp(doc);
  }

  void Commit(const Document& doc) {
    util::EnsureDirectory(options_.file.parent_path());
    util::AtomicWriteFile(options_.file, util::ToJson(doc), options_.fsync);
  }

  void Audit(const std::string& action, const std::string& detail, uint64_t version, int64_t duration_ms = 0) {
    audit::AuditEvent event;
    event.timestamp   = util::Now();
    event.component   = options_.name;
    event.action      = action;
    event.resource    = options_.file.filename().string();
    event.holder_pid  = 0;
    event.outcome     = "v" + std::to_string(version);
    event.duration_ms = duration_ms;
    event.detail      = detail;
    audit_->Record(event);
  }

  DocumentStoreOptions                            options_;
  std::shared_ptr<const DocumentSchema<Document>> schema_;
  std::shared_ptr<lock::LockManager>              locks_;
  std::shared_ptr<audit::AuditTrail>              audit_;
  BackupCatalog                                   backups_;
};

} // namespace coord::state
