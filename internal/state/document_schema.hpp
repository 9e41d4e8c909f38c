#pragma once

namespace coord::state {

/*
  Per-document rules plugged into DocumentStore.
*/
template <typename Document>
class DocumentSchema {
 public:
  virtual ~DocumentSchema() = default;

  virtual Document Default() const = 0;

  // Throws ValidationFailed with a message naming the offending field.
  virtual void Validate(const Document& doc) const = 0;

  virtual bool NeedsMigration(const Document&) const {
    return false;
  }

  virtual void Migrate(Document*) const {
  }

  // Document-specific stamping applied on every commit (schema version etc).
  virtual void Stamp(Document*) const {
  }
};

} // namespace coord::state
