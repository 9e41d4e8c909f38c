#pragma once

#include <set>
#include <string>
#include <vector>

#include "coord/v1/state.pb.h"
#include "document_schema.hpp"

namespace coord::state {

/*
  Rules for the shared pipeline document.
*/
class StateSchema final : public DocumentSchema<coord::v1::StateDocument> {
 public:
  StateSchema(std::string schema_version, std::vector<std::string> phases, std::string initial_phase);

  coord::v1::StateDocument Default() const override;

  void Validate(const coord::v1::StateDocument& doc) const override;

  bool NeedsMigration(const coord::v1::StateDocument& doc) const override;
  void Migrate(coord::v1::StateDocument* doc) const override;

  void Stamp(coord::v1::StateDocument* doc) const override;

  const std::vector<std::string>& Phases() const {
    return phases_;
  }

  const std::string& SchemaVersion() const {
    return schema_version_;
  }

 private:
  std::string              schema_version_;
  std::vector<std::string> phases_;
  std::set<std::string>    phase_set_;
  std::string              initial_phase_;
};

// RFC 7386 merge patch over the document's JSON form. null removes a key.
// Throws ValidationFailed for malformed patches or unknown fields.
void ApplyPatch(const std::string& patch_json, coord::v1::StateDocument* doc);

} // namespace coord::state
