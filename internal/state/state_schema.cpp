#include "state_schema.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace coord::state {

using coord::v1::StateDocument;
using util::ValidationFailed;

StateSchema::StateSchema(std::string schema_version, std::vector<std::string> phases, std::string initial_phase)
    : schema_version_(std::move(schema_version)),
      phases_(std::move(phases)),
      phase_set_(phases_.begin(), phases_.end()),
      initial_phase_(std::move(initial_phase)) {
}

StateDocument StateSchema::Default() const {
  StateDocument doc;
  doc.set_schema_version(schema_version_);
  doc.set_phase(initial_phase_);
  doc.mutable_degraded_mode()->set_enabled(false);
  return doc;
}

void StateSchema::Validate(const StateDocument& doc) const {
  if (doc.schema_version().empty()) {
    throw ValidationFailed("schemaVersion is required");
  }
  if (doc.phase().empty()) {
    throw ValidationFailed("phase is required");
  }
  if (phase_set_.count(doc.phase()) == 0) {
    throw ValidationFailed("phase '" + doc.phase() + "' is not a configured phase");
  }

  std::set<std::string> units;
  for (const auto& unit : doc.completed_units()) {
    if (unit.empty()) {
      throw ValidationFailed("completedUnits contains an empty entry");
    }
    if (!units.insert(unit).second) {
      throw ValidationFailed("completedUnits contains duplicate '" + unit + "'");
    }
  }

  for (const auto& [name, at] : doc.signals()) {
    if (name.empty()) {
      throw ValidationFailed("signal names must not be empty");
    }
  }

  const auto& degraded = doc.degraded_mode();
  if (degraded.enabled() && degraded.reason().empty()) {
    throw ValidationFailed("degradedMode.reason is required while degraded mode is enabled");
  }
}

bool StateSchema::NeedsMigration(const StateDocument& doc) const {
  return doc.schema_version() != schema_version_;
}

void StateSchema::Migrate(StateDocument* doc) const {
  const auto from = doc->schema_version().empty() ? std::string("legacy") : doc->schema_version();
  (*doc->mutable_metadata())["migratedFrom"] = from;
  (*doc->mutable_metadata())["migrated"]     = "true";
  doc->set_schema_version(schema_version_);
  if (doc->phase().empty()) {
    doc->set_phase(initial_phase_);
  }
}

void StateSchema::Stamp(StateDocument* doc) const {
  if (doc->schema_version().empty()) {
    doc->set_schema_version(schema_version_);
  }
}

namespace {

void MergePatch(const google::protobuf::Value& patch, google::protobuf::Value* target) {
  if (!patch.has_struct_value()) {
    *target = patch;
    return;
  }
  if (!target->has_struct_value()) {
    target->mutable_struct_value();
  }

  auto* fields = target->mutable_struct_value()->mutable_fields();
  for (const auto& [key, value] : patch.struct_value().fields()) {
    if (value.kind_case() == google::protobuf::Value::kNullValue) {
      fields->erase(key);
      continue;
    }
    MergePatch(value, &(*fields)[key]);
  }
}

} // namespace

void ApplyPatch(const std::string& patch_json, StateDocument* doc) {
  google::protobuf::Value patch;
  auto                    status = google::protobuf::util::JsonStringToMessage(patch_json, &patch);
  if (!status.ok()) {
    throw ValidationFailed("patch is not valid JSON: " + std::string(status.message()));
  }
  if (!patch.has_struct_value()) {
    throw ValidationFailed("patch must be a JSON object");
  }

  google::protobuf::Value current;
  status = google::protobuf::util::JsonStringToMessage(util::ToJson(*doc, false), &current);
  if (!status.ok()) {
    throw ValidationFailed("document could not be re-read as JSON: " + std::string(status.message()));
  }

  MergePatch(patch, &current);

  std::string merged;
  status = google::protobuf::util::MessageToJsonString(current, &merged);
  if (!status.ok()) {
    throw ValidationFailed("patched document could not be encoded: " + std::string(status.message()));
  }

  StateDocument next;
  util::ParseJson(merged, &next);
  *doc = std::move(next);
}

} // namespace coord::state
