#include "internal/state/state_schema.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using coord::state::StateSchema;
using coord::v1::StateDocument;

StateSchema MakeSchema() {
  return StateSchema("1.0", {"pre-init", "phase0", "phase1", "complete"}, "pre-init");
}

bool Rejects(const StateSchema& schema, const StateDocument& doc) {
  try {
    schema.Validate(doc);
  } catch (const coord::util::ValidationFailed&) {
    return true;
  }
  return false;
}

void TestDefaultDocumentIsValid() {
  const auto schema = MakeSchema();
  const auto doc    = schema.Default();
  assert(doc.schema_version() == "1.0");
  assert(doc.phase() == "pre-init");
  assert(!doc.degraded_mode().enabled());
  schema.Validate(doc);
}

void TestInvalidDocumentsAreRejected() {
  const auto schema = MakeSchema();

  auto bad_phase = schema.Default();
  bad_phase.set_phase("phase9");
  assert(Rejects(schema, bad_phase));

  auto duplicate_units = schema.Default();
  duplicate_units.add_completed_units("task-a");
  duplicate_units.add_completed_units("task-a");
  assert(Rejects(schema, duplicate_units));

  auto degraded_without_reason = schema.Default();
  degraded_without_reason.mutable_degraded_mode()->set_enabled(true);
  assert(Rejects(schema, degraded_without_reason));

  auto missing_version = schema.Default();
  missing_version.clear_schema_version();
  assert(Rejects(schema, missing_version));
}

void TestMigrationStampsOrigin() {
  const auto schema = MakeSchema();

  auto old = schema.Default();
  old.set_schema_version("0.9");
  assert(schema.NeedsMigration(old));

  schema.Migrate(&old);
  assert(old.schema_version() == "1.0");
  assert(old.metadata().at("migratedFrom") == "0.9");
  assert(!schema.NeedsMigration(old));
}

void TestMergePatch() {
  const auto schema = MakeSchema();
  auto       doc    = schema.Default();
  (*doc.mutable_metadata())["owner"] = "ci";
  (*doc.mutable_metadata())["stale"] = "yes";

  coord::state::ApplyPatch(R"({"phase":"phase1","completedUnits":["task-a"],"metadata":{"stale":null,"run":"42"}})", &doc);
  assert(doc.phase() == "phase1");
  assert(doc.completed_units_size() == 1);
  assert(doc.metadata().at("owner") == "ci");
  assert(doc.metadata().at("run") == "42");
  assert(doc.metadata().count("stale") == 0);

  bool threw = false;
  try {
    coord::state::ApplyPatch(R"({"nonsense":1})", &doc);
  } catch (const coord::util::ValidationFailed&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    coord::state::ApplyPatch("[1,2]", &doc);
  } catch (const coord::util::ValidationFailed&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultDocumentIsValid();
  TestInvalidDocumentsAreRejected();
  TestMigrationStampsOrigin();
  TestMergePatch();

  std::cout << "coord_unit_state_schema: pass\n";
  return 0;
}
