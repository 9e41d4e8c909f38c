#include "internal/cli/exit_codes.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include "internal/util/errors.hpp"

namespace {

using namespace coord::cli;
using namespace coord::util;

void TestCoordErrorsMapToDocumentedCodes() {
  assert(ToDiagnostic(LockTimeout("busy")).exit_code() == kExitLockTimeout);
  assert(ToDiagnostic(ValidationFailed("bad phase")).exit_code() == kExitValidation);
  assert(ToDiagnostic(PermissionDenied("ro")).exit_code() == kExitPermission);
  assert(ToDiagnostic(MergeConflict("conflict", {"a.txt"})).exit_code() == kExitMergeConflict);
  assert(ToDiagnostic(IsolationViolation("outside", {"b.txt"})).exit_code() == kExitIsolation);
  assert(ToDiagnostic(DirtyState("dirty", {"c.txt"})).exit_code() == kExitIsolation);
  assert(ToDiagnostic(WorkspaceNotFound("ws")).exit_code() == kExitNotFound);
  assert(ToDiagnostic(NotFound("missing")).exit_code() == kExitNotFound);
  assert(ToDiagnostic(AlreadyExists("dup")).exit_code() == kExitAlreadyExists);
  assert(ToDiagnostic(DiskFull("full")).exit_code() == kExitDiskFull);
  assert(ToDiagnostic(FeatureDisabled("off")).exit_code() == kExitFeatureDisabled);
  assert(ToDiagnostic(RetryExhausted("gave up", ErrorKind::kTimeout, 3)).exit_code() == kExitRetryExhausted);
  assert(ToDiagnostic(ConfigurationError("bad config")).exit_code() == kExitGeneric);
}

void TestDiagnosticCarriesKindAndPaths() {
  const auto diagnostic = ToDiagnostic(MergeConflict("workspace a conflicts", {"src/x.cpp", "src/y.cpp"}));
  assert(diagnostic.kind() == "MergeConflict");
  assert(diagnostic.message() == "workspace a conflicts");
  assert(diagnostic.paths_size() == 2);
  assert(diagnostic.paths(1) == "src/y.cpp");
}

void TestForeignExceptions() {
  const std::filesystem::filesystem_error denied("open", "/root/state.json", std::make_error_code(std::errc::permission_denied));
  const auto                              diagnostic = ToDiagnostic(denied);
  assert(diagnostic.exit_code() == kExitPermission);
  assert(diagnostic.paths_size() == 1);

  assert(ToDiagnostic(std::runtime_error("boom")).exit_code() == kExitGeneric);
  assert(ToDiagnostic(std::runtime_error("boom")).kind() == "Unknown");
}

} // namespace

int main() {
  TestCoordErrorsMapToDocumentedCodes();
  TestDiagnosticCarriesKindAndPaths();
  TestForeignExceptions();

  std::cout << "coord_unit_exit_codes: pass\n";
  return 0;
}
