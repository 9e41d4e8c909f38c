#include "internal/recovery/error_classifier.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <new>
#include <system_error>

namespace {

using coord::recovery::ClassifyError;
using coord::recovery::PolicyFor;
using coord::recovery::RecoveryAction;
using coord::util::ErrorKind;

void TestTypedErrorsKeepTheirKind() {
  assert(ClassifyError(coord::util::LockTimeout("busy")) == ErrorKind::kLockTimeout);
  assert(ClassifyError(coord::util::StateCorruption("bad json")) == ErrorKind::kStateCorruption);
  assert(ClassifyError(coord::util::MergeConflict("conflict", {"a.txt"})) == ErrorKind::kMergeConflict);
}

void TestSystemErrorsAreMapped() {
  const std::filesystem::filesystem_error denied("open", std::make_error_code(std::errc::permission_denied));
  assert(ClassifyError(denied) == ErrorKind::kPermissionDenied);

  const std::system_error full(std::make_error_code(std::errc::no_space_on_device), "write");
  assert(ClassifyError(full) == ErrorKind::kDiskFull);

  const std::system_error fds(std::make_error_code(std::errc::too_many_files_open), "open");
  assert(ClassifyError(fds) == ErrorKind::kResourceExhausted);

  assert(ClassifyError(std::bad_alloc()) == ErrorKind::kResourceExhausted);
  assert(ClassifyError(std::runtime_error("mystery")) == ErrorKind::kUnknown);

  assert(ClassifyError(std::make_exception_ptr(coord::util::DiskFull("full"))) == ErrorKind::kDiskFull);
  assert(ClassifyError(std::exception_ptr()) == ErrorKind::kUnknown);
}

void TestPolicies() {
  assert(PolicyFor(ErrorKind::kLockTimeout) == RecoveryAction::kRetry);
  assert(PolicyFor(ErrorKind::kResourceExhausted) == RecoveryAction::kRetry);
  assert(PolicyFor(ErrorKind::kStateCorruption) == RecoveryAction::kRestoreThenRetry);
  assert(PolicyFor(ErrorKind::kMergeConflict) == RecoveryAction::kSurface);
  assert(PolicyFor(ErrorKind::kIsolationViolation) == RecoveryAction::kSurface);
  assert(PolicyFor(ErrorKind::kPermissionDenied) == RecoveryAction::kEscalate);
  assert(PolicyFor(ErrorKind::kDiskFull) == RecoveryAction::kEscalate);
  assert(coord::recovery::ToString(RecoveryAction::kRestoreThenRetry) == "restore-then-retry");
}

} // namespace

int main() {
  TestTypedErrorsKeepTheirKind();
  TestSystemErrorsAreMapped();
  TestPolicies();

  std::cout << "coord_unit_error_classifier: pass\n";
  return 0;
}
