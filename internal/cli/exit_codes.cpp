#include "exit_codes.hpp"

#include <filesystem>
#include <new>
#include <system_error>

namespace coord::cli {

using util::ErrorKind;

ExitCode ExitCodeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kLockTimeout:
    case ErrorKind::kTimeout:
      return kExitLockTimeout;
    case ErrorKind::kValidationFailed:
    case ErrorKind::kInvalidState:
      return kExitValidation;
    case ErrorKind::kPermissionDenied:
      return kExitPermission;
    case ErrorKind::kMergeConflict:
      return kExitMergeConflict;
    case ErrorKind::kIsolationViolation:
    case ErrorKind::kDirtyState:
      return kExitIsolation;
    case ErrorKind::kNotFound:
    case ErrorKind::kWorkspaceNotFound:
    case ErrorKind::kNotHeld:
      return kExitNotFound;
    case ErrorKind::kAlreadyExists:
      return kExitAlreadyExists;
    case ErrorKind::kDiskFull:
      return kExitDiskFull;
    case ErrorKind::kFeatureDisabled:
      return kExitFeatureDisabled;
    case ErrorKind::kRetryExhausted:
      return kExitRetryExhausted;
    default:
      return kExitGeneric;
  }
}

coord::v1::Diagnostic ToDiagnostic(const std::exception& e) {
  coord::v1::Diagnostic diagnostic;
  diagnostic.set_message(e.what());

  auto kind = ErrorKind::kUnknown;
  if (const auto* coord_error = dynamic_cast<const util::CoordError*>(&e)) {
    kind = coord_error->Kind();
  } else if (const auto* fs_error = dynamic_cast<const std::filesystem::filesystem_error*>(&e)) {
    const auto code = fs_error->code();
    if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted || code == std::errc::read_only_file_system) {
      kind = ErrorKind::kPermissionDenied;
    } else if (code == std::errc::no_space_on_device) {
      kind = ErrorKind::kDiskFull;
    } else if (code == std::errc::no_such_file_or_directory) {
      kind = ErrorKind::kNotFound;
    }
    if (!fs_error->path1().empty()) diagnostic.add_paths(fs_error->path1().string());
    if (!fs_error->path2().empty()) diagnostic.add_paths(fs_error->path2().string());
  } else if (dynamic_cast<const std::bad_alloc*>(&e)) {
    kind = ErrorKind::kResourceExhausted;
  }

  if (const auto* path_error = dynamic_cast<const util::PathError*>(&e)) {
    for (const auto& path : path_error->Paths()) diagnostic.add_paths(path);
  }

  diagnostic.set_kind(std::string(util::ToString(kind)));
  diagnostic.set_exit_code(ExitCodeFor(kind));
  return diagnostic;
}

} // namespace coord::cli
