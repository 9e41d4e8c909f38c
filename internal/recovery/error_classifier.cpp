#include "error_classifier.hpp"

#include <filesystem>
#include <new>
#include <system_error>

namespace coord::recovery {

using util::ErrorKind;

namespace {

ErrorKind FromErrorCode(const std::error_code& ec) {
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted || ec == std::errc::read_only_file_system) {
    return ErrorKind::kPermissionDenied;
  }
  if (ec == std::errc::no_space_on_device) {
    return ErrorKind::kDiskFull;
  }
  if (ec == std::errc::timed_out) {
    return ErrorKind::kTimeout;
  }
  if (ec == std::errc::too_many_files_open || ec == std::errc::too_many_files_open_in_system || ec == std::errc::not_enough_memory ||
      ec == std::errc::resource_unavailable_try_again) {
    return ErrorKind::kResourceExhausted;
  }
  if (ec == std::errc::no_such_file_or_directory) {
    return ErrorKind::kNotFound;
  }
  return ErrorKind::kUnknown;
}

} // namespace

ErrorKind ClassifyError(const std::exception& error) {
  if (const auto* typed = dynamic_cast<const util::CoordError*>(&error)) {
    return typed->Kind();
  }
  if (const auto* fs = dynamic_cast<const std::filesystem::filesystem_error*>(&error)) {
    return FromErrorCode(fs->code());
  }
  if (const auto* sys = dynamic_cast<const std::system_error*>(&error)) {
    return FromErrorCode(sys->code());
  }
  if (dynamic_cast<const std::bad_alloc*>(&error)) {
    return ErrorKind::kResourceExhausted;
  }
  return ErrorKind::kUnknown;
}

ErrorKind ClassifyError(std::exception_ptr error) {
  if (!error) {
    return ErrorKind::kUnknown;
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return ClassifyError(e);
  } catch (...) {
    return ErrorKind::kUnknown;
  }
}

RecoveryAction PolicyFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kLockTimeout:
    case ErrorKind::kTimeout:
    case ErrorKind::kResourceExhausted:
    case ErrorKind::kUnknown:
      return RecoveryAction::kRetry;

    case ErrorKind::kStateCorruption:
    case ErrorKind::kValidationFailed:
      return RecoveryAction::kRestoreThenRetry;

    case ErrorKind::kMergeConflict:
    case ErrorKind::kIsolationViolation:
    case ErrorKind::kDirtyState:
      return RecoveryAction::kSurface;

    default:
      return RecoveryAction::kEscalate;
  }
}

std::string_view ToString(RecoveryAction action) {
  switch (action) {
    case RecoveryAction::kRetry:
      return "retry";
    case RecoveryAction::kRestoreThenRetry:
      return "restore-then-retry";
    case RecoveryAction::kSurface:
      return "surface";
    case RecoveryAction::kEscalate:
      return "escalate";
  }
  return "escalate";
}

} // namespace coord::recovery
