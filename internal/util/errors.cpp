#include "internal/util/errors.hpp"

#include <cerrno>
#include <cstring>

namespace coord::util {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kLockTimeout:
      return "LockTimeout";
    case ErrorKind::kStateCorruption:
      return "StateCorruption";
    case ErrorKind::kValidationFailed:
      return "ValidationFailed";
    case ErrorKind::kPermissionDenied:
      return "PermissionDenied";
    case ErrorKind::kDiskFull:
      return "DiskFull";
    case ErrorKind::kTimeout:
      return "Timeout";
    case ErrorKind::kResourceExhausted:
      return "ResourceExhausted";
    case ErrorKind::kIsolationViolation:
      return "IsolationViolation";
    case ErrorKind::kMergeConflict:
      return "MergeConflict";
    case ErrorKind::kWorkspaceNotFound:
      return "WorkspaceNotFound";
    case ErrorKind::kConfigurationError:
      return "ConfigurationError";
    case ErrorKind::kUnknown:
      return "Unknown";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kAlreadyExists:
      return "AlreadyExists";
    case ErrorKind::kNotHeld:
      return "NotHeld";
    case ErrorKind::kDirtyState:
      return "DirtyState";
    case ErrorKind::kInvalidState:
      return "InvalidState";
    case ErrorKind::kFeatureDisabled:
      return "FeatureDisabled";
    case ErrorKind::kRetryExhausted:
      return "RetryExhausted";
  }
  return "Unknown";
}

void ThrowSystemError(int error_number, const std::string& context) {
  const std::string message = context + ": " + std::strerror(error_number);
  switch (error_number) {
    case EACCES:
    case EPERM:
    case EROFS:
      throw PermissionDenied(message);
    case ENOSPC:
    case EDQUOT:
      throw DiskFull(message);
    case EMFILE:
    case ENFILE:
    case ENOMEM:
    case EAGAIN:
      throw ResourceExhausted(message);
    case ETIMEDOUT:
      throw Timeout(message);
    case ENOENT:
      throw NotFound(message);
    default:
      throw CoordError(ErrorKind::kUnknown, message);
  }
}

} // namespace coord::util
