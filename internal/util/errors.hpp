#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace coord::util {

/*
  Central error types.

  Every failure raised by the core carries an ErrorKind. The recovery manager
  classifies on it and the CLI translates it into an exit code.
*/

enum class ErrorKind {
  kLockTimeout,
  kStateCorruption,
  kValidationFailed,
  kPermissionDenied,
  kDiskFull,
  kTimeout,
  kResourceExhausted,
  kIsolationViolation,
  kMergeConflict,
  kWorkspaceNotFound,
  kConfigurationError,
  kUnknown,

  kNotFound,
  kAlreadyExists,
  kNotHeld,
  kDirtyState,
  kInvalidState,
  kFeatureDisabled,
  kRetryExhausted,
};

std::string_view ToString(ErrorKind kind);

class CoordError : public std::runtime_error {
 public:
  CoordError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Errors that carry the paths an operator has to look at.
class PathError : public CoordError {
 public:
  PathError(ErrorKind kind, const std::string& msg, std::vector<std::string> paths) : CoordError(kind, msg), paths_(std::move(paths)) {
  }

  const std::vector<std::string>& Paths() const {
    return paths_;
  }

 private:
  std::vector<std::string> paths_;
};

class LockTimeout : public CoordError {
 public:
  explicit LockTimeout(const std::string& msg) : CoordError(ErrorKind::kLockTimeout, msg) {
  }
};

class NotHeld : public CoordError {
 public:
  explicit NotHeld(const std::string& msg) : CoordError(ErrorKind::kNotHeld, msg) {
  }
};

class StateCorruption : public CoordError {
 public:
  explicit StateCorruption(const std::string& msg) : CoordError(ErrorKind::kStateCorruption, msg) {
  }
};

class ValidationFailed : public CoordError {
 public:
  explicit ValidationFailed(const std::string& msg) : CoordError(ErrorKind::kValidationFailed, msg) {
  }
};

class PermissionDenied : public CoordError {
 public:
  explicit PermissionDenied(const std::string& msg) : CoordError(ErrorKind::kPermissionDenied, msg) {
  }
};

class DiskFull : public CoordError {
 public:
  explicit DiskFull(const std::string& msg) : CoordError(ErrorKind::kDiskFull, msg) {
  }
};

class Timeout : public CoordError {
 public:
  explicit Timeout(const std::string& msg) : CoordError(ErrorKind::kTimeout, msg) {
  }
};

class ResourceExhausted : public CoordError {
 public:
  explicit ResourceExhausted(const std::string& msg) : CoordError(ErrorKind::kResourceExhausted, msg) {
  }
};

class IsolationViolation : public PathError {
 public:
  IsolationViolation(const std::string& msg, std::vector<std::string> paths) : PathError(ErrorKind::kIsolationViolation, msg, std::move(paths)) {
  }
};

class DirtyState : public PathError {
 public:
  DirtyState(const std::string& msg, std::vector<std::string> paths) : PathError(ErrorKind::kDirtyState, msg, std::move(paths)) {
  }
};

class MergeConflict : public PathError {
 public:
  MergeConflict(const std::string& msg, std::vector<std::string> paths) : PathError(ErrorKind::kMergeConflict, msg, std::move(paths)) {
  }
};

class WorkspaceNotFound : public CoordError {
 public:
  explicit WorkspaceNotFound(const std::string& msg) : CoordError(ErrorKind::kWorkspaceNotFound, msg) {
  }
};

class ConfigurationError : public CoordError {
 public:
  explicit ConfigurationError(const std::string& msg) : CoordError(ErrorKind::kConfigurationError, msg) {
  }
};

class NotFound : public CoordError {
 public:
  explicit NotFound(const std::string& msg) : CoordError(ErrorKind::kNotFound, msg) {
  }
};

class AlreadyExists : public CoordError {
 public:
  explicit AlreadyExists(const std::string& msg) : CoordError(ErrorKind::kAlreadyExists, msg) {
  }
};

class InvalidState : public CoordError {
 public:
  explicit InvalidState(const std::string& msg) : CoordError(ErrorKind::kInvalidState, msg) {
  }
};

class FeatureDisabled : public CoordError {
 public:
  explicit FeatureDisabled(const std::string& msg) : CoordError(ErrorKind::kFeatureDisabled, msg) {
  }
};

class RetryExhausted : public CoordError {
 public:
  RetryExhausted(const std::string& msg, ErrorKind last_kind, int attempts)
      : CoordError(ErrorKind::kRetryExhausted, msg), last_kind_(last_kind), attempts_(attempts) {
  }

  ErrorKind LastKind() const {
    return last_kind_;
  }

  int Attempts() const {
    return attempts_;
  }

 private:
  ErrorKind last_kind_;
  int       attempts_;
};

// Maps std::filesystem / errno failures onto the taxonomy and throws.
[[noreturn]] void ThrowSystemError(int error_number, const std::string& context);

} // namespace coord::util
