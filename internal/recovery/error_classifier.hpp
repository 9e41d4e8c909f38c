#pragma once

#include <exception>
#include <string_view>

#include "internal/util/errors.hpp"

namespace coord::recovery {

enum class RecoveryAction {
  kRetry,            // transient
  kRestoreThenRetry, // integrity
  kSurface,          // needs a human decision
  kEscalate,         // fatal
};

util::ErrorKind ClassifyError(const std::exception& error);
util::ErrorKind ClassifyError(std::exception_ptr error);

RecoveryAction PolicyFor(util::ErrorKind kind);

std::string_view ToString(RecoveryAction action);

} // namespace coord::recovery
