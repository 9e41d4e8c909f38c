#pragma once

#include <exception>

#include "coord/v1/report.pb.h"
#include "internal/util/errors.hpp"

namespace coord::cli {

/*
  Process exit codes of coordctl.
*/
enum ExitCode : int {
  kExitOk               = 0,
  kExitGeneric          = 1,
  kExitLockTimeout      = 2,
  kExitRecovered        = 3,
  kExitValidation       = 4,
  kExitPermission       = 5,
  kExitMergeConflict    = 6,
  kExitIsolation        = 7,
  kExitNotFound         = 8,
  kExitAlreadyExists    = 9,
  kExitDiskFull         = 10,
  kExitFeatureDisabled  = 11,
  kExitRetryExhausted   = 12,
};

ExitCode ExitCodeFor(util::ErrorKind kind);

/*
  Converts internal exceptions into the diagnostic printed on stdout.
*/
coord::v1::Diagnostic ToDiagnostic(const std::exception& e);

} // namespace coord::cli
