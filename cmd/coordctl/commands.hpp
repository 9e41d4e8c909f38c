#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <google/protobuf/message.h>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace coord::cli {

// Bad command line; printed with the usage text.
class UsageError : public util::CoordError {
 public:
  explicit UsageError(const std::string& msg) : util::CoordError(util::ErrorKind::kConfigurationError, msg) {
  }
};

using Args = std::vector<std::string>;

// args[0] is the command name within the group. Each returns the process exit code.
int RunStateCommand(factory::Runtime& rt, const Args& args);
int RunLockCommand(factory::Runtime& rt, const Args& args);
int RunRecoveryCommand(factory::Runtime& rt, const Args& args);
int RunWorkspaceCommand(factory::Runtime& rt, const Args& args);

void PrintUsage();

// One JSON document on stdout.
void Print(const google::protobuf::Message& message);

const std::string& Arg(const Args& args, size_t index, const char* what);
std::string        ArgOr(const Args& args, size_t index, const std::string& fallback);
int64_t            ParseInt(const std::string& value, const char* what);

// "-" reads standard input.
std::string ReadInput(const std::string& value);

} // namespace coord::cli
