#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace coord::util {

/*
  Process helpers used for lock holder liveness and for driving external tools.
*/

pid_t CurrentPid();
pid_t ParentPid();

std::string Hostname();

// kill(pid, 0) based; EPERM counts as alive.
bool IsProcessAlive(pid_t pid);

// Start time in clock ticks since boot (field 22 of /proc/<pid>/stat), 0 when unknown.
uint64_t ProcessStartTime(pid_t pid);

// Alive and, when expected_start_time is non-zero, not a recycled pid.
bool IsSameProcessAlive(pid_t pid, uint64_t expected_start_time);

struct CommandResult {
  int         exit_code = -1;
  std::string out;
  std::string err;

  bool Ok() const {
    return exit_code == 0;
  }
};

// Spawns argv (PATH lookup), optionally feeding stdin, and captures both streams.
// Throws only when the process cannot be started.
CommandResult RunCommand(const std::vector<std::string>& argv, const std::string& input = {});

} // namespace coord::util
