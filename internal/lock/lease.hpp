#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include <sys/types.h>

#include "coord/v1/lock.pb.h"

namespace coord::lock {

// Proof of a held lock. Returned by Acquire, consumed by Release.
struct Lease {
  std::string           lease_id;
  std::string           resource;
  coord::v1::LockMode   mode = coord::v1::LOCK_MODE_EXCLUSIVE;
  std::filesystem::path path;
  pid_t                 holder_pid = 0;

  std::chrono::system_clock::time_point acquired_at;
  std::chrono::system_clock::time_point expires_at;

  std::thread::id owner_thread;
};

} // namespace coord::lock
