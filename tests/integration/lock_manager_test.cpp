#include "internal/lock/lock_manager.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/audit/memory_audit_trail.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace {

namespace fs = std::filesystem;
using coord::lock::LockManager;
using coord::lock::LockOptions;
using namespace std::chrono_literals;

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "coord_lock_manager_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

LockOptions Options(const fs::path& dir) {
  LockOptions options;
  options.lock_dir            = dir;
  options.default_timeout     = 5s;
  options.staleness_threshold = 60s;
  options.initial_backoff     = 2ms;
  options.max_backoff         = 20ms;
  options.priorities          = {{"trunk", 5}, {"state", 10}, {"workspace-index", 20}};
  return options;
}

// Runs body in a child process with its own LockManager; returns the exit status.
template <typename Body>
pid_t Spawn(Body body) {
  const pid_t pid = ::fork();
  assert(pid >= 0);
  if (pid == 0) {
    int code = 1;
    try {
      code = body();
    } catch (const std::exception& e) {
      std::cerr << "child failed: " << e.what() << "\n";
    }
    ::_exit(code);
  }
  return pid;
}

int Wait(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : 128;
}

void Signal(int fd) {
  const char byte = 'x';
  assert(::write(fd, &byte, 1) == 1);
}

void AwaitSignal(int fd) {
  char byte = 0;
  assert(::read(fd, &byte, 1) == 1);
}

void TestContendedAcquireTimesOut() {
  const auto dir   = FreshDir("timeout");
  auto       audit = std::make_shared<coord::audit::MemoryAuditTrail>();
  LockManager locks(Options(dir), audit);

  auto lease = locks.Acquire("state");
  assert(locks.Check("state").state() == coord::v1::LOCK_STATE_HELD);

  const auto child = Spawn([&] {
    LockManager other(Options(dir), nullptr);
    try {
      other.Acquire("state", coord::v1::LOCK_MODE_EXCLUSIVE, 100ms);
    } catch (const coord::util::LockTimeout&) {
      return 0;
    }
    return 2;
  });
  assert(Wait(child) == 0);

  locks.Release(lease);
  assert(locks.Check("state").state() == coord::v1::LOCK_STATE_FREE);
  assert(audit->Count("acquire") == 1);
  assert(audit->Count("release") == 1);
}

void TestMutualExclusionAcrossProcesses() {
  const auto dir     = FreshDir("counter");
  const auto counter = dir / "counter.txt";
  coord::util::AtomicWriteFile(counter, "0", false);

  constexpr int kChildren   = 4;
  constexpr int kIncrements = 25;

  std::vector<pid_t> children;
  for (int c = 0; c < kChildren; ++c) {
    children.push_back(Spawn([&] {
      LockManager locks(Options(dir), nullptr);
      for (int i = 0; i < kIncrements; ++i) {
        coord::lock::ScopedLease guard(locks, locks.Acquire("counter", coord::v1::LOCK_MODE_EXCLUSIVE, 30s));
        const int value = std::stoi(coord::util::ReadFile(counter));
        coord::util::AtomicWriteFile(counter, std::to_string(value + 1), false);
      }
      return 0;
    }));
  }
  for (auto pid : children) {
    assert(Wait(pid) == 0);
  }

  assert(coord::util::ReadFile(counter) == std::to_string(kChildren * kIncrements));
}

void TestDeadHolderIsReclaimed() {
  const auto  dir = FreshDir("dead");
  LockManager locks(Options(dir), nullptr);

  const auto child = Spawn([&] {
    LockManager other(Options(dir), nullptr);
    other.Acquire("state");
    return 0; // exits without releasing
  });
  assert(Wait(child) == 0);

  const auto status = locks.Check("state");
  assert(status.state() == coord::v1::LOCK_STATE_STALE);
  assert(status.holders(0).holder_pid() == child);

  auto lease = locks.Acquire("state", coord::v1::LOCK_MODE_EXCLUSIVE, 1s);
  assert(lease.holder_pid == ::getpid());
  locks.Release(lease);
}

void TestCleanupReclaimsStaleRecords() {
  const auto  dir = FreshDir("cleanup");
  LockManager locks(Options(dir), nullptr);

  for (const char* resource : {"alpha", "beta"}) {
    const auto child = Spawn([&] {
      LockManager other(Options(dir), nullptr);
      other.Acquire(resource);
      return 0;
    });
    assert(Wait(child) == 0);
  }

  auto live = locks.Acquire("gamma");

  const auto report = locks.Cleanup();
  assert(report.reclaimed() == 2);
  assert(locks.Check("alpha").state() == coord::v1::LOCK_STATE_FREE);
  assert(locks.Check("gamma").state() == coord::v1::LOCK_STATE_HELD);
  assert(locks.List().size() == 1);

  locks.Release(live);
}

void TestSharedHoldersBlockWriters() {
  const auto  dir = FreshDir("shared");
  LockManager locks(Options(dir), nullptr);

  int ready[2];
  int done[2];
  assert(::pipe(ready) == 0);
  assert(::pipe(done) == 0);

  const auto reader = Spawn([&] {
    LockManager other(Options(dir), nullptr);
    auto        lease = other.Acquire("state", coord::v1::LOCK_MODE_SHARED);
    Signal(ready[1]);
    AwaitSignal(done[0]);
    other.Release(lease);
    return 0;
  });
  AwaitSignal(ready[0]);

  // Readers share.
  auto shared = locks.Acquire("state", coord::v1::LOCK_MODE_SHARED, 1s);
  assert(locks.Check("state").holders_size() == 2);
  locks.Release(shared);

  bool timed_out = false;
  try {
    locks.Acquire("state", coord::v1::LOCK_MODE_EXCLUSIVE, 150ms);
  } catch (const coord::util::LockTimeout&) {
    timed_out = true;
  }
  assert(timed_out);

  Signal(done[1]);
  assert(Wait(reader) == 0);

  auto exclusive = locks.Acquire("state", coord::v1::LOCK_MODE_EXCLUSIVE, 1s);
  locks.Release(exclusive);

  for (int fd : {ready[0], ready[1], done[0], done[1]}) ::close(fd);
}

void TestOrderingAndReentry() {
  const auto  dir = FreshDir("order");
  LockManager locks(Options(dir), nullptr);

  auto index = locks.Acquire("workspace-index");

  bool out_of_order = false;
  try {
    locks.Acquire("state");
  } catch (const coord::util::ConfigurationError&) {
    out_of_order = true;
  }
  assert(out_of_order);

  bool reentry = false;
  try {
    locks.Acquire("workspace-index");
  } catch (const coord::util::InvalidState&) {
    reentry = true;
  }
  assert(reentry);
  locks.Release(index);

  const auto held = locks.AcquireAll({"workspace-index", "trunk", "state"});
  assert(held.size() == 3);
  assert(held[0].resource == "trunk");
  assert(held[2].resource == "workspace-index");
  for (auto it = held.rbegin(); it != held.rend(); ++it) locks.Release(*it);

  assert(locks.SortByPriority({"zzz-user", "state", "trunk"}).front() == "trunk");
}

void TestReleaseOfLostLockThrowsNotHeld() {
  const auto  dir = FreshDir("notheld");
  LockManager locks(Options(dir), nullptr);

  auto lease = locks.Acquire("state");
  fs::remove(lease.path);

  bool threw = false;
  try {
    locks.Release(lease);
  } catch (const coord::util::NotHeld&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    locks.ReleaseHeldBy("state", ::getpid());
  } catch (const coord::util::NotHeld&) {
    threw = true;
  }
  assert(threw);

  auto again = locks.Acquire("state");
  assert(locks.ReleaseHeldBy("state", ::getpid()) == 1);
  assert(locks.Check("state").state() == coord::v1::LOCK_STATE_FREE);
  (void)again;
}

void TestReservedResourceNamesAreRejected() {
  const auto  dir = FreshDir("names");
  LockManager locks(Options(dir), nullptr);

  for (const char* bad : {"", "a/b", "state.lock", "x.shared.y"}) {
    bool threw = false;
    try {
      locks.Acquire(bad);
    } catch (const coord::util::ValidationFailed&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestContendedAcquireTimesOut();
  TestMutualExclusionAcrossProcesses();
  TestDeadHolderIsReclaimed();
  TestCleanupReclaimsStaleRecords();
  TestSharedHoldersBlockWriters();
  TestOrderingAndReentry();
  TestReleaseOfLostLockThrowsNotHeld();
  TestReservedResourceNamesAreRejected();

  std::cout << "coord_integration_lock_manager: pass\n";
  return 0;
}
