#include <cassert>
#include <filesystem>
#include <iostream>

#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/process.hpp"
#include "internal/util/time.hpp"

namespace {

namespace fs = std::filesystem;

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "coord_util_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

size_t CountEntries(const fs::path& dir) {
  size_t n = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    (void)entry;
    ++n;
  }
  return n;
}

void TestAtomicWriteReplacesWithoutLeftovers() {
  const auto dir  = FreshDir("atomic");
  const auto file = dir / "state.json";

  coord::util::AtomicWriteFile(file, "first");
  coord::util::AtomicWriteFile(file, "second");
  assert(coord::util::ReadFile(file) == "second");
  assert(CountEntries(dir) == 1);

  bool threw = false;
  try {
    (void)coord::util::ReadFile(dir / "missing.json");
  } catch (const coord::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCreateExclusive() {
  const auto dir  = FreshDir("exclusive");
  const auto file = dir / "lock";

  assert(coord::util::CreateExclusive(file, "owner-a"));
  assert(!coord::util::CreateExclusive(file, "owner-b"));
  assert(coord::util::ReadFile(file) == "owner-a");
  assert(CountEntries(dir) == 1);

  assert(coord::util::RemoveFile(file));
  assert(!coord::util::RemoveFile(file));
}

void TestStaleTempFilesAreSwept() {
  const auto dir = FreshDir("sweep");
  coord::util::AtomicWriteFile(dir / ("state.json.tmp." + coord::util::TempSuffix()), "partial", false);
  coord::util::AtomicWriteFile(dir / "state.json", "{}", false);

  assert(coord::util::RemoveStaleTempFiles(dir, std::chrono::hours(1)) == 0);
  assert(coord::util::RemoveStaleTempFiles(dir, std::chrono::seconds(0)) == 1);
  assert(CountEntries(dir) == 1);
}

void TestCompactTimestamps() {
  const auto tp   = coord::util::TimePoint(std::chrono::milliseconds(1790000000123LL));
  const auto text = coord::util::CompactUtc(tp);
  assert(text.size() == 20);
  assert(text.back() == 'Z');

  const auto parsed = coord::util::ParseCompactUtc(text);
  assert(parsed.has_value());
  assert(coord::util::ToUnixMillis(*parsed) == 1790000000123ULL);

  assert(!coord::util::ParseCompactUtc("yesterday").has_value());
  assert(!coord::util::ParseCompactUtc("20261019T190512.12xZ").has_value());
}

void TestComponentNames() {
  coord::util::ValidateComponent("workspace-index", "resource");

  for (const char* bad : {"", "..", "a/b"}) {
    bool threw = false;
    try {
      coord::util::ValidateComponent(bad, "resource");
    } catch (const coord::util::ValidationFailed&) {
      threw = true;
    }
    assert(threw);
  }

  assert(coord::util::ResolveAgainst("/repo", ".coord").string() == "/repo/.coord");
  assert(coord::util::ResolveAgainst("/repo", "/var/coord").string() == "/var/coord");
}

void TestProcessHelpers() {
  assert(coord::util::IsProcessAlive(coord::util::CurrentPid()));
  assert(!coord::util::IsProcessAlive(0));

  const auto start = coord::util::ProcessStartTime(coord::util::CurrentPid());
  assert(start > 0);
  assert(coord::util::IsSameProcessAlive(coord::util::CurrentPid(), start));
  assert(!coord::util::IsSameProcessAlive(coord::util::CurrentPid(), start + 1));

  const auto echoed = coord::util::RunCommand({"cat"}, "hello");
  assert(echoed.Ok());
  assert(echoed.out == "hello");

  const auto failed = coord::util::RunCommand({"sh", "-c", "echo oops >&2; exit 3"});
  assert(failed.exit_code == 3);
  assert(failed.err == "oops\n");
}

} // namespace

int main() {
  TestAtomicWriteReplacesWithoutLeftovers();
  TestCreateExclusive();
  TestStaleTempFilesAreSwept();
  TestCompactTimestamps();
  TestComponentNames();
  TestProcessHelpers();

  std::cout << "coord_unit_util: pass\n";
  return 0;
}
