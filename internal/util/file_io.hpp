#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace coord::util {

/*
  Crash-safe file primitives.

  Every document in the coordination root is replaced by writing a temp file
  next to it, flushing it and renaming it over the target, so readers only ever
  observe the old or the new content.
*/

std::string ReadFile(const std::filesystem::path& path);

// tmp → fsync → rename → fsync(dir). Throws on failure, never leaves the temp file behind.
void AtomicWriteFile(const std::filesystem::path& path, const std::string& content, bool fsync = true);

// Create-if-absent with complete content: temp file hard-linked into place.
// Returns false when path already exists.
bool CreateExclusive(const std::filesystem::path& path, const std::string& content);

// Returns false when the file did not exist.
bool RemoveFile(const std::filesystem::path& path);

void EnsureDirectory(const std::filesystem::path& path);

// Age from last modification; zero when the file is gone.
std::chrono::milliseconds FileAge(const std::filesystem::path& path);

// Temp files are named "<target>.tmp.<id>".
std::string TempSuffix();

// Removes "<stem>.tmp.*" leftovers in dir older than max_age; returns how many.
int RemoveStaleTempFiles(const std::filesystem::path& dir, std::chrono::seconds max_age);

/*
  RAII flock(2) on a dedicated file. Blocks until acquired.
*/
class FileLock {
 public:
  explicit FileLock(const std::filesystem::path& path);
  ~FileLock();

  FileLock(const FileLock&)            = delete;
  FileLock& operator=(const FileLock&) = delete;

 private:
  int fd_ = -1;
};

} // namespace coord::util
