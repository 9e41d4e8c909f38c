#include "internal/util/file_io.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace coord::util {

namespace {

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const {
    return fd_;
  }

  int Release() {
    const int fd = fd_;
    fd_          = -1;
    return fd;
  }

 private:
  int fd_;
};

void WriteAll(int fd, const std::string& content, const std::string& context) {
  size_t offset = 0;
  while (offset < content.size()) {
    const auto n = ::write(fd, content.data() + offset, content.size() - offset);
    if (n < 0) {
      if (errno == EINTR) continue;
      ThrowSystemError(errno, "write " + context);
    }
    offset += static_cast<size_t>(n);
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  FileDescriptor fd(::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (fd.Get() < 0) return;
  ::fsync(fd.Get());
}

std::filesystem::path WriteTemp(const std::filesystem::path& path, const std::string& content, bool fsync) {
  const std::filesystem::path tmp = path.string() + ".tmp." + TempSuffix();

  FileDescriptor fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
  if (fd.Get() < 0) {
    ThrowSystemError(errno, "create " + tmp.string());
  }

  try {
    WriteAll(fd.Get(), content, tmp.string());
    if (fsync && ::fsync(fd.Get()) != 0) {
      ThrowSystemError(errno, "fsync " + tmp.string());
    }
    if (::close(fd.Release()) != 0) {
      ThrowSystemError(errno, "close " + tmp.string());
    }
  } catch (...) {
    ::unlink(tmp.c_str());
    throw;
  }
  return tmp;
}

} // namespace

std::string TempSuffix() {
  return std::to_string(::getpid()) + "." + ShortId();
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      throw NotFound("no such file: " + path.string());
    }
    ThrowSystemError(errno == 0 ? EIO : errno, "open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void AtomicWriteFile(const std::filesystem::path& path, const std::string& content, bool fsync) {
  const auto tmp = WriteTemp(path, content, fsync);
  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    const int error = errno;
    ::unlink(tmp.c_str());
    ThrowSystemError(error, "rename " + tmp.string());
  }
  if (fsync) {
    SyncDirectory(path.parent_path());
  }
}

bool CreateExclusive(const std::filesystem::path& path, const std::string& content) {
  const auto tmp = WriteTemp(path, content, false);
  const int  rc  = ::link(tmp.c_str(), path.c_str());
  const int  err = errno;
  ::unlink(tmp.c_str());
  if (rc == 0) {
    return true;
  }
  if (err == EEXIST) {
    return false;
  }
  ThrowSystemError(err, "link " + path.string());
}

bool RemoveFile(const std::filesystem::path& path) {
  if (::unlink(path.c_str()) == 0) {
    return true;
  }
  if (errno == ENOENT) {
    return false;
  }
  ThrowSystemError(errno, "unlink " + path.string());
}

void EnsureDirectory(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    ThrowSystemError(ec.value(), "mkdir " + path.string());
  }
}

std::chrono::milliseconds FileAge(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return std::chrono::milliseconds(0);
  }
  const auto modified = std::chrono::system_clock::from_time_t(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
  const auto age      = std::chrono::system_clock::now() - modified;
  if (age.count() < 0) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(age);
}

int RemoveStaleTempFiles(const std::filesystem::path& dir, std::chrono::seconds max_age) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return 0;
  }

  int removed = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    const auto name = entry.path().filename().string();
    if (name.find(".tmp.") == std::string::npos) continue;
    if (FileAge(entry.path()) < max_age) continue;
    if (RemoveFile(entry.path())) ++removed;
  }
  return removed;
}

FileLock::FileLock(const std::filesystem::path& path) {
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    ThrowSystemError(errno, "open " + path.string());
  }
  while (::flock(fd_, LOCK_EX) != 0) {
    if (errno == EINTR) continue;
    const int error = errno;
    ::close(fd_);
    fd_ = -1;
    ThrowSystemError(error, "flock " + path.string());
  }
}

FileLock::~FileLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

} // namespace coord::util
