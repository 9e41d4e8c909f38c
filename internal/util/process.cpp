#include "process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <climits>
#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

extern char** environ;

namespace coord::util {

namespace {

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      ThrowSystemError(errno, "pipe");
    }
  }

  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int Read() const {
    return fds_[0];
  }
  int Write() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }

  void CloseWrite() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  int fds_[2] = {-1, -1};
};

} // namespace

pid_t CurrentPid() {
  return ::getpid();
}

pid_t ParentPid() {
  return ::getppid();
}

std::string Hostname() {
  char buf[HOST_NAME_MAX + 1] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) {
    return "unknown";
  }
  return buf;
}

bool IsProcessAlive(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  if (::kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

uint64_t ProcessStartTime(pid_t pid) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
  if (!in) {
    return 0;
  }

  std::string line;
  std::getline(in, line);

  // comm (field 2) may contain spaces; fields resume after the last ')'.
  const auto close_paren = line.rfind(')');
  if (close_paren == std::string::npos) {
    return 0;
  }

  std::istringstream rest(line.substr(close_paren + 1));
  std::string        field;
  // Field 3 is the first token after ')', start time is field 22.
  for (int index = 3; index <= 22; ++index) {
    if (!(rest >> field)) {
      return 0;
    }
  }

  try {
    return std::stoull(field);
  } catch (const std::exception&) {
    return 0;
  }
}

bool IsSameProcessAlive(pid_t pid, uint64_t expected_start_time) {
  if (!IsProcessAlive(pid)) {
    return false;
  }
  if (expected_start_time == 0) {
    return true;
  }
  const auto actual = ProcessStartTime(pid);
  return actual == 0 || actual == expected_start_time;
}

CommandResult RunCommand(const std::vector<std::string>& argv, const std::string& input) {
  if (argv.empty()) {
    throw ConfigurationError("RunCommand: empty argv");
  }

  Pipe in_pipe;
  Pipe out_pipe;
  Pipe err_pipe;

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, in_pipe.Read(), STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, out_pipe.Write(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe.Write(), STDERR_FILENO);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t      child = -1;
  const auto rc    = ::posix_spawnp(&child, args[0], &actions, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  if (rc != 0) {
    ThrowSystemError(rc, "spawn " + argv[0]);
  }

  in_pipe.CloseRead();
  out_pipe.CloseWrite();
  err_pipe.CloseWrite();

  // Small inputs only (commit messages, file bodies); write before draining.
  if (!input.empty()) {
    const auto previous = ::signal(SIGPIPE, SIG_IGN);
    size_t     offset   = 0;
    while (offset < input.size()) {
      const auto n = ::write(in_pipe.Write(), input.data() + offset, input.size() - offset);
      if (n < 0) {
        if (errno == EINTR) continue;
        break;
      }
      offset += static_cast<size_t>(n);
    }
    ::signal(SIGPIPE, previous);
  }
  in_pipe.CloseWrite();

  CommandResult          result;
  std::array<char, 4096> buf{};
  struct pollfd          fds[2] = {{out_pipe.Read(), POLLIN, 0}, {err_pipe.Read(), POLLIN, 0}};
  int                    open   = 2;

  while (open > 0) {
    const auto ready = ::poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      const auto n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        (i == 0 ? result.out : result.err).append(buf.data(), static_cast<size_t>(n));
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      fds[i].fd = -1;
      --open;
    }
  }

  int status = 0;
  while (::waitpid(child, &status, 0) < 0) {
    if (errno != EINTR) {
      ThrowSystemError(errno, "waitpid " + argv[0]);
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace coord::util
