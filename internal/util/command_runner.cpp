#include "command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace netsweep::util {

namespace {

class FdGuard {
 public:
  explicit FdGuard(int fd = -1) : fd_(fd) {
  }
  ~FdGuard() {
    Close();
  }

  FdGuard(const FdGuard&)            = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int Get() const {
    return fd_;
  }

  void Close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_;
};

std::vector<std::string> ChildEnvironment() {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    if (std::strncmp(*entry, "LC_ALL=", 7) == 0 || std::strncmp(*entry, "LANG=", 5) == 0) continue;
    env.emplace_back(*entry);
  }
  env.emplace_back("LC_ALL=C");
  return env;
}

} // namespace

CommandResult ProcessCommandRunner::Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  CommandResult result;
  if (argv.empty()) {
    result.spawn_errno = EINVAL;
    return result;
  }

  int out_pipe[2];
  int err_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.spawn_errno = errno;
    return result;
  }
  FdGuard out_read(out_pipe[0]);
  FdGuard out_write(out_pipe[1]);

  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    result.spawn_errno = errno;
    return result;
  }
  FdGuard err_read(err_pipe[0]);
  FdGuard err_write(err_pipe[1]);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_write.Get(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_write.Get(), STDERR_FILENO);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
  args.push_back(nullptr);

  auto               env_storage = ChildEnvironment();
  std::vector<char*> env;
  env.reserve(env_storage.size() + 1);
  for (auto& entry : env_storage) env.push_back(entry.data());
  env.push_back(nullptr);

  pid_t     pid = 0;
  const int rc  = ::posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), env.data());
  posix_spawn_file_actions_destroy(&actions);

  out_write.Close();
  err_write.Close();

  if (rc != 0) {
    result.spawn_errno = rc;
    return result;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::array<pollfd, 2>        fds     = {{{out_read.Get(), POLLIN, 0}, {err_read.Get(), POLLIN, 0}}};
  std::array<std::string*, 2>  sinks   = {&result.output, &result.error_output};
  int                          pending = 2;
  std::array<char, 4096>       buffer{};

  while (pending > 0) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (ready == 0) continue;

    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;

      const auto n = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (n > 0) {
        sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --pending;
      }
    }
  }

  if (result.timed_out) ::kill(pid, SIGKILL);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace netsweep::util
