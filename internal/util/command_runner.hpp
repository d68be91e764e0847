#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netsweep::util {

struct CommandResult {
  int         exit_code = -1;
  std::string output;
  std::string error_output;
  bool        timed_out = false;

  // errno from the spawn attempt; non-zero means the program never ran.
  int spawn_errno = 0;

  bool Spawned() const {
    return spawn_errno == 0;
  }
};

/*
  Runs an external program with a hard deadline.

  Implementations never throw for a program that fails, exits non-zero or
  overruns its deadline; all of that is reported through CommandResult.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
};

/*
  posix_spawnp based runner.

  stdout/stderr are captured through pipes, stdin is /dev/null and the
  child runs with LC_ALL=C so tool output parses the same everywhere.
  The child is killed with SIGKILL once the deadline passes.
*/
class ProcessCommandRunner final : public CommandRunner {
 public:
  CommandResult Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
};

} // namespace netsweep::util
