#include "command_step.hpp"

#include "internal/util/errors.hpp"

namespace netsweep::enrich {

std::string RunStep(util::CommandRunner& runner, const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  auto result = runner.Run(argv, timeout);
  if (!result.Spawned()) {
    throw util::ResolverError(argv.front() + " unavailable (errno " + std::to_string(result.spawn_errno) + ")");
  }
  if (result.exit_code == 127) {
    throw util::ResolverError(argv.front() + " not installed");
  }
  if (result.timed_out) {
    throw util::ResolverError(argv.front() + " timed out");
  }
  return result.output;
}

} // namespace netsweep::enrich
