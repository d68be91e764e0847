#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/util/command_runner.hpp"

namespace netsweep::enrich {

// stdout of argv, or util::ResolverError when the tool is missing or
// overran its deadline. Exit status is not an error; parsers decide.
std::string RunStep(util::CommandRunner& runner, const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace netsweep::enrich
