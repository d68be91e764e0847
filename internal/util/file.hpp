#pragma once

#include <optional>
#include <string>

namespace netsweep::util {

// Whole file as text; nullopt when it cannot be opened.
std::optional<std::string> ReadTextFile(const std::string& path);

} // namespace netsweep::util
