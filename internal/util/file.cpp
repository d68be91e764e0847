#include "file.hpp"

#include <fstream>
#include <sstream>

namespace netsweep::util {

std::optional<std::string> ReadTextFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace netsweep::util
