#pragma once

#include <optional>
#include <string>

#include "probe_executor.hpp"

namespace netsweep::scan {

/*
  What one scan pass learned about one address.

  mac/hostname/vendor are only set when full mode resolved a new value;
  empty means "nothing new", never "erase".
*/
struct Observation {
  std::string ip;
  ProbeResult probe;

  std::optional<std::string> mac;
  std::optional<std::string> hostname;
  std::optional<std::string> vendor;
};

} // namespace netsweep::scan
