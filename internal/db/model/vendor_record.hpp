#pragma once

#include <string>

namespace netsweep::db::model {

struct VendorRecord {
  std::string oui; // "xx:xx:xx", lowercase
  std::string vendor;
};

} // namespace netsweep::db::model
