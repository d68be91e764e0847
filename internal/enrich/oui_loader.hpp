#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/vendor_record.hpp"

namespace netsweep::enrich {

/*
  Parses a vendor registry into (oui, vendor) rows.

  Two layouts are understood, line by line:
    IEEE oui.txt   "28-6F-B9   (hex)\t\tNokia Shanghai Bell Co., Ltd."
                   ("(base 16)" and address lines are skipped)
    Wireshark      "00:00:0C\tCisco\tCisco Systems, Inc"  (long name preferred)

  Wireshark entries with a mask ("00:1B:C5:00:00/36") are skipped, they
  cover less than a full OUI. The last entry for a repeated OUI wins.
*/
std::vector<db::model::VendorRecord> ParseVendorFile(std::string_view content);

} // namespace netsweep::enrich
