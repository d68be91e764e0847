#include "oui_loader.hpp"

#include <map>
#include <sstream>

#include "internal/util/strings.hpp"
#include "vendor_resolver.hpp"

namespace netsweep::enrich {

namespace {

constexpr std::string_view kHexMarker = "(hex)";

std::vector<std::string> SplitTabs(const std::string& line) {
  std::vector<std::string> out;
  std::size_t              start = 0;
  while (start <= line.size()) {
    const auto tab = line.find('\t', start);
    auto       field = util::Trim(std::string_view(line).substr(start, tab == std::string::npos ? std::string::npos : tab - start));
    if (!field.empty()) out.push_back(std::move(field));
    if (tab == std::string::npos) break;
    start = tab + 1;
  }
  return out;
}

// "XX-XX-XX" with exactly three octets.
std::optional<std::string> ShortOui(std::string_view token) {
  if (token.size() != 8) return std::nullopt;
  return OuiFromMac(std::string(token) + ":00:00:00");
}

} // namespace

std::vector<db::model::VendorRecord> ParseVendorFile(std::string_view content) {
  std::map<std::string, std::string> entries;

  std::istringstream in{std::string(content)};
  std::string        line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();

    const auto trimmed = util::Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') continue;

    if (const auto marker = trimmed.find(kHexMarker); marker != std::string::npos) {
      auto oui    = ShortOui(util::Trim(std::string_view(trimmed).substr(0, marker)));
      auto vendor = util::Trim(std::string_view(trimmed).substr(marker + kHexMarker.size()));
      if (oui && !vendor.empty()) entries[*oui] = vendor;
      continue;
    }

    const auto fields = SplitTabs(trimmed);
    if (fields.size() < 2) continue;

    auto oui = ShortOui(fields[0]);
    if (!oui) continue;
    entries[*oui] = fields.size() >= 3 ? fields[2] : fields[1];
  }

  std::vector<db::model::VendorRecord> out;
  out.reserve(entries.size());
  for (auto& [oui, vendor] : entries) out.push_back({oui, std::move(vendor)});
  return out;
}

} // namespace netsweep::enrich
