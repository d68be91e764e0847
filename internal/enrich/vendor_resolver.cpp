#include "vendor_resolver.hpp"

#include <cctype>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"

namespace netsweep::enrich {

namespace {

const std::unordered_map<std::string, std::string>& BuiltinTable() {
  static const std::unordered_map<std::string, std::string> kTable = {
      {"00:00:0c", "Cisco Systems"},
      {"00:0c:29", "VMware"},
      {"00:0e:58", "Sonos"},
      {"00:11:32", "Synology"},
      {"00:15:6d", "Ubiquiti Networks"},
      {"00:17:88", "Philips Lighting"},
      {"00:1b:21", "Intel Corporate"},
      {"00:1e:c2", "Apple"},
      {"00:24:d4", "Freebox SAS"},
      {"00:50:56", "VMware"},
      {"04:18:d6", "Ubiquiti Networks"},
      {"08:00:27", "PCS Systemtechnik (VirtualBox)"},
      {"24:0a:c4", "Espressif"},
      {"28:cf:da", "Apple"},
      {"30:ae:a4", "Espressif"},
      {"3c:07:54", "Apple"},
      {"44:65:0d", "Amazon Technologies"},
      {"50:c7:bf", "TP-Link"},
      {"52:54:00", "QEMU virtual NIC"},
      {"ac:bc:32", "Apple"},
      {"b8:27:eb", "Raspberry Pi Foundation"},
      {"dc:a6:32", "Raspberry Pi Trading"},
      {"e4:5f:01", "Raspberry Pi Trading"},
      {"f4:ca:e5", "Freebox SAS"},
      {"f4:f5:d8", "Google"},
  };
  return kTable;
}

} // namespace

std::optional<std::string> OuiFromMac(std::string_view mac) {
  std::string hex;
  hex.reserve(12);
  for (char c : mac) {
    if (std::isxdigit(static_cast<unsigned char>(c))) {
      hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    } else if (c != ':' && c != '-' && c != '.') {
      return std::nullopt;
    }
  }
  if (hex.size() != 12) return std::nullopt;

  return hex.substr(0, 2) + ":" + hex.substr(2, 2) + ":" + hex.substr(4, 2);
}

std::optional<std::string> BuiltinVendor(std::string_view oui) {
  const auto& table = BuiltinTable();
  auto        it    = table.find(std::string(oui));
  if (it == table.end()) return std::nullopt;
  return it->second;
}

VendorResolver::VendorResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<std::string> VendorResolver::Resolve(std::string_view mac) const {
  const auto oui = OuiFromMac(mac);
  if (!oui) return std::nullopt;

  if (repository_) {
    try {
      auto tx     = repository_->Begin();
      auto vendor = repository_->LookupVendor(*tx, *oui);
      tx->Commit();
      if (vendor && !vendor->empty()) return vendor;
    } catch (const std::exception& e) {
      NETSWEEP_LOG_DEBUG("vendor table lookup failed", {netsweep::observability::StringField("oui", *oui),
                                                        netsweep::observability::StringField("error", e.what())});
    }
  }
  return BuiltinVendor(*oui);
}

} // namespace netsweep::enrich
