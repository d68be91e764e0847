#pragma once

#include <cstdint>
#include <string>

#include "internal/retention/retention_manager.hpp"
#include "internal/retention/retention_policy.hpp"
#include "service_context.hpp"

namespace netsweep::service {

class MaintenanceService {
 public:
  explicit MaintenanceService(ServiceContext ctx);

  retention::RetentionPolicy GetRetentionPolicy();
  void                       SetRetentionPolicy(const retention::RetentionPolicy& policy);

  // days == 0 removes every matching row; each returns rows removed.
  uint64_t PurgeHistory(uint32_t days);
  uint64_t PurgeDevices(uint32_t days);
  uint64_t PurgeOfflineDevices(uint32_t days);
  uint64_t PurgeLatency(uint32_t days);

  retention::PurgeReport ExecutePurge();

  void Compact();

  retention::StorageStats StorageStats();

  // Replaces the vendor table from an IEEE oui.txt or Wireshark manuf file.
  uint64_t ImportVendors(const std::string& path);

 private:
  ServiceContext ctx_;
};

} // namespace netsweep::service
