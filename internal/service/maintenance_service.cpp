#include "maintenance_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/enrich/oui_loader.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file.hpp"
#include "observe_call.hpp"

namespace netsweep::service {

MaintenanceService::MaintenanceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

retention::RetentionPolicy MaintenanceService::GetRetentionPolicy() {
  return ObserveCall("MaintenanceService.GetRetentionPolicy", {}, [&] { return ctx_.retention->GetPolicy(); });
}

void MaintenanceService::SetRetentionPolicy(const retention::RetentionPolicy& policy) {
  ObserveCall("MaintenanceService.SetRetentionPolicy", {}, [&] { ctx_.retention->SetPolicy(policy); });
}

uint64_t MaintenanceService::PurgeHistory(uint32_t days) {
  return ObserveCall("MaintenanceService.PurgeHistory", {}, [&] { return ctx_.retention->PurgeHistory(days); });
}

uint64_t MaintenanceService::PurgeDevices(uint32_t days) {
  return ObserveCall("MaintenanceService.PurgeDevices", {}, [&] { return ctx_.retention->PurgeDevices(days); });
}

uint64_t MaintenanceService::PurgeOfflineDevices(uint32_t days) {
  return ObserveCall("MaintenanceService.PurgeOfflineDevices", {}, [&] { return ctx_.retention->PurgeOfflineDevices(days); });
}

uint64_t MaintenanceService::PurgeLatency(uint32_t days) {
  return ObserveCall("MaintenanceService.PurgeLatency", {}, [&] { return ctx_.retention->PurgeLatency(days); });
}

retention::PurgeReport MaintenanceService::ExecutePurge() {
  return ObserveCall("MaintenanceService.ExecutePurge", {}, [&] { return ctx_.retention->ExecutePurge(); });
}

void MaintenanceService::Compact() {
  ObserveCall("MaintenanceService.Compact", {}, [&] { ctx_.retention->Compact(); });
}

retention::StorageStats MaintenanceService::StorageStats() {
  return ObserveCall("MaintenanceService.StorageStats", {}, [&] { return ctx_.retention->GetStorageStats(); });
}

uint64_t MaintenanceService::ImportVendors(const std::string& path) {
  return ObserveCall("MaintenanceService.ImportVendors", path, [&] {
    const auto content = util::ReadTextFile(path);
    if (!content) {
      throw util::NotFound("vendor file not readable: " + path);
    }

    const auto vendors = enrich::ParseVendorFile(*content);
    if (vendors.empty()) {
      throw util::ValidationError("no vendor entries found in " + path);
    }

    auto tx     = ctx_.repository->Begin();
    auto result = ctx_.repository->ReplaceVendors(*tx, vendors);
    if (!result) {
      throw util::PersistenceError("replace vendors: " + result.message);
    }
    tx->Commit();

    NETSWEEP_LOG_INFO("vendor table imported", {netsweep::observability::StringField("path", path),
                                                netsweep::observability::IntField("entries", static_cast<int64_t>(vendors.size()))});
    return static_cast<uint64_t>(vendors.size());
  });
}

} // namespace netsweep::service
