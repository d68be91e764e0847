#include "port_scan_pass.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/enrich/port_scanner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reconcile/state_reconciler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace netsweep::core {

using netsweep::observability::IntField;
using netsweep::observability::StringField;

PortScanPass::PortScanPass(std::shared_ptr<enrich::PortScanner> scanner, std::shared_ptr<reconcile::StateReconciler> reconciler,
                           std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : scanner_(std::move(scanner)),
      reconciler_(std::move(reconciler)),
      repository_(std::move(repository)),
      clock_(std::move(clock)) {
}

bool PortScanPass::Enabled() const {
  return scanner_->Options().enabled;
}

PortScanReport PortScanPass::Run() {
  PortScanReport report;
  if (!scanner_->Available()) {
    NETSWEEP_LOG_WARN("port scan skipped, nmap not available", {StringField("binary", scanner_->Options().nmap_binary)});
    report.skipped = true;
    return report;
  }

  std::vector<db::model::DeviceRecord> online;
  {
    db::DeviceFilter filter;
    filter.status = netsweep::model::DeviceStatus::kOnline;
    db::Pagination page;
    page.limit = scanner_->Options().max_hosts;

    auto tx = repository_->Begin();
    online  = repository_->ListDevices(*tx, filter, db::NativeOrder{db::NativeSortField::kLastSeen, db::SortOrder::kDesc}, page);
    tx->Commit();
  }
  report.candidates = online.size();

  for (const auto& device : online) {
    try {
      auto ports = scanner_->Scan(device.ip);
      if (reconciler_->MergeExtraInfo(device.ip, enrich::OpenPortsJson(ports, util::ToUnixMillis(clock_->Now())))) {
        ++report.scanned;
      }
    } catch (const util::ResolverError& e) {
      ++report.failed;
      NETSWEEP_LOG_WARN("port scan failed", {StringField("ip", device.ip), StringField("error", e.what())});
    } catch (const util::PersistenceError& e) {
      ++report.failed;
      NETSWEEP_LOG_WARN("port scan result not stored", {StringField("ip", device.ip), StringField("error", e.what())});
    }
  }

  NETSWEEP_LOG_INFO("port scan finished", {IntField("candidates", static_cast<int64_t>(report.candidates)),
                                           IntField("scanned", static_cast<int64_t>(report.scanned)), IntField("failed", static_cast<int64_t>(report.failed))});
  return report;
}

} // namespace netsweep::core
