#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/scan_mode.hpp"
#include "internal/scan/batch_scheduler.hpp"
#include "internal/scan/observation.hpp"

namespace netsweep::db {
class Repository;
}
namespace netsweep::enrich {
class Enricher;
}
namespace netsweep::reconcile {
class StateReconciler;
}
namespace netsweep::scan {
class Prober;
}

namespace netsweep::core {

/*
  Scan orchestration: probe, optionally enrich, reconcile.

  Quick mode only probes. Full mode additionally runs the enrichment
  chains for addresses that answered. Nothing is enriched for an
  address that did not answer.

  A scan in which every attempted reconciliation failed throws
  util::PersistenceError; partial failures are only counted.
*/
class NetworkScanner {
 public:
  NetworkScanner(std::shared_ptr<scan::Prober> prober, std::shared_ptr<enrich::Enricher> enricher,
                 std::shared_ptr<reconcile::StateReconciler> reconciler, std::shared_ptr<db::Repository> repository,
                 scan::BatchOptions options, std::shared_ptr<util::Clock> clock);

  // Throws util::ValidationError before any probe for a bad range.
  scan::ScanSummary ScanRange(std::string_view range, netsweep::model::ScanMode mode);

  // Quick pass over every address already in the inventory.
  scan::ScanSummary RefreshKnown();

  // Single private address; a record is only created if it answers.
  scan::SettleOutcome ScanAddress(const std::string& ip, netsweep::model::ScanMode mode);

 private:
  scan::Observation Observe(const std::string& ip, netsweep::model::ScanMode mode);

  scan::ScanSummary Sweep(const std::vector<std::string>& addresses, netsweep::model::ScanMode mode);

  std::shared_ptr<scan::Prober>               prober_;
  std::shared_ptr<enrich::Enricher>           enricher_;
  std::shared_ptr<reconcile::StateReconciler> reconciler_;
  std::shared_ptr<db::Repository>             repository_;
  scan::BatchScheduler                        scheduler_;
};

} // namespace netsweep::core
