#pragma once

#include <cstdint>
#include <memory>

namespace netsweep::db {
class Repository;
}
namespace netsweep::enrich {
class PortScanner;
}
namespace netsweep::reconcile {
class StateReconciler;
}
namespace netsweep::util {
class Clock;
}

namespace netsweep::core {

struct PortScanReport {
  uint64_t candidates = 0;
  uint64_t scanned    = 0;
  uint64_t failed     = 0;
  bool     skipped    = false; // nmap missing
};

/*
  Open-port enrichment of the online inventory.

  Hosts are taken most recently seen first, capped at max_hosts, and
  scanned one at a time. Each result lands in extra_info as openPorts
  plus lastPortScan through StateReconciler::MergeExtraInfo. A host that
  fails is logged and skipped; a missing nmap skips the whole pass.
*/
class PortScanPass {
 public:
  PortScanPass(std::shared_ptr<enrich::PortScanner> scanner, std::shared_ptr<reconcile::StateReconciler> reconciler,
               std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  // Whether full scans should be followed by a pass.
  bool Enabled() const;

  PortScanReport Run();

 private:
  std::shared_ptr<enrich::PortScanner>        scanner_;
  std::shared_ptr<reconcile::StateReconciler> reconciler_;
  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<util::Clock>                clock_;
};

} // namespace netsweep::core
