#include "network_scanner.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/enrich/enricher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reconcile/state_reconciler.hpp"
#include "internal/scan/probe_executor.hpp"
#include "internal/scan/range_parser.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ipv4.hpp"

namespace netsweep::core {

using netsweep::model::ScanMode;
using netsweep::observability::IntField;
using netsweep::observability::StringField;

NetworkScanner::NetworkScanner(std::shared_ptr<scan::Prober> prober, std::shared_ptr<enrich::Enricher> enricher,
                               std::shared_ptr<reconcile::StateReconciler> reconciler, std::shared_ptr<db::Repository> repository,
                               scan::BatchOptions options, std::shared_ptr<util::Clock> clock)
    : prober_(std::move(prober)),
      enricher_(std::move(enricher)),
      reconciler_(std::move(reconciler)),
      repository_(std::move(repository)),
      scheduler_(options, std::move(clock)) {
}

scan::Observation NetworkScanner::Observe(const std::string& ip, ScanMode mode) {
  scan::Observation observation;
  observation.ip    = ip;
  observation.probe = prober_->Probe(ip);

  if (mode != ScanMode::kFull || !observation.probe.success || !enricher_) {
    return observation;
  }

  try {
    auto found           = enricher_->Enrich(ip);
    observation.mac      = std::move(found.mac);
    observation.hostname = std::move(found.hostname);
    observation.vendor   = std::move(found.vendor);
  } catch (const std::exception& e) {
    // the probe result stands on its own
    NETSWEEP_LOG_WARN("enrichment failed", {StringField("ip", ip), StringField("error", e.what())});
  }
  return observation;
}

scan::ScanSummary NetworkScanner::Sweep(const std::vector<std::string>& addresses, ScanMode mode) {
  auto summary = scheduler_.Run(
      addresses, [this, mode](const std::string& ip) { return Observe(ip, mode); },
      [this](const scan::Observation& observation) { return reconciler_->Reconcile(observation); });

  const uint64_t attempted = summary.found + summary.updated + summary.persistence_failures;
  if (attempted > 0 && summary.persistence_failures == attempted) {
    throw util::PersistenceError("scan failed: all " + std::to_string(attempted) + " reconciliations failed");
  }

  NETSWEEP_LOG_INFO("scan finished", {StringField("mode", netsweep::model::ToString(mode)), IntField("scanned", static_cast<int64_t>(summary.scanned)),
                                      IntField("found", static_cast<int64_t>(summary.found)), IntField("updated", static_cast<int64_t>(summary.updated)),
                                      IntField("online", static_cast<int64_t>(summary.online)), IntField("offline", static_cast<int64_t>(summary.offline)),
                                      IntField("persistence_failures", static_cast<int64_t>(summary.persistence_failures)),
                                      IntField("duration_ms", static_cast<int64_t>(summary.duration_ms))});
  return summary;
}

scan::ScanSummary NetworkScanner::ScanRange(std::string_view range, ScanMode mode) {
  const auto addresses = scan::ParseRange(range);
  NETSWEEP_LOG_INFO("scan started", {StringField("range", range), StringField("mode", netsweep::model::ToString(mode)),
                                     IntField("addresses", static_cast<int64_t>(addresses.size()))});
  return Sweep(addresses, mode);
}

scan::ScanSummary NetworkScanner::RefreshKnown() {
  std::vector<std::string> known;
  {
    auto tx = repository_->Begin();
    known   = repository_->ListDeviceIps(*tx);
    tx->Commit();
  }
  if (known.empty()) {
    return {};
  }
  return Sweep(known, ScanMode::kQuick);
}

scan::SettleOutcome NetworkScanner::ScanAddress(const std::string& ip, ScanMode mode) {
  const auto address = util::ParseIpv4(ip);
  if (!address) {
    throw util::ValidationError("invalid IPv4 address: " + ip);
  }
  if (!util::IsPrivate(*address)) {
    throw util::ValidationError("address is not in private space: " + ip);
  }
  return reconciler_->Reconcile(Observe(util::FormatIpv4(*address), mode));
}

} // namespace netsweep::core
