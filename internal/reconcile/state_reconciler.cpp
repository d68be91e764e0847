#include "state_reconciler.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace netsweep::reconcile {

using netsweep::model::DeviceStatus;
using netsweep::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }

  switch (result.code) {
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::Busy:
    // a concurrent writer (another process) created the row first
    case db::ErrorCode::AlreadyExists:
      throw util::TransactionConflict(prefix + ": " + result.message);
    default:
      throw util::PersistenceError(prefix + ": " + result.message);
  }
}

bool AdvancesLastSeen(DeviceStatus previous, DeviceStatus next) {
  if (next == DeviceStatus::kOnline) return previous != DeviceStatus::kOnline;
  if (next == DeviceStatus::kOffline) return previous == DeviceStatus::kOnline;
  return false;
}

const char* KindName(scan::SettleKind kind) {
  switch (kind) {
    case scan::SettleKind::kCreated:
      return "created";
    case scan::SettleKind::kUpdated:
      return "updated";
    case scan::SettleKind::kSkipped:
      break;
  }
  return "skipped";
}

} // namespace

StateReconciler::StateReconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)),
      clock_(std::move(clock)) {
}

StateReconciler::AddressHold::AddressHold(StateReconciler& owner, const std::string& ip) : owner_(owner), ip_(ip) {
  {
    std::lock_guard<std::mutex> lock(owner_.address_mutexes_guard_);
    auto&                       entry = owner_.address_mutexes_[ip_];
    if (!entry) {
      entry = std::make_shared<AddressMutex>();
    }
    ++entry->holders;
    entry_ = entry;
  }
  entry_->mutex.lock();
}

StateReconciler::AddressHold::~AddressHold() {
  entry_->mutex.unlock();

  std::lock_guard<std::mutex> lock(owner_.address_mutexes_guard_);
  if (--entry_->holders == 0) {
    owner_.address_mutexes_.erase(ip_);
  }
}

std::size_t StateReconciler::TrackedAddresses() {
  std::lock_guard<std::mutex> lock(address_mutexes_guard_);
  return address_mutexes_.size();
}

scan::SettleOutcome StateReconciler::Reconcile(const scan::Observation& observation) {
  AddressHold hold(*this, observation.ip);

  for (int attempt = 1;; ++attempt) {
    try {
      auto outcome = ReconcileOnce(observation);
      netsweep::observability::Metrics::Instance().RecordReconcile(KindName(outcome.kind));
      return outcome;
    } catch (const util::TransactionConflict& e) {
      if (attempt >= kMaxAttempts) {
        netsweep::observability::Metrics::Instance().RecordReconcile("failed");
        throw util::PersistenceError("reconcile " + observation.ip + ": gave up after " + std::to_string(attempt) + " conflicts: " + e.what());
      }
      NETSWEEP_LOG_DEBUG("reconcile conflict, retrying", {StringField("ip", observation.ip), netsweep::observability::IntField("attempt", attempt)});
    } catch (const util::PersistenceError&) {
      netsweep::observability::Metrics::Instance().RecordReconcile("failed");
      throw;
    } catch (const std::exception& e) {
      netsweep::observability::Metrics::Instance().RecordReconcile("failed");
      throw util::PersistenceError("reconcile " + observation.ip + ": " + e.what());
    }
  }
}

bool StateReconciler::MergeExtraInfo(const std::string& ip, const std::string& fields_json) {
  if (!util::NormalizeJsonObject(fields_json)) {
    throw util::ValidationError("extra_info update for " + ip + " is not a JSON object");
  }

  AddressHold hold(*this, ip);

  for (int attempt = 1;; ++attempt) {
    try {
      return MergeExtraInfoOnce(ip, fields_json);
    } catch (const util::TransactionConflict& e) {
      if (attempt >= kMaxAttempts) {
        throw util::PersistenceError("extra_info " + ip + ": gave up after " + std::to_string(attempt) + " conflicts: " + e.what());
      }
      NETSWEEP_LOG_DEBUG("extra_info conflict, retrying", {StringField("ip", ip), netsweep::observability::IntField("attempt", attempt)});
    } catch (const util::ValidationError&) {
      throw;
    } catch (const util::PersistenceError&) {
      throw;
    } catch (const std::exception& e) {
      throw util::PersistenceError("extra_info " + ip + ": " + e.what());
    }
  }
}

bool StateReconciler::MergeExtraInfoOnce(const std::string& ip, const std::string& fields_json) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockDevice(*tx, ip), "lock device " + ip);
  auto existing = repository_->GetDevice(*tx, ip);
  if (!existing) {
    tx->Rollback();
    return false;
  }

  auto merged = util::MergeJsonObjects(existing->extra_info, fields_json);
  if (!merged) {
    tx->Rollback();
    throw util::ValidationError("extra_info update for " + ip + " is not a JSON object");
  }
  existing->extra_info = std::move(*merged);

  ThrowIfDbError(repository_->UpdateDevice(*tx, *existing), "update device " + ip);
  tx->Commit();
  return true;
}

scan::SettleOutcome StateReconciler::ReconcileOnce(const scan::Observation& observation) {
  const auto& probe  = observation.probe;
  const auto  status = probe.success ? DeviceStatus::kOnline : DeviceStatus::kOffline;
  const auto  now_ms = util::ToUnixMillis(clock_->Now());

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockDevice(*tx, observation.ip), "lock device " + observation.ip);
  auto existing = repository_->GetDevice(*tx, observation.ip);

  if (!existing && !probe.success) {
    tx->Rollback();
    return {scan::SettleKind::kSkipped, status};
  }

  db::model::DeviceRecord record;
  scan::SettleKind        kind = scan::SettleKind::kCreated;

  if (!existing) {
    record.ip            = observation.ip;
    record.mac           = observation.mac;
    record.hostname      = observation.hostname;
    record.vendor        = observation.vendor;
    record.first_seen_ms = now_ms;
    record.last_seen_ms  = now_ms;
    record.scan_count    = 1;
    record.extra_info    = "{}";
    if (record.hostname) record.hostname_source = kScannerSource;
    if (record.vendor) record.vendor_source = kScannerSource;
  } else {
    kind   = scan::SettleKind::kUpdated;
    record = std::move(*existing);

    if (observation.mac) record.mac = observation.mac;
    if (observation.hostname) {
      record.hostname        = observation.hostname;
      record.hostname_source = kScannerSource;
    }
    if (observation.vendor) {
      record.vendor        = observation.vendor;
      record.vendor_source = kScannerSource;
    }

    if (AdvancesLastSeen(record.status, status)) record.last_seen_ms = now_ms;
    record.scan_count += 1;
  }

  record.status          = status;
  record.ping_latency_ms = probe.success ? probe.latency_ms : std::nullopt;

  if (kind == scan::SettleKind::kCreated) {
    ThrowIfDbError(repository_->InsertDevice(*tx, record), "insert device " + record.ip);
  } else {
    ThrowIfDbError(repository_->UpdateDevice(*tx, record), "update device " + record.ip);
  }

  db::model::HistoryRecord history;
  history.ip              = record.ip;
  history.status          = record.status;
  history.ping_latency_ms = record.ping_latency_ms;
  history.seen_at_ms      = now_ms;
  ThrowIfDbError(repository_->AppendHistory(*tx, history), "append history " + record.ip);

  tx->Commit();
  return {kind, record.status};
}

} // namespace netsweep::reconcile
