#include "pg_repository.hpp"

#include <variant>

#include "internal/db/sql/device_sql.hpp"

namespace netsweep::db::postgres {

using netsweep::model::DeviceStatus;

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<double> OptDouble(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<double>();
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

DeviceStatus StatusOf(const pqxx::field& f) {
  return netsweep::model::ParseDeviceStatus(f.c_str()).value_or(DeviceStatus::kUnknown);
}

std::string StatusText(DeviceStatus s) {
  return std::string(netsweep::model::ToString(s));
}

model::DeviceRecord ReadDevice(const pqxx::row& row) {
  model::DeviceRecord r;
  r.ip              = row[0].c_str();
  r.mac             = OptText(row[1]);
  r.hostname        = OptText(row[2]);
  r.vendor          = OptText(row[3]);
  r.hostname_source = OptText(row[4]);
  r.vendor_source   = OptText(row[5]);
  r.status          = StatusOf(row[6]);
  r.ping_latency_ms = OptDouble(row[7]);
  r.first_seen_ms   = row[8].as<uint64_t>();
  r.last_seen_ms    = row[9].as<uint64_t>();
  r.scan_count      = row[10].as<uint64_t>();
  r.extra_info      = row[11].c_str();
  return r;
}

model::HistoryRecord ReadHistory(const pqxx::row& row) {
  model::HistoryRecord h;
  h.ip              = row[0].c_str();
  h.status          = StatusOf(row[1]);
  h.ping_latency_ms = OptDouble(row[2]);
  h.seen_at_ms      = row[3].as<uint64_t>();
  return h;
}

pqxx::params ToPqxx(const sql::Params& in) {
  pqxx::params out;
  for (const auto& param : in) {
    std::visit([&](const auto& value) { out.append(value); }, param);
  }
  return out;
}

const std::string& ExtraOrEmpty(const model::DeviceRecord& r) {
  static const std::string kEmpty = "{}";
  return r.extra_info.empty() ? kEmpty : r.extra_info;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

// READ COMMITTED: the next statement after the lock sees the previous holder's commit.
Result PgRepository::LockDevice(Transaction& t, const std::string& ip) {
  try {
    TX(t).Work().exec_prepared("lock_device", ip);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_device", r.ip, r.mac, r.hostname, r.vendor, r.hostname_source, r.vendor_source, StatusText(r.status),
                               r.ping_latency_ms, r.first_seen_ms, r.last_seen_ms, r.scan_count, ExtraOrEmpty(r));
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_device", r.ip, r.mac, r.hostname, r.vendor, r.hostname_source, r.vendor_source,
                                          StatusText(r.status), r.ping_latency_ms, r.first_seen_ms, r.last_seen_ms, r.scan_count, ExtraOrEmpty(r));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "device " + r.ip);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeviceRecord> PgRepository::GetDevice(Transaction& t, const std::string& ip) {
  auto res = TX(t).Work().exec_prepared("get_device", ip);
  if (res.empty()) return std::nullopt;
  return ReadDevice(res[0]);
}

Result PgRepository::DeleteDevice(Transaction& t, const std::string& ip) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_device", ip);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DeviceRecord> PgRepository::ListDevices(Transaction& t, const DeviceFilter& filter, const std::optional<NativeOrder>& order,
                                                           const std::optional<Pagination>& page) {
  auto where = sql::BuildDeviceWhere(filter, sql::Dialect::kPostgres);

  std::string query = std::string("SELECT ") + sql::kDeviceColumns + " FROM devices" + where.sql;
  if (order) query += sql::BuildDeviceOrderBy(*order);
  if (page) {
    const auto next = where.params.size() + 1;
    query += " LIMIT $" + std::to_string(next) + " OFFSET $" + std::to_string(next + 1);
    where.params.emplace_back(static_cast<uint64_t>(page->limit));
    where.params.emplace_back(static_cast<uint64_t>(page->offset));
  }

  auto res = TX(t).Work().exec_params(query + ";", ToPqxx(where.params));

  std::vector<model::DeviceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDevice(row));
  return out;
}

uint64_t PgRepository::CountDevices(Transaction& t, const DeviceFilter& filter) {
  auto where = sql::BuildDeviceWhere(filter, sql::Dialect::kPostgres);
  auto res   = TX(t).Work().exec_params("SELECT COUNT(*) FROM devices" + where.sql + ";", ToPqxx(where.params));
  return res[0][0].as<uint64_t>();
}

std::vector<std::string> PgRepository::ListDeviceIps(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT ip FROM devices ORDER BY ip;");

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

StatusCounts PgRepository::CountByStatus(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT COUNT(*), "
      "COUNT(*) FILTER (WHERE status='online'), "
      "COUNT(*) FILTER (WHERE status='offline'), "
      "COUNT(*) FILTER (WHERE status='unknown'), "
      "MAX(last_seen_ms) FROM devices;");

  StatusCounts counts;
  counts.total            = res[0][0].as<uint64_t>();
  counts.online           = res[0][1].as<uint64_t>();
  counts.offline          = res[0][2].as<uint64_t>();
  counts.unknown          = res[0][3].as<uint64_t>();
  counts.max_last_seen_ms = OptU64(res[0][4]);
  return counts;
}

Result PgRepository::DeleteDevicesLastSeenBefore(Transaction& t, std::optional<uint64_t> cutoff_ms, std::optional<DeviceStatus> status) {
  std::string  query = "DELETE FROM devices WHERE TRUE";
  pqxx::params params;
  int          next = 1;
  if (status) {
    query += " AND status=$" + std::to_string(next++);
    params.append(StatusText(*status));
  }
  if (cutoff_ms) {
    query += " AND last_seen_ms < $" + std::to_string(next++);
    params.append(*cutoff_ms);
  }

  try {
    auto res = TX(t).Work().exec_params(query + ";", params);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result PgRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  try {
    TX(t).Work().exec_prepared("append_history", r.ip, StatusText(r.status), r.ping_latency_ms, r.seen_at_ms);
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::HistoryRecord> PgRepository::ListHistorySince(Transaction& t, uint64_t since_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT ip,status,ping_latency_ms,seen_at_ms FROM device_history WHERE seen_at_ms >= $1 ORDER BY seen_at_ms, id;", since_ms);

  std::vector<model::HistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadHistory(row));
  return out;
}

std::vector<model::HistoryRecord> PgRepository::ListDeviceHistory(Transaction& t, const std::string& ip, std::size_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT ip,status,ping_latency_ms,seen_at_ms FROM device_history WHERE ip=$1 ORDER BY seen_at_ms DESC, id DESC LIMIT $2;", ip,
      static_cast<uint64_t>(limit));

  std::vector<model::HistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadHistory(row));
  return out;
}

Result PgRepository::DeleteHistoryBefore(Transaction& t, std::optional<uint64_t> cutoff_ms) {
  try {
    auto res = cutoff_ms ? TX(t).Work().exec_params("DELETE FROM device_history WHERE seen_at_ms < $1;", *cutoff_ms)
                         : TX(t).Work().exec("DELETE FROM device_history;");
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Latency monitoring
// ------------------------------------------------------------------

Result PgRepository::UpsertMonitoring(Transaction& t, const model::MonitoringToggleRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO latency_monitoring(ip,enabled,updated_at_ms) VALUES($1,$2,$3) "
        "ON CONFLICT(ip) DO UPDATE SET enabled=EXCLUDED.enabled, updated_at_ms=EXCLUDED.updated_at_ms;",
        r.ip, r.enabled, r.updated_at_ms);
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MonitoringToggleRecord> PgRepository::GetMonitoring(Transaction& t, const std::string& ip) {
  auto res = TX(t).Work().exec_params("SELECT ip,enabled,updated_at_ms FROM latency_monitoring WHERE ip=$1;", ip);
  if (res.empty()) return std::nullopt;
  return model::MonitoringToggleRecord{res[0][0].c_str(), res[0][1].as<bool>(), res[0][2].as<uint64_t>()};
}

std::vector<model::MonitoringToggleRecord> PgRepository::ListMonitoring(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT ip,enabled,updated_at_ms FROM latency_monitoring ORDER BY ip;");

  std::vector<model::MonitoringToggleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({row[0].c_str(), row[1].as<bool>(), row[2].as<uint64_t>()});
  return out;
}

Result PgRepository::AppendLatency(Transaction& t, const model::LatencyRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO latency_measurements(ip,latency_ms,packet_loss,measured_at_ms) VALUES($1,$2,$3,$4);", r.ip, r.latency_ms,
                             r.packet_loss, r.measured_at_ms);
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LatencyRecord> PgRepository::ListLatencySince(Transaction& t, const std::string& ip, uint64_t since_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT ip,latency_ms,packet_loss,measured_at_ms FROM latency_measurements WHERE ip=$1 AND measured_at_ms >= $2 ORDER BY measured_at_ms, id;",
      ip, since_ms);

  std::vector<model::LatencyRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::LatencyRecord m;
    m.ip             = row[0].c_str();
    m.latency_ms     = OptDouble(row[1]);
    m.packet_loss    = row[2].as<bool>();
    m.measured_at_ms = row[3].as<uint64_t>();
    out.push_back(std::move(m));
  }
  return out;
}

Result PgRepository::DeleteLatencyBefore(Transaction& t, std::optional<uint64_t> cutoff_ms) {
  try {
    auto res = cutoff_ms ? TX(t).Work().exec_params("DELETE FROM latency_measurements WHERE measured_at_ms < $1;", *cutoff_ms)
                         : TX(t).Work().exec("DELETE FROM latency_measurements;");
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Vendors / settings
// ------------------------------------------------------------------

Result PgRepository::ReplaceVendors(Transaction& t, const std::vector<model::VendorRecord>& vendors) {
  try {
    auto& work = TX(t).Work();
    work.exec("DELETE FROM vendors;");
    for (const auto& v : vendors) {
      work.exec_params("INSERT INTO vendors(oui,vendor) VALUES($1,$2) ON CONFLICT(oui) DO UPDATE SET vendor=EXCLUDED.vendor;", v.oui, v.vendor);
    }
    auto res = work.exec("SELECT COUNT(*) FROM vendors;");
    return Result::Ok(res[0][0].as<uint64_t>());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::LookupVendor(Transaction& t, const std::string& oui) {
  auto res = TX(t).Work().exec_params("SELECT vendor FROM vendors WHERE oui=$1;", oui);
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

Result PgRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  try {
    TX(t).Work().exec_params("INSERT INTO settings(key,value) VALUES($1,$2) ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value;", key, value);
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::GetSetting(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_params("SELECT value FROM settings WHERE key=$1;", key);
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

StorageCounts PgRepository::CountStorage(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT (SELECT COUNT(*) FROM devices), (SELECT COUNT(*) FROM device_history), "
      "(SELECT COUNT(*) FROM latency_measurements), (SELECT COUNT(*) FROM vendors), "
      "(SELECT MIN(first_seen_ms) FROM devices), (SELECT MIN(seen_at_ms) FROM device_history);");

  StorageCounts counts;
  counts.devices              = res[0][0].as<uint64_t>();
  counts.history              = res[0][1].as<uint64_t>();
  counts.latency              = res[0][2].as<uint64_t>();
  counts.vendors              = res[0][3].as<uint64_t>();
  counts.oldest_first_seen_ms = OptU64(res[0][4]);
  counts.oldest_history_ms    = OptU64(res[0][5]);
  return counts;
}

Result PgRepository::Compact() {
  try {
    auto                 conn = pool_->Acquire();
    pqxx::nontransaction ntx(*conn);
    ntx.exec("VACUUM ANALYZE;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace netsweep::db::postgres
