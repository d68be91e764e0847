#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/db/sql/device_sql.hpp"

namespace netsweep::db::sqlite {

using netsweep::db::ErrorCode;
using netsweep::db::Result;
using netsweep::model::DeviceStatus;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

int PrepareStmt(sqlite3* db, const std::string& sql, Stmt& out) {
  sqlite3_stmt* raw = nullptr;
  const int     rc  = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr);
  out.reset(raw);
  return rc;
}

// Reads have no Result channel; a statement that cannot run is a hard error.
Stmt PrepareOrThrow(sqlite3* db, const std::string& sql) {
  Stmt st;
  if (PrepareStmt(db, sql, st) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindParams(sqlite3_stmt* st, const sql::Params& params, int first_index = 1) {
  int idx = first_index;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(st, idx);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(st, idx, value);
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            BindU64(st, idx, value);
          } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(st, idx, value);
          } else {
            BindText(st, idx, value);
          }
        },
        param);
    ++idx;
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

DeviceStatus ColStatus(sqlite3_stmt* st, int col) {
  return netsweep::model::ParseDeviceStatus(ColText(st, col)).value_or(DeviceStatus::kUnknown);
}

model::DeviceRecord ReadDevice(sqlite3_stmt* st) {
  model::DeviceRecord r;
  r.ip              = ColText(st, 0);
  r.mac             = ColOptText(st, 1);
  r.hostname        = ColOptText(st, 2);
  r.vendor          = ColOptText(st, 3);
  r.hostname_source = ColOptText(st, 4);
  r.vendor_source   = ColOptText(st, 5);
  r.status          = ColStatus(st, 6);
  r.ping_latency_ms = ColOptDouble(st, 7);
  r.first_seen_ms   = ColU64(st, 8);
  r.last_seen_ms    = ColU64(st, 9);
  r.scan_count      = ColU64(st, 10);
  r.extra_info      = ColText(st, 11);
  return r;
}

// Binds the twelve device columns in kDeviceColumns order starting at idx 1.
void BindDevice(sqlite3_stmt* st, const model::DeviceRecord& r) {
  BindText(st, 1, r.ip);
  BindOptText(st, 2, r.mac);
  BindOptText(st, 3, r.hostname);
  BindOptText(st, 4, r.vendor);
  BindOptText(st, 5, r.hostname_source);
  BindOptText(st, 6, r.vendor_source);
  BindText(st, 7, std::string(netsweep::model::ToString(r.status)));
  BindOptDouble(st, 8, r.ping_latency_ms);
  BindU64(st, 9, r.first_seen_ms);
  BindU64(st, 10, r.last_seen_ms);
  BindU64(st, 11, r.scan_count);
  BindText(st, 12, r.extra_info.empty() ? "{}" : r.extra_info);
}

model::HistoryRecord ReadHistory(sqlite3_stmt* st) {
  model::HistoryRecord h;
  h.ip              = ColText(st, 0);
  h.status          = ColStatus(st, 1);
  h.ping_latency_ms = ColOptDouble(st, 2);
  h.seen_at_ms      = ColU64(st, 3);
  return h;
}

uint64_t CountRows(sqlite3* db, const char* sql) {
  auto st = PrepareOrThrow(db, sql);
  return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

// BEGIN IMMEDIATE already holds the database write lock for every connection.
Result SqliteRepository::LockDevice(Transaction&, const std::string&) {
  return Result::Ok();
}

Result SqliteRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db, std::string("INSERT INTO devices(") + sql::kDeviceColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindDevice(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db,
                        "UPDATE devices SET mac=?2,hostname=?3,vendor=?4,hostname_source=?5,vendor_source=?6,status=?7,ping_latency_ms=?8,"
                         "first_seen_ms=?9,last_seen_ms=?10,scan_count=?11,extra_info=?12 WHERE ip=?1;",
                        st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindDevice(st.get(), r);
  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && result.affected == 0) return Result::Err(ErrorCode::NotFound, "device " + r.ip);
  return result;
}

std::optional<model::DeviceRecord> SqliteRepository::GetDevice(Transaction& t, const std::string& ip) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + sql::kDeviceColumns + " FROM devices WHERE ip=?;");
  BindText(st.get(), 1, ip);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadDevice(st.get());
}

Result SqliteRepository::DeleteDevice(Transaction& t, const std::string& ip) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db, "DELETE FROM devices WHERE ip=?;", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, ip);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::DeviceRecord> SqliteRepository::ListDevices(Transaction& t, const DeviceFilter& filter, const std::optional<NativeOrder>& order,
                                                               const std::optional<Pagination>& page) {
  auto* db    = TX(t).Handle();
  auto  where = sql::BuildDeviceWhere(filter, sql::Dialect::kSqlite);

  std::string query = std::string("SELECT ") + sql::kDeviceColumns + " FROM devices" + where.sql;
  if (order) query += sql::BuildDeviceOrderBy(*order);
  if (page) {
    query += " LIMIT ? OFFSET ?";
    where.params.emplace_back(static_cast<uint64_t>(page->limit));
    where.params.emplace_back(static_cast<uint64_t>(page->offset));
  }

  auto st = PrepareOrThrow(db, query + ";");
  BindParams(st.get(), where.params);

  std::vector<model::DeviceRecord> out;
  while (StepRow(db, st.get())) out.push_back(ReadDevice(st.get()));
  return out;
}

uint64_t SqliteRepository::CountDevices(Transaction& t, const DeviceFilter& filter) {
  auto* db    = TX(t).Handle();
  auto  where = sql::BuildDeviceWhere(filter, sql::Dialect::kSqlite);
  auto  st    = PrepareOrThrow(db, "SELECT COUNT(*) FROM devices" + where.sql + ";");
  BindParams(st.get(), where.params);
  return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

std::vector<std::string> SqliteRepository::ListDeviceIps(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT ip FROM devices ORDER BY ip;");

  std::vector<std::string> out;
  while (StepRow(db, st.get())) out.push_back(ColText(st.get(), 0));
  return out;
}

StatusCounts SqliteRepository::CountByStatus(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT COUNT(*), "
                             "COALESCE(SUM(CASE WHEN status='online' THEN 1 ELSE 0 END),0), "
                             "COALESCE(SUM(CASE WHEN status='offline' THEN 1 ELSE 0 END),0), "
                             "COALESCE(SUM(CASE WHEN status='unknown' THEN 1 ELSE 0 END),0), "
                             "MAX(last_seen_ms) FROM devices;");

  StatusCounts counts;
  if (StepRow(db, st.get())) {
    counts.total            = ColU64(st.get(), 0);
    counts.online           = ColU64(st.get(), 1);
    counts.offline          = ColU64(st.get(), 2);
    counts.unknown          = ColU64(st.get(), 3);
    counts.max_last_seen_ms = ColOptU64(st.get(), 4);
  }
  return counts;
}

Result SqliteRepository::DeleteDevicesLastSeenBefore(Transaction& t, std::optional<uint64_t> cutoff_ms, std::optional<DeviceStatus> status) {
  auto* db = TX(t).Handle();

  std::string query = "DELETE FROM devices WHERE 1=1";
  if (status) query += " AND status=?";
  if (cutoff_ms) query += " AND last_seen_ms < ?";

  Stmt st;
  int  rc = PrepareStmt(db, query + ";", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  int idx = 1;
  if (status) BindText(st.get(), idx++, std::string(netsweep::model::ToString(*status)));
  if (cutoff_ms) BindU64(st.get(), idx++, *cutoff_ms);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db, "INSERT INTO device_history(ip,status,ping_latency_ms,seen_at_ms) VALUES(?,?,?,?);", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, r.ip);
  BindText(st.get(), 2, std::string(netsweep::model::ToString(r.status)));
  BindOptDouble(st.get(), 3, r.ping_latency_ms);
  BindU64(st.get(), 4, r.seen_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::HistoryRecord> SqliteRepository::ListHistorySince(Transaction& t, uint64_t since_ms) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT ip,status,ping_latency_ms,seen_at_ms FROM device_history WHERE seen_at_ms >= ? ORDER BY seen_at_ms, id;");
  BindU64(st.get(), 1, since_ms);

  std::vector<model::HistoryRecord> out;
  while (StepRow(db, st.get())) out.push_back(ReadHistory(st.get()));
  return out;
}

std::vector<model::HistoryRecord> SqliteRepository::ListDeviceHistory(Transaction& t, const std::string& ip, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT ip,status,ping_latency_ms,seen_at_ms FROM device_history WHERE ip=? ORDER BY seen_at_ms DESC, id DESC LIMIT ?;");
  BindText(st.get(), 1, ip);
  BindU64(st.get(), 2, limit);

  std::vector<model::HistoryRecord> out;
  while (StepRow(db, st.get())) out.push_back(ReadHistory(st.get()));
  return out;
}

Result SqliteRepository::DeleteHistoryBefore(Transaction& t, std::optional<uint64_t> cutoff_ms) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db, cutoff_ms ? "DELETE FROM device_history WHERE seen_at_ms < ?;" : "DELETE FROM device_history;", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  if (cutoff_ms) BindU64(st.get(), 1, *cutoff_ms);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Latency monitoring
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMonitoring(Transaction& t, const model::MonitoringToggleRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db,
                        "INSERT INTO latency_monitoring(ip,enabled,updated_at_ms) VALUES(?,?,?) "
                         "ON CONFLICT(ip) DO UPDATE SET enabled=excluded.enabled, updated_at_ms=excluded.updated_at_ms;",
                        st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, r.ip);
  sqlite3_bind_int(st.get(), 2, r.enabled ? 1 : 0);
  BindU64(st.get(), 3, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MonitoringToggleRecord> SqliteRepository::GetMonitoring(Transaction& t, const std::string& ip) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT ip,enabled,updated_at_ms FROM latency_monitoring WHERE ip=?;");
  BindText(st.get(), 1, ip);

  if (!StepRow(db, st.get())) return std::nullopt;
  return model::MonitoringToggleRecord{ColText(st.get(), 0), sqlite3_column_int(st.get(), 1) != 0, ColU64(st.get(), 2)};
}

std::vector<model::MonitoringToggleRecord> SqliteRepository::ListMonitoring(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT ip,enabled,updated_at_ms FROM latency_monitoring ORDER BY ip;");

  std::vector<model::MonitoringToggleRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back({ColText(st.get(), 0), sqlite3_column_int(st.get(), 1) != 0, ColU64(st.get(), 2)});
  }
  return out;
}

Result SqliteRepository::AppendLatency(Transaction& t, const model::LatencyRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db, "INSERT INTO latency_measurements(ip,latency_ms,packet_loss,measured_at_ms) VALUES(?,?,?,?);", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, r.ip);
  BindOptDouble(st.get(), 2, r.latency_ms);
  sqlite3_bind_int(st.get(), 3, r.packet_loss ? 1 : 0);
  BindU64(st.get(), 4, r.measured_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::LatencyRecord> SqliteRepository::ListLatencySince(Transaction& t, const std::string& ip, uint64_t since_ms) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(
      db, "SELECT ip,latency_ms,packet_loss,measured_at_ms FROM latency_measurements WHERE ip=? AND measured_at_ms >= ? ORDER BY measured_at_ms, id;");
  BindText(st.get(), 1, ip);
  BindU64(st.get(), 2, since_ms);

  std::vector<model::LatencyRecord> out;
  while (StepRow(db, st.get())) {
    model::LatencyRecord m;
    m.ip             = ColText(st.get(), 0);
    m.latency_ms     = ColOptDouble(st.get(), 1);
    m.packet_loss    = sqlite3_column_int(st.get(), 2) != 0;
    m.measured_at_ms = ColU64(st.get(), 3);
    out.push_back(std::move(m));
  }
  return out;
}

Result SqliteRepository::DeleteLatencyBefore(Transaction& t, std::optional<uint64_t> cutoff_ms) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db, cutoff_ms ? "DELETE FROM latency_measurements WHERE measured_at_ms < ?;" : "DELETE FROM latency_measurements;", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  if (cutoff_ms) BindU64(st.get(), 1, *cutoff_ms);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Vendors / settings
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceVendors(Transaction& t, const std::vector<model::VendorRecord>& vendors) {
  auto* db = TX(t).Handle();

  Stmt clear;
  int  rc = PrepareStmt(db, "DELETE FROM vendors;", clear);
  if (rc != SQLITE_OK) return Translate(db, rc);
  rc = sqlite3_step(clear.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  Stmt st;
  rc = PrepareStmt(db, "INSERT OR REPLACE INTO vendors(oui,vendor) VALUES(?,?);", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  for (const auto& v : vendors) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, v.oui);
    BindText(st.get(), 2, v.vendor);
    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok(CountRows(db, "SELECT COUNT(*) FROM vendors;"));
}

std::optional<std::string> SqliteRepository::LookupVendor(Transaction& t, const std::string& oui) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT vendor FROM vendors WHERE oui=?;");
  BindText(st.get(), 1, oui);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ColText(st.get(), 0);
}

Result SqliteRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  auto* db = TX(t).Handle();

  Stmt st;
  int  rc = PrepareStmt(db, "INSERT INTO settings(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<std::string> SqliteRepository::GetSetting(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT value FROM settings WHERE key=?;");
  BindText(st.get(), 1, key);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ColText(st.get(), 0);
}

StorageCounts SqliteRepository::CountStorage(Transaction& t) {
  auto* db = TX(t).Handle();

  StorageCounts counts;
  counts.devices = CountRows(db, "SELECT COUNT(*) FROM devices;");
  counts.history = CountRows(db, "SELECT COUNT(*) FROM device_history;");
  counts.latency = CountRows(db, "SELECT COUNT(*) FROM latency_measurements;");
  counts.vendors = CountRows(db, "SELECT COUNT(*) FROM vendors;");

  auto st = PrepareOrThrow(db, "SELECT (SELECT MIN(first_seen_ms) FROM devices), (SELECT MIN(seen_at_ms) FROM device_history);");
  if (StepRow(db, st.get())) {
    counts.oldest_first_seen_ms = ColOptU64(st.get(), 0);
    counts.oldest_history_ms    = ColOptU64(st.get(), 1);
  }
  return counts;
}

Result SqliteRepository::Compact() {
  auto lock = db_->LockTransaction();
  try {
    db_->Exec("VACUUM;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
}

} // namespace netsweep::db::sqlite
