#include "schema.hpp"

namespace netsweep::db::sql {

const std::vector<std::string>& BootstrapStatements(Dialect dialect) {
  static const std::vector<std::string> kSqlite = {
      "CREATE TABLE IF NOT EXISTS devices (ip TEXT PRIMARY KEY, mac TEXT, hostname TEXT, vendor TEXT, hostname_source TEXT, vendor_source TEXT, "
      "status TEXT NOT NULL CHECK (status IN ('online','offline','unknown')), ping_latency_ms REAL, first_seen_ms INTEGER NOT NULL, "
      "last_seen_ms INTEGER NOT NULL, scan_count INTEGER NOT NULL DEFAULT 1, extra_info TEXT NOT NULL DEFAULT '{}');",
      "CREATE INDEX IF NOT EXISTS idx_devices_status ON devices(status);",
      "CREATE INDEX IF NOT EXISTS idx_devices_last_seen ON devices(last_seen_ms);",
      "CREATE TABLE IF NOT EXISTS device_history (id INTEGER PRIMARY KEY AUTOINCREMENT, ip TEXT NOT NULL, status TEXT NOT NULL, "
      "ping_latency_ms REAL, seen_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_history_seen_at ON device_history(seen_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_history_ip ON device_history(ip, seen_at_ms);",
      "CREATE TABLE IF NOT EXISTS latency_measurements (id INTEGER PRIMARY KEY AUTOINCREMENT, ip TEXT NOT NULL, latency_ms REAL, "
      "packet_loss INTEGER NOT NULL DEFAULT 0, measured_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_latency_ip_time ON latency_measurements(ip, measured_at_ms);",
      "CREATE TABLE IF NOT EXISTS latency_monitoring (ip TEXT PRIMARY KEY, enabled INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS vendors (oui TEXT PRIMARY KEY, vendor TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
  };

  static const std::vector<std::string> kPostgres = {
      "CREATE TABLE IF NOT EXISTS devices (ip TEXT PRIMARY KEY, mac TEXT, hostname TEXT, vendor TEXT, hostname_source TEXT, vendor_source TEXT, "
      "status TEXT NOT NULL CHECK (status IN ('online','offline','unknown')), ping_latency_ms DOUBLE PRECISION, first_seen_ms BIGINT NOT NULL, "
      "last_seen_ms BIGINT NOT NULL, scan_count BIGINT NOT NULL DEFAULT 1, extra_info JSONB NOT NULL DEFAULT '{}'::jsonb);",
      "CREATE INDEX IF NOT EXISTS idx_devices_status ON devices(status);",
      "CREATE INDEX IF NOT EXISTS idx_devices_last_seen ON devices(last_seen_ms);",
      "CREATE TABLE IF NOT EXISTS device_history (id BIGSERIAL PRIMARY KEY, ip TEXT NOT NULL, status TEXT NOT NULL, ping_latency_ms DOUBLE PRECISION, "
      "seen_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_history_seen_at ON device_history(seen_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_history_ip ON device_history(ip, seen_at_ms);",
      "CREATE TABLE IF NOT EXISTS latency_measurements (id BIGSERIAL PRIMARY KEY, ip TEXT NOT NULL, latency_ms DOUBLE PRECISION, "
      "packet_loss BOOLEAN NOT NULL DEFAULT FALSE, measured_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_latency_ip_time ON latency_measurements(ip, measured_at_ms);",
      "CREATE TABLE IF NOT EXISTS latency_monitoring (ip TEXT PRIMARY KEY, enabled BOOLEAN NOT NULL DEFAULT FALSE, updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS vendors (oui TEXT PRIMARY KEY, vendor TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
  };

  return dialect == Dialect::kSqlite ? kSqlite : kPostgres;
}

} // namespace netsweep::db::sql
