#include "pg_pool.hpp"

#include "internal/db/sql/device_sql.hpp"

namespace netsweep::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string columns = sql::kDeviceColumns;

  conn.prepare("lock_device", "SELECT pg_advisory_xact_lock(hashtext($1))");

  conn.prepare("get_device", "SELECT " + columns + " FROM devices WHERE ip=$1");

  conn.prepare("insert_device", "INSERT INTO devices(" + columns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12::jsonb)");

  conn.prepare("update_device",
               "UPDATE devices SET mac=$2,hostname=$3,vendor=$4,hostname_source=$5,vendor_source=$6,status=$7,ping_latency_ms=$8,"
               "first_seen_ms=$9,last_seen_ms=$10,scan_count=$11,extra_info=$12::jsonb WHERE ip=$1");

  conn.prepare("delete_device", "DELETE FROM devices WHERE ip=$1");

  conn.prepare("append_history", "INSERT INTO device_history(ip,status,ping_latency_ms,seen_at_ms) VALUES($1,$2,$3,$4)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace netsweep::db::postgres
