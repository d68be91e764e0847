#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace netsweep::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3 connection.

  The connection is shared by every transaction of the process, so
  transactions take the writer lock for their whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  std::unique_lock<std::mutex> LockTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace netsweep::db::sqlite
