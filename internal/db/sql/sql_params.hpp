#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace netsweep::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so one parameter list serves either backend.
*/

using Param = std::variant<std::nullptr_t, int64_t, uint64_t, double, std::string>;

using Params = std::vector<Param>;

enum class Dialect {
  kSqlite,
  kPostgres,
};

// SQL text plus the parameters its placeholders refer to, in order.
struct Fragment {
  std::string sql;
  Params      params;
};

} // namespace netsweep::db::sql
