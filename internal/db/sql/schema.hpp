#pragma once

#include <string>
#include <vector>

#include "internal/db/sql/sql_params.hpp"

namespace netsweep::db::sql {

/*
  Idempotent bootstrap DDL (CREATE ... IF NOT EXISTS) per dialect.
  Executed in order by the factory and by the integration tests.
*/
const std::vector<std::string>& BootstrapStatements(Dialect dialect);

} // namespace netsweep::db::sql
