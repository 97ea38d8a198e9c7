#pragma once

#include "sqlite_db.hpp"

namespace hsm::db::sqlite {

/*
  Creates the catalogue, status and cache tables if missing, then probes
  each table so a stale database file fails at startup instead of on the
  first request.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace hsm::db::sqlite
