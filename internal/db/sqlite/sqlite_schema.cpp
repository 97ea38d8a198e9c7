#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace hsm::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS tracked_file (id TEXT PRIMARY KEY, dataset_id TEXT NOT NULL DEFAULT '', filename TEXT NOT NULL DEFAULT '', verified INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS storage_box (name TEXT PRIMARY KEY, storage_class TEXT NOT NULL, location TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS storage_object (file_id TEXT NOT NULL REFERENCES tracked_file(id) ON DELETE CASCADE, storage_box TEXT NOT NULL REFERENCES storage_box(name), uri TEXT NOT NULL, verified INTEGER NOT NULL DEFAULT 0, preferred INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (file_id, storage_box));",
      "CREATE TABLE IF NOT EXISTS dataset (id TEXT PRIMARY KEY);",
      "CREATE TABLE IF NOT EXISTS dataset_experiment (dataset_id TEXT NOT NULL REFERENCES dataset(id) ON DELETE CASCADE, experiment_id TEXT NOT NULL, PRIMARY KEY (dataset_id, experiment_id));",
      "CREATE TABLE IF NOT EXISTS hsm_schema (namespace TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS hsm_status (namespace TEXT NOT NULL REFERENCES hsm_schema(namespace), file_id TEXT NOT NULL, value TEXT NOT NULL CHECK (value IN ('True','False')), updated_at_ms INTEGER NOT NULL, PRIMARY KEY (namespace, file_id));",
      "CREATE TABLE IF NOT EXISTS hsm_cache (key TEXT PRIMARY KEY, value TEXT NOT NULL, expires_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,dataset_id,filename,verified FROM tracked_file LIMIT 1;");
  db.Exec("SELECT file_id,storage_box,uri,verified,preferred FROM storage_object LIMIT 1;");
  db.Exec("SELECT namespace,file_id,value,updated_at_ms FROM hsm_status LIMIT 1;");
  db.Exec("SELECT key,value,expires_at_ms FROM hsm_cache LIMIT 1;");
}

} // namespace hsm::db::sqlite
