#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace hsm::db::sqlite {

using hsm::db::ErrorCode;
using hsm::db::Result;

namespace {

void RequirePrepared(const Statement& st, sqlite3* db) {
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

void RequireDone(int rc, sqlite3* db) {
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

model::TrackedFileRecord ReadFile(const Statement& st) {
  model::TrackedFileRecord r;
  r.id         = st.ColText(0);
  r.dataset_id = st.ColText(1);
  r.filename   = st.ColText(2);
  r.verified   = st.ColBool(3);
  return r;
}

model::StatusRecord ReadStatus(const Statement& st) {
  model::StatusRecord r;
  r.namespace_uri = st.ColText(0);
  r.file_id       = st.ColText(1);
  r.value         = st.ColText(2);
  r.updated_at_ms = st.ColU64(3);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (sqlite3_extended_errcode(db)) {
        case SQLITE_CONSTRAINT_PRIMARYKEY:
        case SQLITE_CONSTRAINT_UNIQUE:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        default:
            break;
    }

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// File catalogue
// ------------------------------------------------------------------

Result SqliteRepository::InsertFile(Transaction& t, const model::TrackedFileRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO tracked_file(id,dataset_id,filename,verified) VALUES(?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    st.BindText(1, r.id);
    st.BindText(2, r.dataset_id);
    st.BindText(3, r.filename);
    st.BindBool(4, r.verified);

    return Translate(db, st.Step());
}

Result SqliteRepository::UpdateFile(Transaction& t, const model::TrackedFileRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE tracked_file SET dataset_id=?, filename=?, verified=? WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    st.BindText(1, r.dataset_id);
    st.BindText(2, r.filename);
    st.BindBool(3, r.verified);
    st.BindText(4, r.id);

    auto result = Translate(db, st.Step());
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "file " + r.id);
    return result;
}

std::optional<model::TrackedFileRecord> SqliteRepository::GetFile(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT id,dataset_id,filename,verified FROM tracked_file WHERE id=?;");
    RequirePrepared(st, db);
    st.BindText(1, id);

    int rc = st.Step();
    if (rc != SQLITE_ROW) {
        RequireDone(rc, db);
        return std::nullopt;
    }
    return ReadFile(st);
}

std::vector<model::TrackedFileRecord> SqliteRepository::ListFiles(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT id,dataset_id,filename,verified FROM tracked_file ORDER BY id;");
    RequirePrepared(st, db);

    std::vector<model::TrackedFileRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) out.push_back(ReadFile(st));
    RequireDone(rc, db);
    return out;
}

std::vector<model::TrackedFileRecord> SqliteRepository::ListFilesInDataset(Transaction& t, const std::string& dataset_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT id,dataset_id,filename,verified FROM tracked_file WHERE dataset_id=? ORDER BY id;");
    RequirePrepared(st, db);
    st.BindText(1, dataset_id);

    std::vector<model::TrackedFileRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) out.push_back(ReadFile(st));
    RequireDone(rc, db);
    return out;
}

Result SqliteRepository::InsertStorageBox(Transaction& t, const model::StorageBoxRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO storage_box(name,storage_class,location) VALUES(?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    st.BindText(1, r.name);
    st.BindText(2, r.storage_class);
    st.BindText(3, r.location);

    return Translate(db, st.Step());
}

std::optional<model::StorageBoxRecord> SqliteRepository::GetStorageBox(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT name,storage_class,location FROM storage_box WHERE name=?;");
    RequirePrepared(st, db);
    st.BindText(1, name);

    int rc = st.Step();
    if (rc != SQLITE_ROW) {
        RequireDone(rc, db);
        return std::nullopt;
    }

    model::StorageBoxRecord r;
    r.name          = st.ColText(0);
    r.storage_class = st.ColText(1);
    r.location      = st.ColText(2);
    return r;
}

Result SqliteRepository::InsertStorageObject(Transaction& t, const model::StorageObjectRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO storage_object(file_id,storage_box,uri,verified,preferred) VALUES(?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    st.BindText(1, r.file_id);
    st.BindText(2, r.storage_box);
    st.BindText(3, r.uri);
    st.BindBool(4, r.verified);
    st.BindBool(5, r.preferred);

    return Translate(db, st.Step());
}

std::vector<model::StorageObjectRecord> SqliteRepository::ListStorageObjects(Transaction& t, const std::string& file_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT file_id,storage_box,uri,verified,preferred FROM storage_object WHERE file_id=? ORDER BY storage_box;");
    RequirePrepared(st, db);
    st.BindText(1, file_id);

    std::vector<model::StorageObjectRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        model::StorageObjectRecord r;
        r.file_id     = st.ColText(0);
        r.storage_box = st.ColText(1);
        r.uri         = st.ColText(2);
        r.verified    = st.ColBool(3);
        r.preferred   = st.ColBool(4);
        out.push_back(std::move(r));
    }
    RequireDone(rc, db);
    return out;
}

std::vector<std::string> SqliteRepository::ExperimentsOf(sqlite3* db, const std::string& dataset_id) {
    Statement st(db, "SELECT experiment_id FROM dataset_experiment WHERE dataset_id=? ORDER BY experiment_id;");
    RequirePrepared(st, db);
    st.BindText(1, dataset_id);

    std::vector<std::string> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) out.push_back(st.ColText(0));
    RequireDone(rc, db);
    return out;
}

Result SqliteRepository::InsertDataset(Transaction& t, const model::DatasetRecord& r) {
    auto* db = TX(t).Handle();

    {
        Statement st(db, "INSERT INTO dataset(id) VALUES(?);");
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        st.BindText(1, r.id);
        auto result = Translate(db, st.Step());
        if (!result) return result;
    }

    for (const auto& experiment_id : r.experiment_ids) {
        Statement st(db, "INSERT INTO dataset_experiment(dataset_id,experiment_id) VALUES(?,?);");
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        st.BindText(1, r.id);
        st.BindText(2, experiment_id);
        auto result = Translate(db, st.Step());
        if (!result) return result;
    }
    return Result::Ok();
}

std::optional<model::DatasetRecord> SqliteRepository::GetDataset(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    {
        Statement st(db, "SELECT id FROM dataset WHERE id=?;");
        RequirePrepared(st, db);
        st.BindText(1, id);
        int rc = st.Step();
        if (rc != SQLITE_ROW) {
            RequireDone(rc, db);
            return std::nullopt;
        }
    }

    model::DatasetRecord r;
    r.id             = id;
    r.experiment_ids = ExperimentsOf(db, id);
    return r;
}

std::vector<model::DatasetRecord> SqliteRepository::ListDatasetsInExperiment(Transaction& t, const std::string& experiment_id) {
    auto* db = TX(t).Handle();

    std::vector<std::string> ids;
    {
        Statement st(db, "SELECT dataset_id FROM dataset_experiment WHERE experiment_id=? ORDER BY dataset_id;");
        RequirePrepared(st, db);
        st.BindText(1, experiment_id);
        int rc;
        while ((rc = st.Step()) == SQLITE_ROW) ids.push_back(st.ColText(0));
        RequireDone(rc, db);
    }

    std::vector<model::DatasetRecord> out;
    out.reserve(ids.size());
    for (auto& id : ids) {
        model::DatasetRecord r;
        r.experiment_ids = ExperimentsOf(db, id);
        r.id             = std::move(id);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Namespaces
// ------------------------------------------------------------------

Result SqliteRepository::InsertSchema(Transaction& t, const model::SchemaRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO hsm_schema(namespace,name) VALUES(?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    st.BindText(1, r.namespace_uri);
    st.BindText(2, r.name);

    return Translate(db, st.Step());
}

std::optional<model::SchemaRecord> SqliteRepository::GetSchema(Transaction& t, const std::string& namespace_uri) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT namespace,name FROM hsm_schema WHERE namespace=?;");
    RequirePrepared(st, db);
    st.BindText(1, namespace_uri);

    int rc = st.Step();
    if (rc != SQLITE_ROW) {
        RequireDone(rc, db);
        return std::nullopt;
    }

    model::SchemaRecord r;
    r.namespace_uri = st.ColText(0);
    r.name          = st.ColText(1);
    return r;
}

// ------------------------------------------------------------------
// Status records
// ------------------------------------------------------------------

Result SqliteRepository::InsertStatus(Transaction& t, const model::StatusRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO hsm_status(namespace,file_id,value,updated_at_ms) VALUES(?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    st.BindText(1, r.namespace_uri);
    st.BindText(2, r.file_id);
    st.BindText(3, r.value);
    st.BindU64(4, r.updated_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::StatusRecord> SqliteRepository::GetStatus(Transaction& t, const std::string& namespace_uri, const std::string& file_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT namespace,file_id,value,updated_at_ms FROM hsm_status WHERE namespace=? AND file_id=?;");
    RequirePrepared(st, db);
    st.BindText(1, namespace_uri);
    st.BindText(2, file_id);

    int rc = st.Step();
    if (rc != SQLITE_ROW) {
        RequireDone(rc, db);
        return std::nullopt;
    }
    return ReadStatus(st);
}

Result SqliteRepository::UpdateStatus(Transaction& t, const model::StatusRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE hsm_status SET value=?, updated_at_ms=? WHERE namespace=? AND file_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    st.BindText(1, r.value);
    st.BindU64(2, r.updated_at_ms);
    st.BindText(3, r.namespace_uri);
    st.BindText(4, r.file_id);

    auto result = Translate(db, st.Step());
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "status " + r.file_id);
    return result;
}

std::vector<model::StatusRecord> SqliteRepository::ListStatusByValue(Transaction& t, const std::string& namespace_uri, const std::string& value,
                                                                     const std::string& after_file_id, std::size_t limit) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "SELECT namespace,file_id,value,updated_at_ms FROM hsm_status "
                 "WHERE namespace=? AND value=? AND file_id>? ORDER BY file_id LIMIT ?;");
    RequirePrepared(st, db);
    st.BindText(1, namespace_uri);
    st.BindText(2, value);
    st.BindText(3, after_file_id);
    st.BindU64(4, limit);

    std::vector<model::StatusRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) out.push_back(ReadStatus(st));
    RequireDone(rc, db);
    return out;
}

} // namespace hsm::db::sqlite
