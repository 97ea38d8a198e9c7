#include "status_store.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace hsm::status {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

bool IsOnlineValue(const std::string& value) {
  return value == kOnlineValue;
}

} // namespace

const char* ToStatusValue(bool online) {
  return online ? kOnlineValue : kOfflineValue;
}

StatusStore::StatusStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) throw std::invalid_argument("StatusStore requires a repository");
}

bool StatusStore::EnsureNamespace(const std::string& namespace_uri, const std::string& name) {
  auto tx = repository_->Begin();
  if (repository_->GetSchema(*tx, namespace_uri).has_value()) {
    tx->Commit();
    return false;
  }

  db::model::SchemaRecord record;
  record.namespace_uri = namespace_uri;
  record.name          = name;

  auto result = repository_->InsertSchema(*tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  ThrowIfDbError(result, "register namespace " + namespace_uri);
  tx->Commit();
  return true;
}

void StatusStore::RequireNamespace(db::Transaction& tx, const std::string& namespace_uri) {
  if (!repository_->GetSchema(tx, namespace_uri).has_value()) {
    throw util::NotFound("status namespace not registered: " + namespace_uri);
  }
}

void StatusStore::RequireNamespace(const std::string& namespace_uri) {
  auto tx = repository_->Begin();
  RequireNamespace(*tx, namespace_uri);
  tx->Commit();
}

std::optional<bool> StatusStore::Get(const std::string& file_id, const std::string& namespace_uri) {
  auto tx = repository_->Begin();
  RequireNamespace(*tx, namespace_uri);
  auto record = repository_->GetStatus(*tx, namespace_uri, file_id);
  tx->Commit();

  if (!record.has_value()) return std::nullopt;
  return IsOnlineValue(record->value);
}

bool StatusStore::Create(const std::string& file_id, const std::string& namespace_uri, bool online) {
  auto tx = repository_->Begin();
  RequireNamespace(*tx, namespace_uri);

  db::model::StatusRecord record;
  record.namespace_uri = namespace_uri;
  record.file_id       = file_id;
  record.value         = ToStatusValue(online);
  record.updated_at_ms = util::ToUnixMillis(util::Now());

  auto result = repository_->InsertStatus(*tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  ThrowIfDbError(result, "create status for file " + file_id);
  tx->Commit();
  return true;
}

bool StatusStore::MarkOffline(const std::string& file_id, const std::string& namespace_uri) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetStatus(*tx, namespace_uri, file_id);
  if (!record.has_value() || !IsOnlineValue(record->value)) {
    tx->Commit();
    return false;
  }

  record->value         = kOfflineValue;
  record->updated_at_ms = util::ToUnixMillis(util::Now());
  ThrowIfDbError(repository_->UpdateStatus(*tx, *record), "mark file " + file_id + " offline");
  tx->Commit();
  return true;
}

std::vector<db::model::StatusRecord> StatusStore::OnlinePage(const std::string& namespace_uri, const std::string& after_file_id, std::size_t limit) {
  auto tx   = repository_->Begin();
  auto page = repository_->ListStatusByValue(*tx, namespace_uri, kOnlineValue, after_file_id, limit);
  tx->Commit();
  return page;
}

bool StatusStore::FileStatus(const std::string& file_id, const std::string& namespace_uri) {
  auto value = Get(file_id, namespace_uri);
  if (!value.has_value()) {
    throw util::NotFound("no status record for file " + file_id + " in " + namespace_uri);
  }
  return *value;
}

bool StatusStore::DatasetOnline(db::Transaction& tx, const std::string& dataset_id, const std::string& namespace_uri) {
  for (const auto& file : repository_->ListFilesInDataset(tx, dataset_id)) {
    auto record = repository_->GetStatus(tx, namespace_uri, file.id);
    if (!record.has_value() || !IsOnlineValue(record->value)) {
      return false;
    }
  }
  return true;
}

bool StatusStore::DatasetOnline(const std::string& dataset_id, const std::string& namespace_uri) {
  auto tx = repository_->Begin();
  RequireNamespace(*tx, namespace_uri);
  const bool online = DatasetOnline(*tx, dataset_id, namespace_uri);
  tx->Commit();
  return online;
}

bool StatusStore::ExperimentOnline(const std::string& experiment_id, const std::string& namespace_uri) {
  auto tx = repository_->Begin();
  RequireNamespace(*tx, namespace_uri);

  bool online = true;
  for (const auto& dataset : repository_->ListDatasetsInExperiment(*tx, experiment_id)) {
    if (!DatasetOnline(*tx, dataset.id, namespace_uri)) {
      online = false;
      break;
    }
  }
  tx->Commit();
  return online;
}

} // namespace hsm::status
