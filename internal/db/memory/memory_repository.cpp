#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace hsm::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// File catalogue
// ------------------------------------------------------------------

Result MemoryRepository::InsertFile(Transaction& t, const model::TrackedFileRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.files.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "file " + r.id);
  s.files[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateFile(Transaction& t, const model::TrackedFileRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.files.contains(r.id)) return Result::Err(ErrorCode::NotFound, "file " + r.id);
  s.files[r.id] = r;
  return Result::Ok();
}

std::optional<model::TrackedFileRecord> MemoryRepository::GetFile(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.files.find(id);
  if (it == s.files.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TrackedFileRecord> MemoryRepository::ListFiles(Transaction& t) {
  const auto&                           s = TX(t).View();
  std::vector<model::TrackedFileRecord> records;
  records.reserve(s.files.size());
  for (const auto& [_, record] : s.files) {
    records.push_back(record);
  }
  return records;
}

std::vector<model::TrackedFileRecord> MemoryRepository::ListFilesInDataset(Transaction& t, const std::string& dataset_id) {
  std::vector<model::TrackedFileRecord> records;
  for (const auto& [_, record] : TX(t).View().files) {
    if (record.dataset_id == dataset_id) records.push_back(record);
  }
  return records;
}

Result MemoryRepository::InsertStorageBox(Transaction& t, const model::StorageBoxRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.boxes.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "storage box " + r.name);
  s.boxes[r.name] = r;
  return Result::Ok();
}

std::optional<model::StorageBoxRecord> MemoryRepository::GetStorageBox(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.boxes.find(name);
  if (it == s.boxes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertStorageObject(Transaction& t, const model::StorageObjectRecord& r) {
  auto&     s = TX(t).Mutable();
  ObjectKey key{r.file_id, r.storage_box};
  if (s.objects.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "object " + r.file_id + "@" + r.storage_box);
  s.objects[key] = r;
  return Result::Ok();
}

std::vector<model::StorageObjectRecord> MemoryRepository::ListStorageObjects(Transaction& t, const std::string& file_id) {
  const auto&                             s = TX(t).View();
  std::vector<model::StorageObjectRecord> records;
  for (auto it = s.objects.lower_bound({file_id, ""}); it != s.objects.end() && it->first.first == file_id; ++it) {
    records.push_back(it->second);
  }
  return records;
}

Result MemoryRepository::InsertDataset(Transaction& t, const model::DatasetRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.datasets.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "dataset " + r.id);
  s.datasets[r.id] = r;
  return Result::Ok();
}

std::optional<model::DatasetRecord> MemoryRepository::GetDataset(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.datasets.find(id);
  if (it == s.datasets.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DatasetRecord> MemoryRepository::ListDatasetsInExperiment(Transaction& t, const std::string& experiment_id) {
  std::vector<model::DatasetRecord> records;
  for (const auto& [_, record] : TX(t).View().datasets) {
    if (std::find(record.experiment_ids.begin(), record.experiment_ids.end(), experiment_id) != record.experiment_ids.end()) {
      records.push_back(record);
    }
  }
  return records;
}

// ------------------------------------------------------------------
// Namespaces
// ------------------------------------------------------------------

Result MemoryRepository::InsertSchema(Transaction& t, const model::SchemaRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.schemas.contains(r.namespace_uri)) return Result::Err(ErrorCode::AlreadyExists, "schema " + r.namespace_uri);
  s.schemas[r.namespace_uri] = r;
  return Result::Ok();
}

std::optional<model::SchemaRecord> MemoryRepository::GetSchema(Transaction& t, const std::string& namespace_uri) {
  const auto& s  = TX(t).View();
  auto        it = s.schemas.find(namespace_uri);
  if (it == s.schemas.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Status records
// ------------------------------------------------------------------

Result MemoryRepository::InsertStatus(Transaction& t, const model::StatusRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.schemas.contains(r.namespace_uri)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown namespace " + r.namespace_uri);
  }
  StatusKey key{r.namespace_uri, r.file_id};
  if (s.statuses.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "status " + r.file_id);
  s.statuses[key] = r;
  return Result::Ok();
}

std::optional<model::StatusRecord> MemoryRepository::GetStatus(Transaction& t, const std::string& namespace_uri, const std::string& file_id) {
  const auto& s  = TX(t).View();
  auto        it = s.statuses.find({namespace_uri, file_id});
  if (it == s.statuses.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateStatus(Transaction& t, const model::StatusRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.statuses.find({r.namespace_uri, r.file_id});
  if (it == s.statuses.end()) return Result::Err(ErrorCode::NotFound, "status " + r.file_id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::StatusRecord> MemoryRepository::ListStatusByValue(Transaction& t, const std::string& namespace_uri, const std::string& value,
                                                                     const std::string& after_file_id, std::size_t limit) {
  const auto&                      s = TX(t).View();
  std::vector<model::StatusRecord> records;

  for (auto it = s.statuses.upper_bound({namespace_uri, after_file_id});
       it != s.statuses.end() && it->first.first == namespace_uri && records.size() < limit; ++it) {
    if (it->second.value == value) records.push_back(it->second);
  }
  return records;
}

} // namespace hsm::db::memory
