#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace hsm::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertFile(Transaction&, const model::TrackedFileRecord&) override;
  Result UpdateFile(Transaction&, const model::TrackedFileRecord&) override;
  std::optional<model::TrackedFileRecord> GetFile(Transaction&, const std::string&) override;
  std::vector<model::TrackedFileRecord> ListFiles(Transaction&) override;
  std::vector<model::TrackedFileRecord> ListFilesInDataset(Transaction&, const std::string&) override;

  Result InsertStorageBox(Transaction&, const model::StorageBoxRecord&) override;
  std::optional<model::StorageBoxRecord> GetStorageBox(Transaction&, const std::string&) override;

  Result InsertStorageObject(Transaction&, const model::StorageObjectRecord&) override;
  std::vector<model::StorageObjectRecord> ListStorageObjects(Transaction&, const std::string&) override;

  Result InsertDataset(Transaction&, const model::DatasetRecord&) override;
  std::optional<model::DatasetRecord> GetDataset(Transaction&, const std::string&) override;
  std::vector<model::DatasetRecord> ListDatasetsInExperiment(Transaction&, const std::string&) override;

  Result InsertSchema(Transaction&, const model::SchemaRecord&) override;
  std::optional<model::SchemaRecord> GetSchema(Transaction&, const std::string&) override;

  Result InsertStatus(Transaction&, const model::StatusRecord&) override;
  std::optional<model::StatusRecord> GetStatus(Transaction&, const std::string&, const std::string&) override;
  Result UpdateStatus(Transaction&, const model::StatusRecord&) override;
  std::vector<model::StatusRecord> ListStatusByValue(Transaction&, const std::string& namespace_uri, const std::string& value,
                                                     const std::string& after_file_id, std::size_t limit) override;

private:
  friend class MemoryTransaction;

  // (namespace, file_id)
  using StatusKey = std::pair<std::string, std::string>;

  // (file_id, storage_box)
  using ObjectKey = std::pair<std::string, std::string>;

  // ordered maps keep listings deterministic
  struct State {
    std::map<std::string, model::TrackedFileRecord> files;
    std::map<std::string, model::StorageBoxRecord> boxes;
    std::map<ObjectKey, model::StorageObjectRecord> objects;
    std::map<std::string, model::DatasetRecord> datasets;
    std::map<std::string, model::SchemaRecord> schemas;
    std::map<StatusKey, model::StatusRecord> statuses;
  };

  std::mutex mutex_;
  // held by the one transaction currently writing
  std::mutex writer_mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

} // namespace hsm::db::memory
