#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/dataset_record.hpp"
#include "internal/db/model/schema_record.hpp"
#include "internal/db/model/status_record.hpp"
#include "internal/db/model/storage_box_record.hpp"
#include "internal/db/model/storage_object_record.hpp"
#include "internal/db/model/tracked_file_record.hpp"

namespace hsm::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - (namespace, file_id) is unique for status records; a second
    InsertStatus for the same pair returns AlreadyExists

  The DB is the source of truth for:
    file catalogue (files, replicas, storage boxes, datasets)
    registered namespaces
    online/offline status records
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // File catalogue
  // ---------------------------------------------------------------------

  virtual Result InsertFile(Transaction&, const model::TrackedFileRecord&) = 0;

  virtual Result UpdateFile(Transaction&, const model::TrackedFileRecord&) = 0;

  virtual std::optional<model::TrackedFileRecord> GetFile(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::TrackedFileRecord> ListFiles(Transaction&) = 0;

  virtual std::vector<model::TrackedFileRecord> ListFilesInDataset(Transaction&, const std::string& dataset_id) = 0;

  virtual Result InsertStorageBox(Transaction&, const model::StorageBoxRecord&) = 0;

  virtual std::optional<model::StorageBoxRecord> GetStorageBox(Transaction&, const std::string& name) = 0;

  virtual Result InsertStorageObject(Transaction&, const model::StorageObjectRecord&) = 0;

  virtual std::vector<model::StorageObjectRecord> ListStorageObjects(Transaction&, const std::string& file_id) = 0;

  virtual Result InsertDataset(Transaction&, const model::DatasetRecord&) = 0;

  virtual std::optional<model::DatasetRecord> GetDataset(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::DatasetRecord> ListDatasetsInExperiment(Transaction&, const std::string& experiment_id) = 0;

  // ---------------------------------------------------------------------
  // Namespaces
  // ---------------------------------------------------------------------

  virtual Result InsertSchema(Transaction&, const model::SchemaRecord&) = 0;

  virtual std::optional<model::SchemaRecord> GetSchema(Transaction&, const std::string& namespace_uri) = 0;

  // ---------------------------------------------------------------------
  // Status records
  // ---------------------------------------------------------------------

  virtual Result InsertStatus(Transaction&, const model::StatusRecord&) = 0;

  virtual std::optional<model::StatusRecord> GetStatus(Transaction&, const std::string& namespace_uri, const std::string& file_id) = 0;

  // NotFound if the record does not exist
  virtual Result UpdateStatus(Transaction&, const model::StatusRecord&) = 0;

  /*
    Keyset page of status records with the given value, ordered by file_id.
    Returns at most `limit` rows with file_id > after_file_id.
  */
  virtual std::vector<model::StatusRecord> ListStatusByValue(Transaction&, const std::string& namespace_uri, const std::string& value,
                                                             const std::string& after_file_id, std::size_t limit) = 0;
};

} // namespace hsm::db
