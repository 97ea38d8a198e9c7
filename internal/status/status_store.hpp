#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace hsm::status {

inline constexpr const char* kOnlineValue  = "True";
inline constexpr const char* kOfflineValue = "False";

const char* ToStatusValue(bool online);

/*
  Binding between online/offline booleans and persisted status records.

  Every operation that names a namespace first checks the namespace has a
  registered schema and throws util::NotFound otherwise. Each call runs in
  its own repository transaction.

  Records only ever move "True" -> "False" through MarkOffline(); nothing
  here rewrites a "False" record.
*/
class StatusStore {
 public:
  explicit StatusStore(std::shared_ptr<db::Repository> repository);

  // Registers the namespace schema if missing. Returns true if it was added.
  bool EnsureNamespace(const std::string& namespace_uri, const std::string& name);

  void RequireNamespace(const std::string& namespace_uri);

  std::optional<bool> Get(const std::string& file_id, const std::string& namespace_uri);

  bool Exists(const std::string& file_id, const std::string& namespace_uri) {
    return Get(file_id, namespace_uri).has_value();
  }

  // false when a record already exists for (namespace, file).
  bool Create(const std::string& file_id, const std::string& namespace_uri, bool online);

  /*
    Re-reads the record and flips it to "False" only while it still reads
    "True". Returns true when this call performed the flip.
  */
  bool MarkOffline(const std::string& file_id, const std::string& namespace_uri);

  // Keyset page of "True" records with file_id > after_file_id.
  std::vector<db::model::StatusRecord> OnlinePage(const std::string& namespace_uri, const std::string& after_file_id, std::size_t limit);

  // ------------------------------------------------------------------
  // Stored-status queries
  // ------------------------------------------------------------------

  // Stored value for the file; util::NotFound when no record exists.
  bool FileStatus(const std::string& file_id, const std::string& namespace_uri);

  // True iff every file in the dataset has a stored "True".
  bool DatasetOnline(const std::string& dataset_id, const std::string& namespace_uri);

  // True iff every dataset in the experiment is online.
  bool ExperimentOnline(const std::string& experiment_id, const std::string& namespace_uri);

 private:
  void RequireNamespace(db::Transaction& tx, const std::string& namespace_uri);
  bool DatasetOnline(db::Transaction& tx, const std::string& dataset_id, const std::string& namespace_uri);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace hsm::status
