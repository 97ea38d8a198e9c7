#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/backend/hsm_backend.hpp"
#include "internal/backend/hsm_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/outcome.hpp"

namespace hsm::status {

/*
  A tracked file resolved down to the replica an HSM backend should look at.
*/
struct ResolvedFile {
  db::model::TrackedFileRecord   file;
  db::model::StorageObjectRecord object;
  db::model::StorageBoxRecord    box;

  // location joined with the replica uri
  backend::StorageObject target;
};

/*
  Preferred verified replica, else the first verified one, else the first
  one. nullopt when the file has no replicas.
*/
std::optional<db::model::StorageObjectRecord> PreferredObject(const std::vector<db::model::StorageObjectRecord>& objects);

std::string JoinLocation(const std::string& location, const std::string& uri);

/*
  Live online/offline checks and recalls for tracked files.

  Resolve() enforces, in order:
    file exists                        else util::NotFound
    file verified                      else util::Unverified
    file has a replica                 else util::MissingLocationError
    chosen replica verified            else util::Unverified
    box storage class is supported     else util::StorageClassNotSupportedError
    box has a location                 else util::MissingLocationError

  Dispatch() picks the checker registered for the replica's storage box
  (util::MultipleConfigError when ambiguous) and hands the check to it. The
  returned future completes when the backend delivers its Outcome; it must
  not be waited on from the pool's delivery thread.
*/
class OnlineStatus {
 public:
  OnlineStatus(std::shared_ptr<db::Repository> repository, std::shared_ptr<backend::HsmRegistry> registry, std::vector<std::string> storage_classes);

  ResolvedFile Resolve(const std::string& file_id);

  std::future<util::Outcome<bool>> Dispatch(const ResolvedFile& resolved);

  // Resolve + Dispatch + wait. Nothing is persisted.
  bool CheckOnline(const std::string& file_id);

  /*
    Recalls each file through the retriever of its storage box. One entry
    per input id, in input order; resolution failures are reported as
    failed entries rather than thrown.
  */
  std::vector<backend::RetrieveEntry> Retrieve(const std::vector<std::string>& file_ids);

  bool IsSupportedClass(const std::string& storage_class) const;

  const std::vector<std::string>& StorageClasses() const {
    return storage_classes_;
  }

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<backend::HsmRegistry> registry_;
  std::vector<std::string>              storage_classes_;
};

} // namespace hsm::status
