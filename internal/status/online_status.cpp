#include "online_status.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hsm::status {

using observability::StringField;
using observability::UIntField;

std::optional<db::model::StorageObjectRecord> PreferredObject(const std::vector<db::model::StorageObjectRecord>& objects) {
  if (objects.empty()) return std::nullopt;

  auto preferred = std::find_if(objects.begin(), objects.end(), [](const auto& o) { return o.preferred && o.verified; });
  if (preferred != objects.end()) return *preferred;

  auto verified = std::find_if(objects.begin(), objects.end(), [](const auto& o) { return o.verified; });
  if (verified != objects.end()) return *verified;

  return objects.front();
}

std::string JoinLocation(const std::string& location, const std::string& uri) {
  if (uri.empty()) return location;
  if (location.empty() || uri.front() == '/') return uri;
  if (location.back() == '/') return location + uri;
  return location + "/" + uri;
}

OnlineStatus::OnlineStatus(std::shared_ptr<db::Repository> repository, std::shared_ptr<backend::HsmRegistry> registry,
                           std::vector<std::string> storage_classes)
    : repository_(std::move(repository)), registry_(std::move(registry)), storage_classes_(std::move(storage_classes)) {
  if (!repository_ || !registry_) throw std::invalid_argument("OnlineStatus requires a repository and an HSM registry");
}

bool OnlineStatus::IsSupportedClass(const std::string& storage_class) const {
  return std::find(storage_classes_.begin(), storage_classes_.end(), storage_class) != storage_classes_.end();
}

ResolvedFile OnlineStatus::Resolve(const std::string& file_id) {
  auto tx   = repository_->Begin();
  auto file = repository_->GetFile(*tx, file_id);
  if (!file.has_value()) {
    throw util::NotFound("tracked file not found: " + file_id);
  }
  if (!file->verified) {
    throw util::Unverified("cannot check online status of unverified file " + file_id);
  }

  auto object = PreferredObject(repository_->ListStorageObjects(*tx, file_id));
  if (!object.has_value()) {
    throw util::MissingLocationError("file " + file_id + " has no storage object");
  }
  if (!object->verified) {
    throw util::Unverified("storage object of file " + file_id + " in box " + object->storage_box + " is not verified");
  }

  auto box = repository_->GetStorageBox(*tx, object->storage_box);
  tx->Commit();
  if (!box.has_value()) {
    throw util::MissingLocationError("storage box " + object->storage_box + " of file " + file_id + " does not exist");
  }

  if (!IsSupportedClass(box->storage_class)) {
    throw util::StorageClassNotSupportedError("storage class " + box->storage_class + " of box " + box->name +
                                              " is not supported; add it to hsm.storage_classes to enable online checks");
  }
  if (box->location.empty()) {
    throw util::MissingLocationError("storage box " + box->name + " has no location");
  }

  ResolvedFile resolved;
  resolved.target.file_id  = file_id;
  resolved.target.path     = JoinLocation(box->location, object->uri);
  resolved.target.verified = true;
  resolved.file            = std::move(*file);
  resolved.object          = std::move(*object);
  resolved.box             = std::move(*box);
  return resolved;
}

std::future<util::Outcome<bool>> OnlineStatus::Dispatch(const ResolvedFile& resolved) {
  auto checker = registry_->CheckerFor(resolved.box.name);

  auto promise = std::make_shared<std::promise<util::Outcome<bool>>>();
  auto future  = promise->get_future();
  checker->Online(resolved.target, [promise](util::Outcome<bool> outcome) { promise->set_value(std::move(outcome)); });
  return future;
}

bool OnlineStatus::CheckOnline(const std::string& file_id) {
  auto resolved = Resolve(file_id);
  return Dispatch(resolved).get().GetOrThrow();
}

std::vector<backend::RetrieveEntry> OnlineStatus::Retrieve(const std::vector<std::string>& file_ids) {
  std::vector<backend::RetrieveEntry> results(file_ids.size());

  struct Group {
    std::vector<backend::StorageObject> objects;
    std::vector<std::size_t>            positions;
  };
  std::map<std::string, Group> by_box;

  for (std::size_t i = 0; i < file_ids.size(); ++i) {
    results[i].file_id = file_ids[i];
    try {
      auto  resolved = Resolve(file_ids[i]);
      auto& group    = by_box[resolved.box.name];
      group.objects.push_back(resolved.target);
      group.positions.push_back(i);
    } catch (const std::exception& e) {
      HSM_LOG_WARN("Retrieve skipped file", {StringField("file_id", file_ids[i]), StringField("error", e.what())});
      results[i].outcome = util::Outcome<bool>::Failure(std::current_exception());
    }
  }

  for (auto& [box, group] : by_box) {
    auto promise = std::make_shared<std::promise<std::vector<backend::RetrieveEntry>>>();
    auto future  = promise->get_future();

    try {
      registry_->RetrieverFor(box)->RetrieveBatch(group.objects,
                                                  [promise](std::vector<backend::RetrieveEntry> entries) { promise->set_value(std::move(entries)); });
    } catch (const std::exception& e) {
      HSM_LOG_WARN("Retrieve failed for storage box", {StringField("storage_box", box), StringField("error", e.what())});
      for (auto position : group.positions) {
        results[position].outcome = util::Outcome<bool>::Failure(std::current_exception());
      }
      continue;
    }

    auto entries = future.get();
    for (std::size_t j = 0; j < entries.size() && j < group.positions.size(); ++j) {
      results[group.positions[j]].outcome = std::move(entries[j].outcome);
    }
    HSM_LOG_DEBUG("Retrieve batch complete", {StringField("storage_box", box), UIntField("files", group.objects.size())});
  }

  return results;
}

} // namespace hsm::status
