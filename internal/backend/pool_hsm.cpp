#include "pool_hsm.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/probe/online_classifier.hpp"
#include "internal/util/errors.hpp"

namespace hsm::backend {

using hsm::observability::StringField;

namespace {

void RequireVerified(const StorageObject& object) {
  if (!object.verified) {
    throw util::Unverified("storage object for file " + object.file_id + " is not verified");
  }
}

// Collects per-object results; fires the callback once the last one lands.
struct BatchState {
  std::mutex                 mutex;
  std::vector<RetrieveEntry> entries;
  std::size_t                remaining = 0;
  BatchCallback              callback;
};

void Complete(const std::shared_ptr<BatchState>& state, std::size_t index, util::Outcome<bool> outcome) {
  std::vector<RetrieveEntry> finished;
  {
    std::lock_guard lock(state->mutex);
    state->entries[index].outcome = std::move(outcome);
    if (--state->remaining != 0) {
      return;
    }
    finished = std::move(state->entries);
  }
  state->callback(std::move(finished));
}

} // namespace

PoolHsm::PoolHsm(std::shared_ptr<worker::WorkerPool> pool, probe::StatProbe probe, uint64_t min_file_size_bytes)
    : pool_(std::move(pool)), probe_(std::move(probe)), min_file_size_bytes_(min_file_size_bytes) {
  if (!pool_) {
    throw std::invalid_argument("PoolHsm requires a worker pool");
  }
}

// ------------------------------------------------------------
// Online
// ------------------------------------------------------------

void PoolHsm::Online(const StorageObject& object, OnlineCallback callback) {
  RequireVerified(object);

  const auto threshold = object.min_file_size_bytes.value_or(min_file_size_bytes_);
  pool_->Submit(
      [probe = probe_, path = object.path, threshold] {
        const auto result = probe.ProbeOrThrow(path);
        return probe::IsOnline(result, threshold);
      },
      std::move(callback));
}

// ------------------------------------------------------------
// Retrieve
// ------------------------------------------------------------

bool PoolHsm::ReadFirstByte(const std::string& path) {
  int fd = -1;
  do {
    fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);

  if (fd < 0) {
    throw util::RetrieveError("open failed for " + path + ": " + std::strerror(errno));
  }

  char    byte = 0;
  ssize_t n    = 0;
  do {
    n = ::read(fd, &byte, 1);
  } while (n < 0 && errno == EINTR);

  const int read_errno = errno;
  ::close(fd);

  if (n < 0) {
    throw util::RetrieveError("read failed for " + path + ": " + std::strerror(read_errno));
  }
  return true;
}

void PoolHsm::Retrieve(const StorageObject& object, RetrieveCallback callback) {
  RequireVerified(object);

  HSM_LOG_DEBUG("Retrieve scheduled", {StringField("file_id", object.file_id), StringField("path", object.path)});
  pool_->Submit([path = object.path] { return ReadFirstByte(path); }, std::move(callback));
}

void PoolHsm::RetrieveBatch(const std::vector<StorageObject>& objects, BatchCallback callback) {
  auto state       = std::make_shared<BatchState>();
  state->callback  = std::move(callback);
  state->remaining = objects.size();
  state->entries.reserve(objects.size());
  for (const auto& object : objects) {
    state->entries.push_back({object.file_id, util::Outcome<bool>::Success(false)});
  }

  if (objects.empty()) {
    pool_->Deliver([state] { state->callback({}); });
    return;
  }

  // Rejections are recorded per entry instead of thrown, so the batch
  // callback still sees every object exactly once.
  std::vector<std::size_t> rejected;
  for (std::size_t i = 0; i < objects.size(); ++i) {
    if (!objects[i].verified) {
      rejected.push_back(i);
      continue;
    }
    pool_->Submit([path = objects[i].path] { return ReadFirstByte(path); },
                  [state, i](util::Outcome<bool> outcome) { Complete(state, i, std::move(outcome)); });
  }

  for (auto i : rejected) {
    auto error = util::Outcome<bool>::Fail(util::Unverified("storage object for file " + objects[i].file_id + " is not verified"));
    pool_->Deliver([state, i, error] { Complete(state, i, error); });
  }
}

} // namespace hsm::backend
