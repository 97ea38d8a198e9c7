#include "worker_pool.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace hsm::worker {

using hsm::observability::StringField;

WorkerPool::WorkerPool(std::size_t threads) {
  if (threads == 0) {
    threads = std::max(1u, std::thread::hardware_concurrency());
  }

  delivery_thread_ = std::thread(&WorkerPool::RunDelivery, this);

  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&WorkerPool::RunWorker, this);
  }
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

void WorkerPool::Deliver(TaskQueue::Task delivery) {
  deliveries_.Enqueue(std::move(delivery));
}

void WorkerPool::Shutdown() {
  std::lock_guard lock(shutdown_mutex_);
  if (stopped_) {
    return;
  }
  stopped_ = true;

  // Workers drain the job queue and may still enqueue deliveries, so the
  // delivery queue stays open until every worker has exited.
  jobs_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }

  deliveries_.Shutdown();
  if (delivery_thread_.joinable()) delivery_thread_.join();
}

void WorkerPool::RunWorker() {
  while (auto job = jobs_.Dequeue()) {
    try {
      (*job)();
    } catch (const std::exception& e) {
      HSM_LOG_ERROR("Worker job could not hand off its result", {StringField("error", e.what())});
    }
  }
}

void WorkerPool::RunDelivery() {
  while (auto delivery = deliveries_.Dequeue()) {
    try {
      (*delivery)();
    } catch (const std::exception& e) {
      HSM_LOG_ERROR("Result callback threw", {StringField("error", e.what())});
    }
  }
}

} // namespace hsm::worker
