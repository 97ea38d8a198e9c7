#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/util/outcome.hpp"
#include "task_queue.hpp"

namespace hsm::worker {

/*
  Bounded pool of job threads plus one result-delivery thread.

      pool.Submit([&] { return probe.ProbeOrThrow(path); },
                  [](util::Outcome<ProbeResult> r) { ... });

  Submit() never waits for the job. The job runs on one of the worker
  threads and whatever it returns or throws is captured in an Outcome, so an
  exception never unwinds a worker. The callback then runs exactly once on
  the delivery thread; callbacks are serialised there and must be short.

  Shutdown() stops intake, lets queued jobs and deliveries finish, then
  joins every thread. The destructor calls it.
*/
class WorkerPool {
 public:
  // threads == 0 -> std::thread::hardware_concurrency()
  explicit WorkerPool(std::size_t threads = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <typename Job, typename Callback>
  void Submit(Job job, Callback callback) {
    using Value = std::decay_t<std::invoke_result_t<Job&>>;
    jobs_.Enqueue([this, job = std::move(job), callback = std::move(callback)]() mutable {
      auto outcome = util::Outcome<Value>::Attempt(job);
      deliveries_.Enqueue([callback = std::move(callback), outcome = std::move(outcome)]() mutable { callback(std::move(outcome)); });
    });
  }

  // Runs `delivery` on the delivery thread, behind any pending results.
  void Deliver(TaskQueue::Task delivery);

  void Shutdown();

  std::size_t ThreadCount() const {
    return workers_.size();
  }

 private:
  void RunWorker();
  void RunDelivery();

  TaskQueue jobs_;
  TaskQueue deliveries_;

  std::vector<std::thread> workers_;
  std::thread              delivery_thread_;

  std::mutex       shutdown_mutex_;
  std::atomic_bool stopped_{false};
};

} // namespace hsm::worker
