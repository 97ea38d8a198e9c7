#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace hsm::worker {

/*
  Thread-safe blocking queue of closures.

  After Shutdown() no new task is accepted, but everything already queued
  is still handed out before Dequeue() reports the end.
*/
class TaskQueue {
 public:
  using Task = std::function<void()>;

  // Throws util::InvalidState once shut down.
  void Enqueue(Task task);

  // blocking wait; nullopt once shut down and drained
  std::optional<Task> Dequeue();

  void Shutdown();

  std::size_t Size();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace hsm::worker
