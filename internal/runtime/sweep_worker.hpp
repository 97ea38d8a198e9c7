#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace hsm::service {
class HsmStatusService;
}

namespace hsm::runtime {

/*
  Background thread running the reconciliation sweep every `interval`.

  The first sweep starts one interval after Start(). A failed sweep is
  logged and the next tick proceeds; Stop() interrupts the wait and joins,
  letting an in-flight sweep finish first.
*/
class SweepWorker {
 public:
  SweepWorker(std::shared_ptr<hsm::service::HsmStatusService> service, std::chrono::seconds interval);
  ~SweepWorker();

  SweepWorker(const SweepWorker&)            = delete;
  SweepWorker& operator=(const SweepWorker&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<hsm::service::HsmStatusService> service_;
  std::chrono::seconds                            interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace hsm::runtime
