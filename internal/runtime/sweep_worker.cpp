#include "sweep_worker.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/service/hsm_status_service.hpp"

namespace hsm::runtime {

SweepWorker::SweepWorker(std::shared_ptr<hsm::service::HsmStatusService> service, std::chrono::seconds interval)
    : service_(std::move(service)), interval_(interval) {
  if (!service_) throw std::invalid_argument("SweepWorker requires a status service");
  if (interval_.count() <= 0) throw std::invalid_argument("SweepWorker interval must be positive");
}

SweepWorker::~SweepWorker() {
  Stop();
}

void SweepWorker::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&SweepWorker::Run, this);
}

void SweepWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SweepWorker::Run() {
  HSM_LOG_INFO("Sweep worker started", {observability::IntField("interval_seconds", interval_.count())});

  for (;;) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;
    }

    try {
      service_->RunSweep(hsm::status::v1::RunSweepRequest{});
    } catch (const std::exception& e) {
      HSM_LOG_ERROR("Periodic sweep failed", {observability::StringField("error", e.what())});
    }
  }

  HSM_LOG_INFO("Sweep worker stopped");
}

} // namespace hsm::runtime
