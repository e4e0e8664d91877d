#include "sweep_worker.hpp"

#include "internal/core/protocol_engine.hpp"
#include "internal/observability/logging.hpp"

namespace nsi::timeout {

SweepWorker::SweepWorker(std::shared_ptr<nsi::core::ProtocolEngine> engine, std::chrono::milliseconds interval)
    : engine_(std::move(engine)), interval_(interval) {
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
  std::unique_lock lock(mutex_);

  while (running_) {
    cv_.wait_for(lock, interval_, [&] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      engine_->Tick();
    } catch (const std::exception& e) {
      NSI_LOG_ERROR("sweep tick failed", {nsi::observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace nsi::timeout
