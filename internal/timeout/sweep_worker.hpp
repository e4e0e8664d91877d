#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace nsi::core {
class ProtocolEngine;
}

namespace nsi::timeout {

/*
  Background worker that drives the engine's periodic tick.

  Executes:
      expired deadlines -> timeout / query retry
      expired reservation end -> passedEndTime
*/
class SweepWorker {
 public:
  SweepWorker(std::shared_ptr<nsi::core::ProtocolEngine> engine, std::chrono::milliseconds interval);
  ~SweepWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<nsi::core::ProtocolEngine> engine_;
  std::chrono::milliseconds                  interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace nsi::timeout
