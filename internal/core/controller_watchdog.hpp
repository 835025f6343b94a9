#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "internal/util/cancel_token.hpp"
#include "internal/util/time.hpp"

namespace rollout::core {

class RolloutController;

/*
  Periodically asks the controller to adopt non-terminal rollouts whose
  service lease has expired, so a standby controller resumes work left
  behind by a crashed peer.
*/
class ControllerWatchdog {
 public:
  ControllerWatchdog(std::shared_ptr<RolloutController> controller, util::Millis interval);
  ~ControllerWatchdog();

  void Start();
  void Stop();

  // One scan; returns how many rollouts were adopted.
  std::size_t ScanOnce();

 private:
  void Loop();

  std::shared_ptr<RolloutController> controller_;
  util::Millis                       interval_;

  std::thread                        thread_;
  std::atomic<bool>                  running_{false};
  std::unique_ptr<util::CancelToken> stop_;
};

} // namespace rollout::core
