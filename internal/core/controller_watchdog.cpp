#include "controller_watchdog.hpp"

#include "internal/observability/logging.hpp"
#include "rollout_controller.hpp"

namespace rollout::core {

using observability::IntField;
using observability::StringField;

ControllerWatchdog::ControllerWatchdog(std::shared_ptr<RolloutController> controller, util::Millis interval)
    : controller_(std::move(controller)), interval_(interval) {
}

ControllerWatchdog::~ControllerWatchdog() {
  Stop();
}

void ControllerWatchdog::Start() {
  if (running_.exchange(true)) return;
  stop_   = std::make_unique<util::CancelToken>();
  thread_ = std::thread(&ControllerWatchdog::Loop, this);
}

void ControllerWatchdog::Stop() {
  if (!running_.exchange(false)) return;
  stop_->Cancel();
  if (thread_.joinable()) thread_.join();
}

std::size_t ControllerWatchdog::ScanOnce() {
  const auto adopted = controller_->Recover();
  if (adopted > 0) {
    ROLLOUT_LOG_INFO("watchdog resumed rollouts", {IntField("adopted", static_cast<int64_t>(adopted))});
  }
  return adopted;
}

void ControllerWatchdog::Loop() {
  while (!stop_->WaitFor(interval_)) {
    try {
      ScanOnce();
    } catch (const std::exception& e) {
      ROLLOUT_LOG_ERROR("watchdog scan failed", {StringField("error", e.what())});
    }
  }
}

} // namespace rollout::core
