#include "async_notifier.hpp"

#include "internal/observability/logging.hpp"

namespace rollout::collab {

AsyncNotifier::AsyncNotifier(NotifierPtr inner)
    : inner_(std::move(inner)), queue_(std::make_shared<runtime::TaskQueue>()), pool_(queue_, 1, "notifier") {
  pool_.Start();
}

AsyncNotifier::~AsyncNotifier() {
  Stop();
}

void AsyncNotifier::Notify(const rollout::manager::v1::RolloutEvent& event) {
  queue_->Post("notify", [inner = inner_, event] {
    try {
      inner->Notify(event);
    } catch (const std::exception& e) {
      ROLLOUT_LOG_WARN("notification delivery failed",
                       {observability::StringField("rollout_id", event.rollout_id()), observability::StringField("error", e.what())});
    }
  });
}

void AsyncNotifier::Stop() {
  pool_.Stop();
}

} // namespace rollout::collab
