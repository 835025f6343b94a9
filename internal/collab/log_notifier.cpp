#include "log_notifier.hpp"

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"

namespace rollout::collab {

void LogNotifier::Notify(const rollout::manager::v1::RolloutEvent& event) {
  const auto& transition = event.transition();
  const auto  level      = transition.to_state() == rollout::manager::v1::ROLLOUT_STATE_FAILED ? spdlog::level::err : spdlog::level::info;

  observability::Log(level, "rollout event",
                     {observability::StringField("rollout_id", event.rollout_id()),
                      observability::StringField("service", event.service_name()),
                      observability::StringField("from", model::ToString(transition.from_state())),
                      observability::StringField("to", model::ToString(transition.to_state())),
                      observability::StringField("reason", rollout::manager::v1::ReasonCode_Name(transition.reason())),
                      observability::StringField("diagnostic", transition.diagnostic()),
                      observability::IntField("history_entries", event.history_size())});
}

} // namespace rollout::collab
