#pragma once

#include "notifier.hpp"

namespace rollout::collab {

// Writes every rollout event to the structured log.
class LogNotifier final : public Notifier {
 public:
  void Notify(const rollout::manager::v1::RolloutEvent& event) override;
};

} // namespace rollout::collab
