#pragma once

#include <memory>

#include "rollout/manager/v1.hpp"

namespace rollout::collab {

// Outbound notification channel. Delivery is best effort.
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void Notify(const rollout::manager::v1::RolloutEvent& event) = 0;
};

using NotifierPtr = std::shared_ptr<Notifier>;

} // namespace rollout::collab
