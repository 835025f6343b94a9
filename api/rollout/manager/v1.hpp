#pragma once

#include "rollout/manager/core/v1/types.pb.h"

#include "rollout/manager/services/v1/rollout_admin_service.pb.h"
#include "rollout/manager/services/v1/rollout_service.pb.h"

namespace rollout::manager::v1 {
using namespace ::rollout::manager::core::v1;
using namespace ::rollout::manager::services::v1;
}
