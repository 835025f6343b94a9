#pragma once

#include "rollout/manager/v1.hpp"

#include "rollout/manager/services/v1/rollout_admin_service.grpc.pb.h"
#include "rollout/manager/services/v1/rollout_service.grpc.pb.h"
