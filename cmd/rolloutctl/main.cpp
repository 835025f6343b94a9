#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "client/cpp/rollout_client.h"
#include "rollout/manager/v1.hpp"

using namespace rollout::manager::v1;
using rollout::manager::client::RolloutClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rolloutctl <addr> submit <service> <artifact> <version> <blue_green|canary|rolling|shadow> <idempotency_key> [options]\n"
            << "      --canary-percent N   --ramp 25,50,100   --soak-ms N   --step-soak-ms N\n"
            << "      --tick-ms N          --batches N        --manual-halt --tolerance X\n"
            << "      --max METRIC=LIMIT   --min METRIC=LIMIT\n"
            << "  rolloutctl <addr> get <rollout_id>\n"
            << "  rolloutctl <addr> wait <rollout_id> [timeout_ms]\n"
            << "  rolloutctl <addr> abort <rollout_id> [reason]\n"
            << "  rolloutctl <addr> list [service] [--all]\n"
            << "  rolloutctl <addr> retry-batch <rollout_id>\n"
            << "  rolloutctl <addr> rollback <rollout_id>\n"
            << "  rolloutctl <addr> revert <service> [idempotency_key]\n"
            << "  rolloutctl <addr> traffic <service>\n"
            << "  rolloutctl <addr> groups [service] [--all]\n"
            << "  rolloutctl <addr> stats\n";
}

static std::optional<Strategy> ParseStrategy(const std::string& value) {
  if (value == "blue_green") return STRATEGY_BLUE_GREEN;
  if (value == "canary") return STRATEGY_CANARY;
  if (value == "rolling") return STRATEGY_ROLLING;
  if (value == "shadow") return STRATEGY_SHADOW;
  return std::nullopt;
}

static bool ParseThreshold(const std::string& value, ThresholdComparator comparator, MetricThreshold* threshold) {
  const auto eq = value.find('=');
  if (eq == std::string::npos || eq == 0) return false;
  threshold->set_metric(value.substr(0, eq));
  threshold->set_limit(std::stod(value.substr(eq + 1)));
  threshold->set_comparator(comparator);
  return true;
}

static void SetMillis(google::protobuf::Duration* duration, const std::string& value) {
  const auto ms = std::stoll(value);
  duration->set_seconds(ms / 1000);
  duration->set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static void PrintJson(const google::protobuf::Message& message) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  if (google::protobuf::util::MessageToJsonString(message, &json, options).ok()) {
    std::cout << json;
  } else {
    std::cout << message.DebugString();
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];

  RolloutClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 8) {
      Usage();
      return 1;
    }

    const auto strategy = ParseStrategy(argv[6]);
    if (!strategy) {
      std::cerr << "unsupported strategy: " << argv[6] << "\n";
      return 1;
    }

    RolloutRequest request;
    request.set_service_name(argv[3]);
    request.mutable_target_artifact()->set_name(argv[4]);
    request.mutable_target_artifact()->set_version(argv[5]);
    request.set_strategy(*strategy);
    request.set_idempotency_key(argv[7]);

    auto* params = request.mutable_strategy_params();
    for (int i = 8; i < argc; ++i) {
      const std::string flag  = argv[i];
      const bool        value = i + 1 < argc;

      if (flag == "--manual-halt") {
        params->set_halt_policy(HALT_POLICY_MANUAL);
      } else if (flag == "--canary-percent" && value) {
        params->set_canary_percent(static_cast<uint32_t>(std::stoul(argv[++i])));
      } else if (flag == "--ramp" && value) {
        std::stringstream ramp(argv[++i]);
        std::string       step;
        while (std::getline(ramp, step, ',')) params->add_ramp_steps(static_cast<uint32_t>(std::stoul(step)));
      } else if (flag == "--soak-ms" && value) {
        SetMillis(params->mutable_soak_duration(), argv[++i]);
      } else if (flag == "--step-soak-ms" && value) {
        SetMillis(params->mutable_step_soak_duration(), argv[++i]);
      } else if (flag == "--tick-ms" && value) {
        SetMillis(params->mutable_tick_interval(), argv[++i]);
      } else if (flag == "--batches" && value) {
        params->set_batch_count(static_cast<uint32_t>(std::stoul(argv[++i])));
      } else if (flag == "--tolerance" && value) {
        params->set_divergence_tolerance(std::stod(argv[++i]));
      } else if ((flag == "--max" || flag == "--min") && value) {
        const auto comparator = flag == "--max" ? THRESHOLD_COMPARATOR_MAX : THRESHOLD_COMPARATOR_MIN;
        if (!ParseThreshold(argv[++i], comparator, params->add_thresholds())) {
          std::cerr << "threshold must be METRIC=LIMIT: " << argv[i] << "\n";
          return 1;
        }
      } else {
        std::cerr << "unknown option: " << flag << "\n";
        return 1;
      }
    }

    SubmitRolloutResponse resp;
    auto                  status = client.Submit(request, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "rollout_id=" << resp.rollout_id() << " disposition=" << SubmitDisposition_Name(resp.disposition())
              << " state=" << RolloutState_Name(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get" || cmd == "wait") {
    if (argc < 4) return 1;

    Rollout rollout;
    auto    status = cmd == "get" ? client.Get(argv[3], &rollout)
                                  : client.WaitForTerminal(argv[3], argc >= 5 ? std::stoull(argv[4]) : 600000, &rollout);
    if (!status.ok()) return Fail(status);

    PrintJson(rollout);
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "abort") {
    if (argc < 4) return 1;

    AbortRolloutResponse resp;
    auto                 status = client.Abort(argv[3], argc >= 5 ? argv[4] : "", &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "acknowledged state=" << RolloutState_Name(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    std::string service;
    bool        all = false;
    for (int i = 3; i < argc; ++i) {
      if (std::string(argv[i]) == "--all") {
        all = true;
      } else {
        service = argv[i];
      }
    }

    ListRolloutsResponse resp;
    auto                 status = client.List(service, all, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& rollout : resp.rollouts()) {
      std::cout << rollout.id() << " " << rollout.request().service_name() << " " << rollout.artifact().name() << "@"
                << rollout.artifact().version() << " " << Strategy_Name(rollout.request().strategy()) << " "
                << RolloutState_Name(rollout.state()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retry-batch" || cmd == "rollback") {
    if (argc < 4) return 1;

    ResolveHaltResponse resp;
    auto status = client.ResolveHalt(argv[3], cmd == "retry-batch" ? HALT_DECISION_RETRY_BATCH : HALT_DECISION_ROLLBACK, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "state=" << RolloutState_Name(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "revert") {
    if (argc < 4) return 1;

    RevertServiceResponse resp;
    auto                  status = client.Revert(argv[3], argc >= 5 ? argv[4] : "", &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "rollout_id=" << resp.rollout_id() << " artifact=" << resp.artifact().name() << "@" << resp.artifact().version()
              << " disposition=" << SubmitDisposition_Name(resp.disposition()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "traffic") {
    if (argc < 4) return 1;

    TrafficSplit traffic;
    auto         status = client.GetTrafficSplit(argv[3], &traffic);
    if (!status.ok()) return Fail(status);

    std::cout << "version=" << traffic.version() << "\n";
    for (const auto& [group, weight] : traffic.weights()) std::cout << "  " << group << " " << weight << "%\n";
    for (const auto& group : traffic.mirrors()) std::cout << "  " << group << " (mirror)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "groups") {
    std::string service;
    bool        all = false;
    for (int i = 3; i < argc; ++i) {
      if (std::string(argv[i]) == "--all") {
        all = true;
      } else {
        service = argv[i];
      }
    }

    ListInstanceGroupsResponse resp;
    auto                       status = client.ListInstanceGroups(service, all, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& group : resp.groups()) {
      std::cout << group.id() << " " << group.service_name() << " " << group.artifact().version() << " "
                << LifecycleState_Name(group.lifecycle_state()) << " " << group.ready_replicas() << "/" << group.desired_replicas()
                << " weight=" << group.traffic_weight() << (group.mirrored() ? " mirrored" : "") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsResponse resp;
    auto          status = client.Stats(&resp);
    if (!status.ok()) return Fail(status);

    std::cout << "active=" << resp.active_rollouts() << " promoted=" << resp.promoted_rollouts()
              << " rolled_back=" << resp.rolled_back_rollouts() << " failed=" << resp.failed_rollouts()
              << " live_groups=" << resp.live_instance_groups() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
