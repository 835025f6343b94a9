#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/rollout_client.h"
#include "rollout/manager/v1.hpp"

namespace v1 = rollout::manager::v1;

int main(int argc, char** argv) {
  const std::string target  = argc > 1 ? argv[1] : "localhost:50051";
  const std::string version = argc > 2 ? argv[2] : "1.1.0";

  rollout::manager::client::RolloutClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // 10% canary, then 50% and full, each step soaking for two seconds while
  // the error rate stays under 5%.
  v1::RolloutRequest request;
  request.set_service_name("checkout");
  request.mutable_target_artifact()->set_name("checkout");
  request.mutable_target_artifact()->set_version(version);
  request.set_strategy(v1::STRATEGY_CANARY);
  request.set_idempotency_key("canary-example-" + version);

  auto* params = request.mutable_strategy_params();
  params->set_canary_percent(10);
  params->add_ramp_steps(50);
  params->add_ramp_steps(100);
  params->mutable_soak_duration()->set_seconds(2);
  params->mutable_tick_interval()->set_nanos(500000000);

  auto* threshold = params->add_thresholds();
  threshold->set_metric("error_rate");
  threshold->set_comparator(v1::THRESHOLD_COMPARATOR_MAX);
  threshold->set_limit(0.05);

  v1::SubmitRolloutResponse submitted;
  auto                      status = client.Submit(request, &submitted);
  if (!status.ok()) {
    std::cerr << "SubmitRollout failed: " << status.error_message() << '\n';
    return 1;
  }
  std::cout << "rollout " << submitted.rollout_id() << " " << v1::SubmitDisposition_Name(submitted.disposition()) << '\n';

  v1::Rollout rollout;
  status = client.WaitForTerminal(submitted.rollout_id(), 120000, &rollout);
  if (!status.ok()) {
    std::cerr << "waiting for " << submitted.rollout_id() << " failed: " << status.error_message() << '\n';
    return 1;
  }

  for (const auto& entry : rollout.history()) {
    std::cout << "  " << v1::RolloutState_Name(entry.from_state()) << " -> " << v1::RolloutState_Name(entry.to_state()) << " ["
              << v1::ReasonCode_Name(entry.reason()) << "] " << entry.diagnostic() << '\n';
  }

  v1::TrafficSplit traffic;
  status = client.GetTrafficSplit("checkout", &traffic);
  if (!status.ok()) {
    std::cerr << "GetTrafficSplit failed: " << status.error_message() << '\n';
    return 1;
  }
  std::cout << "traffic (version " << traffic.version() << "):\n";
  for (const auto& [group_id, weight] : traffic.weights()) {
    std::cout << "  " << group_id << " " << weight << "%\n";
  }

  return rollout.state() == v1::ROLLOUT_STATE_PROMOTED ? 0 : 3;
}
