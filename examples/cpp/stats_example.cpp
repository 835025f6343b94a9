#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/rollout_client.h"
#include "rollout/manager/v1.hpp"

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  rollout::manager::client::RolloutClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  rollout::manager::v1::StatsResponse stats;
  auto                                status = client.Stats(&stats);
  if (!status.ok()) {
    std::cerr << "Stats RPC failed: " << status.error_message() << '\n';
    return 1;
  }

  std::cout << "Rollout Manager stats for " << target << '\n';
  std::cout << "rollouts: active=" << stats.active_rollouts() << ", promoted=" << stats.promoted_rollouts()
            << ", rolled_back=" << stats.rolled_back_rollouts() << ", failed=" << stats.failed_rollouts() << '\n';
  std::cout << "live instance groups: " << stats.live_instance_groups() << '\n';

  return 0;
}
