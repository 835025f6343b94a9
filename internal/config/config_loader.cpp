#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace rollout::config {

namespace cfg = rollout::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("1.0" is a version, not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static cfg::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  cfg::RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

namespace {

using util::Millis;

void DefaultDuration(google::protobuf::Duration* d, Millis fallback) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    *d = util::ToProto(fallback);
  }
}

void AddDefaultCheck(google::protobuf::RepeatedPtrField<cfg::CheckSpec>* checks, const std::string& name, cfg::CheckKind kind) {
  auto* check = checks->Add();
  check->set_name(name);
  check->set_kind(kind);
  *check->mutable_timeout() = util::ToProto(Millis(5000));
}

void Invalid(const std::string& message) {
  throw std::runtime_error("Invalid configuration: " + message);
}

void ValidateChecks(const google::protobuf::RepeatedPtrField<cfg::CheckSpec>& checks, const std::string& section) {
  std::unordered_set<std::string> names;
  for (const auto& check : checks) {
    if (check.name().empty()) {
      Invalid(section + " entry without a name");
    }
    if (!names.insert(check.name()).second) {
      Invalid(section + " has duplicate check '" + check.name() + "'");
    }
    if (check.kind() == cfg::CHECK_KIND_UNSPECIFIED) {
      Invalid(section + " check '" + check.name() + "' has no kind");
    }
    if (check.kind() == cfg::CHECK_KIND_SYNTHETIC && check.path().empty()) {
      Invalid(section + " synthetic check '" + check.name() + "' requires a path");
    }
    if (check.kind() == cfg::CHECK_KIND_METRIC && check.threshold().metric().empty()) {
      Invalid(section + " metric check '" + check.name() + "' requires threshold.metric");
    }
    if (util::FromProto(check.timeout()) <= Millis(0)) {
      Invalid(section + " check '" + check.name() + "' requires a positive timeout");
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

cfg::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

cfg::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(cfg::RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address("0.0.0.0:50061");
  }

  if (config->database().backend_case() == cfg::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_memory();
  }

  auto* controller = config->mutable_controller();
  if (controller->controller_id().empty()) {
    controller->set_controller_id(util::NewId("ctl-"));
  }
  if (controller->worker_threads() == 0) {
    controller->set_worker_threads(4);
  }
  DefaultDuration(controller->mutable_provision_timeout(), Millis(300000));
  DefaultDuration(controller->mutable_provision_poll_interval(), Millis(1000));
  DefaultDuration(controller->mutable_rollout_timeout(), Millis(2 * 60 * 60 * 1000));
  DefaultDuration(controller->mutable_default_tick_interval(), Millis(30000));
  DefaultDuration(controller->mutable_teardown_grace(), Millis(60000));
  DefaultDuration(controller->mutable_watchdog_interval(), Millis(10000));

  auto* retry = controller->mutable_retry();
  if (retry->max_attempts() == 0) {
    retry->set_max_attempts(4);
  }
  DefaultDuration(retry->mutable_initial_backoff(), Millis(100));
  DefaultDuration(retry->mutable_max_backoff(), Millis(2000));
  if (retry->multiplier() == 0.0) {
    retry->set_multiplier(2.0);
  }

  auto* leases = config->mutable_leases();
  DefaultDuration(leases->mutable_ttl(), Millis(30000));
  DefaultDuration(leases->mutable_renew_interval(), util::FromProto(leases->ttl()) / 3);

  auto* gate = config->mutable_health_gate();
  if (gate->worker_threads() == 0) {
    gate->set_worker_threads(4);
  }
  DefaultDuration(gate->mutable_grace(), Millis(2000));
  if (gate->checks_size() == 0) {
    AddDefaultCheck(gate->mutable_checks(), "liveness", cfg::CHECK_KIND_LIVENESS);
    AddDefaultCheck(gate->mutable_checks(), "readiness", cfg::CHECK_KIND_READINESS);
  }
  if (gate->rollback_checks_size() == 0) {
    AddDefaultCheck(gate->mutable_rollback_checks(), "liveness", cfg::CHECK_KIND_LIVENESS);
  }
  for (auto& check : *gate->mutable_checks()) {
    DefaultDuration(check.mutable_timeout(), Millis(5000));
  }
  for (auto& check : *gate->mutable_rollback_checks()) {
    DefaultDuration(check.mutable_timeout(), Millis(5000));
  }

  if (config->collaborators().backend_case() == cfg::CollaboratorsConfig::BACKEND_NOT_SET) {
    config->mutable_collaborators()->mutable_simulation();
  }

  auto* metrics = config->mutable_observability()->mutable_metrics();
  if (metrics->collection_interval_ms() == 0) {
    metrics->set_collection_interval_ms(1000);
    metrics->set_request_metrics_enabled(true);
    metrics->set_rollout_metrics_enabled(true);
    metrics->set_health_check_metrics_enabled(true);
    metrics->set_route_labels_enabled(true);
  }
}

void ConfigLoader::Validate(const cfg::RuntimeConfig& config) {
  const auto& controller = config.controller();
  if (controller.worker_threads() == 0) {
    Invalid("controller.worker_threads must be positive");
  }
  if (util::FromProto(controller.provision_poll_interval()) <= Millis(0)) {
    Invalid("controller.provision_poll_interval must be positive");
  }
  if (util::FromProto(controller.default_tick_interval()) <= Millis(0)) {
    Invalid("controller.default_tick_interval must be positive");
  }
  if (util::FromProto(controller.rollout_timeout()) < util::FromProto(controller.provision_timeout())) {
    Invalid("controller.rollout_timeout must not be shorter than controller.provision_timeout");
  }
  if (controller.retry().max_attempts() == 0) {
    Invalid("controller.retry.max_attempts must be at least 1");
  }
  if (controller.retry().multiplier() < 1.0) {
    Invalid("controller.retry.multiplier must be >= 1.0");
  }

  std::unordered_set<std::string> services;
  for (const auto& service : controller.services()) {
    if (service.empty() || !services.insert(service).second) {
      Invalid("controller.services entries must be unique and non-empty");
    }
  }

  const auto ttl   = util::FromProto(config.leases().ttl());
  const auto renew = util::FromProto(config.leases().renew_interval());
  if (ttl <= Millis(0)) {
    Invalid("leases.ttl must be positive");
  }
  if (renew <= Millis(0) || renew >= ttl) {
    Invalid("leases.renew_interval must be positive and shorter than leases.ttl");
  }

  if (config.health_gate().worker_threads() == 0) {
    Invalid("health_gate.worker_threads must be positive");
  }
  if (config.health_gate().checks_size() == 0) {
    Invalid("health_gate.checks must not be empty");
  }
  ValidateChecks(config.health_gate().checks(), "health_gate.checks");
  ValidateChecks(config.health_gate().rollback_checks(), "health_gate.rollback_checks");

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    Invalid("database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    Invalid("database.postgres.connection_uri is required");
  }

  if (config.collaborators().has_simulation()) {
    for (const auto& artifact : config.collaborators().simulation().artifacts()) {
      if (artifact.name().empty() || artifact.version().empty()) {
        Invalid("collaborators.simulation.artifacts entries need name and version");
      }
    }
  }
}

} // namespace rollout::config
