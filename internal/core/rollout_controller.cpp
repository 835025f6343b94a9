#include "rollout_controller.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>

#include "config/config.pb.h"
#include "internal/db/api/result_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/soak/soak_evaluator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace rollout::core {

namespace v1 = rollout::manager::v1;

using observability::IntField;
using observability::StringField;

namespace {

db::model::RolloutRecord ToRecord(const v1::Rollout& rollout) {
  db::model::RolloutRecord record;
  record.id              = rollout.id();
  record.service_name    = rollout.request().service_name();
  record.idempotency_key = rollout.request().idempotency_key();
  record.state           = rollout.state();
  record.terminal        = model::IsTerminal(rollout.state());
  record.version         = rollout.version();
  record.created_at_ms   = util::ToUnixMillis(util::FromProto(rollout.created_at()));
  record.updated_at_ms   = util::ToUnixMillis(util::FromProto(rollout.updated_at()));
  record.body            = rollout;
  record.body.clear_history();
  record.body.clear_traffic();
  return record;
}

db::model::HistoryRecord ToHistoryRecord(const std::string& rollout_id, const v1::HistoryEntry& entry) {
  db::model::HistoryRecord record;
  record.rollout_id = rollout_id;
  record.seq        = entry.seq();
  record.from_state = entry.from_state();
  record.to_state   = entry.to_state();
  record.reason     = entry.reason();
  record.diagnostic = entry.diagnostic();
  record.at_ms      = util::ToUnixMillis(util::FromProto(entry.at()));
  return record;
}

v1::HistoryEntry FromHistoryRecord(const db::model::HistoryRecord& record) {
  v1::HistoryEntry entry;
  entry.set_seq(record.seq);
  entry.set_from_state(record.from_state);
  entry.set_to_state(record.to_state);
  entry.set_reason(record.reason);
  entry.set_diagnostic(record.diagnostic);
  *entry.mutable_at() = util::ToProto(util::FromUnixMillis(record.at_ms));
  return entry;
}

v1::HistoryEntry MakeEntry(v1::RolloutState from, v1::RolloutState to, v1::ReasonCode reason, const std::string& diagnostic) {
  v1::HistoryEntry entry;
  entry.set_from_state(from);
  entry.set_to_state(to);
  entry.set_reason(reason);
  entry.set_diagnostic(diagnostic);
  return entry;
}

util::Millis Elapsed(const google::protobuf::Timestamp& since) {
  return std::chrono::duration_cast<util::Millis>(util::Now() - util::FromProto(since));
}

std::string Percent(uint32_t value) {
  return std::to_string(value) + "%";
}

} // namespace

// -------------------------------------------------------------------------
// Options
// -------------------------------------------------------------------------

ControllerOptions ControllerOptions::FromConfig(const rollout::runtime::config::RuntimeConfig& config) {
  const auto& controller = config.controller();

  ControllerOptions options;
  options.controller_id           = controller.controller_id();
  options.worker_threads          = controller.worker_threads();
  options.provision_timeout       = util::FromProto(controller.provision_timeout());
  options.provision_poll_interval = util::FromProto(controller.provision_poll_interval());
  options.rollout_timeout         = util::FromProto(controller.rollout_timeout());
  options.default_tick_interval   = util::FromProto(controller.default_tick_interval());
  options.lease_renew_interval    = util::FromProto(config.leases().renew_interval());

  options.retry.max_attempts    = controller.retry().max_attempts();
  options.retry.initial_backoff = util::FromProto(controller.retry().initial_backoff());
  options.retry.max_backoff     = util::FromProto(controller.retry().max_backoff());
  options.retry.multiplier      = controller.retry().multiplier();

  options.allowed_services.assign(controller.services().begin(), controller.services().end());
  return options;
}

// -------------------------------------------------------------------------
// Lifecycle
// -------------------------------------------------------------------------

RolloutController::RolloutController(ControllerDependencies deps, ControllerOptions options)
    : deps_(std::move(deps)), options_(std::move(options)), pool_(deps_.queue, options_.worker_threads, "controller") {
  if (!deps_.repository || !deps_.leases || !deps_.resolver || !deps_.fleet || !deps_.splitter || !deps_.gate || !deps_.rollback || !deps_.teardown ||
      !deps_.scheduler || !deps_.metrics || !deps_.notifier || !deps_.queue) {
    throw std::invalid_argument("RolloutController requires every dependency");
  }
}

RolloutController::~RolloutController() {
  Stop();
}

void RolloutController::Start() {
  if (started_.exchange(true)) return;

  deps_.metrics->Subscribe([this](const v1::MetricAlert& alert) {
    try {
      OnAlert(alert);
    } catch (const std::exception& e) {
      ROLLOUT_LOG_ERROR("metric alert handling failed", {StringField("service", alert.service_name()), StringField("error", e.what())});
    }
  });

  pool_.Start();

  const auto adopted   = Recover();
  const auto teardowns = deps_.teardown->RescheduleAll();

  ROLLOUT_LOG_INFO("rollout controller started",
                   {StringField("controller_id", options_.controller_id), IntField("workers", static_cast<int64_t>(options_.worker_threads)),
                    IntField("adopted", static_cast<int64_t>(adopted)), IntField("teardowns", static_cast<int64_t>(teardowns))});
}

void RolloutController::Stop() {
  if (stopping_.exchange(true)) return;

  std::vector<ExecutionPtr> executions;
  {
    std::lock_guard lock(executions_mutex_);
    for (auto& [id, exec] : executions_) executions.push_back(exec);
    executions_.clear();
  }
  for (auto& exec : executions) {
    std::shared_ptr<util::CancelToken> token;
    {
      std::lock_guard lock(exec->mutex);
      exec->finished = true;
      exec->mailbox.clear();
      token = exec->cancel;
    }
    token->Cancel();
  }

  pool_.Stop();

  ROLLOUT_LOG_INFO("rollout controller stopped",
                   {StringField("controller_id", options_.controller_id), IntField("abandoned", static_cast<int64_t>(executions.size()))});
}

std::size_t RolloutController::ActiveExecutions() const {
  std::lock_guard lock(executions_mutex_);
  return executions_.size();
}

// -------------------------------------------------------------------------
// Public operations
// -------------------------------------------------------------------------

void RolloutController::CheckServiceAllowed(const std::string& service_name) const {
  if (options_.allowed_services.empty()) return;
  if (std::find(options_.allowed_services.begin(), options_.allowed_services.end(), service_name) == options_.allowed_services.end()) {
    throw util::InvalidArgument("service '" + service_name + "' is not managed by this controller");
  }
}

SubmitResult RolloutController::Submit(const v1::RolloutRequest& request) {
  observability::SpanScope span("rollout.submit");
  span.SetAttribute("service", request.service_name());

  if (stopping_) {
    throw util::Unavailable("controller is shutting down");
  }

  strategy::ValidateRequest(request);
  CheckServiceAllowed(request.service_name());

  // replays and conflicts are answered before touching the registry
  {
    auto tx       = deps_.repository->Begin();
    auto existing = deps_.repository->FindRolloutByIdempotencyKey(*tx, request.idempotency_key());
    if (existing) {
      if (!google::protobuf::util::MessageDifferencer::Equals(existing->body.request(), request)) {
        throw util::InvalidArgument("idempotency key '" + request.idempotency_key() + "' was already used for a different request");
      }
      auto rollout = Assemble(*tx, *existing);
      tx->Commit();
      return SubmitResult{std::move(rollout), false};
    }

    if (auto active = deps_.repository->FindActiveRollout(*tx, request.service_name())) {
      throw util::Conflict("service '" + request.service_name() + "' already has rollout " + active->id + " in state " +
                           std::string(model::ToString(active->state)));
    }
    tx->Commit();
  }

  const auto artifact = deps_.resolver->Resolve(request.target_artifact());

  const auto source = deps_.fleet->ServingGroup(request.service_name());
  if (!source) {
    // a split left behind by a failed rollback has no single version to roll back to
    for (const auto& group : deps_.fleet->List(request.service_name(), false)) {
      if (model::IsLive(group.lifecycle_state()) && group.traffic_weight() > 0) {
        throw util::InvalidArgument("service '" + request.service_name() + "' is split across versions (" + group.id() + " at " +
                                    Percent(group.traffic_weight()) + "); restore a single serving version first");
      }
    }
  }
  if (!source && strategy::RequiresServingGroup(request.strategy())) {
    throw util::InvalidArgument(std::string(model::ToString(request.strategy())) + " rollout of '" + request.service_name() +
                                "' needs a serving version; deploy the first version with blue_green");
  }
  if (source && source->artifact().name() == artifact.name() && source->artifact().version() == artifact.version()) {
    throw util::InvalidArgument("service '" + request.service_name() + "' already serves " + artifact.name() + "@" + artifact.version());
  }

  const auto source_replicas = source ? source->desired_replicas() : 0;
  // rejects bad strategy parameters before anything is persisted
  strategy::BuildTrafficPlan(request, artifact.resource_spec().replicas(), source_replicas);

  v1::Rollout rollout;
  rollout.set_id(util::NewId("ro-"));
  *rollout.mutable_request() = request;
  rollout.set_state(v1::ROLLOUT_STATE_PENDING);
  *rollout.mutable_artifact() = artifact;
  if (source) {
    rollout.set_source_group_id(source->id());
    rollout.set_source_replicas(source_replicas);
  }
  const auto now                = util::ToProto(util::Now());
  *rollout.mutable_created_at() = now;
  *rollout.mutable_updated_at() = now;
  rollout.set_version(1);

  auto entry = MakeEntry(v1::ROLLOUT_STATE_UNSPECIFIED, v1::ROLLOUT_STATE_PENDING, v1::REASON_CODE_ACCEPTED,
                         std::string(model::ToString(request.strategy())) + " rollout of " + artifact.name() + "@" + artifact.version());
  entry.set_seq(1);
  *entry.mutable_at() = now;

  ExecutionPtr exec;
  {
    // adoption takes the same lock; the execution exists before anyone else can see the row
    std::lock_guard submit_lock(submit_mutex_);
    auto            tx = deps_.repository->Begin();

    if (auto existing = deps_.repository->FindRolloutByIdempotencyKey(*tx, request.idempotency_key())) {
      auto replay = Assemble(*tx, *existing);
      tx->Commit();
      return SubmitResult{std::move(replay), false};
    }
    if (auto active = deps_.repository->FindActiveRollout(*tx, request.service_name())) {
      throw util::Conflict("service '" + request.service_name() + "' already has rollout " + active->id);
    }

    lease::Lease lease;
    try {
      lease = deps_.leases->Acquire(*tx, request.service_name());
    } catch (const util::LeaseConflict& e) {
      throw util::Conflict(e.what());
    }

    const auto inserted = deps_.repository->InsertRollout(*tx, ToRecord(rollout));
    if (!inserted && inserted.code == db::ErrorCode::AlreadyExists) {
      throw util::Conflict("concurrent submission for idempotency key '" + request.idempotency_key() + "'");
    }
    db::ThrowIfDbError(inserted, "insert rollout");
    db::ThrowIfDbError(deps_.repository->AppendHistory(*tx, ToHistoryRecord(rollout.id(), entry)), "append history");
    tx->Commit();

    exec = StartExecution(rollout, lease);
  }

  Published(rollout, entry);
  observability::Metrics::Instance().SetActiveRollouts(request.service_name(), 1);

  ROLLOUT_LOG_INFO("rollout accepted",
                   {StringField("rollout_id", rollout.id()), StringField("service", request.service_name()),
                    StringField("strategy", model::ToString(request.strategy())),
                    StringField("artifact", artifact.name() + "@" + artifact.version()),
                    StringField("source_group", rollout.source_group_id())});

  Enqueue(exec, Event{EventKind::kAdvance});

  *rollout.add_history()     = entry;
  *rollout.mutable_traffic() = deps_.splitter->GetWeights(request.service_name())->ToProto();
  return SubmitResult{std::move(rollout), true};
}

v1::Rollout RolloutController::Get(const std::string& rollout_id) {
  auto tx     = deps_.repository->Begin();
  auto record = deps_.repository->GetRollout(*tx, rollout_id);
  if (!record) {
    throw util::NotFound("rollout not found: " + rollout_id);
  }
  auto rollout = Assemble(*tx, *record);
  tx->Commit();
  return rollout;
}

std::vector<v1::Rollout> RolloutController::List(const std::string& service_name, bool include_terminal) {
  auto tx      = deps_.repository->Begin();
  auto records = deps_.repository->ListRollouts(*tx, service_name, include_terminal);

  std::vector<v1::Rollout> out;
  out.reserve(records.size());
  for (const auto& record : records) out.push_back(Assemble(*tx, record));
  tx->Commit();
  return out;
}

v1::Rollout RolloutController::Abort(const std::string& rollout_id, const std::string& reason) {
  auto rollout = Get(rollout_id);
  if (model::IsTerminal(rollout.state())) {
    throw util::InvalidState("rollout " + rollout_id + " is already " + std::string(model::ToString(rollout.state())));
  }

  auto exec = FindExecution(rollout_id);
  if (!exec) {
    auto tx     = deps_.repository->Begin();
    auto record = deps_.repository->GetRollout(*tx, rollout_id);
    tx->Commit();
    exec = record ? EnsureExecution(*record) : nullptr;
  }
  if (!exec) {
    throw util::InvalidState("rollout " + rollout_id + " is driven by another controller");
  }

  ROLLOUT_LOG_INFO("abort requested", {StringField("rollout_id", rollout_id), StringField("reason", reason)});

  Interrupt(exec);
  Enqueue(exec, Event{EventKind::kAbort, reason.empty() ? "aborted by operator" : reason});
  return rollout;
}

v1::Rollout RolloutController::ResolveHalt(const std::string& rollout_id, v1::HaltDecision decision) {
  if (decision != v1::HALT_DECISION_RETRY_BATCH && decision != v1::HALT_DECISION_ROLLBACK) {
    throw util::InvalidArgument("halt decision must be RETRY_BATCH or ROLLBACK");
  }

  auto rollout = Get(rollout_id);
  if (rollout.state() != v1::ROLLOUT_STATE_SHIFTING || !rollout.halted()) {
    throw util::InvalidState("rollout " + rollout_id + " is not halted");
  }

  auto exec = FindExecution(rollout_id);
  if (!exec) {
    auto tx     = deps_.repository->Begin();
    auto record = deps_.repository->GetRollout(*tx, rollout_id);
    tx->Commit();
    exec = record ? EnsureExecution(*record) : nullptr;
  }
  if (!exec) {
    throw util::InvalidState("rollout " + rollout_id + " is driven by another controller");
  }

  Event event{EventKind::kHaltDecision};
  event.decision = decision;
  Enqueue(exec, std::move(event));
  return rollout;
}

SubmitResult RolloutController::Revert(const std::string& service_name, const std::string& idempotency_key) {
  std::vector<db::model::RolloutRecord> records;
  {
    auto tx = deps_.repository->Begin();
    // a retried revert answers with the rollout it started, whatever has been promoted since
    if (!idempotency_key.empty()) {
      auto existing = deps_.repository->FindRolloutByIdempotencyKey(*tx, idempotency_key);
      if (existing && existing->service_name == service_name) {
        auto replay = Assemble(*tx, *existing);
        tx->Commit();
        return SubmitResult{std::move(replay), false};
      }
    }
    records = deps_.repository->ListRollouts(*tx, service_name, true);
    tx->Commit();
  }

  std::vector<v1::ArtifactRef> promoted;
  for (const auto& record : records) {
    if (record.state == v1::ROLLOUT_STATE_PROMOTED && record.body.request().strategy() != v1::STRATEGY_SHADOW) {
      promoted.push_back(record.body.artifact());
    }
  }
  if (promoted.empty()) {
    throw util::InvalidState("service '" + service_name + "' has no promoted rollout to revert");
  }

  const auto& current = promoted.back();
  for (auto it = promoted.rbegin() + 1; it != promoted.rend(); ++it) {
    if (it->name() == current.name() && it->version() == current.version()) continue;

    v1::RolloutRequest request;
    request.set_service_name(service_name);
    request.mutable_target_artifact()->set_name(it->name());
    request.mutable_target_artifact()->set_version(it->version());
    request.set_strategy(v1::STRATEGY_BLUE_GREEN);
    request.set_idempotency_key(idempotency_key.empty() ? "revert-" + service_name + "-" + current.version() : idempotency_key);

    ROLLOUT_LOG_INFO("reverting service", {StringField("service", service_name), StringField("from", current.version()),
                                           StringField("to", it->version())});
    return Submit(request);
  }

  throw util::InvalidState("service '" + service_name + "' has no earlier promoted version than " + current.version());
}

void RolloutController::OnAlert(const v1::MetricAlert& alert) {
  std::optional<db::model::RolloutRecord> active;
  {
    auto tx = deps_.repository->Begin();
    active  = deps_.repository->FindActiveRollout(*tx, alert.service_name());
    tx->Commit();
  }
  if (!active) return;

  const auto state = active->state;
  if (state != v1::ROLLOUT_STATE_SHIFTING && state != v1::ROLLOUT_STATE_SOAKING) return;
  if (!alert.group_id().empty() && alert.group_id() != active->body.target_group_id()) return;

  auto exec = FindExecution(active->id);
  if (!exec) return;

  ROLLOUT_LOG_WARN("metric alert received", {StringField("rollout_id", active->id), StringField("metric", alert.metric()),
                                             StringField("message", alert.message())});

  Interrupt(exec);
  Enqueue(exec, Event{EventKind::kAlert,
                      alert.metric() + "=" + std::to_string(alert.value()) + (alert.message().empty() ? "" : ": " + alert.message())});
}

// -------------------------------------------------------------------------
// Recovery
// -------------------------------------------------------------------------

std::size_t RolloutController::Recover() {
  if (stopping_) return 0;

  std::vector<db::model::RolloutRecord> records;
  {
    auto tx = deps_.repository->Begin();
    records = deps_.repository->ListRollouts(*tx, "", false);
    tx->Commit();
  }

  std::size_t adopted = 0;
  for (const auto& record : records) {
    std::lock_guard submit_lock(submit_mutex_);
    if (FindExecution(record.id)) continue;
    if (!options_.allowed_services.empty() &&
        std::find(options_.allowed_services.begin(), options_.allowed_services.end(), record.service_name) ==
            options_.allowed_services.end()) {
      continue;
    }

    try {
      if (Adopt(record)) ++adopted;
    } catch (const util::LeaseConflict&) {
      // held by a live controller
    } catch (const util::Conflict& e) {
      ROLLOUT_LOG_DEBUG("adoption raced", {StringField("rollout_id", record.id), StringField("error", e.what())});
    } catch (const std::exception& e) {
      ROLLOUT_LOG_ERROR("rollout adoption failed", {StringField("rollout_id", record.id), StringField("error", e.what())});
    }
  }
  return adopted;
}

bool RolloutController::Adopt(const db::model::RolloutRecord& candidate) {
  auto tx = deps_.repository->Begin();

  const auto current = deps_.repository->GetLease(*tx, candidate.service_name);
  if (current && current->holder_id != deps_.leases->HolderId() && current->expires_at_ms > util::NowMillis()) {
    tx->Rollback();
    return false;
  }

  auto record = deps_.repository->GetRollout(*tx, candidate.id);
  if (!record || record->terminal) {
    tx->Rollback();
    return false;
  }

  const auto lease   = deps_.leases->Acquire(*tx, candidate.service_name);
  auto       rollout = record->body;
  rollout.set_version(record->version);

  std::optional<v1::HistoryEntry> entry = MakeEntry(rollout.state(), rollout.state(), v1::REASON_CODE_LEASE_RECOVERED,
                                                    "resumed by controller " + deps_.leases->HolderId() + " (fencing token " +
                                                        std::to_string(lease.fencing_token) + ")");
  rollout = WriteInTx(*tx, rollout, {}, &entry);
  tx->Commit();

  Published(rollout, *entry);
  observability::Metrics::Instance().SetActiveRollouts(rollout.request().service_name(), 1);

  ROLLOUT_LOG_INFO("rollout adopted", {StringField("rollout_id", rollout.id()), StringField("service", rollout.request().service_name()),
                                       StringField("state", model::ToString(rollout.state())),
                                       IntField("fencing_token", static_cast<int64_t>(lease.fencing_token))});

  auto exec = StartExecution(rollout, lease);
  Enqueue(exec, Event{EventKind::kAdvance});
  return true;
}

RolloutController::ExecutionPtr RolloutController::EnsureExecution(const db::model::RolloutRecord& record) {
  std::lock_guard submit_lock(submit_mutex_);
  if (auto exec = FindExecution(record.id)) return exec;
  try {
    if (!Adopt(record)) return nullptr;
  } catch (const util::LeaseConflict&) {
    return nullptr;
  }
  return FindExecution(record.id);
}

// -------------------------------------------------------------------------
// Executions
// -------------------------------------------------------------------------

RolloutController::ExecutionPtr RolloutController::StartExecution(const v1::Rollout& rollout, const lease::Lease& lease) {
  auto exec          = std::make_shared<Execution>();
  exec->rollout_id   = rollout.id();
  exec->service_name = rollout.request().service_name();
  exec->lease        = lease;
  exec->next_renew   = util::SteadyClock::now() + options_.lease_renew_interval;

  std::lock_guard lock(executions_mutex_);
  executions_[exec->rollout_id] = exec;
  return exec;
}

RolloutController::ExecutionPtr RolloutController::FindExecution(const std::string& rollout_id) const {
  std::lock_guard lock(executions_mutex_);
  auto            it = executions_.find(rollout_id);
  return it == executions_.end() ? nullptr : it->second;
}

void RolloutController::Enqueue(const ExecutionPtr& exec, Event event) {
  {
    std::lock_guard lock(exec->mutex);
    if (exec->finished) return;
    exec->mailbox.push_back(std::move(event));
    if (exec->draining) return;
    exec->draining = true;
  }
  deps_.queue->Post("rollout.drain", [this, exec] { Drain(exec); });
}

void RolloutController::Drain(const ExecutionPtr& exec) {
  for (;;) {
    Event event;
    {
      std::lock_guard lock(exec->mutex);
      if (exec->finished || exec->mailbox.empty() || stopping_) {
        exec->draining = false;
        return;
      }
      event = std::move(exec->mailbox.front());
      exec->mailbox.pop_front();
    }
    Handle(exec, event);
  }
}

void RolloutController::Handle(const ExecutionPtr& exec, const Event& event) {
  Next next;
  try {
    switch (event.kind) {
      case EventKind::kAdvance:
        next = Drive(*exec);
        break;
      case EventKind::kAlert:
        next = HandleAlert(*exec, event);
        break;
      case EventKind::kAbort:
        next = HandleAbort(*exec, event);
        break;
      case EventKind::kHaltDecision:
        next = HandleHaltDecision(*exec, event);
        break;
    }
  } catch (const util::LeaseConflict& e) {
    ROLLOUT_LOG_WARN("lease lost, stopping execution", {StringField("rollout_id", exec->rollout_id), StringField("error", e.what())});
    Finish(exec, false);
    return;
  } catch (const util::Conflict& e) {
    ROLLOUT_LOG_WARN("rollout written elsewhere, stopping execution",
                     {StringField("rollout_id", exec->rollout_id), StringField("error", e.what())});
    Finish(exec, false);
    return;
  } catch (const std::exception& e) {
    try {
      next = HandleFailure(*exec, e);
    } catch (const util::LeaseConflict& lost) {
      ROLLOUT_LOG_WARN("lease lost while handling failure", {StringField("rollout_id", exec->rollout_id), StringField("error", lost.what())});
      Finish(exec, false);
      return;
    } catch (const util::Conflict& lost) {
      ROLLOUT_LOG_WARN("rollout written elsewhere while handling failure",
                       {StringField("rollout_id", exec->rollout_id), StringField("error", lost.what())});
      Finish(exec, false);
      return;
    }
  }
  Apply(exec, next);
}

void RolloutController::Apply(const ExecutionPtr& exec, Next next) {
  switch (next.kind) {
    case Next::Kind::kNow: {
      {
        std::lock_guard lock(exec->mutex);
        ++exec->timer_generation;
      }
      Enqueue(exec, Event{EventKind::kAdvance});
      break;
    }
    case Next::Kind::kAfter:
      ScheduleAdvance(exec, std::min(next.delay, options_.lease_renew_interval));
      break;
    case Next::Kind::kIdle:
      ScheduleAdvance(exec, options_.lease_renew_interval);
      break;
    case Next::Kind::kDone:
      Finish(exec, true);
      break;
  }
}

void RolloutController::ScheduleAdvance(const ExecutionPtr& exec, util::Millis delay) {
  uint64_t generation = 0;
  {
    std::lock_guard lock(exec->mutex);
    if (exec->finished) return;
    generation = ++exec->timer_generation;
  }

  deps_.queue->PostAfter(delay, "rollout.tick", [this, exec, generation] {
    {
      std::lock_guard lock(exec->mutex);
      // superseded by a later schedule or an immediate advance
      if (exec->finished || exec->timer_generation != generation) return;
    }
    Enqueue(exec, Event{EventKind::kAdvance});
  });
}

void RolloutController::Interrupt(const ExecutionPtr& exec) {
  std::shared_ptr<util::CancelToken> token;
  {
    std::lock_guard lock(exec->mutex);
    exec->interrupted = true;
    token             = exec->cancel;
  }
  token->Cancel();
}

void RolloutController::ResetInterrupt(Execution& exec) {
  std::lock_guard lock(exec.mutex);
  exec.interrupted = false;
  if (exec.cancel->IsCancelled()) exec.cancel = std::make_shared<util::CancelToken>();
}

void RolloutController::Finish(const ExecutionPtr& exec, bool release_lease) {
  {
    std::lock_guard lock(exec->mutex);
    exec->finished = true;
    exec->mailbox.clear();
  }
  {
    std::lock_guard lock(executions_mutex_);
    auto            it = executions_.find(exec->rollout_id);
    if (it != executions_.end() && it->second == exec) executions_.erase(it);
  }

  if (release_lease) {
    try {
      deps_.leases->Release(exec->lease);
    } catch (const std::exception& e) {
      ROLLOUT_LOG_WARN("lease release failed", {StringField("service", exec->service_name), StringField("error", e.what())});
    }
    observability::Metrics::Instance().SetActiveRollouts(exec->service_name, 0);
  }
}

// -------------------------------------------------------------------------
// Event handlers
// -------------------------------------------------------------------------

RolloutController::Next RolloutController::HandleFailure(Execution& exec, const std::exception& error) {
  ROLLOUT_LOG_ERROR("rollout step failed", {StringField("rollout_id", exec.rollout_id), StringField("error", error.what())});

  try {
    const auto rollout = Load(exec.rollout_id);
    if (model::IsTerminal(rollout.state())) return Next::Done();

    const bool transient = dynamic_cast<const util::Unavailable*>(&error) != nullptr;

    if (rollout.state() == v1::ROLLOUT_STATE_ROLLING_BACK) {
      if (transient) return Next::After(options_.retry.max_backoff);
      Transition(exec, rollout, v1::ROLLOUT_STATE_FAILED, v1::REASON_CODE_INTERNAL_ERROR, error.what());
      return Next::Done();
    }

    auto reason = v1::REASON_CODE_INTERNAL_ERROR;
    if (dynamic_cast<const util::UnexpectedTermination*>(&error) != nullptr) {
      reason = v1::REASON_CODE_UNEXPECTED_TERMINATION;
    } else if (transient) {
      reason = v1::REASON_CODE_TRANSIENT_EXHAUSTED;
    }
    return BeginRollback(exec, rollout, reason, error.what());
  } catch (const util::LeaseConflict&) {
    throw;
  } catch (const util::Conflict&) {
    throw;
  } catch (const std::exception& e) {
    ROLLOUT_LOG_ERROR("failure handling failed, retrying later", {StringField("rollout_id", exec.rollout_id), StringField("error", e.what())});
    return Next::After(options_.provision_poll_interval);
  }
}

RolloutController::Next RolloutController::HandleAlert(Execution& exec, const Event& event) {
  const auto rollout = Load(exec.rollout_id);
  if (model::IsTerminal(rollout.state())) return Next::Done();

  if (rollout.state() == v1::ROLLOUT_STATE_SHIFTING || rollout.state() == v1::ROLLOUT_STATE_SOAKING) {
    return BeginRollback(exec, rollout, v1::REASON_CODE_SOAK_ALERT, event.detail);
  }

  ResetInterrupt(exec);
  return Next::Now();
}

RolloutController::Next RolloutController::HandleAbort(Execution& exec, const Event& event) {
  const auto rollout = Load(exec.rollout_id);
  if (model::IsTerminal(rollout.state())) return Next::Done();

  if (rollout.state() == v1::ROLLOUT_STATE_ROLLING_BACK) {
    ResetInterrupt(exec);
    return Next::Now();
  }
  return BeginRollback(exec, rollout, v1::REASON_CODE_OPERATOR_ABORTED, event.detail);
}

RolloutController::Next RolloutController::HandleHaltDecision(Execution& exec, const Event& event) {
  auto rollout = Load(exec.rollout_id);
  if (rollout.state() != v1::ROLLOUT_STATE_SHIFTING || !rollout.halted()) {
    ROLLOUT_LOG_INFO("halt decision ignored, rollout no longer halted", {StringField("rollout_id", exec.rollout_id)});
    return model::IsTerminal(rollout.state()) ? Next::Done() : Next::Now();
  }

  if (event.decision == v1::HALT_DECISION_ROLLBACK) {
    return BeginRollback(exec, rollout, v1::REASON_CODE_BATCH_HALTED, "operator chose rollback after halted batch " +
                                                                          std::to_string(rollout.current_step() + 1));
  }

  Annotate(exec, rollout, v1::REASON_CODE_BATCH_RETRY, "operator retried batch " + std::to_string(rollout.current_step() + 1),
           [](v1::Rollout& next) {
             next.set_halted(false);
             next.set_batch_phase(v1::BATCH_PHASE_SCALING);
             *next.mutable_phase_started_at() = util::ToProto(util::Now());
           });
  return Next::Now();
}

RolloutController::Next RolloutController::BeginRollback(Execution& exec, const v1::Rollout& rollout, v1::ReasonCode reason, const std::string& diagnostic) {
  Transition(exec, rollout, v1::ROLLOUT_STATE_ROLLING_BACK, reason, diagnostic, [](v1::Rollout& next) { next.set_halted(false); });
  ResetInterrupt(exec);
  return Next::Now();
}

RolloutController::Next RolloutController::Drive(Execution& exec) {
  if (exec.interrupted) return Next::Idle();

  auto rollout = Load(exec.rollout_id);
  if (model::IsTerminal(rollout.state())) return Next::Done();

  RenewIfDue(exec);

  if (rollout.state() != v1::ROLLOUT_STATE_ROLLING_BACK && Elapsed(rollout.created_at()) > options_.rollout_timeout) {
    return BeginRollback(exec, rollout, v1::REASON_CODE_ROLLOUT_TIMEOUT,
                         "rollout exceeded " + std::to_string(options_.rollout_timeout.count()) + "ms");
  }

  switch (rollout.state()) {
    case v1::ROLLOUT_STATE_PENDING:
      return DrivePending(exec, rollout);
    case v1::ROLLOUT_STATE_PROVISIONING:
      return DriveProvisioning(exec, std::move(rollout));
    case v1::ROLLOUT_STATE_VALIDATING:
      return DriveValidating(exec, rollout);
    case v1::ROLLOUT_STATE_SHIFTING:
      return DriveShifting(exec, rollout);
    case v1::ROLLOUT_STATE_SOAKING:
      return DriveSoaking(exec, rollout);
    case v1::ROLLOUT_STATE_ROLLING_BACK:
      return DriveRollingBack(exec, rollout);
    default:
      throw std::runtime_error("rollout " + rollout.id() + " has unknown state " + std::to_string(rollout.state()));
  }
}

RolloutController::Next RolloutController::DrivePending(Execution& exec, const v1::Rollout& rollout) {
  Transition(exec, rollout, v1::ROLLOUT_STATE_PROVISIONING, v1::REASON_CODE_ARTIFACT_RESOLVED, rollout.artifact().locator(),
             [](v1::Rollout& next) { *next.mutable_phase_started_at() = util::ToProto(util::Now()); });
  return Next::Now();
}

RolloutController::Next RolloutController::DriveProvisioning(Execution& exec, v1::Rollout rollout) {
  const auto  service = rollout.request().service_name();
  const auto  cancel  = exec.cancel;

  if (rollout.target_group_id().empty()) {
    const auto plan = PlanFor(rollout);

    v1::InstanceGroupSpec spec;
    spec.set_service_name(service);
    *spec.mutable_artifact() = rollout.artifact();
    spec.set_replicas(plan.initial_target_replicas);
    // replays after a crash get the same group back
    spec.set_request_token(rollout.id());

    const auto group_id = util::RetryTransient(
        options_.retry, "scheduler.create", [&] { return deps_.scheduler->CreateInstanceGroup(spec); }, cancel.get());

    v1::InstanceGroup group;
    group.set_id(group_id);
    group.set_service_name(service);
    *group.mutable_artifact() = rollout.artifact();
    group.set_desired_replicas(plan.initial_target_replicas);
    group.set_lifecycle_state(v1::LIFECYCLE_STATE_PROVISIONING);
    group.set_rollout_id(rollout.id());
    deps_.fleet->Register(group);

    rollout = Annotate(exec, rollout, v1::REASON_CODE_GROUP_CREATED, group_id + " with " + std::to_string(plan.initial_target_replicas) + " replicas",
                       [&](v1::Rollout& next) { next.set_target_group_id(group_id); });
  }

  const auto target = rollout.target_group_id();
  const auto group  = RefreshGroup(exec, target);

  if (group.desired_replicas() > 0 && group.ready_replicas() >= group.desired_replicas()) {
    deps_.fleet->SetLifecycle(target, v1::LIFECYCLE_STATE_READY);
    Transition(exec, rollout, v1::ROLLOUT_STATE_VALIDATING, v1::REASON_CODE_GROUP_READY,
               std::to_string(group.ready_replicas()) + "/" + std::to_string(group.desired_replicas()) + " replicas ready");
    return Next::Now();
  }

  const auto timeout = ProvisionTimeout(rollout);
  if (Elapsed(rollout.phase_started_at()) > timeout) {
    return BeginRollback(exec, rollout, v1::REASON_CODE_PROVISIONING_TIMEOUT,
                         std::to_string(group.ready_replicas()) + "/" + std::to_string(group.desired_replicas()) + " replicas ready after " +
                             std::to_string(timeout.count()) + "ms");
  }
  return Next::After(options_.provision_poll_interval);
}

RolloutController::Next RolloutController::DriveValidating(Execution& exec, const v1::Rollout& rollout) {
  const auto group = deps_.fleet->Find(rollout.target_group_id());
  if (!group) {
    throw util::UnexpectedTermination("target group " + rollout.target_group_id() + " is unknown");
  }

  const auto cancel = exec.cancel;
  const auto result = deps_.gate->Evaluate(*group, deps_.checks, cancel.get());
  if (exec.interrupted) return Next::Idle();

  if (!result.passed) {
    return BeginRollback(exec, rollout, v1::REASON_CODE_HEALTH_GATE_FAILED, result.Summary());
  }

  deps_.fleet->SetLifecycle(group->id(), v1::LIFECYCLE_STATE_VALIDATED);
  Transition(exec, rollout, v1::ROLLOUT_STATE_SHIFTING, v1::REASON_CODE_HEALTH_GATE_PASSED,
             std::to_string(result.results.size()) + " checks passed", [](v1::Rollout& next) {
               next.set_current_step(0);
               next.set_batch_phase(v1::BATCH_PHASE_SCALING);
               *next.mutable_phase_started_at() = util::ToProto(util::Now());
             });
  return Next::Now();
}

std::map<std::string, uint32_t> RolloutController::SplitFor(const v1::Rollout& rollout, uint32_t target_percent) const {
  std::map<std::string, uint32_t> weights;
  weights[rollout.target_group_id()] = target_percent;
  if (target_percent < 100 && !rollout.source_group_id().empty()) {
    weights[rollout.source_group_id()] = 100 - target_percent;
  }
  return weights;
}

RolloutController::Next RolloutController::DriveShifting(Execution& exec, const v1::Rollout& rollout) {
  if (rollout.halted()) return Next::Idle();

  const auto plan = PlanFor(rollout);
  if (rollout.current_step() >= plan.steps.size()) {
    throw std::runtime_error("rollout " + rollout.id() + " is at step " + std::to_string(rollout.current_step()) + " of " +
                             std::to_string(plan.steps.size()));
  }

  const auto& step    = plan.steps[rollout.current_step()];
  const auto& service = rollout.request().service_name();
  const auto& target  = rollout.target_group_id();

  if (step.kind != strategy::StepKind::kReplicaBatch) {
    RefreshGroup(exec, target);
  }

  switch (step.kind) {
    case strategy::StepKind::kWeight:
      deps_.fleet->SetWeights(service, SplitFor(rollout, step.target_percent));
      deps_.fleet->SetLifecycle(target, v1::LIFECYCLE_STATE_SERVING);
      Transition(exec, rollout, v1::ROLLOUT_STATE_SOAKING, v1::REASON_CODE_TRAFFIC_SHIFTED,
                 "step " + std::to_string(rollout.current_step() + 1) + "/" + std::to_string(plan.steps.size()) + ": target at " +
                     Percent(step.target_percent),
                 [](v1::Rollout& next) { *next.mutable_step_started_at() = util::ToProto(util::Now()); });
      return Next::Now();

    case strategy::StepKind::kMirror:
      deps_.fleet->SetMirror(service, target, true);
      Transition(exec, rollout, v1::ROLLOUT_STATE_SOAKING, v1::REASON_CODE_TRAFFIC_SHIFTED, "mirroring live traffic to " + target,
                 [](v1::Rollout& next) { *next.mutable_step_started_at() = util::ToProto(util::Now()); });
      return Next::Now();

    case strategy::StepKind::kReplicaBatch:
      return DriveBatch(exec, rollout, plan);
  }
  return Next::Idle();
}

RolloutController::Next RolloutController::DriveBatch(Execution& exec, v1::Rollout rollout, const strategy::TrafficPlan& plan) {
  const auto& step    = plan.steps[rollout.current_step()];
  const auto  batch   = std::to_string(rollout.current_step() + 1) + "/" + std::to_string(plan.steps.size());
  // `rollout` is reassigned below; nothing may borrow from it
  const auto  service = rollout.request().service_name();
  const auto  target  = rollout.target_group_id();
  const auto  cancel  = exec.cancel;

  if (rollout.batch_phase() != v1::BATCH_PHASE_VALIDATING) {
    ScaleGroup(exec, target, step.target_replicas);

    const auto group = RefreshGroup(exec, target);
    if (group.ready_replicas() < group.desired_replicas()) {
      if (Elapsed(rollout.phase_started_at()) > ProvisionTimeout(rollout)) {
        return HaltBatch(exec, rollout,
                         "batch " + batch + ": " + std::to_string(group.ready_replicas()) + "/" + std::to_string(group.desired_replicas()) +
                             " replicas ready before timeout");
      }
      return Next::After(options_.provision_poll_interval);
    }

    rollout = Update(exec, rollout, [](v1::Rollout& next) { next.set_batch_phase(v1::BATCH_PHASE_VALIDATING); });
  }

  if (step.rerun_gate) {
    const auto group = deps_.fleet->Find(target);
    if (!group) {
      throw util::UnexpectedTermination("target group " + target + " is unknown");
    }
    const auto result = deps_.gate->Evaluate(*group, deps_.checks, cancel.get());
    if (exec.interrupted) return Next::Idle();
    if (!result.passed) {
      return HaltBatch(exec, rollout, "batch " + batch + " failed health gate: " + result.Summary());
    }
  }

  deps_.fleet->SetWeights(service, SplitFor(rollout, step.target_percent));
  deps_.fleet->SetLifecycle(target, v1::LIFECYCLE_STATE_SERVING);
  if (!rollout.source_group_id().empty()) {
    ScaleGroup(exec, rollout.source_group_id(), step.source_replicas);
  }

  Transition(exec, rollout, v1::ROLLOUT_STATE_SOAKING, v1::REASON_CODE_TRAFFIC_SHIFTED,
             "batch " + batch + ": target " + std::to_string(step.target_replicas) + " replicas at " + Percent(step.target_percent) +
                 ", source " + std::to_string(step.source_replicas) + " replicas",
             [](v1::Rollout& next) { *next.mutable_step_started_at() = util::ToProto(util::Now()); });
  return Next::Now();
}

RolloutController::Next RolloutController::HaltBatch(Execution& exec, const v1::Rollout& rollout, const std::string& diagnostic) {
  auto halted = Annotate(exec, rollout, v1::REASON_CODE_BATCH_HALTED, diagnostic, [](v1::Rollout& next) { next.set_halted(true); });

  if (rollout.request().strategy_params().halt_policy() == v1::HALT_POLICY_ROLLBACK) {
    return BeginRollback(exec, halted, v1::REASON_CODE_BATCH_HALTED, diagnostic);
  }

  ROLLOUT_LOG_WARN("rollout halted, waiting for operator", {StringField("rollout_id", rollout.id()), StringField("diagnostic", diagnostic)});
  return Next::Idle();
}

std::optional<std::pair<v1::ReasonCode, std::string>> RolloutController::EvaluateSoak(const v1::Rollout& rollout, util::Millis window) {
  const auto& params     = rollout.request().strategy_params();
  const auto& service    = rollout.request().service_name();
  const auto& thresholds = params.thresholds();

  auto names = soak::MetricNames(thresholds);
  if (rollout.request().strategy() != v1::STRATEGY_SHADOW) {
    if (names.empty()) return std::nullopt;

    const auto values = util::RetryTransient(options_.retry, "metrics.query", [&] {
      return deps_.metrics->Query(service, rollout.target_group_id(), names, window);
    });
    if (auto breach = soak::EvaluateThresholds(thresholds, values)) {
      return std::make_pair(v1::REASON_CODE_SOAK_THRESHOLD_BREACHED, breach->diagnostic);
    }
    return std::nullopt;
  }

  if (names.empty()) names = soak::DefaultDivergenceMetrics();

  const auto shadow = util::RetryTransient(options_.retry, "metrics.query",
                                           [&] { return deps_.metrics->Query(service, rollout.target_group_id(), names, window); });
  if (auto breach = soak::EvaluateThresholds(thresholds, shadow)) {
    return std::make_pair(v1::REASON_CODE_SOAK_THRESHOLD_BREACHED, breach->diagnostic);
  }

  const auto live = util::RetryTransient(options_.retry, "metrics.query",
                                         [&] { return deps_.metrics->Query(service, rollout.source_group_id(), names, window); });
  const auto tolerance =
      params.divergence_tolerance() > 0.0 ? params.divergence_tolerance() : strategy::kDefaultDivergenceTolerance;
  if (auto breach = soak::EvaluateDivergence(names, live, shadow, tolerance)) {
    return std::make_pair(v1::REASON_CODE_SHADOW_DIVERGENCE, breach->diagnostic);
  }
  return std::nullopt;
}

RolloutController::Next RolloutController::DriveSoaking(Execution& exec, const v1::Rollout& rollout) {
  const auto  plan    = PlanFor(rollout);
  const auto& step    = plan.steps.at(rollout.current_step());
  const auto  elapsed = Elapsed(rollout.step_started_at());
  const auto  tick    = TickInterval(rollout);

  // a target the cluster killed mid-soak never advances or gets promoted
  RefreshGroup(exec, rollout.target_group_id());

  if (step.soak.count() > 0) {
    if (auto breach = EvaluateSoak(rollout, std::min(tick, step.soak))) {
      ROLLOUT_LOG_WARN("soak breach", {StringField("rollout_id", rollout.id()), StringField("diagnostic", breach->second),
                                       IntField("elapsed_ms", elapsed.count())});
      return BeginRollback(exec, rollout, breach->first, breach->second);
    }
  }

  if (elapsed < step.soak) {
    return Next::After(std::min(tick, step.soak - elapsed));
  }

  if (rollout.current_step() + 1 < plan.steps.size()) {
    Transition(exec, rollout, v1::ROLLOUT_STATE_SHIFTING, v1::REASON_CODE_STEP_ADVANCED,
               "soak of step " + std::to_string(rollout.current_step() + 1) + " held for " + std::to_string(elapsed.count()) + "ms",
               [](v1::Rollout& next) {
                 next.set_current_step(next.current_step() + 1);
                 next.set_batch_phase(v1::BATCH_PHASE_SCALING);
                 *next.mutable_phase_started_at() = util::ToProto(util::Now());
               });
    return Next::Now();
  }

  return Promote(exec, rollout);
}

RolloutController::Next RolloutController::Promote(Execution& exec, const v1::Rollout& rollout) {
  const auto& service = rollout.request().service_name();
  const auto& target  = rollout.target_group_id();

  if (rollout.request().strategy() == v1::STRATEGY_SHADOW) {
    deps_.fleet->SetMirror(service, target, false);
    deps_.fleet->SetLifecycle(target, v1::LIFECYCLE_STATE_RETIRING);
    deps_.teardown->Schedule(target);

    Transition(exec, rollout, v1::ROLLOUT_STATE_PROMOTED, v1::REASON_CODE_PROMOTED,
               "shadow of " + rollout.artifact().version() + " matched live traffic; shadow group retired");
    return Next::Done();
  }

  const auto serving = deps_.fleet->ServingGroup(service);
  if (!serving || serving->id() != target) {
    deps_.fleet->SetWeights(service, {{target, 100}});
  }
  deps_.fleet->SetLifecycle(target, v1::LIFECYCLE_STATE_SERVING);

  if (!rollout.source_group_id().empty()) {
    const auto source = deps_.fleet->Find(rollout.source_group_id());
    if (source && source->lifecycle_state() == v1::LIFECYCLE_STATE_SERVING) {
      deps_.fleet->SetLifecycle(source->id(), v1::LIFECYCLE_STATE_RETIRING);
      deps_.teardown->Schedule(source->id());
    }
  }

  Transition(exec, rollout, v1::ROLLOUT_STATE_PROMOTED, v1::REASON_CODE_PROMOTED,
             rollout.artifact().name() + "@" + rollout.artifact().version() + " serving 100% on " + target);
  return Next::Done();
}

RolloutController::Next RolloutController::DriveRollingBack(Execution& exec, const v1::Rollout& rollout) {
  std::string reason = "rollback";
  {
    auto tx      = deps_.repository->Begin();
    auto history = deps_.repository->GetHistory(*tx, rollout.id());
    tx->Commit();
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
      if (it->to_state == v1::ROLLOUT_STATE_ROLLING_BACK && it->from_state != it->to_state) {
        reason = v1::ReasonCode_Name(it->reason) + (it->diagnostic.empty() ? "" : ": " + it->diagnostic);
        break;
      }
    }
  }

  const auto cancel = exec.cancel;
  try {
    const auto result = util::RetryTransient(
        options_.retry, "rollback", [&] { return deps_.rollback->Rollback(rollout.id(), reason, cancel.get()); }, cancel.get());
    Transition(exec, rollout, v1::ROLLOUT_STATE_ROLLED_BACK, v1::REASON_CODE_ROLLBACK_COMPLETED, result.diagnostic);
  } catch (const util::IrrecoverableRollout& e) {
    Transition(exec, rollout, v1::ROLLOUT_STATE_FAILED, v1::REASON_CODE_ROLLBACK_IMPOSSIBLE, e.what());
  } catch (const util::Unavailable& e) {
    ROLLOUT_LOG_ERROR("rollback attempt failed, will retry", {StringField("rollout_id", rollout.id()), StringField("error", e.what())});
    ResetInterrupt(exec);
    return Next::After(options_.retry.max_backoff);
  }
  return Next::Done();
}

// -------------------------------------------------------------------------
// Persistence
// -------------------------------------------------------------------------

v1::Rollout RolloutController::Load(const std::string& rollout_id) {
  auto tx     = deps_.repository->Begin();
  auto record = deps_.repository->GetRollout(*tx, rollout_id);
  tx->Commit();
  if (!record) {
    throw util::NotFound("rollout not found: " + rollout_id);
  }

  auto rollout = record->body;
  rollout.set_version(record->version);
  return rollout;
}

v1::Rollout RolloutController::Assemble(db::Transaction& tx, const db::model::RolloutRecord& record) {
  auto rollout = record.body;
  rollout.set_version(record.version);
  for (const auto& entry : deps_.repository->GetHistory(tx, record.id)) {
    *rollout.add_history() = FromHistoryRecord(entry);
  }
  *rollout.mutable_traffic() = deps_.splitter->GetWeights(record.service_name)->ToProto();
  return rollout;
}

v1::Rollout RolloutController::Transition(Execution& exec, const v1::Rollout& current, v1::RolloutState to, v1::ReasonCode reason,
                                          const std::string& diagnostic, const Mutation& mutate) {
  if (!model::CanTransition(current.state(), to)) {
    throw util::InvalidState("rollout " + current.id() + " cannot move from " + std::string(model::ToString(current.state())) + " to " +
                             std::string(model::ToString(to)));
  }

  return Write(
      exec, current,
      [&](v1::Rollout& next) {
        if (mutate) mutate(next);
        next.set_state(to);
      },
      MakeEntry(current.state(), to, reason, diagnostic));
}

v1::Rollout RolloutController::Annotate(Execution& exec, const v1::Rollout& current, v1::ReasonCode reason, const std::string& diagnostic,
                                        const Mutation& mutate) {
  return Write(exec, current, mutate, MakeEntry(current.state(), current.state(), reason, diagnostic));
}

v1::Rollout RolloutController::Update(Execution& exec, const v1::Rollout& current, const Mutation& mutate) {
  return Write(exec, current, mutate, std::nullopt);
}

v1::Rollout RolloutController::Write(Execution& exec, const v1::Rollout& current, const Mutation& mutate,
                                     std::optional<v1::HistoryEntry> entry) {
  auto tx = deps_.repository->Begin();
  deps_.leases->CheckHeld(*tx, exec.lease);
  auto next = WriteInTx(*tx, current, mutate, &entry);
  tx->Commit();

  if (entry) Published(next, *entry);
  return next;
}

v1::Rollout RolloutController::WriteInTx(db::Transaction& tx, const v1::Rollout& current, const Mutation& mutate,
                                         std::optional<v1::HistoryEntry>* entry) {
  auto next = current;
  next.clear_history();
  next.clear_traffic();
  if (mutate) mutate(next);
  next.set_version(current.version() + 1);
  *next.mutable_updated_at() = util::ToProto(util::Now());

  db::ThrowIfDbError(deps_.repository->UpdateRollout(tx, ToRecord(next), current.version()), "update rollout " + current.id());

  if (entry != nullptr && entry->has_value()) {
    auto& record = **entry;
    record.set_seq(deps_.repository->GetHistory(tx, current.id()).size() + 1);
    *record.mutable_at() = next.updated_at();
    db::ThrowIfDbError(deps_.repository->AppendHistory(tx, ToHistoryRecord(current.id(), record)), "append history for " + current.id());
  }
  return next;
}

void RolloutController::Published(const v1::Rollout& rollout, const v1::HistoryEntry& entry) {
  const auto from   = model::ToString(entry.from_state());
  const auto to     = model::ToString(entry.to_state());
  const auto reason = v1::ReasonCode_Name(entry.reason());

  ROLLOUT_LOG_INFO("rollout transition", {StringField("rollout_id", rollout.id()), StringField("service", rollout.request().service_name()),
                                          StringField("from", from), StringField("to", to), StringField("reason", reason),
                                          StringField("diagnostic", entry.diagnostic()), IntField("seq", static_cast<int64_t>(entry.seq()))});

  if (entry.from_state() != entry.to_state()) {
    observability::Metrics::Instance().RecordTransition(from, to, reason);
  }

  v1::RolloutEvent event;
  event.set_rollout_id(rollout.id());
  event.set_service_name(rollout.request().service_name());
  *event.mutable_transition() = entry;

  if (model::IsTerminal(entry.to_state())) {
    observability::Metrics::Instance().ObserveRolloutDurationMs(model::ToString(rollout.request().strategy()), to,
                                                                static_cast<double>(Elapsed(rollout.created_at()).count()));
  }

  if (entry.to_state() == v1::ROLLOUT_STATE_FAILED) {
    auto tx = deps_.repository->Begin();
    for (const auto& record : deps_.repository->GetHistory(*tx, rollout.id())) {
      *event.add_history() = FromHistoryRecord(record);
    }
    tx->Commit();
  }

  try {
    deps_.notifier->Notify(event);
  } catch (const std::exception& e) {
    ROLLOUT_LOG_WARN("notification failed", {StringField("rollout_id", rollout.id()), StringField("error", e.what())});
  }
}

// -------------------------------------------------------------------------
// Helpers
// -------------------------------------------------------------------------

strategy::TrafficPlan RolloutController::PlanFor(const v1::Rollout& rollout) const {
  return strategy::BuildTrafficPlan(rollout.request(), rollout.artifact().resource_spec().replicas(), rollout.source_replicas());
}

util::Millis RolloutController::ProvisionTimeout(const v1::Rollout& rollout) const {
  return util::OrDefault(rollout.request().strategy_params().provision_timeout(), options_.provision_timeout);
}

util::Millis RolloutController::TickInterval(const v1::Rollout& rollout) const {
  return util::OrDefault(rollout.request().strategy_params().tick_interval(), options_.default_tick_interval);
}

void RolloutController::RenewIfDue(Execution& exec) {
  const auto now = util::SteadyClock::now();
  if (now < exec.next_renew) return;

  exec.lease      = deps_.leases->Renew(exec.lease);
  exec.next_renew = now + options_.lease_renew_interval;
}

void RolloutController::ScaleGroup(Execution& exec, const std::string& group_id, uint32_t replicas) {
  const auto group = deps_.fleet->Find(group_id);
  if (!group) {
    throw util::UnexpectedTermination("instance group " + group_id + " is unknown");
  }
  if (group->desired_replicas() == replicas) return;

  const auto cancel = exec.cancel;
  util::RetryTransient(
      options_.retry, "scheduler.scale", [&] { deps_.scheduler->ScaleInstanceGroup(group_id, replicas); }, cancel.get());
  deps_.fleet->SetDesiredReplicas(group_id, replicas);

  ROLLOUT_LOG_INFO("instance group scaled", {StringField("group_id", group_id), IntField("from", group->desired_replicas()),
                                             IntField("to", replicas)});
}

v1::InstanceGroup RolloutController::RefreshGroup(Execution& exec, const std::string& group_id) {
  const auto cancel = exec.cancel;
  return util::RetryTransient(
      options_.retry, "scheduler.status", [&] { return deps_.fleet->RefreshReadiness(group_id); }, cancel.get());
}

} // namespace rollout::core
