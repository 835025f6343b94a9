#include "traffic_splitter.hpp"

#include "internal/db/api/result_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rollout::traffic {

namespace {

WeightTablePtr EmptyTable(const std::string& service_name) {
  auto table          = std::make_shared<WeightTable>();
  table->service_name = service_name;
  return table;
}

std::string Describe(const WeightTable& table) {
  std::string out;
  for (const auto& [group, weight] : table.weights) {
    if (!out.empty()) out += ",";
    out += group + "=" + std::to_string(weight);
  }
  return out.empty() ? "<none>" : out;
}

} // namespace

TrafficSplitter::TrafficSplitter(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void TrafficSplitter::Hydrate() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListTrafficTables(*tx);
  tx->Commit();

  for (const auto& record : records) {
    auto& slot = SlotFor(record.service_name);
    auto  table = std::make_shared<WeightTable>(WeightTable::FromProto(record.body));
    table->service_name = record.service_name;
    table->version      = record.version;
    slot.table.store(std::move(table));
  }

  ROLLOUT_LOG_INFO("traffic tables hydrated", {observability::IntField("services", static_cast<int64_t>(records.size()))});
}

TrafficSplitter::Slot* TrafficSplitter::FindSlot(const std::string& service_name) const {
  std::shared_lock lock(slots_mutex_);
  auto             it = slots_.find(service_name);
  return it == slots_.end() ? nullptr : it->second.get();
}

TrafficSplitter::Slot& TrafficSplitter::SlotFor(const std::string& service_name) {
  if (auto* slot = FindSlot(service_name)) return *slot;

  std::unique_lock lock(slots_mutex_);
  auto&            slot = slots_[service_name];
  if (!slot) {
    slot = std::make_unique<Slot>();
    slot->table.store(EmptyTable(service_name));
  }
  return *slot;
}

WeightTablePtr TrafficSplitter::GetWeights(const std::string& service_name) const {
  if (auto* slot = FindSlot(service_name)) return slot->table.load();
  return EmptyTable(service_name);
}

void TrafficSplitter::Validate(const std::string& service_name, const std::map<std::string, uint32_t>& weights) {
  uint32_t total = 0;
  for (const auto& [group, weight] : weights) {
    if (group.empty()) {
      throw util::InvalidArgument("traffic weight for " + service_name + " names an empty group id");
    }
    if (weight > 100) {
      throw util::InvalidArgument("traffic weight " + std::to_string(weight) + " for group " + group + " exceeds 100");
    }
    total += weight;
  }
  if (total != 0 && total != 100) {
    throw util::InvalidArgument("traffic weights for " + service_name + " sum to " + std::to_string(total) + ", expected 100");
  }
}

WeightTablePtr TrafficSplitter::Publish(Slot& slot, WeightTable next) {
  const auto current = slot.table.load();

  next.service_name = current->service_name;
  next.version      = current->version + 1;
  next.updated_at   = util::Now();

  db::model::TrafficTableRecord record;
  record.service_name = next.service_name;
  record.version      = next.version;
  record.body         = next.ToProto();

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertTrafficTable(*tx, record), "persist traffic table for " + next.service_name);
  tx->Commit();

  auto published = std::make_shared<const WeightTable>(std::move(next));
  slot.table.store(published);

  ROLLOUT_LOG_INFO("traffic table updated",
                   {observability::StringField("service", published->service_name),
                    observability::IntField("version", static_cast<int64_t>(published->version)),
                    observability::StringField("weights", Describe(*published)),
                    observability::IntField("mirrors", static_cast<int64_t>(published->mirrors.size()))});
  return published;
}

WeightTablePtr TrafficSplitter::SetWeights(const std::string& service_name, const std::map<std::string, uint32_t>& weights,
                                           std::optional<uint64_t> expected_version) {
  Validate(service_name, weights);

  auto&           slot = SlotFor(service_name);
  std::lock_guard lock(slot.write_mutex);

  const auto current = slot.table.load();
  if (expected_version && *expected_version != current->version) {
    throw util::Conflict("traffic table for " + service_name + " is at version " + std::to_string(current->version) + ", expected " +
                         std::to_string(*expected_version));
  }

  WeightTable next = *current;
  next.weights.clear();
  for (const auto& [group, weight] : weights) {
    if (weight > 0) next.weights[group] = weight;
  }
  return Publish(slot, std::move(next));
}

WeightTablePtr TrafficSplitter::SetMirror(const std::string& service_name, const std::string& group_id) {
  auto&           slot = SlotFor(service_name);
  std::lock_guard lock(slot.write_mutex);

  const auto current = slot.table.load();
  if (current->mirrors.contains(group_id)) return current;

  WeightTable next = *current;
  next.mirrors.insert(group_id);
  return Publish(slot, std::move(next));
}

WeightTablePtr TrafficSplitter::ClearMirror(const std::string& service_name, const std::string& group_id) {
  auto&           slot = SlotFor(service_name);
  std::lock_guard lock(slot.write_mutex);

  const auto current = slot.table.load();
  if (!current->mirrors.contains(group_id)) return current;

  WeightTable next = *current;
  next.mirrors.erase(group_id);
  return Publish(slot, std::move(next));
}

WeightTablePtr TrafficSplitter::RemoveGroup(const std::string& service_name, const std::string& group_id) {
  auto&           slot = SlotFor(service_name);
  std::lock_guard lock(slot.write_mutex);

  const auto current = slot.table.load();
  if (current->WeightOf(group_id) > 0) {
    throw util::InvalidArgument("group " + group_id + " still receives " + std::to_string(current->WeightOf(group_id)) + "% of traffic");
  }
  if (!current->weights.contains(group_id) && !current->mirrors.contains(group_id)) return current;

  WeightTable next = *current;
  next.weights.erase(group_id);
  next.mirrors.erase(group_id);
  return Publish(slot, std::move(next));
}

} // namespace rollout::traffic
