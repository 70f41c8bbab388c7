#include "store_gateway.hpp"

#include "internal/util/format.hpp"

namespace autopilot::gateway {

namespace {

GatewayReceipt Replayed() {
  return {true, "already applied", {{"idempotent_replay", "true"}}};
}

void Save(db::Repository& repository, db::Transaction& tx, const db::model::EntityRecord& entity) {
  auto result = repository.UpsertEntity(tx, entity);
  if (!result) throw GatewayError("entity " + entity.id + ": " + result.message);
}

} // namespace

StoreGateway::StoreGateway(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::chrono::hours replay_window,
                           std::size_t max_remembered)
    : repository_(std::move(repository)),
      clock_(std::move(clock)),
      replay_window_ms_(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(replay_window).count())),
      max_remembered_(max_remembered) {
}

GatewayReceipt StoreGateway::UpdateBudget(const std::string& action_id, const std::string& entity_id, double new_daily_budget_usd) {
  if (AlreadyApplied(action_id)) return Replayed();
  if (new_daily_budget_usd < 0.0) throw GatewayError("daily budget cannot be negative");

  auto tx     = repository_->Begin();
  auto entity = repository_->GetEntity(*tx, entity_id);
  if (!entity) throw GatewayError("entity " + entity_id + " not found");

  const double old_budget  = entity->daily_budget_usd;
  entity->daily_budget_usd = new_daily_budget_usd;
  entity->updated_at_ms    = util::ToUnixMillis(clock_->Now());
  Save(*repository_, *tx, *entity);
  tx->Commit();

  MarkApplied(action_id);
  return {true,
          "daily budget updated",
          {{"entity_id", entity_id}, {"old_budget", util::FormatFixed(old_budget, 2)}, {"new_budget", util::FormatFixed(new_daily_budget_usd, 2)}}};
}

GatewayReceipt StoreGateway::SetStatus(const std::string& action_id, const std::string& entity_id, const std::string& status) {
  if (AlreadyApplied(action_id)) return Replayed();

  auto tx     = repository_->Begin();
  auto entity = repository_->GetEntity(*tx, entity_id);
  if (!entity) throw GatewayError("entity " + entity_id + " not found");

  const auto previous   = entity->status;
  entity->status        = status;
  entity->updated_at_ms = util::ToUnixMillis(clock_->Now());
  Save(*repository_, *tx, *entity);
  tx->Commit();

  MarkApplied(action_id);
  return {true, "status updated", {{"entity_id", entity_id}, {"old_status", previous}, {"new_status", status}}};
}

GatewayReceipt StoreGateway::ApplyReallocation(const std::string& action_id, const autopilot::v1::ReallocationPlan& plan) {
  if (AlreadyApplied(action_id)) return Replayed();
  if (plan.allocations_size() == 0) throw GatewayError("reallocation plan has no allocations");

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  auto tx = repository_->Begin();
  for (const auto& allocation : plan.allocations()) {
    auto entity = repository_->GetEntity(*tx, allocation.ad_id());
    if (!entity) throw GatewayError("entity " + allocation.ad_id() + " not found");

    entity->daily_budget_usd = allocation.allocated_budget();
    entity->updated_at_ms    = now_ms;
    Save(*repository_, *tx, *entity);
  }
  tx->Commit();

  MarkApplied(action_id);
  return {true,
          "budgets reallocated",
          {{"ads", std::to_string(plan.allocations_size())}, {"total_allocated", util::FormatFixed(plan.total_allocated(), 2)}}};
}

GatewayReceipt StoreGateway::SwapCreative(const std::string&, const std::string& ad_id, const std::string&) {
  throw GatewayError("creative swap for ad " + ad_id + " requires a live ad platform");
}

bool StoreGateway::AlreadyApplied(const std::string& action_id) {
  std::lock_guard lock(applied_mutex_);
  Forget(util::ToUnixMillis(clock_->Now()));
  return applied_.count(action_id) > 0;
}

void StoreGateway::MarkApplied(const std::string& action_id) {
  const auto      now_ms = util::ToUnixMillis(clock_->Now());
  std::lock_guard lock(applied_mutex_);
  if (applied_.emplace(action_id, now_ms).second) {
    applied_order_.emplace_back(now_ms, action_id);
  }
  Forget(now_ms);
}

void StoreGateway::Forget(uint64_t now_ms) {
  const uint64_t cutoff = now_ms > replay_window_ms_ ? now_ms - replay_window_ms_ : 0;
  while (!applied_order_.empty() && (applied_order_.front().first < cutoff || applied_order_.size() > max_remembered_)) {
    applied_.erase(applied_order_.front().second);
    applied_order_.pop_front();
  }
}

} // namespace autopilot::gateway
