#include "pg_pool.hpp"

#include "pg_columns.hpp"

namespace autopilot::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_entity",
               "SELECT id,level,campaign_id,adset_id,name,status,daily_budget_usd,created_at_ms,updated_at_ms "
               "FROM entities WHERE id=$1");

  conn.prepare("upsert_entity",
               "INSERT INTO entities(id,level,campaign_id,adset_id,name,status,daily_budget_usd,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
               "ON CONFLICT(id) DO UPDATE SET level=EXCLUDED.level,campaign_id=EXCLUDED.campaign_id,adset_id=EXCLUDED.adset_id,"
               "name=EXCLUDED.name,status=EXCLUDED.status,daily_budget_usd=EXCLUDED.daily_budget_usd,"
               "created_at_ms=EXCLUDED.created_at_ms,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_action", std::string("SELECT ") + kActionSelectColumns + " FROM actions WHERE action_id=$1");

  conn.prepare("insert_action",
               "INSERT INTO actions(action_id,type,status,target_level,target_id,campaign_id,adset_id,ad_id,amount_pct,amount_usd,"
               "old_budget_usd,new_budget_usd,reason,reason_details,confidence,roas_value,safety_score,created_by,approved_by,executed_by,"
               "execution_result,execution_error,reallocation_plan,affected_ad_ids,created_at_ms,updated_at_ms,approved_at_ms,"
               "executed_at_ms,expires_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21::jsonb,$22,$23::jsonb,$24::jsonb,"
               "$25,$26,$27,$28,$29)");

  conn.prepare("update_action",
               "UPDATE actions SET type=$2,target_level=$3,target_id=$4,campaign_id=$5,adset_id=$6,ad_id=$7,amount_pct=$8,"
               "amount_usd=$9,old_budget_usd=$10,new_budget_usd=$11,reason=$12,reason_details=$13,confidence=$14,roas_value=$15,"
               "safety_score=$16,created_by=$17,approved_by=$18,executed_by=$19,execution_result=$20::jsonb,execution_error=$21,"
               "reallocation_plan=$22::jsonb,affected_ad_ids=$23::jsonb,created_at_ms=$24,updated_at_ms=$25,approved_at_ms=$26,"
               "executed_at_ms=$27,expires_at_ms=$28 WHERE action_id=$1");

  conn.prepare("latest_executed_action", std::string("SELECT ") + kActionSelectColumns +
                                             " FROM actions WHERE target_id=$1 AND type=$2 AND status=$3 "
                                             "ORDER BY executed_at_ms DESC LIMIT 1");

  conn.prepare("update_outcome_attribution", "UPDATE outcomes SET attribution_model=$2,attribution_weight=$3 WHERE outcome_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace autopilot::db::postgres
