#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace autopilot::db::postgres {

/*
  PgPool

  Bounded pool of pqxx connections shared by PgRepository and PgTransaction.

  - At most max_connections are open; Acquire blocks until one is idle.
  - A connection serves one transaction at a time and returns to the idle
    list when the last shared_ptr to it is dropped.
  - Every new connection gets the entity and action statements prepared
    (get_entity, upsert_entity, get_action, insert_action, update_action,
    latest_executed_action, update_outcome_attribution).
  - A connection released after the pool is destroyed is closed.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Blocks while the pool is exhausted.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace autopilot::db::postgres
