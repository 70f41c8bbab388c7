#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/sql/schema.hpp"

namespace autopilot::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open sqlite database " + path_ + ": " + msg);
  }

  try {
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error("sqlite " + path_ + ": " + msg);
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error("sqlite " + path_ + ": " + sqlite3_errmsg(db_));
  }
  int version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) version = sqlite3_column_int(stmt, 0);
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::EnsureSchema() {
  std::lock_guard lock(tx_mutex_);

  const int current = SchemaVersion();
  if (current > kSchemaVersion) {
    throw std::runtime_error("sqlite " + path_ + " has schema version " + std::to_string(current) + ", this build supports " +
                             std::to_string(kSchemaVersion));
  }

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& ddl : sql::SqliteSchema()) {
      Exec(ddl);
    }
    Exec("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
    Exec("COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

} // namespace autopilot::db::sqlite
