#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace autopilot::db::sqlite {

/*
  SqliteDB

  Owns the single sqlite3 connection behind SqliteRepository. The file is
  opened in WAL mode with a busy timeout; every SqliteTransaction runs on
  this connection and holds TxMutex() from BEGIN to COMMIT/ROLLBACK.

  EnsureSchema() applies the autopilot tables in one transaction and
  stamps PRAGMA user_version. A file written by a newer build is refused.
*/
class SqliteDB {
 public:
  static constexpr int kSchemaVersion = 1;

  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Throws std::runtime_error with the sqlite message on failure.
  void Exec(const std::string& sql);

  void EnsureSchema();
  int  SchemaVersion();

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  std::mutex  tx_mutex_;
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace autopilot::db::sqlite
