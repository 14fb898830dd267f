#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace collector::queue::sqlite {

struct SqliteOptions {
  std::string path;

  // FULL fsyncs the WAL on every commit; NORMAL may lose the last
  // transactions on power loss.
  std::string synchronous = "FULL";

  uint32_t wal_autocheckpoint = 10;

  // 0 = unlimited. Enforced through PRAGMA max_page_count.
  uint64_t max_size_bytes = 0;
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Single integer result of a query such as "PRAGMA page_size;"
  int64_t QueryInt(const std::string& sql);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

} // namespace collector::queue::sqlite
