#include "sqlite_db.hpp"

#include <stdexcept>

namespace collector::queue::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(options_.path + ": " + msg);
  }

  try {
    Configure();
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
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

int64_t SqliteDB::QueryInt(const std::string& sql) {
  sqlite3_stmt* stmt = Prepare(sql);
  int           rc   = sqlite3_step(stmt);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(stmt);
    throw std::runtime_error("sqlite query returned no row: " + sql);
  }
  const int64_t value = sqlite3_column_int64(stmt, 0);
  sqlite3_finalize(stmt);
  return value;
}

void SqliteDB::Configure() {
  if (options_.synchronous != "FULL" && options_.synchronous != "NORMAL") {
    throw std::runtime_error("unsupported synchronous mode '" + options_.synchronous + "'");
  }

  // WAL lets PeekBatch read while an append commits
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=" + options_.synchronous + ";");
  Exec("PRAGMA wal_autocheckpoint=" + std::to_string(options_.wal_autocheckpoint) + ";");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  if (options_.max_size_bytes > 0) {
    const auto page_size = QueryInt("PRAGMA page_size;");
    auto       max_pages = static_cast<int64_t>(options_.max_size_bytes) / page_size;
    if (max_pages < 1) max_pages = 1;
    Exec("PRAGMA max_page_count=" + std::to_string(max_pages) + ";");
  }
}

} // namespace collector::queue::sqlite
