#include "sqlite_queue.hpp"

#include "internal/util/time.hpp"

namespace collector::queue::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

SqliteQueue::SqliteQueue(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  BootstrapSchema(*db_);
  pending_ = static_cast<uint64_t>(db_->QueryInt("SELECT COUNT(*) FROM queue_entries;"));
}

void SqliteQueue::BootstrapSchema(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS queue_entries ("
      "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
      "line TEXT NOT NULL, "
      "enqueued_at_ms INTEGER NOT NULL);");

  db.Exec("SELECT seq,line,enqueued_at_ms FROM queue_entries LIMIT 1;");
}

Result SqliteQueue::Translate(sqlite3* db, int rc, const char* op) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  // Every backend failure means durability can no longer be promised:
  // SQLITE_FULL (disk or max_page_count), IOERR, CORRUPT, READONLY, BUSY
  // past the busy timeout.
  return Result::Err(QueueError::Unavailable,
                     std::string(op) + ": " + sqlite3_errstr(rc) + " (" + sqlite3_errmsg(db) + ")");
}

Result SqliteQueue::Enqueue(const std::string& line) {
  {
    std::lock_guard lock(mutex_);
    auto*           db = db_->Handle();

    const char*   sql = "INSERT INTO queue_entries(line,enqueued_at_ms) VALUES(?,?);";
    sqlite3_stmt* st  = nullptr;
    int           rc  = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc, "enqueue prepare");

    BindText(st, 1, line);
    BindU64(st, 2, util::ToUnixMillis(util::Now()));

    rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc, "enqueue");

    ++pending_;
  }
  cv_.notify_all();
  return Result::Ok();
}

Result SqliteQueue::PeekBatch(size_t max_count, std::vector<QueueEntry>* out) {
  out->clear();
  if (max_count == 0) return Result::Ok();

  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char*   sql = "SELECT seq,line FROM queue_entries ORDER BY seq ASC LIMIT ?;";
  sqlite3_stmt* st  = nullptr;
  int           rc  = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc, "peek prepare");

  BindU64(st, 1, max_count);

  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    QueueEntry e;
    e.sequence = ColU64(st, 0);
    e.line     = ColText(st, 1);
    out->push_back(std::move(e));
  }
  sqlite3_finalize(st);

  if (rc != SQLITE_DONE) {
    out->clear();
    return Translate(db, rc, "peek");
  }
  return Result::Ok();
}

Result SqliteQueue::OldestSequence(uint64_t* out) {
  auto* db = db_->Handle();

  const char*   sql = "SELECT COALESCE(MIN(seq), 0) FROM queue_entries;";
  sqlite3_stmt* st  = nullptr;
  int           rc  = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc, "oldest prepare");

  rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    *out = ColU64(st, 0);
  }
  sqlite3_finalize(st);
  return rc == SQLITE_ROW ? Result::Ok() : Translate(db, rc, "oldest");
}

bool SqliteQueue::Contains(uint64_t sequence) {
  auto* db = db_->Handle();

  const char*   sql = "SELECT 1 FROM queue_entries WHERE seq=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return false;

  BindU64(st, 1, sequence);
  const bool found = sqlite3_step(st) == SQLITE_ROW;
  sqlite3_finalize(st);
  return found;
}

Result SqliteQueue::Acknowledge(uint64_t sequence) {
  std::lock_guard lock(mutex_);

  uint64_t oldest = 0;
  auto     r      = OldestSequence(&oldest);
  if (!r) return r;

  // empty queue, or already acknowledged
  if (oldest == 0 || sequence < oldest) return Result::Ok();

  if (sequence > oldest) {
    if (!Contains(sequence)) return Result::Ok();
    return Result::Err(QueueError::OutOfOrder,
                       "entry " + std::to_string(sequence) + " acknowledged before pending entry " + std::to_string(oldest));
  }

  auto*         db  = db_->Handle();
  const char*   sql = "DELETE FROM queue_entries WHERE seq=?;";
  sqlite3_stmt* st  = nullptr;
  int           rc  = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc, "acknowledge prepare");

  BindU64(st, 1, sequence);
  rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Translate(db, rc, "acknowledge");

  if (sqlite3_changes(db) > 0 && pending_ > 0) --pending_;
  return Result::Ok();
}

uint64_t SqliteQueue::Size() {
  std::lock_guard lock(mutex_);
  return pending_;
}

bool SqliteQueue::WaitForEntries(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return pending_ > 0; });
}

} // namespace collector::queue::sqlite
