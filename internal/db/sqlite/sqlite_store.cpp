#include "sqlite_store.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace coordinator::db::sqlite {

using coordinator::db::ErrorCode;
using coordinator::db::Result;

namespace {

constexpr int kSchemaVersion = 1;

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement PrepareOrNull(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return Statement{};
  }
  return Statement{st};
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

// 0 means "never expires"
int64_t ExpiryMillis(std::chrono::milliseconds ttl) {
  return ttl.count() > 0 ? util::NowMillis() + ttl.count() : 0;
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteStore::BootstrapSchema(SqliteDB& db) {
  const int version = db.UserVersion();
  if (version > kSchemaVersion) {
    throw std::runtime_error(db.Path() + " has schema version " + std::to_string(version) + ", newer than supported version " +
                             std::to_string(kSchemaVersion));
  }
  if (version == kSchemaVersion) return;

  SqliteTransaction tx(db.Handle());
  if (tx.Begin() != SQLITE_OK) {
    throw std::runtime_error("schema bootstrap: " + std::string(sqlite3_errmsg(db.Handle())));
  }
  db.Exec(
      "CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value BLOB NOT NULL, expires_at_ms INTEGER NOT NULL DEFAULT 0);"
      "CREATE TABLE IF NOT EXISTS kv_list (seq INTEGER PRIMARY KEY AUTOINCREMENT, list_key TEXT NOT NULL, value BLOB NOT NULL);"
      "CREATE INDEX IF NOT EXISTS kv_list_key_seq ON kv_list(list_key, seq);"
      "CREATE INDEX IF NOT EXISTS kv_expires ON kv(expires_at_ms) WHERE expires_at_ms<>0;"
      "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
  if (tx.Commit() != SQLITE_OK) {
    throw std::runtime_error("schema bootstrap: " + std::string(sqlite3_errmsg(db.Handle())));
  }
}

Result SqliteStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_MISMATCH:
      return Result::Err(ErrorCode::InvalidArgument, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::optional<std::string> SqliteStore::Get(const std::string& key) {
  auto* db = db_->Handle();
  auto  st = PrepareOrNull(db, "SELECT value FROM kv WHERE key=? AND (expires_at_ms=0 OR expires_at_ms>?);");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, key);
  BindI64(st.get(), 2, util::NowMillis());

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ColBlob(st.get(), 0);
}

Result SqliteStore::Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
  std::lock_guard lock(write_mutex_);
  auto*           db = db_->Handle();
  auto            st = PrepareOrNull(db,
                                 "INSERT INTO kv(key,value,expires_at_ms) VALUES(?,?,?) "
                                 "ON CONFLICT(key) DO UPDATE SET value=excluded.value, expires_at_ms=excluded.expires_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, key);
  BindBlob(st.get(), 2, value);
  BindI64(st.get(), 3, ExpiryMillis(ttl));
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteStore::Delete(const std::string& key) {
  std::lock_guard   lock(write_mutex_);
  auto*             db = db_->Handle();
  SqliteTransaction tx(db);
  if (auto r = Translate(db, tx.Begin()); !r) return r;

  for (const char* sql : {"DELETE FROM kv WHERE key=?;", "DELETE FROM kv_list WHERE list_key=?;"}) {
    auto st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, key);
    auto r = Translate(db, sqlite3_step(st.get()));
    if (!r) return r;
  }
  return Translate(db, tx.Commit());
}

Result SqliteStore::Increment(const std::string& key, int64_t delta, int64_t& value, std::chrono::milliseconds ttl) {
  std::lock_guard lock(write_mutex_);
  auto*           db  = db_->Handle();
  const auto      now = util::NowMillis();

  auto purge = PrepareOrNull(db, "DELETE FROM kv WHERE key=? AND expires_at_ms<>0 AND expires_at_ms<=?;");
  if (!purge) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(purge.get(), 1, key);
  BindI64(purge.get(), 2, now);
  if (auto r = Translate(db, sqlite3_step(purge.get())); !r) return r;

  auto st = PrepareOrNull(db,
                          "INSERT INTO kv(key,value,expires_at_ms) VALUES(?,?,?) "
                          "ON CONFLICT(key) DO UPDATE SET value=CAST(CAST(kv.value AS TEXT) AS INTEGER)+CAST(CAST(excluded.value AS TEXT) AS INTEGER) "
                          "RETURNING CAST(value AS TEXT);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  // counters are stored as decimal text so Get() returns the same bytes as the memory store
  BindText(st.get(), 1, key);
  BindBlob(st.get(), 2, std::to_string(delta));
  BindI64(st.get(), 3, ExpiryMillis(ttl));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);

  try {
    value = std::stoll(ColText(st.get(), 0));
  } catch (const std::exception&) {
    return Result::Err(ErrorCode::InvalidArgument, "value at " + key + " is not an integer");
  }
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<std::string> SqliteStore::ListKeys(const std::string& prefix) {
  auto* db = db_->Handle();
  auto  st = PrepareOrNull(db, "SELECT key FROM kv WHERE substr(key,1,?)=? AND (expires_at_ms=0 OR expires_at_ms>?) ORDER BY key;");
  if (!st) return {};

  BindI64(st.get(), 1, static_cast<int64_t>(prefix.size()));
  BindText(st.get(), 2, prefix);
  BindI64(st.get(), 3, util::NowMillis());

  std::vector<std::string> keys;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    keys.push_back(ColText(st.get(), 0));
  }
  return keys;
}

Result SqliteStore::Append(const std::string& list_key, const std::string& value, std::size_t max_length) {
  std::lock_guard   lock(write_mutex_);
  auto*             db = db_->Handle();
  SqliteTransaction tx(db);
  if (auto r = Translate(db, tx.Begin()); !r) return r;

  auto insert = PrepareOrNull(db, "INSERT INTO kv_list(list_key,value) VALUES(?,?);");
  if (!insert) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(insert.get(), 1, list_key);
  BindBlob(insert.get(), 2, value);
  if (auto r = Translate(db, sqlite3_step(insert.get())); !r) return r;

  if (max_length == 0) return Translate(db, tx.Commit());

  auto trim = PrepareOrNull(db,
                            "DELETE FROM kv_list WHERE list_key=? AND seq<=("
                            "SELECT seq FROM kv_list WHERE list_key=? ORDER BY seq DESC LIMIT 1 OFFSET ?);");
  if (!trim) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(trim.get(), 1, list_key);
  BindText(trim.get(), 2, list_key);
  BindI64(trim.get(), 3, static_cast<int64_t>(max_length));
  if (auto r = Translate(db, sqlite3_step(trim.get())); !r) return r;
  return Translate(db, tx.Commit());
}

std::vector<std::string> SqliteStore::Tail(const std::string& list_key, std::size_t count) {
  auto* db = db_->Handle();
  auto  st = PrepareOrNull(db,
                           "SELECT value FROM (SELECT seq,value FROM kv_list WHERE list_key=? ORDER BY seq DESC LIMIT ?) "
                           "ORDER BY seq ASC;");
  if (!st) return {};

  BindText(st.get(), 1, list_key);
  BindI64(st.get(), 2, static_cast<int64_t>(count));

  std::vector<std::string> values;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    values.push_back(ColBlob(st.get(), 0));
  }
  return values;
}

Result SqliteStore::Ping() {
  auto* db = db_->Handle();
  auto  st = PrepareOrNull(db, "SELECT 1;");
  if (!st) return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace coordinator::db::sqlite
