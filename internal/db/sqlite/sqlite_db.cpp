#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace coordinator::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = "open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
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
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + msg);
  }
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* st = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st, nullptr), db_, "read user_version");
  const int version = sqlite3_step(st) == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
  sqlite3_finalize(st);
  return version;
}

void SqliteDB::SetUserVersion(int version) {
  // pragmas do not accept bound parameters
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure() {
  // file databases use WAL so status reads and scrapes never wait on a writer
  if (path_ != ":memory:" && !path_.empty()) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  ThrowIf(sqlite3_busy_timeout(db_, kBusyTimeoutMs), db_, "busy_timeout");
  Exec("PRAGMA temp_store=MEMORY;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  const int rc = sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    COORDINATOR_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", sqlite3_errmsg(db_))});
  }
}

int SqliteTransaction::Begin() {
  const int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr);
  open_        = rc == SQLITE_OK;
  return rc;
}

int SqliteTransaction::Commit() {
  const int rc = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr);
  if (rc == SQLITE_OK) open_ = false;
  return rc;
}

} // namespace coordinator::db::sqlite
