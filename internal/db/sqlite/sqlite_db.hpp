#pragma once

#include <sqlite3.h>

#include <string>

namespace coordinator::db::sqlite {

/*
  Owns one sqlite3 connection.

  Opened in serialized (FULLMUTEX) mode so one handle can be shared by
  every thread of the coordinator. Opening applies the pragmas the store
  relies on (WAL for file databases, busy timeout, in-memory temp store).
*/
class SqliteDB {
 public:
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

  // Runs one or more statements; throws std::runtime_error on failure.
  void Exec(const std::string& sql);

  // PRAGMA user_version, used as the schema version.
  int  UserVersion();
  void SetUserVersion(int version);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  SqliteTransaction

  BEGIN IMMEDIATE on Begin(), rolled back on destruction unless Commit()
  succeeded. The connection is shared, so callers must hold the store's
  write lock for the lifetime of the transaction.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(sqlite3* db) : db_(db) {
  }
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  // Both return the sqlite result code.
  int Begin();
  int Commit();

 private:
  sqlite3* db_;
  bool     open_ = false;
};

} // namespace coordinator::db::sqlite
