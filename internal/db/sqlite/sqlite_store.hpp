#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/kv_store.hpp"
#include "sqlite_db.hpp"

namespace coordinator::db::sqlite {

/*
  KvStore over two tables:

    kv(key TEXT PRIMARY KEY, value BLOB, expires_at_ms INTEGER)
    kv_list(seq INTEGER PRIMARY KEY AUTOINCREMENT, list_key TEXT, value BLOB)

  Every write holds write_mutex_, so a multi-statement write (Delete,
  Append+trim) can run in its own transaction on the shared handle.
  Plain reads go straight to the handle.

  The schema version is kept in PRAGMA user_version. A database written
  by a newer schema is refused at bootstrap.
*/
class SqliteStore final : public KvStore {
 public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  // Creates or upgrades tables and indexes. Idempotent.
  static void BootstrapSchema(SqliteDB& db);

  std::optional<std::string> Get(const std::string& key) override;
  Result                     Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
  Result                     Delete(const std::string& key) override;
  Result                     Increment(const std::string& key, int64_t delta, int64_t& value, std::chrono::milliseconds ttl) override;
  std::vector<std::string>   ListKeys(const std::string& prefix) override;
  Result                     Append(const std::string& list_key, const std::string& value, std::size_t max_length) override;
  std::vector<std::string>   Tail(const std::string& list_key, std::size_t count) override;
  Result                     Ping() override;

 private:
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                write_mutex_;
};

} // namespace coordinator::db::sqlite
