#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/kv_store.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using coordinator::db::KvStore;

struct BackendFactory {
  std::string                                          name;
  std::function<std::shared_ptr<KvStore>()>            make_store;
  std::function<bool()>                                supports_restart;
  std::function<void(std::shared_ptr<KvStore>&)>       restart;
  std::function<void()>                                cleanup;
};

void VerifyGetSetDelete(KvStore& store, const std::string& prefix) {
  const auto key = prefix + ":value";
  assert(!store.Get(key).has_value());

  assert(store.Set(key, "v1"));
  assert(store.Get(key).value() == "v1");

  // overwrite replaces the value in place
  assert(store.Set(key, std::string("bin\0ary", 7)));
  assert(store.Get(key).value() == std::string("bin\0ary", 7));

  assert(store.Delete(key));
  assert(!store.Get(key).has_value());

  // deleting a missing key is not an error
  assert(store.Delete(key));
}

void VerifyExpiry(KvStore& store, const std::string& prefix) {
  const auto short_key = prefix + ":short";
  const auto long_key  = prefix + ":long";

  assert(store.Set(short_key, "gone-soon", 20ms));
  assert(store.Set(long_key, "stays", 1h));
  assert(store.Get(short_key).has_value());

  std::this_thread::sleep_for(50ms);
  assert(!store.Get(short_key).has_value());
  assert(store.Get(long_key).value() == "stays");

  // expired keys are not listed
  const auto keys = store.ListKeys(prefix + ":");
  assert(keys.size() == 1);
  assert(keys[0] == long_key);

  // re-setting without ttl clears the expiry
  assert(store.Set(short_key, "back", 20ms));
  assert(store.Set(short_key, "back"));
  std::this_thread::sleep_for(50ms);
  assert(store.Get(short_key).value() == "back");
}

void VerifyIncrement(KvStore& store, const std::string& prefix) {
  const auto key   = prefix + ":counter";
  int64_t    value = 0;

  assert(store.Increment(key, 1, value));
  assert(value == 1);
  assert(store.Increment(key, 5, value));
  assert(value == 6);
  assert(store.Increment(key, -2, value));
  assert(value == 4);
  assert(store.Get(key).value() == "4");

  // ttl applies on create, and an expired counter starts over
  const auto windowed = prefix + ":window";
  assert(store.Increment(windowed, 3, value, 20ms));
  assert(value == 3);
  assert(store.Increment(windowed, 1, value, 20ms));
  assert(value == 4);
  std::this_thread::sleep_for(50ms);
  assert(store.Increment(windowed, 1, value, 20ms));
  assert(value == 1);
}

void VerifyListKeys(KvStore& store, const std::string& prefix) {
  assert(store.Set(prefix + ":b", "2"));
  assert(store.Set(prefix + ":a", "1"));
  assert(store.Set(prefix + ":c", "3"));
  assert(store.Set(prefix + "-other:a", "x"));

  const auto keys = store.ListKeys(prefix + ":");
  assert(keys.size() == 3);
  assert(keys[0] == prefix + ":a");
  assert(keys[1] == prefix + ":b");
  assert(keys[2] == prefix + ":c");

  assert(store.ListKeys(prefix + ":zzz").empty());
}

void VerifyBoundedLists(KvStore& store, const std::string& prefix) {
  const auto list = prefix + ":series";
  assert(store.Tail(list, 10).empty());

  for (int i = 0; i < 7; ++i) {
    assert(store.Append(list, "e" + std::to_string(i), 5));
  }

  // oldest two were dropped, remaining entries come back oldest first
  const auto all = store.Tail(list, 10);
  assert(all.size() == 5);
  assert(all.front() == "e2");
  assert(all.back() == "e6");

  const auto newest = store.Tail(list, 2);
  assert(newest.size() == 2);
  assert(newest[0] == "e5");
  assert(newest[1] == "e6");

  // lists and keys live in separate namespaces
  assert(!store.Get(list).has_value());
}

void VerifyPing(KvStore& store) {
  assert(store.Ping());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  assert(store->Set(prefix + ":durable", "kept"));
  assert(store->Append(prefix + ":events", "first", 10));
  int64_t value = 0;
  assert(store->Increment(prefix + ":count", 7, value));

  backend.restart(store);

  assert(store->Get(prefix + ":durable").value() == "kept");
  assert(store->Tail(prefix + ":events", 10).size() == 1);
  assert(store->Increment(prefix + ":count", 1, value));
  assert(value == 8);
}

void VerifySchemaVersionGuard() {
  const auto path = (std::filesystem::temp_directory_path() /
                     ("coordinator_integration_schema_" + std::to_string(coordinator::util::NowMillis()) + ".db"))
                        .string();
  {
    coordinator::db::sqlite::SqliteDB db(path);
    coordinator::db::sqlite::SqliteStore::BootstrapSchema(db);
    assert(db.UserVersion() == 1);

    // bootstrapping twice is a no-op
    coordinator::db::sqlite::SqliteStore::BootstrapSchema(db);
    assert(db.UserVersion() == 1);

    db.SetUserVersion(99);
    bool refused = false;
    try {
      coordinator::db::sqlite::SqliteStore::BootstrapSchema(db);
    } catch (const std::runtime_error&) {
      refused = true;
    }
    assert(refused);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<coordinator::db::memory::MemoryStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<KvStore>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() /
                  ("coordinator_integration_sqlite_" + std::to_string(coordinator::util::NowMillis()) + ".db"))
                     .string();

  auto make_store = [db_path]() -> std::shared_ptr<KvStore> {
    auto db = std::make_shared<coordinator::db::sqlite::SqliteDB>(db_path);
    coordinator::db::sqlite::SqliteStore::BootstrapSchema(*db);
    return std::make_shared<coordinator::db::sqlite::SqliteStore>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<KvStore>& store) {
        store.reset();
        store = make_store();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto store = backend.make_store();

  VerifyGetSetDelete(*store, backend.name + "-basic");
  VerifyExpiry(*store, backend.name + "-expiry");
  VerifyIncrement(*store, backend.name + "-increment");
  VerifyListKeys(*store, backend.name + "-list");
  VerifyBoundedLists(*store, backend.name + "-append");
  VerifyPing(*store);

  store.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifySchemaVersionGuard();

  std::cout << "coordinator_integration_store_parity: pass\n";
  return 0;
}
