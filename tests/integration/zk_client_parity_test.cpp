#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/cached_datastream_reader.hpp"
#include "internal/store/zk_backed_datastream_store.hpp"
#include "internal/zk/memory/memory_zk_client.hpp"
#include "internal/zk/zk_client.hpp"

#if DATASTREAM_ZK_SQLITE
#include "internal/zk/sqlite/sqlite_db.hpp"
#include "internal/zk/sqlite/sqlite_zk_client.hpp"
#endif

#if DATASTREAM_ZK_ZOOKEEPER
#include "internal/zk/zookeeper/zookeeper_client.hpp"
#endif

namespace {

using datastream::zk::ZkClient;
using datastream::zk::ZkClientException;
using datastream::zk::ZkErrorCode;

struct BackendFactory {
  std::string                                name;
  std::function<std::shared_ptr<ZkClient>()> make_client;
  std::function<void()>                      cleanup;
};

std::string UniqueSuffix() {
  return std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
}

template <typename Fn>
bool ThrowsCode(ZkErrorCode code, Fn&& fn) {
  try {
    fn();
  } catch (const ZkClientException& e) {
    return e.Code() == code;
  }
  return false;
}

std::vector<std::string> Sorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  return values;
}

void VerifyNodeSemantics(ZkClient& client, const std::string& root) {
  client.EnsurePath(root + "/a/b");
  assert(client.Exists(root + "/a"));
  assert(!client.ReadData(root + "/a/b", true).has_value());
  assert(!client.ReadData(root + "/missing", true).has_value());
  assert(ThrowsCode(ZkErrorCode::kNoNode, [&] { client.ReadData(root + "/missing", false); }));
  assert(ThrowsCode(ZkErrorCode::kNoNode, [&] { client.WriteData(root + "/missing", "x"); }));
  assert(ThrowsCode(ZkErrorCode::kNoNode, [&] { client.GetChildren(root + "/missing"); }));

  client.WriteData(root + "/a/b", "value");
  assert(client.EnsureReadData(root + "/a/b") == "value");

  client.EnsurePath(root + "/a/c");
  client.EnsurePath(root + "/a-sibling");
  assert(Sorted(client.GetChildren(root + "/a")) == (std::vector<std::string>{"b", "c"}));

  assert(ThrowsCode(ZkErrorCode::kNotEmpty, [&] { client.Delete(root + "/a"); }));
  assert(client.Delete(root + "/a/c"));
  assert(!client.Delete(root + "/a/c"));

  client.DeleteRecursively(root + "/a");
  assert(!client.Exists(root + "/a"));
  assert(!client.Exists(root + "/a/b"));
  assert(client.Exists(root + "/a-sibling"));
  client.DeleteRecursively(root + "/a");
}

void VerifySerializedUpdates(const std::shared_ptr<ZkClient>& client, const std::string& root) {
  const auto path = root + "/counter";
  client->EnsurePath(path);
  client->WriteData(path, "0");

  constexpr int kThreads    = 4;
  constexpr int kIncrements = 20;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kIncrements; ++i) {
        client->UpdateDataSerialized(path, [](const std::optional<std::string>& current) {
          return std::to_string(std::stoi(current.value_or("0")) + 1);
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(client->EnsureReadData(path) == std::to_string(kThreads * kIncrements));
}

void VerifyStoreOnBackend(const std::shared_ptr<ZkClient>& client, const std::string& cluster) {
  auto cache = std::make_shared<datastream::cache::CachedDatastreamReader>(client, cluster, std::chrono::milliseconds(0));
  datastream::store::ZkBackedDatastreamStore store(client, cache, cluster);

  datastream::store::v1::Datastream ds;
  ds.set_name("d1");
  ds.set_connector_name("c1");
  store.CreateDatastream("d1", ds);

  client->EnsurePath("/" + cluster + "/dms/d1/numTasks");
  client->WriteData("/" + cluster + "/dms/d1/numTasks", "4");

  const auto read = store.GetDatastream("d1");
  assert(read.has_value());
  assert(read->metadata().at("numTasks") == "4");
  assert(store.GetAllDatastreams() == std::vector<std::string>{"d1"});

  assert(store.DeleteDatastream("d1"));
  assert(store.GetDatastream("d1")->status() == datastream::store::v1::DATASTREAM_STATUS_DELETING);

  client->DeleteRecursively("/" + cluster);
}

std::vector<BackendFactory> Backends() {
  std::vector<BackendFactory> backends;

  backends.push_back({"memory", [] { return std::make_shared<datastream::zk::memory::MemoryZkClient>(); }, [] {}});

#if DATASTREAM_ZK_SQLITE
  const auto sqlite_path = std::filesystem::temp_directory_path() / ("datastream_zk_parity_" + UniqueSuffix() + ".db");
  backends.push_back({"sqlite",
                      [sqlite_path] {
                        auto db = std::make_shared<datastream::zk::sqlite::SqliteDB>(sqlite_path.string(), true);
                        return std::make_shared<datastream::zk::sqlite::SqliteZkClient>(std::move(db));
                      },
                      [sqlite_path] {
                        std::error_code ec;
                        std::filesystem::remove(sqlite_path, ec);
                        std::filesystem::remove(sqlite_path.string() + "-wal", ec);
                        std::filesystem::remove(sqlite_path.string() + "-shm", ec);
                      }});
#endif

#if DATASTREAM_ZK_ZOOKEEPER
  if (const char* connect = std::getenv("DATASTREAM_TEST_ZK_CONNECT")) {
    backends.push_back({"zookeeper",
                        [connect] {
                          datastream::zk::zookeeper::ZooKeeperOptions options;
                          options.connect_string = connect;
                          return std::make_shared<datastream::zk::zookeeper::ZooKeeperClient>(std::move(options));
                        },
                        [] {}});
  } else {
    std::cout << "zookeeper backend skipped: DATASTREAM_TEST_ZK_CONNECT not set\n";
  }
#endif

  return backends;
}

} // namespace

int main() {
  for (const auto& backend : Backends()) {
    const auto root    = "/parity-" + UniqueSuffix();
    const auto cluster = "parity-store-" + UniqueSuffix();

    {
      auto client = backend.make_client();
      VerifyNodeSemantics(*client, root);
      VerifySerializedUpdates(client, root);
      VerifyStoreOnBackend(client, cluster);
      client->DeleteRecursively(root);
    }
    backend.cleanup();

    std::cout << "zk_client_parity[" << backend.name << "]: pass\n";
  }

  std::cout << "datastream_store_integration_zk_client_parity: pass\n";
  return 0;
}
