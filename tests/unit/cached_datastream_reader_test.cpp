#include "internal/cache/cached_datastream_reader.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/zk/memory/memory_zk_client.hpp"

namespace {

using datastream::cache::CachedDatastreamReader;
using datastream::zk::ZkClientException;
using datastream::zk::ZkErrorCode;
using datastream::zk::memory::MemoryZkClient;

// Counts listings and can simulate an unreachable coordination service.
class HookedZkClient : public MemoryZkClient {
 public:
  std::vector<std::string> GetChildren(const std::string& path) override {
    ++list_calls;
    if (fail_listing) {
      throw ZkClientException(ZkErrorCode::kConnectionLoss, path);
    }
    return MemoryZkClient::GetChildren(path);
  }

  std::atomic<int>  list_calls{0};
  std::atomic<bool> fail_listing{false};
};

std::vector<std::string> Sorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  return values;
}

void TestMissingRootIsEmpty() {
  auto                   client = std::make_shared<HookedZkClient>();
  CachedDatastreamReader reader(client, "c", std::chrono::milliseconds(0));
  assert(reader.GetAllDatastreamNames().empty());
}

void TestSnapshotIsServedWithinInterval() {
  auto client = std::make_shared<HookedZkClient>();
  client->EnsurePath("/c/dms/d1");

  CachedDatastreamReader reader(client, "c", std::chrono::hours(1));
  assert(reader.GetAllDatastreamNames() == std::vector<std::string>{"d1"});

  client->EnsurePath("/c/dms/d2");
  assert(reader.GetAllDatastreamNames() == std::vector<std::string>{"d1"});
  assert(client->list_calls == 1);

  reader.Invalidate();
  assert(Sorted(reader.GetAllDatastreamNames()) == (std::vector<std::string>{"d1", "d2"}));
  assert(client->list_calls == 2);
}

void TestZeroIntervalAlwaysRefreshes() {
  auto client = std::make_shared<HookedZkClient>();
  client->EnsurePath("/c/dms/d1");

  CachedDatastreamReader reader(client, "c", std::chrono::milliseconds(0));
  reader.GetAllDatastreamNames();
  client->EnsurePath("/c/dms/d2");
  assert(reader.GetAllDatastreamNames().size() == 2);
}

void TestFreshnessFollowsMonotonicClock() {
  auto client = std::make_shared<HookedZkClient>();
  client->EnsurePath("/c/dms/d1");

  auto                   now = std::make_shared<datastream::util::SteadyTimePoint>(std::chrono::steady_clock::now());
  CachedDatastreamReader reader(client, "c", std::chrono::seconds(10), [now] { return *now; });
  reader.GetAllDatastreamNames();
  client->EnsurePath("/c/dms/d2");

  *now += std::chrono::seconds(9);
  assert(reader.GetAllDatastreamNames().size() == 1);
  assert(client->list_calls == 1);

  *now += std::chrono::seconds(1);
  assert(reader.GetAllDatastreamNames().size() == 2);
  assert(client->list_calls == 2);
}

void TestRefreshFailureKeepsPreviousSnapshot() {
  auto client = std::make_shared<HookedZkClient>();
  client->EnsurePath("/c/dms/d1");

  CachedDatastreamReader reader(client, "c", std::chrono::milliseconds(0));
  assert(reader.GetAllDatastreamNames().size() == 1);

  client->fail_listing = true;
  assert(reader.GetAllDatastreamNames() == std::vector<std::string>{"d1"});
}

} // namespace

int main() {
  TestMissingRootIsEmpty();
  TestSnapshotIsServedWithinInterval();
  TestZeroIntervalAlwaysRefreshes();
  TestFreshnessFollowsMonotonicClock();
  TestRefreshFailureKeepsPreviousSnapshot();

  std::cout << "datastream_store_unit_cached_datastream_reader: pass\n";
  return 0;
}
