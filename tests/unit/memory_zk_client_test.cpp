#include "internal/zk/memory/memory_zk_client.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using datastream::zk::ZkClientException;
using datastream::zk::ZkErrorCode;
using datastream::zk::memory::MemoryZkClient;

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

void TestEnsurePathCreatesDatalessAncestors() {
  MemoryZkClient client;
  client.EnsurePath("/a/b/c");

  assert(client.Exists("/a"));
  assert(client.Exists("/a/b"));
  assert(client.Exists("/a/b/c"));
  assert(!client.ReadData("/a/b/c", true).has_value());
  assert(client.NodeCount() == 3);

  // Idempotent.
  client.EnsurePath("/a/b/c");
  assert(client.NodeCount() == 3);
}

void TestReadWrite() {
  MemoryZkClient client;
  assert(!client.ReadData("/missing", true).has_value());
  assert(ThrowsCode(ZkErrorCode::kNoNode, [&] { client.ReadData("/missing", false); }));
  assert(ThrowsCode(ZkErrorCode::kNoNode, [&] { client.WriteData("/missing", "x"); }));

  client.EnsurePath("/n");
  assert(ThrowsCode(ZkErrorCode::kNoNode, [&] { client.EnsureReadData("/n"); }));

  client.WriteData("/n", "v1");
  assert(client.EnsureReadData("/n") == "v1");
  client.WriteData("/n", "v2");
  assert(*client.ReadData("/n", false) == "v2");
}

void TestChildrenIgnoreLookalikeSiblings() {
  MemoryZkClient client;
  client.EnsurePath("/a/x");
  client.EnsurePath("/a/y/z");
  client.EnsurePath("/a-b");
  client.EnsurePath("/a.c");

  assert(Sorted(client.GetChildren("/a")) == (std::vector<std::string>{"x", "y"}));
  assert(Sorted(client.GetChildren("/")) == (std::vector<std::string>{"a", "a-b", "a.c"}));
  assert(ThrowsCode(ZkErrorCode::kNoNode, [&] { client.GetChildren("/nope"); }));
}

void TestDelete() {
  MemoryZkClient client;
  client.EnsurePath("/a/b");

  assert(!client.Delete("/missing"));
  assert(ThrowsCode(ZkErrorCode::kNotEmpty, [&] { client.Delete("/a"); }));
  assert(client.Delete("/a/b"));
  assert(client.Delete("/a"));
  assert(client.NodeCount() == 0);
}

void TestDeleteRecursivelyLeavesSiblings() {
  MemoryZkClient client;
  client.EnsurePath("/a/b/c");
  client.EnsurePath("/a/d");
  client.EnsurePath("/a-b/e");

  client.DeleteRecursively("/a");
  assert(!client.Exists("/a"));
  assert(!client.Exists("/a/b/c"));
  assert(client.Exists("/a-b/e"));

  // Absent node is a no-op.
  client.DeleteRecursively("/a");
}

void TestBadPaths() {
  MemoryZkClient client;
  assert(ThrowsCode(ZkErrorCode::kBadArguments, [&] { client.Exists("relative"); }));
  assert(ThrowsCode(ZkErrorCode::kBadArguments, [&] { client.EnsurePath("/a//b"); }));
  assert(ThrowsCode(ZkErrorCode::kBadArguments, [&] { client.EnsurePath("/a/"); }));
}

void TestUpdateDataSerializedUnderContention() {
  MemoryZkClient client;
  client.EnsurePath("/counter");
  client.WriteData("/counter", "0");

  constexpr int kThreads    = 4;
  constexpr int kIncrements = 50;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kIncrements; ++i) {
        client.UpdateDataSerialized("/counter", [](const std::optional<std::string>& current) {
          return std::to_string(std::stoi(current.value_or("0")) + 1);
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(client.EnsureReadData("/counter") == std::to_string(kThreads * kIncrements));
  assert(ThrowsCode(ZkErrorCode::kNoNode, [&] {
    client.UpdateDataSerialized("/missing", [](const std::optional<std::string>&) { return std::string("x"); });
  }));
}

} // namespace

int main() {
  TestEnsurePathCreatesDatalessAncestors();
  TestReadWrite();
  TestChildrenIgnoreLookalikeSiblings();
  TestDelete();
  TestDeleteRecursivelyLeavesSiblings();
  TestBadPaths();
  TestUpdateDataSerializedUnderContention();

  std::cout << "datastream_store_unit_memory_zk_client: pass\n";
  return 0;
}
