#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/zk/zk_client.hpp"

namespace datastream::zk::memory {

/*
  In-process node tree.

  Backs the default runtime and the test suites. Every operation holds a
  single mutex, so each call is atomic; sequences of calls are not.
*/
class MemoryZkClient : public ZkClient {
 public:
  MemoryZkClient();

  bool Exists(const std::string& path) override;
  std::optional<std::string> ReadData(const std::string& path, bool return_null_if_absent) override;
  void WriteData(const std::string& path, const std::string& data) override;
  void EnsurePath(const std::string& path) override;
  std::vector<std::string> GetChildren(const std::string& path) override;
  bool Delete(const std::string& path) override;
  void DeleteRecursively(const std::string& path) override;

  // Number of nodes, root excluded.
  std::size_t NodeCount() const;

 protected:
  VersionedData ReadVersioned(const std::string& path) override;
  bool WriteIfVersion(const std::string& path, const std::string& data, int32_t expected_version) override;

 private:
  struct Node {
    std::optional<std::string> data;
    int32_t                    version = 0;
  };

  using NodeMap = std::map<std::string, Node>;

  static std::string ChildPrefix(const std::string& path);
  bool HasChildrenLocked(const std::string& path) const;

  mutable std::mutex mutex_;
  NodeMap            nodes_;
};

} // namespace datastream::zk::memory
