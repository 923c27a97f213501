#pragma once

#include <zookeeper/zookeeper.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/zk/zk_client.hpp"

namespace datastream::zk::zookeeper {

struct ZooKeeperOptions {
  std::string               connect_string;
  std::chrono::milliseconds session_timeout{30000};
  std::chrono::milliseconds connection_timeout{15000};
};

/*
  ZooKeeper C client (libzookeeper_mt) behind the ZkClient contract.

  The constructor blocks until the session reaches ZOO_CONNECTED_STATE or
  the connection timeout elapses. The zhandle_t is thread-safe; this class
  adds no locking of its own beyond the session-state latch.
*/
class ZooKeeperClient final : public ZkClient {
 public:
  explicit ZooKeeperClient(ZooKeeperOptions options);
  ~ZooKeeperClient() override;

  ZooKeeperClient(const ZooKeeperClient&)            = delete;
  ZooKeeperClient& operator=(const ZooKeeperClient&) = delete;

  bool Exists(const std::string& path) override;
  std::optional<std::string> ReadData(const std::string& path, bool return_null_if_absent) override;
  void WriteData(const std::string& path, const std::string& data) override;
  void EnsurePath(const std::string& path) override;
  std::vector<std::string> GetChildren(const std::string& path) override;
  bool Delete(const std::string& path) override;
  void DeleteRecursively(const std::string& path) override;

 protected:
  VersionedData ReadVersioned(const std::string& path) override;
  bool WriteIfVersion(const std::string& path, const std::string& data, int32_t expected_version) override;

 private:
  static void OnSessionEvent(zhandle_t* zh, int type, int state, const char* path, void* context);

  void WaitUntilConnected();

  // Returns the data and fills stat; nullopt data means ZNONODE.
  std::optional<VersionedData> Get(const std::string& path, Stat* stat);

  ZooKeeperOptions        options_;
  zhandle_t*              handle_ = nullptr;
  std::mutex              state_mutex_;
  std::condition_variable state_changed_;
  int                     session_state_ = 0;
};

} // namespace datastream::zk::zookeeper
