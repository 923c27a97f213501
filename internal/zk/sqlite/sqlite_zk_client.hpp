#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/zk/zk_client.hpp"
#include "sqlite_db.hpp"

namespace datastream::zk::sqlite {

/*
  Node tree persisted in a single sqlite table.

  Intended for development and single-node deployments: it provides the
  same per-node semantics as ZooKeeper but no watches and no sessions.
  All calls are serialized on one connection.
*/
class SqliteZkClient final : public ZkClient {
 public:
  explicit SqliteZkClient(std::shared_ptr<SqliteDB> db);

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
  void Bootstrap();
  bool ExistsLocked(const std::string& path);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace datastream::zk::sqlite
