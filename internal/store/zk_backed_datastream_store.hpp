#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "internal/store/datastream_store.hpp"
#include "internal/util/time.hpp"

namespace datastream::zk {
class ZkClient;
}
namespace datastream::cache {
class CachedDatastreamReader;
}

namespace datastream::store {

// Upper bound on the encoded size of a datastream record.
inline constexpr std::size_t kMaxDatastreamBlobBytes = 1024 * 1024;

class ZkBackedDatastreamStore final : public DatastreamStore {
 public:
  ZkBackedDatastreamStore(std::shared_ptr<zk::ZkClient> zk_client, std::shared_ptr<cache::CachedDatastreamReader> name_cache,
                          std::string cluster, util::MillisClock clock = util::SystemMillisClock());

  std::optional<v1::Datastream> GetDatastream(const std::string& key) override;
  std::vector<std::string>      GetAllDatastreams() override;
  void                          CreateDatastream(const std::string& key, const v1::Datastream& datastream) override;
  void          UpdateDatastream(const std::string& key, const v1::Datastream& datastream, bool notify_leader) override;
  bool          DeleteDatastream(const std::string& key) override;
  CleanupResult DeleteDatastreamNumTasks(const std::string& key) override;

  std::optional<std::string> GetAssignedTaskInstance(const std::string& datastream, const std::string& task) override;

  void          UpdatePartitionAssignments(const std::string& key, const v1::Datastream& datastream,
                                           const v1::HostTargetAssignment& target_assignment, bool notify_leader) override;
  CleanupResult ForceCleanupDatastream(const std::string& key) override;

  // Writes the current time to the dms root; the leader watches that node.
  void NotifyLeaderOfDataChange();

 private:
  // Strips numTasks, encodes and enforces kMaxDatastreamBlobBytes.
  std::string EncodeForWrite(const std::string& key, const v1::Datastream& datastream) const;

  // Raises util::InvalidArgument unless hostname belongs to a live, non-paused instance.
  void VerifyHostname(const std::string& hostname);

  std::shared_ptr<zk::ZkClient>                 zk_client_;
  std::shared_ptr<cache::CachedDatastreamReader> name_cache_;
  std::string                                    cluster_;
  util::MillisClock                              clock_;
};

} // namespace datastream::store
