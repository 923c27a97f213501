#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datastream/store/v1/assignment.pb.h"
#include "datastream/store/v1/datastream.pb.h"

namespace datastream::store {

// Outcome of a best-effort cleanup. Backing-store failures are reported, never raised.
enum class CleanupResult { kRemoved, kNothingToRemove, kFailed };

const char* ToString(CleanupResult result);

/*
  Persistent registry of datastream definitions for one cluster.

  CRITICAL GUARANTEES:

  - GetDatastream returns a value iff the record node exists and holds data
  - The numTasks metadata entry is always read fresh from its side node
    and is never persisted inside the record
  - Every successful create, update or delete writes the dms root once
    so the leader reconciles (update may opt out)
  - An assignment never names a host that is not a live, non-paused member

  Strict operations raise the exceptions in internal/util/errors.hpp;
  coordination failures arrive as util::StoreError, never as a raw
  zk::ZkClientException. Lookups treat a malformed key as absent.
  Cleanup operations return a CleanupResult and never raise.
*/
class DatastreamStore {
 public:
  virtual ~DatastreamStore() = default;

  virtual std::optional<v1::Datastream> GetDatastream(const std::string& key) = 0;

  // Sorted names; may lag the coordination service by the name-cache refresh interval.
  virtual std::vector<std::string> GetAllDatastreams() = 0;

  virtual void CreateDatastream(const std::string& key, const v1::Datastream& datastream) = 0;

  virtual void UpdateDatastream(const std::string& key, const v1::Datastream& datastream, bool notify_leader) = 0;

  // Soft delete: marks the record DELETING. Returns false when there was no record.
  virtual bool DeleteDatastream(const std::string& key) = 0;

  virtual CleanupResult DeleteDatastreamNumTasks(const std::string& key) = 0;

  virtual std::optional<std::string> GetAssignedTaskInstance(const std::string& datastream, const std::string& task) = 0;

  virtual void UpdatePartitionAssignments(const std::string& key, const v1::Datastream& datastream,
                                          const v1::HostTargetAssignment& target_assignment, bool notify_leader) = 0;

  virtual CleanupResult ForceCleanupDatastream(const std::string& key) = 0;
};

} // namespace datastream::store
