#pragma once

#include <cstdint>
#include <string>

namespace datastream::zk {

/*
  Path layout of a cluster namespace in the coordination service.

    /<cluster>
      /instances/<host>-<seq>               cluster members
      /liveinstances
      /dms                                  dms root; written to notify the leader
        /<datastream>                       datastream record (JSON)
          /numTasks                         task count, written by the leader
          /assignmentTokens/...             in-flight assignment state
      /connectors/<connector>/<task>        host assigned to a task
      /targetAssignment/<connector>         touched to announce new assignments
        /<group>/<timestamp_ms>             assignment history (JSON)

  Every segment must be non-empty, must not contain '/', and must not be
  "." or "..", which keeps the mapping injective. Violations raise
  util::InvalidArgument.
*/
class KeyBuilder {
 public:
  static std::string Cluster(const std::string& cluster);
  static std::string LiveInstances(const std::string& cluster);
  static std::string Instances(const std::string& cluster);
  static std::string Instance(const std::string& cluster, const std::string& instance);

  static std::string Datastreams(const std::string& cluster);
  static std::string Datastream(const std::string& cluster, const std::string& key);
  static std::string DatastreamNumTasks(const std::string& cluster, const std::string& key);
  static std::string DatastreamAssignmentTokens(const std::string& cluster, const std::string& key);

  static std::string Connectors(const std::string& cluster);
  static std::string Connector(const std::string& cluster, const std::string& connector);
  static std::string ConnectorTask(const std::string& cluster, const std::string& connector, const std::string& task);

  static std::string TargetAssignmentBase(const std::string& cluster, const std::string& connector);
  static std::string TargetAssignment(const std::string& cluster, const std::string& connector, const std::string& group);
  static std::string TargetAssignmentEntry(const std::string& cluster, const std::string& connector, const std::string& group,
                                           uint64_t timestamp_ms);

  // Raises util::InvalidArgument unless value is usable as a single path segment.
  static void ValidateSegment(const std::string& what, const std::string& value);
};

} // namespace datastream::zk
