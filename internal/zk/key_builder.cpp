#include "key_builder.hpp"

#include "internal/util/errors.hpp"

namespace datastream::zk {

namespace {

constexpr char kLiveInstances[]    = "liveinstances";
constexpr char kInstances[]        = "instances";
constexpr char kDatastreams[]      = "dms";
constexpr char kNumTasks[]         = "numTasks";
constexpr char kAssignmentTokens[] = "assignmentTokens";
constexpr char kConnectors[]       = "connectors";
constexpr char kTargetAssignment[] = "targetAssignment";

} // namespace

void KeyBuilder::ValidateSegment(const std::string& what, const std::string& value) {
  if (value.empty()) {
    throw util::InvalidArgument(what + " must not be empty");
  }
  if (value.find('/') != std::string::npos) {
    throw util::InvalidArgument(what + " must not contain '/': " + value);
  }
  if (value == "." || value == "..") {
    throw util::InvalidArgument(what + " must not be '" + value + "'");
  }
}

std::string KeyBuilder::Cluster(const std::string& cluster) {
  ValidateSegment("cluster name", cluster);
  return "/" + cluster;
}

std::string KeyBuilder::LiveInstances(const std::string& cluster) {
  return Cluster(cluster) + "/" + kLiveInstances;
}

std::string KeyBuilder::Instances(const std::string& cluster) {
  return Cluster(cluster) + "/" + kInstances;
}

std::string KeyBuilder::Instance(const std::string& cluster, const std::string& instance) {
  ValidateSegment("instance name", instance);
  return Instances(cluster) + "/" + instance;
}

std::string KeyBuilder::Datastreams(const std::string& cluster) {
  return Cluster(cluster) + "/" + kDatastreams;
}

std::string KeyBuilder::Datastream(const std::string& cluster, const std::string& key) {
  ValidateSegment("datastream key", key);
  return Datastreams(cluster) + "/" + key;
}

std::string KeyBuilder::DatastreamNumTasks(const std::string& cluster, const std::string& key) {
  return Datastream(cluster, key) + "/" + kNumTasks;
}

std::string KeyBuilder::DatastreamAssignmentTokens(const std::string& cluster, const std::string& key) {
  return Datastream(cluster, key) + "/" + kAssignmentTokens;
}

std::string KeyBuilder::Connectors(const std::string& cluster) {
  return Cluster(cluster) + "/" + kConnectors;
}

std::string KeyBuilder::Connector(const std::string& cluster, const std::string& connector) {
  ValidateSegment("connector name", connector);
  return Connectors(cluster) + "/" + connector;
}

std::string KeyBuilder::ConnectorTask(const std::string& cluster, const std::string& connector, const std::string& task) {
  ValidateSegment("task name", task);
  return Connector(cluster, connector) + "/" + task;
}

std::string KeyBuilder::TargetAssignmentBase(const std::string& cluster, const std::string& connector) {
  ValidateSegment("connector name", connector);
  return Cluster(cluster) + "/" + kTargetAssignment + "/" + connector;
}

std::string KeyBuilder::TargetAssignment(const std::string& cluster, const std::string& connector, const std::string& group) {
  ValidateSegment("datastream group name", group);
  return TargetAssignmentBase(cluster, connector) + "/" + group;
}

std::string KeyBuilder::TargetAssignmentEntry(const std::string& cluster, const std::string& connector, const std::string& group,
                                              uint64_t timestamp_ms) {
  return TargetAssignment(cluster, connector, group) + "/" + std::to_string(timestamp_ms);
}

} // namespace datastream::zk
