#include "zk_backed_datastream_store.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "internal/cache/cached_datastream_reader.hpp"
#include "internal/codec/datastream_json.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/zk/instance_name.hpp"
#include "internal/zk/key_builder.hpp"
#include "internal/zk/zk_client.hpp"

namespace datastream::store {

using zk::KeyBuilder;
using observability::IntField;
using observability::StringField;

namespace {

std::string Megabytes(std::size_t bytes) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
  return oss.str();
}

void RecordCleanup(std::string_view operation, CleanupResult result) {
  observability::Metrics::Instance().RecordCleanup(operation, ToString(result));
}

// Client failures inside fn surface as StoreError; other exceptions pass through.
template <typename Fn>
auto WrapStoreError(std::string_view action, const std::string& subject, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const zk::ZkClientException& e) {
    DATASTREAM_LOG_ERROR("coordination failure", {StringField("action", action), StringField("subject", subject), StringField("error", e.what())});
    throw util::StoreError("failed to " + std::string(action) + " " + subject + ": " + e.what());
  }
}

} // namespace

const char* ToString(CleanupResult result) {
  switch (result) {
    case CleanupResult::kRemoved:
      return "removed";
    case CleanupResult::kNothingToRemove:
      return "nothing_to_remove";
    case CleanupResult::kFailed:
      return "failed";
  }
  return "unknown";
}

ZkBackedDatastreamStore::ZkBackedDatastreamStore(std::shared_ptr<zk::ZkClient>                  zk_client,
                                                 std::shared_ptr<cache::CachedDatastreamReader> name_cache, std::string cluster,
                                                 util::MillisClock clock)
    : zk_client_(std::move(zk_client)), name_cache_(std::move(name_cache)), cluster_(std::move(cluster)), clock_(std::move(clock)) {
  if (!zk_client_ || !name_cache_) {
    throw std::invalid_argument("ZkBackedDatastreamStore: missing zk client or name cache");
  }
  if (!clock_) {
    clock_ = util::SystemMillisClock();
  }
  KeyBuilder::ValidateSegment("cluster name", cluster_);
}

// ------------------------------------------------------------
// Records
// ------------------------------------------------------------

std::optional<v1::Datastream> ZkBackedDatastreamStore::GetDatastream(const std::string& key) {
  if (key.empty()) {
    return std::nullopt;
  }

  std::string path;
  try {
    path = KeyBuilder::Datastream(cluster_, key);
  } catch (const util::InvalidArgument& e) {
    DATASTREAM_LOG_DEBUG("lookup of malformed datastream key", {StringField("key", key), StringField("error", e.what())});
    return std::nullopt;
  }

  const auto blob = WrapStoreError("read datastream", key, [&] { return zk_client_->ReadData(path, true); });
  if (!blob) {
    return std::nullopt;
  }

  auto datastream = codec::DatastreamFromJson(*blob);
  if (!datastream) {
    DATASTREAM_LOG_WARN("unreadable datastream record", {StringField("key", key), StringField("path", path)});
    return std::nullopt;
  }

  // Never trust a persisted numTasks entry; the side node is authoritative.
  datastream->mutable_metadata()->erase(codec::kNumTasksKey);
  const auto num_tasks =
      WrapStoreError("read numTasks of", key, [&] { return zk_client_->ReadData(KeyBuilder::DatastreamNumTasks(cluster_, key), true); });
  if (num_tasks) {
    (*datastream->mutable_metadata())[codec::kNumTasksKey] = *num_tasks;
  }
  return datastream;
}

std::vector<std::string> ZkBackedDatastreamStore::GetAllDatastreams() {
  auto names = name_cache_->GetAllDatastreamNames();
  std::sort(names.begin(), names.end());
  return names;
}

void ZkBackedDatastreamStore::CreateDatastream(const std::string& key, const v1::Datastream& datastream) {
  if (key.empty()) {
    throw util::InvalidArgument("datastream key must not be empty");
  }

  const auto path = KeyBuilder::Datastream(cluster_, key);
  const auto blob = EncodeForWrite(key, datastream);

  WrapStoreError("create datastream", key, [&] {
    if (zk_client_->Exists(path)) {
      const auto existing = zk_client_->ReadData(path, true).value_or("");
      DATASTREAM_LOG_WARN("datastream already exists", {StringField("key", key), StringField("path", path), StringField("content", existing)});
      throw util::AlreadyExists("datastream " + key + " already exists: " + existing);
    }

    zk_client_->EnsurePath(path);
    zk_client_->WriteData(path, blob);
  });
  name_cache_->Invalidate();

  DATASTREAM_LOG_INFO("created datastream", {StringField("key", key), StringField("connector", datastream.connector_name()),
                                             IntField("bytes", static_cast<int64_t>(blob.size()))});
  NotifyLeaderOfDataChange();
}

void ZkBackedDatastreamStore::UpdateDatastream(const std::string& key, const v1::Datastream& datastream, bool notify_leader) {
  if (!GetDatastream(key)) {
    throw util::NotFound("datastream " + key + " does not exist");
  }

  const auto blob = EncodeForWrite(key, datastream);
  WrapStoreError("update datastream", key, [&] { zk_client_->WriteData(KeyBuilder::Datastream(cluster_, key), blob); });

  DATASTREAM_LOG_INFO("updated datastream", {StringField("key", key), IntField("status", datastream.status()),
                                             observability::BoolField("notify_leader", notify_leader)});
  if (notify_leader) {
    NotifyLeaderOfDataChange();
  }
}

bool ZkBackedDatastreamStore::DeleteDatastream(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidArgument("datastream key must not be empty");
  }

  auto datastream = GetDatastream(key);
  if (!datastream) {
    DATASTREAM_LOG_DEBUG("delete of absent datastream ignored", {StringField("key", key)});
    return false;
  }

  datastream->set_status(v1::DATASTREAM_STATUS_DELETING);
  const auto blob = codec::ToJson(codec::StripNumTasks(*datastream));
  WrapStoreError("soft-delete datastream", key, [&] {
    zk_client_->UpdateDataSerialized(KeyBuilder::Datastream(cluster_, key), [&blob](const std::optional<std::string>&) { return blob; });
  });

  DATASTREAM_LOG_INFO("marked datastream for deletion", {StringField("key", key)});
  NotifyLeaderOfDataChange();
  return true;
}

CleanupResult ZkBackedDatastreamStore::DeleteDatastreamNumTasks(const std::string& key) {
  std::string path;

  CleanupResult result = CleanupResult::kRemoved;
  try {
    path = KeyBuilder::DatastreamNumTasks(cluster_, key);
    if (!zk_client_->Exists(path) || !zk_client_->Delete(path)) {
      DATASTREAM_LOG_WARN("numTasks node does not exist", {StringField("key", key), StringField("path", path)});
      result = CleanupResult::kNothingToRemove;
    }
  } catch (const util::InvalidArgument& e) {
    DATASTREAM_LOG_WARN("no numTasks node for malformed key", {StringField("key", key), StringField("error", e.what())});
    result = CleanupResult::kNothingToRemove;
  } catch (const zk::ZkClientException& e) {
    DATASTREAM_LOG_ERROR("failed to delete numTasks node", {StringField("key", key), StringField("path", path), StringField("error", e.what())});
    result = CleanupResult::kFailed;
  }

  RecordCleanup("num_tasks", result);
  return result;
}

std::optional<std::string> ZkBackedDatastreamStore::GetAssignedTaskInstance(const std::string& datastream, const std::string& task) {
  if (task.empty()) {
    return std::nullopt;
  }

  const auto record = GetDatastream(datastream);
  if (!record || record->connector_name().empty()) {
    return std::nullopt;
  }

  std::string path;
  try {
    path = KeyBuilder::ConnectorTask(cluster_, record->connector_name(), task);
  } catch (const util::InvalidArgument& e) {
    DATASTREAM_LOG_DEBUG("lookup of malformed task", {StringField("datastream", datastream), StringField("task", task), StringField("error", e.what())});
    return std::nullopt;
  }
  return WrapStoreError("read task assignment of", datastream, [&] { return zk_client_->ReadData(path, true); });
}

// ------------------------------------------------------------
// Target assignments
// ------------------------------------------------------------

void ZkBackedDatastreamStore::UpdatePartitionAssignments(const std::string& key, const v1::Datastream& datastream,
                                                         const v1::HostTargetAssignment& target_assignment, bool notify_leader) {
  if (key.empty()) {
    throw util::InvalidArgument("datastream key must not be empty");
  }

  VerifyHostname(target_assignment.target_host());

  const auto connector  = datastream.connector_name();
  const auto group_path = KeyBuilder::TargetAssignment(cluster_, connector, codec::TaskPrefix(datastream));
  const auto payload    = codec::ToJson(target_assignment);

  std::optional<std::string> entry_path;
  WrapStoreError("record target assignment of", key, [&] {
    zk_client_->EnsurePath(group_path);
    if (zk_client_->Exists(group_path)) {
      entry_path = KeyBuilder::TargetAssignmentEntry(cluster_, connector, codec::TaskPrefix(datastream), clock_());
      zk_client_->EnsurePath(*entry_path);
      zk_client_->WriteData(*entry_path, payload);
    }
  });

  if (entry_path) {
    DATASTREAM_LOG_INFO("recorded target assignment",
                        {StringField("key", key), StringField("path", *entry_path), StringField("host", target_assignment.target_host()),
                         IntField("partitions", target_assignment.partition_names_size())});
  }

  if (!notify_leader) {
    return;
  }

  const auto base_path = KeyBuilder::TargetAssignmentBase(cluster_, connector);
  try {
    zk_client_->WriteData(base_path, std::to_string(clock_()));
  } catch (const zk::ZkClientException& e) {
    DATASTREAM_LOG_ERROR("failed to notify leader of target assignment change",
                         {StringField("key", key), StringField("path", base_path), StringField("error", e.what())});
    throw util::StoreError("failed to notify leader of target assignment change for " + key + ": " + e.what());
  }
  observability::Metrics::Instance().RecordLeaderNotification("target_assignment");
}

void ZkBackedDatastreamStore::VerifyHostname(const std::string& hostname) {
  const auto instances_path = KeyBuilder::Instances(cluster_);

  std::vector<std::string> instances;
  try {
    zk_client_->EnsurePath(instances_path);
    instances = zk_client_->GetChildren(instances_path);
  } catch (const zk::ZkClientException& e) {
    throw util::StoreError("failed to list instances of cluster " + cluster_ + ": " + e.what());
  }

  for (const auto& instance : instances) {
    if (instance == zk::kPausedInstance) {
      continue;
    }
    try {
      if (zk::ParseHostnameFromZkInstance(instance) == hostname) {
        return;
      }
    } catch (const util::InvalidArgument& e) {
      DATASTREAM_LOG_WARN("skipping malformed instance name", {StringField("instance", instance), StringField("error", e.what())});
    }
  }

  throw util::InvalidArgument("hostname '" + hostname + "' is not a live instance of cluster " + cluster_);
}

// ------------------------------------------------------------
// Cleanup
// ------------------------------------------------------------

CleanupResult ZkBackedDatastreamStore::ForceCleanupDatastream(const std::string& key) {
  std::string path;

  CleanupResult result = CleanupResult::kRemoved;
  try {
    path = KeyBuilder::DatastreamAssignmentTokens(cluster_, key);
    if (!zk_client_->Exists(path)) {
      DATASTREAM_LOG_INFO("no assignment tokens to clean up", {StringField("key", key)});
      result = CleanupResult::kNothingToRemove;
    } else {
      zk_client_->DeleteRecursively(path);
      DATASTREAM_LOG_INFO("removed assignment tokens", {StringField("key", key), StringField("path", path)});
    }
  } catch (const util::InvalidArgument& e) {
    DATASTREAM_LOG_WARN("no assignment tokens for malformed key", {StringField("key", key), StringField("error", e.what())});
    result = CleanupResult::kNothingToRemove;
  } catch (const zk::ZkClientException& e) {
    DATASTREAM_LOG_ERROR("failed to remove assignment tokens", {StringField("key", key), StringField("path", path), StringField("error", e.what())});
    result = CleanupResult::kFailed;
  }

  RecordCleanup("assignment_tokens", result);
  return result;
}

// ------------------------------------------------------------
// Leader notification
// ------------------------------------------------------------

void ZkBackedDatastreamStore::NotifyLeaderOfDataChange() {
  const auto stamp = std::to_string(clock_());
  WrapStoreError("notify leader of data change in cluster", cluster_, [&] {
    zk_client_->UpdateDataSerialized(KeyBuilder::Datastreams(cluster_), [&stamp](const std::optional<std::string>&) { return stamp; });
  });
  observability::Metrics::Instance().RecordLeaderNotification("dms");
}

std::string ZkBackedDatastreamStore::EncodeForWrite(const std::string& key, const v1::Datastream& datastream) const {
  auto blob = codec::ToJson(codec::StripNumTasks(datastream));
  if (blob.size() > kMaxDatastreamBlobBytes) {
    throw util::SizeLimitExceeded("datastream " + key + " is " + Megabytes(blob.size()) + " (" + std::to_string(blob.size()) +
                                  " bytes), exceeding the limit of " + Megabytes(kMaxDatastreamBlobBytes) + " (" +
                                  std::to_string(kMaxDatastreamBlobBytes) + " bytes)");
  }
  return blob;
}

} // namespace datastream::store
