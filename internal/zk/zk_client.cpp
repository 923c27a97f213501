#include "zk_client.hpp"

#include "internal/observability/logging.hpp"

namespace datastream::zk {

namespace {

// Bounded so a pathological updater cannot spin forever under contention.
constexpr int kMaxSerializedUpdateAttempts = 64;

} // namespace

const char* ToString(ZkErrorCode code) {
  switch (code) {
    case ZkErrorCode::kNoNode:
      return "no_node";
    case ZkErrorCode::kNodeExists:
      return "node_exists";
    case ZkErrorCode::kNotEmpty:
      return "not_empty";
    case ZkErrorCode::kBadVersion:
      return "bad_version";
    case ZkErrorCode::kBadArguments:
      return "bad_arguments";
    case ZkErrorCode::kConnectionLoss:
      return "connection_loss";
    case ZkErrorCode::kSessionExpired:
      return "session_expired";
    case ZkErrorCode::kTimeout:
      return "timeout";
    case ZkErrorCode::kInternal:
      return "internal";
  }
  return "unknown";
}

ZkClientException::ZkClientException(ZkErrorCode code, const std::string& msg)
    : std::runtime_error(std::string(ToString(code)) + ": " + msg), code_(code) {
}

std::string ZkClient::EnsureReadData(const std::string& path) {
  auto data = ReadData(path, false);
  if (!data) {
    throw ZkClientException(ZkErrorCode::kNoNode, "node has no data: " + path);
  }
  return *data;
}

void ZkClient::UpdateDataSerialized(const std::string& path, const DataUpdater& updater) {
  for (int attempt = 1; attempt <= kMaxSerializedUpdateAttempts; ++attempt) {
    const auto current = ReadVersioned(path);
    const auto next    = updater(current.data);
    if (WriteIfVersion(path, next, current.version)) {
      return;
    }
    DATASTREAM_LOG_DEBUG("Version conflict on serialized update, retrying",
                         {observability::StringField("path", path), observability::IntField("attempt", attempt)});
  }
  throw ZkClientException(ZkErrorCode::kBadVersion, "serialized update did not converge: " + path);
}

std::vector<std::string> AncestorPaths(const std::string& path) {
  std::vector<std::string> paths;
  std::string::size_type   pos = 0;
  while ((pos = path.find('/', pos + 1)) != std::string::npos) {
    paths.push_back(path.substr(0, pos));
  }
  if (path.size() > 1) {
    paths.push_back(path);
  }
  return paths;
}

std::string ParentPath(const std::string& path) {
  const auto pos = path.rfind('/');
  if (pos == std::string::npos || pos == 0) {
    return "/";
  }
  return path.substr(0, pos);
}

std::string BaseName(const std::string& path) {
  const auto pos = path.rfind('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

void ValidatePath(const std::string& path) {
  if (path.empty() || path.front() != '/') {
    throw ZkClientException(ZkErrorCode::kBadArguments, "path must be absolute: '" + path + "'");
  }
  if (path.size() > 1 && path.back() == '/') {
    throw ZkClientException(ZkErrorCode::kBadArguments, "path must not end with '/': " + path);
  }
  if (path.find("//") != std::string::npos) {
    throw ZkClientException(ZkErrorCode::kBadArguments, "path has an empty segment: " + path);
  }
}

} // namespace datastream::zk
