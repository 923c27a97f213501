#include "zookeeper_client.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace datastream::zk::zookeeper {

namespace {

ZkErrorCode Translate(int rc) {
  switch (rc) {
    case ZNONODE:
      return ZkErrorCode::kNoNode;
    case ZNODEEXISTS:
      return ZkErrorCode::kNodeExists;
    case ZNOTEMPTY:
      return ZkErrorCode::kNotEmpty;
    case ZBADVERSION:
      return ZkErrorCode::kBadVersion;
    case ZBADARGUMENTS:
      return ZkErrorCode::kBadArguments;
    case ZCONNECTIONLOSS:
      return ZkErrorCode::kConnectionLoss;
    case ZSESSIONEXPIRED:
      return ZkErrorCode::kSessionExpired;
    case ZOPERATIONTIMEOUT:
      return ZkErrorCode::kTimeout;
    default:
      return ZkErrorCode::kInternal;
  }
}

[[noreturn]] void Throw(int rc, const std::string& op, const std::string& path) {
  throw ZkClientException(Translate(rc), op + " " + path + ": " + zerror(rc));
}

} // namespace

ZooKeeperClient::ZooKeeperClient(ZooKeeperOptions options) : options_(std::move(options)) {
  zoo_set_debug_level(ZOO_LOG_LEVEL_WARN);
  handle_ = zookeeper_init(options_.connect_string.c_str(), &ZooKeeperClient::OnSessionEvent,
                           static_cast<int>(options_.session_timeout.count()), nullptr, this, 0);
  if (!handle_) {
    throw ZkClientException(ZkErrorCode::kConnectionLoss, "zookeeper_init failed for " + options_.connect_string);
  }

  try {
    WaitUntilConnected();
  } catch (const ZkClientException&) {
    zookeeper_close(handle_);
    handle_ = nullptr;
    throw;
  }

  DATASTREAM_LOG_INFO("Connected to ZooKeeper", {observability::StringField("connect_string", options_.connect_string)});
}

ZooKeeperClient::~ZooKeeperClient() {
  if (handle_) {
    zookeeper_close(handle_);
  }
}

void ZooKeeperClient::OnSessionEvent(zhandle_t*, int type, int state, const char*, void* context) {
  if (type != ZOO_SESSION_EVENT) {
    return;
  }
  auto* self = static_cast<ZooKeeperClient*>(context);
  {
    std::scoped_lock lock(self->state_mutex_);
    self->session_state_ = state;
  }
  self->state_changed_.notify_all();

  if (state == ZOO_EXPIRED_SESSION_STATE) {
    DATASTREAM_LOG_ERROR("ZooKeeper session expired", {observability::StringField("connect_string", self->options_.connect_string)});
  }
}

void ZooKeeperClient::WaitUntilConnected() {
  std::unique_lock lock(state_mutex_);
  const bool connected = state_changed_.wait_for(lock, options_.connection_timeout, [this] {
    return session_state_ == ZOO_CONNECTED_STATE || session_state_ == ZOO_EXPIRED_SESSION_STATE || session_state_ == ZOO_AUTH_FAILED_STATE;
  });

  if (!connected) {
    throw ZkClientException(ZkErrorCode::kTimeout, "no ZooKeeper session within " + std::to_string(options_.connection_timeout.count()) + "ms");
  }
  if (session_state_ != ZOO_CONNECTED_STATE) {
    throw ZkClientException(ZkErrorCode::kSessionExpired, "ZooKeeper session could not be established");
  }
}

bool ZooKeeperClient::Exists(const std::string& path) {
  ValidatePath(path);
  Stat      stat;
  const int rc = zoo_exists(handle_, path.c_str(), 0, &stat);
  if (rc == ZOK) return true;
  if (rc == ZNONODE) return false;
  Throw(rc, "exists", path);
}

std::optional<VersionedData> ZooKeeperClient::Get(const std::string& path, Stat* stat) {
  // Size the buffer from the node's stat; retry if the value grew in between.
  for (;;) {
    int rc = zoo_exists(handle_, path.c_str(), 0, stat);
    if (rc == ZNONODE) return std::nullopt;
    if (rc != ZOK) Throw(rc, "exists", path);

    const int   capacity = stat->dataLength > 0 ? stat->dataLength : 1;
    std::string buffer(static_cast<std::size_t>(capacity), '\0');
    int         length = capacity;
    rc                 = zoo_get(handle_, path.c_str(), 0, buffer.data(), &length, stat);
    if (rc == ZNONODE) return std::nullopt;
    if (rc != ZOK) Throw(rc, "get", path);
    if (stat->dataLength > capacity) continue;

    VersionedData result;
    result.version = stat->version;
    if (length >= 0) {
      buffer.resize(static_cast<std::size_t>(length));
      result.data = std::move(buffer);
    }
    return result;
  }
}

std::optional<std::string> ZooKeeperClient::ReadData(const std::string& path, bool return_null_if_absent) {
  ValidatePath(path);
  Stat stat;
  auto value = Get(path, &stat);
  if (!value) {
    if (return_null_if_absent) return std::nullopt;
    throw ZkClientException(ZkErrorCode::kNoNode, path);
  }
  return value->data;
}

void ZooKeeperClient::WriteData(const std::string& path, const std::string& data) {
  ValidatePath(path);
  const int rc = zoo_set(handle_, path.c_str(), data.data(), static_cast<int>(data.size()), -1);
  if (rc != ZOK) Throw(rc, "set", path);
}

void ZooKeeperClient::EnsurePath(const std::string& path) {
  ValidatePath(path);
  for (const auto& ancestor : AncestorPaths(path)) {
    const int rc = zoo_create(handle_, ancestor.c_str(), nullptr, -1, &ZOO_OPEN_ACL_UNSAFE, 0, nullptr, 0);
    if (rc != ZOK && rc != ZNODEEXISTS) Throw(rc, "create", ancestor);
  }
}

std::vector<std::string> ZooKeeperClient::GetChildren(const std::string& path) {
  ValidatePath(path);
  String_vector strings{};
  const int     rc = zoo_get_children(handle_, path.c_str(), 0, &strings);
  if (rc != ZOK) Throw(rc, "get_children", path);

  std::vector<std::string> children;
  children.reserve(static_cast<std::size_t>(strings.count));
  for (int32_t i = 0; i < strings.count; ++i) {
    children.emplace_back(strings.data[i]);
  }
  deallocate_String_vector(&strings);
  return children;
}

bool ZooKeeperClient::Delete(const std::string& path) {
  ValidatePath(path);
  const int rc = zoo_delete(handle_, path.c_str(), -1);
  if (rc == ZOK) return true;
  if (rc == ZNONODE) return false;
  Throw(rc, "delete", path);
}

void ZooKeeperClient::DeleteRecursively(const std::string& path) {
  ValidatePath(path);
  if (path == "/") {
    throw ZkClientException(ZkErrorCode::kBadArguments, "cannot delete the root node");
  }

  std::vector<std::string> children;
  try {
    children = GetChildren(path);
  } catch (const ZkClientException& e) {
    if (e.Code() == ZkErrorCode::kNoNode) return;
    throw;
  }

  for (const auto& child : children) {
    DeleteRecursively(path + "/" + child);
  }

  const int rc = zoo_delete(handle_, path.c_str(), -1);
  if (rc != ZOK && rc != ZNONODE) Throw(rc, "delete", path);
}

VersionedData ZooKeeperClient::ReadVersioned(const std::string& path) {
  ValidatePath(path);
  Stat stat;
  auto value = Get(path, &stat);
  if (!value) {
    throw ZkClientException(ZkErrorCode::kNoNode, path);
  }
  return *value;
}

bool ZooKeeperClient::WriteIfVersion(const std::string& path, const std::string& data, int32_t expected_version) {
  ValidatePath(path);
  const int rc = zoo_set(handle_, path.c_str(), data.data(), static_cast<int>(data.size()), expected_version);
  if (rc == ZOK) return true;
  if (rc == ZBADVERSION) return false;
  Throw(rc, "set", path);
}

} // namespace datastream::zk::zookeeper
