#include "memory_zk_client.hpp"

namespace datastream::zk::memory {

MemoryZkClient::MemoryZkClient() {
  nodes_.emplace("/", Node{});
}

std::string MemoryZkClient::ChildPrefix(const std::string& path) {
  return path == "/" ? path : path + "/";
}

bool MemoryZkClient::HasChildrenLocked(const std::string& path) const {
  const auto prefix = ChildPrefix(path);
  // Siblings such as "/a-b" sort between "/a" and "/a/x", so scan from the prefix.
  auto it = nodes_.lower_bound(prefix);
  if (it != nodes_.end() && it->first == path) ++it;
  return it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

bool MemoryZkClient::Exists(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  return nodes_.contains(path);
}

std::optional<std::string> MemoryZkClient::ReadData(const std::string& path, bool return_null_if_absent) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  auto             it = nodes_.find(path);
  if (it == nodes_.end()) {
    if (return_null_if_absent) return std::nullopt;
    throw ZkClientException(ZkErrorCode::kNoNode, path);
  }
  return it->second.data;
}

void MemoryZkClient::WriteData(const std::string& path, const std::string& data) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  auto             it = nodes_.find(path);
  if (it == nodes_.end()) {
    throw ZkClientException(ZkErrorCode::kNoNode, path);
  }
  it->second.data = data;
  ++it->second.version;
}

void MemoryZkClient::EnsurePath(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  for (const auto& ancestor : AncestorPaths(path)) {
    nodes_.try_emplace(ancestor);
  }
}

std::vector<std::string> MemoryZkClient::GetChildren(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  if (!nodes_.contains(path)) {
    throw ZkClientException(ZkErrorCode::kNoNode, path);
  }

  const auto               prefix = ChildPrefix(path);
  std::vector<std::string> children;
  for (auto it = nodes_.lower_bound(prefix); it != nodes_.end(); ++it) {
    const auto& key = it->first;
    if (key == path) continue;
    if (key.compare(0, prefix.size(), prefix) != 0) break;
    if (key.find('/', prefix.size()) == std::string::npos) {
      children.push_back(key.substr(prefix.size()));
    }
  }
  return children;
}

bool MemoryZkClient::Delete(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  if (path == "/") {
    throw ZkClientException(ZkErrorCode::kBadArguments, "cannot delete the root node");
  }
  auto it = nodes_.find(path);
  if (it == nodes_.end()) return false;
  if (HasChildrenLocked(path)) {
    throw ZkClientException(ZkErrorCode::kNotEmpty, path);
  }
  nodes_.erase(it);
  return true;
}

void MemoryZkClient::DeleteRecursively(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  if (path == "/") {
    throw ZkClientException(ZkErrorCode::kBadArguments, "cannot delete the root node");
  }
  if (nodes_.erase(path) == 0) return;

  const auto prefix = ChildPrefix(path);
  auto       first  = nodes_.lower_bound(prefix);
  auto       last   = first;
  while (last != nodes_.end() && last->first.compare(0, prefix.size(), prefix) == 0) {
    ++last;
  }
  nodes_.erase(first, last);
}

std::size_t MemoryZkClient::NodeCount() const {
  std::scoped_lock lock(mutex_);
  return nodes_.size() - 1;
}

VersionedData MemoryZkClient::ReadVersioned(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  auto             it = nodes_.find(path);
  if (it == nodes_.end()) {
    throw ZkClientException(ZkErrorCode::kNoNode, path);
  }
  return {it->second.data, it->second.version};
}

bool MemoryZkClient::WriteIfVersion(const std::string& path, const std::string& data, int32_t expected_version) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  auto             it = nodes_.find(path);
  if (it == nodes_.end()) {
    throw ZkClientException(ZkErrorCode::kNoNode, path);
  }
  if (it->second.version != expected_version) return false;
  it->second.data = data;
  ++it->second.version;
  return true;
}

} // namespace datastream::zk::memory
