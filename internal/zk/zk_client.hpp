#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace datastream::zk {

/*
  Portable coordination-client error codes.

  Backends translate their native failures into these. Upper layers
  should never depend on sqlite or ZooKeeper C client error values.
*/
enum class ZkErrorCode {
  kNoNode,
  kNodeExists,
  kNotEmpty,
  kBadVersion,
  kBadArguments,
  kConnectionLoss,
  kSessionExpired,
  kTimeout,
  kInternal
};

const char* ToString(ZkErrorCode code);

class ZkClientException : public std::runtime_error {
 public:
  ZkClientException(ZkErrorCode code, const std::string& msg);

  ZkErrorCode Code() const {
    return code_;
  }

 private:
  ZkErrorCode code_;
};

// Version-stamped value of a node, as observed by a single read.
struct VersionedData {
  std::optional<std::string> data;
  int32_t                    version = 0;
};

/*
  Hierarchical, watch-capable coordination service client.

  CRITICAL GUARANTEES (all backends):

  - Single-node reads and writes are linearizable per node
  - No multi-node atomicity: EnsurePath followed by WriteData is two steps
  - Nodes created by EnsurePath carry no data (ReadData yields nullopt)
  - Implementations are safe for concurrent use from multiple threads
*/
class ZkClient {
 public:
  // Receives the current value (nullopt for a data-less node) and returns the replacement.
  using DataUpdater = std::function<std::string(const std::optional<std::string>&)>;

  virtual ~ZkClient() = default;

  virtual bool Exists(const std::string& path) = 0;

  // Returns nullopt for a data-less node. An absent node yields nullopt when
  // return_null_if_absent is set and raises kNoNode otherwise.
  virtual std::optional<std::string> ReadData(const std::string& path, bool return_null_if_absent) = 0;

  // Unconditional overwrite. Raises kNoNode when the node does not exist.
  virtual void WriteData(const std::string& path, const std::string& data) = 0;

  // Creates the node and every missing ancestor; idempotent.
  virtual void EnsurePath(const std::string& path) = 0;

  // Child names (not full paths). Raises kNoNode when the node does not exist.
  virtual std::vector<std::string> GetChildren(const std::string& path) = 0;

  // Deletes a leaf node. Returns false when it does not exist; raises kNotEmpty with children.
  virtual bool Delete(const std::string& path) = 0;

  // Deletes the node and its whole subtree; an absent node is a no-op.
  virtual void DeleteRecursively(const std::string& path) = 0;

  // Read that must succeed: raises kNoNode when absent or data-less.
  std::string EnsureReadData(const std::string& path);

  /*
    Read-modify-write that reapplies updater against the latest value
    until a version-checked write succeeds. Raises kNoNode when the node
    does not exist.
  */
  void UpdateDataSerialized(const std::string& path, const DataUpdater& updater);

 protected:
  virtual VersionedData ReadVersioned(const std::string& path) = 0;

  // Returns false when the node's version no longer matches expected_version.
  virtual bool WriteIfVersion(const std::string& path, const std::string& data, int32_t expected_version) = 0;
};

// Splits "/a/b/c" into {"/a", "/a/b", "/a/b/c"}; "/" yields nothing.
std::vector<std::string> AncestorPaths(const std::string& path);

std::string ParentPath(const std::string& path);

std::string BaseName(const std::string& path);

// Raises kBadArguments unless path is absolute, has no empty segments and no trailing '/'.
void ValidatePath(const std::string& path);

} // namespace datastream::zk
