#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace datastream::zk {
class ZkClient;
}

namespace datastream::cache {

/*
  Periodically refreshed snapshot of the datastream names of a cluster.

  Readers may observe names up to refresh_interval stale. A failed
  refresh keeps serving the previous snapshot.
*/
class CachedDatastreamReader {
 public:
  CachedDatastreamReader(std::shared_ptr<zk::ZkClient> client, std::string cluster,
                         std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(1000),
                         util::SteadyClock         clock            = util::SystemSteadyClock());

  // Unordered; callers sort.
  std::vector<std::string> GetAllDatastreamNames();

  // Forces the next read to go to the coordination service.
  void Invalidate();

 private:
  std::vector<std::string> Fetch();
  bool                     IsFresh() const;

  std::shared_ptr<zk::ZkClient> client_;
  std::string                   cluster_;
  std::chrono::milliseconds     refresh_interval_;
  util::SteadyClock             clock_;

  mutable std::shared_mutex mutex_;
  std::vector<std::string>  names_;
  util::SteadyTimePoint     refreshed_at_{};
  bool                      valid_ = false;
};

} // namespace datastream::cache
