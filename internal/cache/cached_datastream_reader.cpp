#include "cached_datastream_reader.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/zk/key_builder.hpp"
#include "internal/zk/zk_client.hpp"

namespace datastream::cache {

CachedDatastreamReader::CachedDatastreamReader(std::shared_ptr<zk::ZkClient> client, std::string cluster,
                                               std::chrono::milliseconds refresh_interval, util::SteadyClock clock)
    : client_(std::move(client)), cluster_(std::move(cluster)), refresh_interval_(refresh_interval), clock_(std::move(clock)) {
  if (!client_) {
    throw std::invalid_argument("CachedDatastreamReader: null zk client");
  }
  if (!clock_) {
    clock_ = util::SystemSteadyClock();
  }
  zk::KeyBuilder::ValidateSegment("cluster name", cluster_);
}

std::vector<std::string> CachedDatastreamReader::GetAllDatastreamNames() {
  {
    std::shared_lock lock(mutex_);
    if (IsFresh()) {
      return names_;
    }
  }

  std::unique_lock lock(mutex_);
  if (IsFresh()) {
    return names_;
  }

  try {
    names_        = Fetch();
    refreshed_at_ = clock_();
    valid_        = true;
  } catch (const zk::ZkClientException& e) {
    DATASTREAM_LOG_WARN("datastream name refresh failed; serving previous snapshot",
                        {observability::StringField("cluster", cluster_), observability::StringField("error", e.what()),
                         observability::IntField("cached", static_cast<int64_t>(names_.size()))});
  }
  return names_;
}

void CachedDatastreamReader::Invalidate() {
  std::unique_lock lock(mutex_);
  valid_ = false;
}

bool CachedDatastreamReader::IsFresh() const {
  return valid_ && clock_() - refreshed_at_ < refresh_interval_;
}

std::vector<std::string> CachedDatastreamReader::Fetch() {
  const auto root = zk::KeyBuilder::Datastreams(cluster_);
  try {
    return client_->GetChildren(root);
  } catch (const zk::ZkClientException& e) {
    if (e.Code() == zk::ZkErrorCode::kNoNode) {
      return {};
    }
    throw;
  }
}

} // namespace datastream::cache
