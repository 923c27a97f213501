#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/cache/cached_datastream_reader.hpp"
#include "internal/grpc/datastream_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/datastream_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/zk_backed_datastream_store.hpp"
#include "internal/zk/memory/memory_zk_client.hpp"
#if DATASTREAM_ZK_SQLITE
#include "internal/zk/sqlite/sqlite_db.hpp"
#include "internal/zk/sqlite/sqlite_zk_client.hpp"
#endif
#if DATASTREAM_ZK_ZOOKEEPER
#include "internal/zk/zookeeper/zookeeper_client.hpp"
#endif

namespace datastream::factory {

std::shared_ptr<zk::ZkClient> BuildZkClient(const runtime::config::RuntimeConfig& config) {
  const auto& coordination = config.coordination();

  if (coordination.has_sqlite()) {
#if DATASTREAM_ZK_SQLITE
    DATASTREAM_LOG_INFO("using sqlite coordination backend", {observability::StringField("path", coordination.sqlite().path())});
    auto db = std::make_shared<zk::sqlite::SqliteDB>(coordination.sqlite().path(), coordination.sqlite().wal_mode());
    return std::make_shared<zk::sqlite::SqliteZkClient>(std::move(db));
#else
    throw std::runtime_error("sqlite coordination backend requested but not enabled at build time");
#endif
  }

  if (coordination.has_zookeeper()) {
#if DATASTREAM_ZK_ZOOKEEPER
    const auto& zookeeper = coordination.zookeeper();
    DATASTREAM_LOG_INFO("using zookeeper coordination backend", {observability::StringField("connect_string", zookeeper.connect_string())});

    zk::zookeeper::ZooKeeperOptions options;
    options.connect_string     = zookeeper.connect_string();
    options.session_timeout    = std::chrono::milliseconds(zookeeper.session_timeout_ms());
    options.connection_timeout = std::chrono::milliseconds(zookeeper.connection_timeout_ms());
    return std::make_shared<zk::zookeeper::ZooKeeperClient>(std::move(options));
#else
    throw std::runtime_error("zookeeper coordination backend requested but not enabled at build time");
#endif
  }

  DATASTREAM_LOG_INFO("using in-memory coordination backend");
  return std::make_shared<zk::memory::MemoryZkClient>();
}

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config) {
  Application app;

  app.zk_client = BuildZkClient(config);

  auto name_cache = std::make_shared<cache::CachedDatastreamReader>(
      app.zk_client, config.cluster().name(), std::chrono::milliseconds(config.name_cache().refresh_interval_ms()));

  app.store = std::make_shared<store::ZkBackedDatastreamStore>(app.zk_client, std::move(name_cache), config.cluster().name());

  service::ServiceContext ctx;
  ctx.store              = app.store;
  app.datastream_service = std::make_shared<service::DatastreamService>(ctx);

  app.grpc_services.push_back(std::make_unique<grpc::DatastreamServer>(app.datastream_service));

  return app;
}

} // namespace datastream::factory
