#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace datastream::zk {
class ZkClient;
}
namespace datastream::store {
class DatastreamStore;
}
namespace datastream::service {
class DatastreamService;
}

namespace datastream::factory {

/*
  Everything the server process owns for its lifetime.
*/
struct Application {
  std::shared_ptr<datastream::zk::ZkClient>                 zk_client;
  std::shared_ptr<datastream::store::DatastreamStore>       store;
  std::shared_ptr<datastream::service::DatastreamService>   datastream_service;
  std::vector<std::unique_ptr<::grpc::Service>>             grpc_services;
};

/*
  Composition root. The only place that knows concrete coordination
  backends.
*/
std::shared_ptr<datastream::zk::ZkClient> BuildZkClient(const datastream::runtime::config::RuntimeConfig& config);

Application Build(const datastream::runtime::config::RuntimeConfig& config);

} // namespace datastream::factory
