#pragma once

#include <memory>

namespace datastream::store {
class DatastreamStore;
}

namespace datastream::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<datastream::store::DatastreamStore> store;
};

} // namespace datastream::service
