#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace datastream::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace datastream::grpc
