#pragma once

#include <stdexcept>
#include <string>

namespace datastream::util {

/*
  Central error types.

  Strict store operations raise these; the gRPC layer translates them
  to status codes (see internal/grpc/grpc_error.cpp).
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SizeLimitExceeded : public std::runtime_error {
 public:
  explicit SizeLimitExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Wraps a coordination-service failure raised on a strict path.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace datastream::util
