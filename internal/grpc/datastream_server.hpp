#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "api/datastream/store/v1.hpp"
#include "internal/service/datastream_service.hpp"

namespace datastream::grpc {

class DatastreamServer final : public datastream::store::v1::DatastreamManagementService::Service {
 public:
  explicit DatastreamServer(std::shared_ptr<datastream::service::DatastreamService> svc);

  ::grpc::Status CreateDatastream(::grpc::ServerContext*, const datastream::store::v1::CreateDatastreamRequest*,
                                  google::protobuf::Empty*) override;

  ::grpc::Status GetDatastream(::grpc::ServerContext*, const datastream::store::v1::GetDatastreamRequest*,
                               datastream::store::v1::GetDatastreamResponse*) override;

  ::grpc::Status ListDatastreams(::grpc::ServerContext*, const datastream::store::v1::ListDatastreamsRequest*,
                                 datastream::store::v1::ListDatastreamsResponse*) override;

  ::grpc::Status UpdateDatastream(::grpc::ServerContext*, const datastream::store::v1::UpdateDatastreamRequest*,
                                  google::protobuf::Empty*) override;

  ::grpc::Status DeleteDatastream(::grpc::ServerContext*, const datastream::store::v1::DeleteDatastreamRequest*,
                                  datastream::store::v1::DeleteDatastreamResponse*) override;

  ::grpc::Status GetAssignedTaskInstance(::grpc::ServerContext*, const datastream::store::v1::GetAssignedTaskInstanceRequest*,
                                         datastream::store::v1::GetAssignedTaskInstanceResponse*) override;

  ::grpc::Status UpdatePartitionAssignments(::grpc::ServerContext*, const datastream::store::v1::UpdatePartitionAssignmentsRequest*,
                                            google::protobuf::Empty*) override;

  ::grpc::Status DeleteDatastreamNumTasks(::grpc::ServerContext*, const datastream::store::v1::CleanupRequest*,
                                          datastream::store::v1::CleanupResponse*) override;

  ::grpc::Status ForceCleanupDatastream(::grpc::ServerContext*, const datastream::store::v1::CleanupRequest*,
                                        datastream::store::v1::CleanupResponse*) override;

 private:
  std::shared_ptr<datastream::service::DatastreamService> service_;
};

} // namespace datastream::grpc
