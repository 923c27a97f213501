#include "datastream_server.hpp"

#include "grpc_error.hpp"

namespace datastream::grpc {

using namespace datastream::store::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

DatastreamServer::DatastreamServer(std::shared_ptr<datastream::service::DatastreamService> svc) : service_(std::move(svc)) {
}

::grpc::Status DatastreamServer::CreateDatastream(::grpc::ServerContext*, const CreateDatastreamRequest* req, google::protobuf::Empty*) {
  return Handle([&] { service_->CreateDatastream(*req); });
}

::grpc::Status DatastreamServer::GetDatastream(::grpc::ServerContext*, const GetDatastreamRequest* req, GetDatastreamResponse* resp) {
  return Handle([&] { *resp = service_->GetDatastream(*req); });
}

::grpc::Status DatastreamServer::ListDatastreams(::grpc::ServerContext*, const ListDatastreamsRequest* req, ListDatastreamsResponse* resp) {
  return Handle([&] { *resp = service_->ListDatastreams(*req); });
}

::grpc::Status DatastreamServer::UpdateDatastream(::grpc::ServerContext*, const UpdateDatastreamRequest* req, google::protobuf::Empty*) {
  return Handle([&] { service_->UpdateDatastream(*req); });
}

::grpc::Status DatastreamServer::DeleteDatastream(::grpc::ServerContext*, const DeleteDatastreamRequest* req,
                                                  DeleteDatastreamResponse* resp) {
  return Handle([&] { *resp = service_->DeleteDatastream(*req); });
}

::grpc::Status DatastreamServer::GetAssignedTaskInstance(::grpc::ServerContext*, const GetAssignedTaskInstanceRequest* req,
                                                         GetAssignedTaskInstanceResponse* resp) {
  return Handle([&] { *resp = service_->GetAssignedTaskInstance(*req); });
}

::grpc::Status DatastreamServer::UpdatePartitionAssignments(::grpc::ServerContext*, const UpdatePartitionAssignmentsRequest* req,
                                                            google::protobuf::Empty*) {
  return Handle([&] { service_->UpdatePartitionAssignments(*req); });
}

::grpc::Status DatastreamServer::DeleteDatastreamNumTasks(::grpc::ServerContext*, const CleanupRequest* req, CleanupResponse* resp) {
  return Handle([&] { *resp = service_->DeleteDatastreamNumTasks(*req); });
}

::grpc::Status DatastreamServer::ForceCleanupDatastream(::grpc::ServerContext*, const CleanupRequest* req, CleanupResponse* resp) {
  return Handle([&] { *resp = service_->ForceCleanupDatastream(*req); });
}

} // namespace datastream::grpc
