#pragma once

#include "api/datastream/store/v1.hpp"
#include "service_context.hpp"

namespace datastream::service {

class DatastreamService {
 public:
  explicit DatastreamService(ServiceContext ctx);

  void CreateDatastream(const datastream::store::v1::CreateDatastreamRequest& req);

  datastream::store::v1::GetDatastreamResponse GetDatastream(const datastream::store::v1::GetDatastreamRequest& req);

  datastream::store::v1::ListDatastreamsResponse ListDatastreams(const datastream::store::v1::ListDatastreamsRequest& req);

  void UpdateDatastream(const datastream::store::v1::UpdateDatastreamRequest& req);

  datastream::store::v1::DeleteDatastreamResponse DeleteDatastream(const datastream::store::v1::DeleteDatastreamRequest& req);

  datastream::store::v1::GetAssignedTaskInstanceResponse
  GetAssignedTaskInstance(const datastream::store::v1::GetAssignedTaskInstanceRequest& req);

  void UpdatePartitionAssignments(const datastream::store::v1::UpdatePartitionAssignmentsRequest& req);

  datastream::store::v1::CleanupResponse DeleteDatastreamNumTasks(const datastream::store::v1::CleanupRequest& req);

  datastream::store::v1::CleanupResponse ForceCleanupDatastream(const datastream::store::v1::CleanupRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datastream::service
