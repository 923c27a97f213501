#include <grpcpp/grpcpp.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/cache/cached_datastream_reader.hpp"
#include "internal/grpc/datastream_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/datastream_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/zk_backed_datastream_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/zk/instance_name.hpp"
#include "internal/zk/memory/memory_zk_client.hpp"

namespace {

using namespace datastream::store::v1;
using datastream::grpc::DatastreamServer;
using datastream::grpc::ToStatus;
using datastream::zk::memory::MemoryZkClient;

struct Harness {
  std::shared_ptr<MemoryZkClient>   zk = std::make_shared<MemoryZkClient>();
  std::unique_ptr<DatastreamServer> server;

  Harness() {
    auto cache = std::make_shared<datastream::cache::CachedDatastreamReader>(zk, "c", std::chrono::milliseconds(0));

    datastream::service::ServiceContext ctx;
    ctx.store = std::make_shared<datastream::store::ZkBackedDatastreamStore>(zk, cache, "c");
    server    = std::make_unique<DatastreamServer>(std::make_shared<datastream::service::DatastreamService>(ctx));
  }

  ::grpc::Status Create(const std::string& name, const std::string& connector = "c1") {
    CreateDatastreamRequest req;
    req.mutable_datastream()->set_name(name);
    req.mutable_datastream()->set_connector_name(connector);
    google::protobuf::Empty resp;
    ::grpc::ServerContext   ctx;
    return server->CreateDatastream(&ctx, &req, &resp);
  }
};

void TestExceptionMapping() {
  assert(ToStatus(datastream::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(datastream::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(datastream::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(datastream::util::SizeLimitExceeded("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(datastream::util::StoreError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(datastream::zk::ZkClientException(datastream::zk::ZkErrorCode::kConnectionLoss, "x")).error_code() ==
         ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestCreateTwiceReturnsAlreadyExists() {
  Harness h;
  assert(h.Create("d1").ok());
  assert(h.Create("d1").error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(h.Create("").error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestGetMissingReturnsNotFound() {
  Harness h;

  GetDatastreamRequest  req;
  GetDatastreamResponse resp;
  ::grpc::ServerContext ctx;
  req.set_name("ghost");
  assert(h.server->GetDatastream(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  assert(h.Create("d1").ok());
  req.set_name("d1");
  assert(h.server->GetDatastream(&ctx, &req, &resp).ok());
  assert(resp.datastream().connector_name() == "c1");
}

void TestUpdateMissingReturnsNotFound() {
  Harness h;

  UpdateDatastreamRequest req;
  req.mutable_datastream()->set_name("ghost");
  req.set_notify_leader(true);
  google::protobuf::Empty resp;
  ::grpc::ServerContext   ctx;
  assert(h.server->UpdateDatastream(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestListPaging() {
  Harness h;
  for (const auto& name : {"d3", "d1", "d2", "d4"}) {
    assert(h.Create(name).ok());
  }

  ListDatastreamsRequest  req;
  ListDatastreamsResponse resp;
  ::grpc::ServerContext   ctx;

  assert(h.server->ListDatastreams(&ctx, &req, &resp).ok());
  assert(resp.names_size() == 4);
  assert(resp.names(0) == "d1");

  req.set_start(1);
  req.set_count(2);
  resp.Clear();
  assert(h.server->ListDatastreams(&ctx, &req, &resp).ok());
  assert(resp.names_size() == 2);
  assert(resp.names(0) == "d2");
  assert(resp.names(1) == "d3");

  req.set_start(10);
  resp.Clear();
  assert(h.server->ListDatastreams(&ctx, &req, &resp).ok());
  assert(resp.names_size() == 0);
}

void TestDeleteAndCleanup() {
  Harness h;
  assert(h.Create("d1").ok());

  DeleteDatastreamRequest  del;
  DeleteDatastreamResponse del_resp;
  ::grpc::ServerContext    ctx;
  del.set_name("d1");
  assert(h.server->DeleteDatastream(&ctx, &del, &del_resp).ok());
  assert(del_resp.marked_deleting());

  del.set_name("ghost");
  assert(h.server->DeleteDatastream(&ctx, &del, &del_resp).ok());
  assert(!del_resp.marked_deleting());

  CleanupRequest  cleanup;
  CleanupResponse cleanup_resp;
  cleanup.set_name("d1");
  assert(h.server->ForceCleanupDatastream(&ctx, &cleanup, &cleanup_resp).ok());
  assert(cleanup_resp.outcome() == CLEANUP_OUTCOME_NOTHING_TO_REMOVE);

  h.zk->EnsurePath("/c/dms/d1/numTasks");
  assert(h.server->DeleteDatastreamNumTasks(&ctx, &cleanup, &cleanup_resp).ok());
  assert(cleanup_resp.outcome() == CLEANUP_OUTCOME_REMOVED);
}

void TestAssignmentThroughService() {
  Harness h;
  assert(h.Create("d1", "kafka").ok());
  h.zk->EnsurePath("/c/instances/" + datastream::zk::FormatZkInstance("host-a", 3));

  UpdatePartitionAssignmentsRequest req;
  req.set_name("d1");
  req.set_notify_leader(true);
  req.mutable_target_assignment()->set_target_host("host-a");
  req.mutable_target_assignment()->add_partition_names("p0");

  google::protobuf::Empty resp;
  ::grpc::ServerContext   ctx;
  assert(h.server->UpdatePartitionAssignments(&ctx, &req, &resp).ok());
  assert(h.zk->GetChildren("/c/targetAssignment/kafka/d1").size() == 1);

  req.mutable_target_assignment()->set_target_host("host-z");
  assert(h.server->UpdatePartitionAssignments(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_name("ghost");
  assert(h.server->UpdatePartitionAssignments(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestAssignedTaskInstance() {
  Harness h;
  assert(h.Create("d1", "kafka").ok());
  h.zk->EnsurePath("/c/connectors/kafka/t1");
  h.zk->WriteData("/c/connectors/kafka/t1", "host-a");

  GetAssignedTaskInstanceRequest  req;
  GetAssignedTaskInstanceResponse resp;
  ::grpc::ServerContext           ctx;
  req.set_datastream("d1");
  req.set_task("t1");
  assert(h.server->GetAssignedTaskInstance(&ctx, &req, &resp).ok());
  assert(resp.found());
  assert(resp.hostname() == "host-a");

  req.set_task("");
  resp.Clear();
  assert(h.server->GetAssignedTaskInstance(&ctx, &req, &resp).ok());
  assert(!resp.found());
}

} // namespace

int main() {
  TestExceptionMapping();
  TestCreateTwiceReturnsAlreadyExists();
  TestGetMissingReturnsNotFound();
  TestUpdateMissingReturnsNotFound();
  TestListPaging();
  TestDeleteAndCleanup();
  TestAssignmentThroughService();
  TestAssignedTaskInstance();

  std::cout << "datastream_store_unit_grpc_status: pass\n";
  return 0;
}
