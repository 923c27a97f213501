#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <iostream>
#include <string>

#include "api/datastream/store/v1.hpp"

using namespace datastream::store::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dmsctl <addr> list [start] [count]\n"
            << "  dmsctl <addr> get <name>\n"
            << "  dmsctl <addr> delete <name>\n"
            << "  dmsctl <addr> cleanup <name>\n"
            << "  dmsctl <addr> delete-num-tasks <name>\n"
            << "  dmsctl <addr> task-host <name> <task>\n"
            << "  dmsctl <addr> assign <name> <host> <partition>[,<partition>...] [--no-notify]\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static void PrintCleanup(const CleanupResponse& resp) {
  std::cout << CleanupOutcome_Name(resp.outcome()) << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = DatastreamManagementService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListDatastreamsRequest req;
    if (argc >= 4) req.set_start(static_cast<uint32_t>(std::stoul(argv[3])));
    if (argc >= 5) req.set_count(static_cast<uint32_t>(std::stoul(argv[4])));

    ListDatastreamsResponse resp;
    auto                    status = stub->ListDatastreams(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& name : resp.names()) {
      std::cout << name << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetDatastreamRequest req;
    req.set_name(argv[3]);

    GetDatastreamResponse resp;
    auto                  status = stub->GetDatastream(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;

    std::string json;
    auto        print_status = google::protobuf::util::MessageToJsonString(resp.datastream(), &json, options);
    if (!print_status.ok()) {
      std::cerr << "failed to render datastream: " << std::string(print_status.message()) << "\n";
      return 2;
    }
    std::cout << json;
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteDatastreamRequest req;
    req.set_name(argv[3]);

    DeleteDatastreamResponse resp;
    auto                     status = stub->DeleteDatastream(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.marked_deleting() ? "marked deleting" : "not found") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup" || cmd == "delete-num-tasks") {
    if (argc < 4) return 1;

    CleanupRequest req;
    req.set_name(argv[3]);

    CleanupResponse resp;
    auto status = cmd == "cleanup" ? stub->ForceCleanupDatastream(&ctx, req, &resp) : stub->DeleteDatastreamNumTasks(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintCleanup(resp);
    return resp.outcome() == CLEANUP_OUTCOME_FAILED ? 3 : 0;
  }

  // ------------------------------------------------------------

  if (cmd == "task-host") {
    if (argc < 5) return 1;

    GetAssignedTaskInstanceRequest req;
    req.set_datastream(argv[3]);
    req.set_task(argv[4]);

    GetAssignedTaskInstanceResponse resp;
    auto                            status = stub->GetAssignedTaskInstance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.found()) {
      std::cout << "unassigned\n";
      return 0;
    }
    std::cout << resp.hostname() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "assign") {
    if (argc < 6) return 1;

    UpdatePartitionAssignmentsRequest req;
    req.set_name(argv[3]);
    req.set_notify_leader(!(argc >= 7 && std::string(argv[6]) == "--no-notify"));

    auto* assignment = req.mutable_target_assignment();
    assignment->set_target_host(argv[4]);

    std::string partitions = argv[5];
    std::size_t begin      = 0;
    while (begin <= partitions.size()) {
      const auto end = partitions.find(',', begin);
      const auto len = (end == std::string::npos ? partitions.size() : end) - begin;
      if (len > 0) assignment->add_partition_names(partitions.substr(begin, len));
      if (end == std::string::npos) break;
      begin = end + 1;
    }

    google::protobuf::Empty resp;
    auto                    status = stub->UpdatePartitionAssignments(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "assigned " << assignment->partition_names_size() << " partitions to " << assignment->target_host() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
