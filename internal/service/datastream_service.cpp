#include "datastream_service.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/datastream_store.hpp"
#include "internal/util/errors.hpp"

namespace datastream::service {

using namespace datastream::store::v1;

namespace {

void RecordOutcome(std::string_view route, bool success, std::chrono::steady_clock::time_point started_at) {
  auto& metrics = observability::Metrics::Instance();
  metrics.RecordRequest(route, success);
  metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view datastream_name, Fn&& fn) {
  observability::SpanScope span(route);
  span.SetAttribute("datastream.name", datastream_name);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      RecordOutcome(route, true, started_at);
      return;
    } else {
      auto result = fn();
      RecordOutcome(route, true, started_at);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DATASTREAM_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                        observability::StringField("datastream", datastream_name)});
    RecordOutcome(route, false, started_at);
    throw;
  }
}

CleanupOutcome ToProto(datastream::store::CleanupResult result) {
  switch (result) {
    case datastream::store::CleanupResult::kRemoved:
      return CLEANUP_OUTCOME_REMOVED;
    case datastream::store::CleanupResult::kNothingToRemove:
      return CLEANUP_OUTCOME_NOTHING_TO_REMOVE;
    case datastream::store::CleanupResult::kFailed:
      return CLEANUP_OUTCOME_FAILED;
  }
  return CLEANUP_OUTCOME_FAILED;
}

CleanupResponse ToCleanupResponse(datastream::store::CleanupResult result) {
  CleanupResponse resp;
  resp.set_outcome(ToProto(result));
  resp.set_message(datastream::store::ToString(result));
  return resp;
}

} // namespace

DatastreamService::DatastreamService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store) {
    throw std::invalid_argument("DatastreamService: store is required");
  }
}

void DatastreamService::CreateDatastream(const CreateDatastreamRequest& req) {
  ObserveRpc("DatastreamService.CreateDatastream", req.datastream().name(), [&] {
    ctx_.store->CreateDatastream(req.datastream().name(), req.datastream());
  });
}

GetDatastreamResponse DatastreamService::GetDatastream(const GetDatastreamRequest& req) {
  return ObserveRpc("DatastreamService.GetDatastream", req.name(), [&] {
    auto datastream = ctx_.store->GetDatastream(req.name());
    if (!datastream) {
      throw util::NotFound("datastream " + req.name() + " not found");
    }

    GetDatastreamResponse resp;
    *resp.mutable_datastream() = std::move(*datastream);
    return resp;
  });
}

ListDatastreamsResponse DatastreamService::ListDatastreams(const ListDatastreamsRequest& req) {
  return ObserveRpc("DatastreamService.ListDatastreams", "", [&] {
    const auto names = ctx_.store->GetAllDatastreams();

    ListDatastreamsResponse resp;
    const auto              begin = std::min<std::size_t>(req.start(), names.size());
    const auto              end   = req.count() == 0 ? names.size() : std::min<std::size_t>(begin + req.count(), names.size());
    for (auto i = begin; i < end; ++i) {
      resp.add_names(names[i]);
    }
    return resp;
  });
}

void DatastreamService::UpdateDatastream(const UpdateDatastreamRequest& req) {
  ObserveRpc("DatastreamService.UpdateDatastream", req.datastream().name(), [&] {
    ctx_.store->UpdateDatastream(req.datastream().name(), req.datastream(), req.notify_leader());
  });
}

DeleteDatastreamResponse DatastreamService::DeleteDatastream(const DeleteDatastreamRequest& req) {
  return ObserveRpc("DatastreamService.DeleteDatastream", req.name(), [&] {
    DeleteDatastreamResponse resp;
    resp.set_marked_deleting(ctx_.store->DeleteDatastream(req.name()));
    return resp;
  });
}

GetAssignedTaskInstanceResponse DatastreamService::GetAssignedTaskInstance(const GetAssignedTaskInstanceRequest& req) {
  return ObserveRpc("DatastreamService.GetAssignedTaskInstance", req.datastream(), [&] {
    GetAssignedTaskInstanceResponse resp;
    if (auto hostname = ctx_.store->GetAssignedTaskInstance(req.datastream(), req.task())) {
      resp.set_found(true);
      resp.set_hostname(*hostname);
    }
    return resp;
  });
}

void DatastreamService::UpdatePartitionAssignments(const UpdatePartitionAssignmentsRequest& req) {
  ObserveRpc("DatastreamService.UpdatePartitionAssignments", req.name(), [&] {
    const auto datastream = ctx_.store->GetDatastream(req.name());
    if (!datastream) {
      throw util::NotFound("datastream " + req.name() + " not found");
    }
    ctx_.store->UpdatePartitionAssignments(req.name(), *datastream, req.target_assignment(), req.notify_leader());
  });
}

CleanupResponse DatastreamService::DeleteDatastreamNumTasks(const CleanupRequest& req) {
  return ObserveRpc("DatastreamService.DeleteDatastreamNumTasks", req.name(), [&] {
    return ToCleanupResponse(ctx_.store->DeleteDatastreamNumTasks(req.name()));
  });
}

CleanupResponse DatastreamService::ForceCleanupDatastream(const CleanupRequest& req) {
  return ObserveRpc("DatastreamService.ForceCleanupDatastream", req.name(), [&] {
    return ToCleanupResponse(ctx_.store->ForceCleanupDatastream(req.name()));
  });
}

} // namespace datastream::service
