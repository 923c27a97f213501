#include "datastream_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace datastream::codec {

namespace {

std::string Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

template <typename T>
std::optional<T> Parse(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  T    message;
  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    DATASTREAM_LOG_WARN("failed to decode json blob", {observability::StringField("type", message.GetTypeName()),
                                                       observability::StringField("error", std::string(status.message())),
                                                       observability::IntField("bytes", static_cast<int64_t>(json.size()))});
    return std::nullopt;
  }
  return message;
}

} // namespace

std::string ToJson(const store::v1::Datastream& datastream) {
  return Print(datastream);
}

std::string ToJson(const store::v1::HostTargetAssignment& assignment) {
  return Print(assignment);
}

std::optional<store::v1::Datastream> DatastreamFromJson(const std::string& json) {
  return Parse<store::v1::Datastream>(json);
}

std::optional<store::v1::HostTargetAssignment> AssignmentFromJson(const std::string& json) {
  return Parse<store::v1::HostTargetAssignment>(json);
}

std::string TaskPrefix(const store::v1::Datastream& datastream) {
  const auto it = datastream.metadata().find(kTaskPrefixKey);
  if (it != datastream.metadata().end()) {
    return it->second;
  }
  return datastream.name();
}

store::v1::Datastream StripNumTasks(const store::v1::Datastream& datastream) {
  store::v1::Datastream stripped = datastream;
  stripped.mutable_metadata()->erase(kNumTasksKey);
  return stripped;
}

} // namespace datastream::codec
