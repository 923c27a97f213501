#pragma once

#include <optional>
#include <string>

#include "datastream/store/v1/assignment.pb.h"
#include "datastream/store/v1/datastream.pb.h"

namespace datastream::codec {

// Derived metadata entry, merged from the numTasks side node on read.
inline constexpr char kNumTasksKey[] = "numTasks";

// Metadata entry naming the task group of a datastream.
inline constexpr char kTaskPrefixKey[] = "system.taskPrefix";

std::string ToJson(const store::v1::Datastream& datastream);
std::string ToJson(const store::v1::HostTargetAssignment& assignment);

// Unknown fields are ignored. Malformed input yields nullopt and a warning log.
std::optional<store::v1::Datastream>           DatastreamFromJson(const std::string& json);
std::optional<store::v1::HostTargetAssignment> AssignmentFromJson(const std::string& json);

// system.taskPrefix when present, the datastream name otherwise.
std::string TaskPrefix(const store::v1::Datastream& datastream);

// Returns a copy without the derived numTasks entry.
store::v1::Datastream StripNumTasks(const store::v1::Datastream& datastream);

} // namespace datastream::codec
