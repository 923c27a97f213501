#pragma once

#include <cstdint>
#include <string>

namespace datastream::zk {

// Reserved member under /<cluster>/instances standing for the paused pseudo-instance.
inline constexpr char kPausedInstance[] = "PAUSED_INSTANCE";

// "host-0000000007" -> "host". Raises util::InvalidArgument on a malformed member name.
std::string ParseHostnameFromZkInstance(const std::string& instance);

// ("host", 7) -> "host-0000000007", the form an ephemeral sequential node takes.
std::string FormatZkInstance(const std::string& hostname, uint64_t sequence);

} // namespace datastream::zk
