#include "instance_name.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"

namespace datastream::zk {

std::string ParseHostnameFromZkInstance(const std::string& instance) {
  const auto dash = instance.rfind('-');
  if (dash == std::string::npos || dash == 0) {
    throw util::InvalidArgument("instance name has no hostname: '" + instance + "'");
  }

  const auto sequence = instance.substr(dash + 1);
  if (sequence.empty() || !std::all_of(sequence.begin(), sequence.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw util::InvalidArgument("instance name has no sequence suffix: '" + instance + "'");
  }

  return instance.substr(0, dash);
}

std::string FormatZkInstance(const std::string& hostname, uint64_t sequence) {
  if (hostname.empty()) {
    throw util::InvalidArgument("hostname must not be empty");
  }
  std::ostringstream oss;
  oss << hostname << '-' << std::setw(10) << std::setfill('0') << sequence;
  return oss.str();
}

} // namespace datastream::zk
