#include "internal/zk/instance_name.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using datastream::zk::FormatZkInstance;
using datastream::zk::ParseHostnameFromZkInstance;

bool ParseFails(const std::string& instance) {
  try {
    ParseHostnameFromZkInstance(instance);
  } catch (const datastream::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestParse() {
  assert(ParseHostnameFromZkInstance("host-0000000007") == "host");
  assert(ParseHostnameFromZkInstance("broker-1.example.com-0000000012") == "broker-1.example.com");
  assert(ParseHostnameFromZkInstance("h-1") == "h");
}

void TestParseRejectsMalformedNames() {
  assert(ParseFails("host"));
  assert(ParseFails("host-"));
  assert(ParseFails("-0000000001"));
  assert(ParseFails("host-00x1"));
  assert(ParseFails(""));
}

void TestFormatRoundTrip() {
  assert(FormatZkInstance("host", 7) == "host-0000000007");
  assert(ParseHostnameFromZkInstance(FormatZkInstance("a-b", 42)) == "a-b");
}

} // namespace

int main() {
  TestParse();
  TestParseRejectsMalformedNames();
  TestFormatRoundTrip();

  std::cout << "datastream_store_unit_instance_name: pass\n";
  return 0;
}
