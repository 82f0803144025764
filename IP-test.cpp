#include "IP.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP::as_address;
  using IP::is_address;
  using IP::is_address4;
  using IP::is_address6;
  using IP::is_address_literal;

  CHECK(is_address4("0.0.0.0"));
  CHECK(is_address4("9.9.9.9"));
  CHECK(is_address4("192.168.1.1"));
  CHECK(is_address4("255.255.255.255"));

  CHECK(!is_address4(""));
  CHECK(!is_address4("foo.bar"));
  CHECK(!is_address4("127.0.0.1."));
  CHECK(!is_address4("192.168.1."));
  CHECK(!is_address4("192.168.1.1a"));
  CHECK(!is_address4("256.0.0.0"));
  CHECK(!is_address4("1.1.1.300"));
  CHECK(!is_address4("300.300.300.300"));

  // No leading zeros.
  CHECK(!is_address4("192.168.001.001"));
  CHECK(!is_address4("01.1.1.1"));

  CHECK(is_address6("::1"));
  CHECK(is_address6("::"));
  CHECK(is_address6("2001:db8::1"));
  CHECK(is_address6("2001:db8::0:1"));
  CHECK(is_address6("2001:0db8:85a3:0000:0000:8a2e:0370:7334"));
  CHECK(is_address6("fe80::1:2:3"));
  CHECK(is_address6("::ffff:192.0.2.128"));
  CHECK(!is_address6("2001:db8:::1"));
  CHECK(!is_address6("12345::1"));
  CHECK(!is_address6("192.168.1.1"));

  CHECK(is_address("10.0.0.1"));
  CHECK(is_address("::1"));

  CHECK(is_address_literal("[192.168.1.1]"));
  CHECK(is_address_literal("[127.0.0.1]"));
  CHECK(is_address_literal("[::1]"));
  CHECK(is_address_literal("[2001:db8::1]"));
  CHECK(is_address_literal("[IPv6:2001:db8::1]"));
  CHECK(is_address_literal("[ipv6:::1]"));
  CHECK(is_address_literal("[IPv6:192.168.1.1]"));
  CHECK(is_address_literal("[ipv6:10.0.0.1]"));

  CHECK(!is_address_literal("192.168.1.1"));
  CHECK(!is_address_literal("[192.168.1.1"));
  CHECK(!is_address_literal("192.168.1.1]"));
  CHECK(!is_address_literal("[]"));
  CHECK(!is_address_literal("[[192.168.1.1]]"));
  CHECK(!is_address_literal("[ 192.168.1.1 ]"));
  CHECK(!is_address_literal("[192.168.1.1a]"));
  CHECK(!is_address_literal("[192.168.001.001]"));
  CHECK(!is_address_literal("[IPv6:]"));
  CHECK(!is_address_literal("[IPv6:example.com]"));
  CHECK(!is_address_literal("[example.com]"));

  CHECK_EQ(as_address("[192.0.2.1]"), "192.0.2.1");
  CHECK_EQ(as_address("[IPv6:2001:db8::1]"), "2001:db8::1");
  CHECK_EQ(as_address("[::1]"), "::1");
  CHECK_EQ(as_address("[IPv6:192.0.2.1]"), "192.0.2.1");
}
