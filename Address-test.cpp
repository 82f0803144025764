#include "Address.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  Address addr;
  CHECK(addr.empty());

  std::string msg;

  CHECK(Address::validate("user@example.com", msg, addr));
  CHECK_EQ(addr.local_part(), "user");
  CHECK_EQ(addr.domain(), "example.com");
  CHECK(addr.name().empty());
  CHECK_EQ(addr.as_string(), "user@example.com");

  CHECK(Address::validate("first.last@sub.example.com", msg, addr));
  CHECK_EQ(addr.local_part(), "first.last");
  CHECK_EQ(addr.domain(), "sub.example.com");

  CHECK(Address::validate("user+tag@example.com", msg, addr));
  CHECK_EQ(addr.local_part(), "user+tag");

  CHECK(Address::validate("\"John Doe\" <john@example.com>", msg, addr));
  CHECK_EQ(addr.name(), "John Doe");
  CHECK_EQ(addr.as_string(), "john@example.com");

  CHECK(Address::validate("John <john@example.com>", msg, addr));
  CHECK_EQ(addr.name(), "John");
  CHECK_EQ(addr.local_part(), "john");

  CHECK(Address::validate("John Q. Public <jqp@example.com>", msg, addr));
  CHECK_EQ(addr.name(), "John Q. Public");

  CHECK(Address::validate("\"Joe \\\"Q\\\"\" Public <joe@example.com>", msg,
                          addr));
  CHECK_EQ(addr.name(), "Joe \"Q\" Public");

  CHECK(Address::validate("<bare@example.com>", msg, addr));
  CHECK(addr.name().empty());
  CHECK_EQ(addr.as_string(), "bare@example.com");

  // A name from a previous parse does not stick.
  CHECK(Address::validate("plain@example.com", msg, addr));
  CHECK(addr.name().empty());

  CHECK(Address::validate("  padded@example.com  ", msg, addr));
  CHECK_EQ(addr.as_string(), "padded@example.com");

  CHECK(Address::validate("\"quoted local\"@example.com", msg, addr));
  CHECK_EQ(addr.local_part(), "\"quoted local\"");

  CHECK(Address::validate("user@[192.168.1.1]", msg, addr));
  CHECK_EQ(addr.domain(), "[192.168.1.1]");

  CHECK(Address::validate("user@[IPv6:2001:db8::1]", msg, addr));
  CHECK_EQ(addr.domain(), "[IPv6:2001:db8::1]");

  CHECK(Address::validate("用户@例子.广告", msg, addr));
  CHECK_EQ(addr.domain(), "例子.广告");

  CHECK(!Address::validate("", msg, addr));
  CHECK(!Address::validate("invalid@", msg, addr));
  CHECK(!Address::validate("@example.com", msg, addr));
  CHECK(!Address::validate("no-at-sign", msg, addr));
  CHECK(!Address::validate("user@host@domain.com", msg, addr));
  CHECK(!Address::validate("first..last@example.com", msg, addr));
  CHECK(!Address::validate(".user@example.com", msg, addr));
  CHECK(!Address::validate("user.@example.com", msg, addr));
  CHECK(!Address::validate("user@example.com.", msg, addr));
  CHECK(!Address::validate("two words@example.com", msg, addr));
  CHECK(!Address::validate("John <john@example.com", msg, addr));
  CHECK(!Address::validate("john@example.com <other@example.com>", msg, addr));
  CHECK(addr.empty());
  CHECK(!msg.empty());

  std::string const long_local(65, 'a');
  CHECK(!Address::validate(long_local + "@example.com", msg, addr));
  CHECK(Address::validate(long_local.substr(1) + "@example.com", msg, addr));

  std::string long_domain;
  while (long_domain.size() < 256)
    long_domain += "abcdefghi.";
  long_domain += "com";
  CHECK(!Address::validate("user@" + long_domain, msg, addr));

  auto threw = false;
  try {
    Address bad("should throw@example.com");
  }
  catch (std::exception const& e) {
    threw = true;
  }
  CHECK(threw);

  Address const good("good@example.com");
  CHECK_EQ(good.domain(), "example.com");
}
