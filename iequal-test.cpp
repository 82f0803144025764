#include "iequal.hpp"

#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK(iequal("", ""));
  CHECK(!iequal("a", ""));
  CHECK(!iequal("", "b"));

  CHECK(iequal("Example.COM", "example.com"));
  CHECK(!iequal("example.co", "example.com"));

  CHECK(istarts_with("IPv6:::1", "ipv6:"));
  CHECK(!istarts_with("IPv", "ipv6:"));

  CHECK(iends_with("domain.TEST", ".test"));
  CHECK(iends_with("test", "test"));
  CHECK(!iends_with("mytest.com", ".test"));
  CHECK(!iends_with("st", ".test"));

  CHECK_EQ(ascii_lower("GMail.COM"), "gmail.com");
  CHECK_EQ(ascii_lower("\xC3\x89.com"), "\xC3\x89.com"); // non-ASCII untouched
}
