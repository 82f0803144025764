#include "Domain.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using domain::is_ip_domain;
  using domain::is_reserved;
  using domain::key;

  CHECK(is_ip_domain("[192.168.1.1]"));
  CHECK(is_ip_domain("[127.0.0.1]"));
  CHECK(is_ip_domain("[::1]"));
  CHECK(is_ip_domain("[2001:db8::0:1]"));
  CHECK(is_ip_domain("[IPv6:2001:db8::1]"));
  CHECK(is_ip_domain("[IPv6:192.0.2.1]"));

  // Bracketing is the only trigger.
  CHECK(!is_ip_domain("192.168.1.1"));
  CHECK(!is_ip_domain("2001:db8::1"));

  CHECK(!is_ip_domain("[]"));
  CHECK(!is_ip_domain("[300.300.300.300]"));
  CHECK(!is_ip_domain("[192.168.1.]"));
  CHECK(!is_ip_domain("[192.168.001.001]"));
  CHECK(!is_ip_domain("[ 192.168.1.1 ]"));
  CHECK(!is_ip_domain("example.com"));

  CHECK(is_reserved("example.com"));
  CHECK(is_reserved("EXAMPLE.COM"));
  CHECK(is_reserved("example.net"));
  CHECK(is_reserved("example.org"));
  CHECK(is_reserved("example.edu"));
  CHECK(is_reserved("localhost"));
  CHECK(is_reserved("domain.test"));
  CHECK(is_reserved("test"));
  CHECK(is_reserved("mydomain.example"));
  CHECK(is_reserved("foo.localhost"));
  CHECK(is_reserved("a.b.INVALID"));

  CHECK(!is_reserved("mytest.com"));
  CHECK(!is_reserved("gmail.com"));
  CHECK(!is_reserved("localhost.foo.com"));
  CHECK(!is_reserved("sub.example.com.au"));
  CHECK(!is_reserved("mytest"));
  CHECK(!is_reserved("latest"));
  CHECK(!is_reserved(""));

  // Subdomains of the example second-level domains are not on the list.
  CHECK(!is_reserved("www.example.com"));

  CHECK_EQ(key("GMail.COM"), "gmail.com");
  CHECK_EQ(key("[IPv6:::1]"), "[ipv6:::1]");
  CHECK_EQ(key("黒川.日本"), "xn--5rtw95l.xn--wgv71a");
}
