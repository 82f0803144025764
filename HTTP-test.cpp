#include "HTTP.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using HTTP::relative_target;

  CHECK_EQ(relative_target("/lists/domains.json", "/other/list.json"),
           "/other/list.json");
  CHECK_EQ(relative_target("/lists/domains.json", "domains-v2.json"),
           "/lists/domains-v2.json");
  CHECK_EQ(relative_target("/lists/domains.json?v=1", "new.json"),
           "/lists/new.json");
  CHECK_EQ(relative_target("/lists/", "domains.json"), "/lists/domains.json");
  CHECK_EQ(relative_target("/domains.json", "v2/domains.json"),
           "/v2/domains.json");
  CHECK_EQ(relative_target("/lists/domains.json", "../domains.json"),
           "/lists/../domains.json");
  CHECK_EQ(relative_target("/lists/domains.json?v=1", "?v=2"),
           "/lists/domains.json?v=2");
  CHECK_EQ(relative_target("/lists/domains.json", ""), "/lists/domains.json");

  // Rejected before any connection is made.
  std::string body;
  std::string msg;
  CHECK(!HTTP::get("ftp://example.com/domains.json", body, msg));
  CHECK(msg.starts_with("unsupported URL scheme")) << msg;
  CHECK(!HTTP::get("https:///domains.json", body, msg));
  CHECK(msg.starts_with("no host")) << msg;
  CHECK(!HTTP::get("http://user@example.com/", body, msg));
  CHECK(msg.starts_with("user info")) << msg;
  CHECK(!HTTP::get("https://[::1/domains.json", body, msg));
  CHECK(msg.starts_with("bad IPv6 host")) << msg;
  CHECK(body.empty());
}
