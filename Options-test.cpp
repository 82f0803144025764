#include "Options.hpp"

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_uint64(dns_cache_size);
DECLARE_string(free_providers_url);

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  auto const defaults = Options::defaults();
  CHECK(defaults.check_dns);
  CHECK(defaults.reject_ip_domains);
  CHECK(!defaults.check_disposable);
  CHECK(!defaults.reject_named_emails);
  CHECK_EQ(defaults.max_email_length, 254);
  CHECK_EQ(defaults.min_domain_length, 1);
  CHECK(defaults.dns_timeout == 3s);
  CHECK(defaults.dns_cache_ttl == 1h);
  CHECK_EQ(defaults.dns_cache_size, 1000);
  CHECK_EQ(defaults.max_concurrency, 0);
  CHECK(!defaults.disposable_list_url.empty());
  CHECK(defaults.free_providers_url.empty());

  // Set fields are kept.
  Options opts;
  opts.max_email_length = 100;
  opts.dns_timeout      = 250ms;
  opts.check_dns        = false;

  auto const filled = opts.with_defaults();
  CHECK_EQ(filled.max_email_length, 100);
  CHECK(filled.dns_timeout == 250ms);
  CHECK(!filled.check_dns);
  CHECK_EQ(filled.min_domain_length, 1);

  // Defaults come from the flags.
  FLAGS_dns_cache_size     = 42;
  FLAGS_free_providers_url = "file:///etc/free.json";
  auto const flagged       = Options{}.with_defaults();
  CHECK_EQ(flagged.dns_cache_size, 42);
  CHECK_EQ(flagged.free_providers_url, "file:///etc/free.json");
}
