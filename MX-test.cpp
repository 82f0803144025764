#include "MX.hpp"

#include <chrono>

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_bool(log_dns_lookups);

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  FLAGS_log_dns_lookups = true;

  MX_resolver_ldns res;

  // RFC 2606: .invalid never resolves, with or without a network.
  auto const r = res.lookup("does-not-exist.invalid", 2s, std::stop_token{});
  CHECK(!r.found);
  CHECK(r.error);
  CHECK_EQ(r.error->kind, Error_kind::dns_lookup_failure);
  CHECK_EQ(r.error->context, "does-not-exist.invalid");

  // Not a name ldns will take.
  std::string const long_label(64, 'x');
  auto const bad = res.lookup(long_label + ".com", 2s, std::stop_token{});
  CHECK(!bad.found);
  CHECK(bad.error);

  // Cancelled before it starts.
  std::stop_source src;
  src.request_stop();
  auto const cancelled = res.lookup("example.org", 2s, src.get_token());
  CHECK(!cancelled.found);
  CHECK(cancelled.error);
}
