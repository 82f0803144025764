#include "MX.hpp"

#include "DNS-ldns.hpp"

#include <algorithm>
#include <exception>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(log_dns_lookups, false, "log each MX lookup and its outcome");

namespace {
Resolution not_found(std::string const& domain, std::string detail)
{
  if (FLAGS_log_dns_lookups)
    LOG(INFO) << "MX " << domain << ": " << detail;
  return Resolution{false, Error{Error_kind::dns_lookup_failure, domain,
                                 std::move(detail)}};
}
} // namespace

Resolution MX_resolver_ldns::lookup(std::string const&        domain,
                                    std::chrono::milliseconds timeout,
                                    std::stop_token           stop)
{
  if (stop.stop_requested())
    return not_found(domain, "lookup cancelled");

  try {
    DNS_ldns::Resolver const res(timeout);
    DNS_ldns::MX_query const q(res, domain);

    if (stop.stop_requested())
      return not_found(domain, "lookup cancelled");

    switch (q.answer()) {
    case DNS_ldns::Answer::no_error: break;
    case DNS_ldns::Answer::nx_domain:
      return not_found(domain, "no such domain");
    case DNS_ldns::Answer::failed: return not_found(domain, "lookup failed");
    }

    auto const mxs = q.records();
    if (mxs.empty())
      return not_found(domain, "no MX records");

    auto const null_mx = std::all_of(begin(mxs), end(mxs), [](auto const& mx) {
      return mx.exchange.empty();
    });
    if (null_mx)
      return not_found(domain, "null MX, domain accepts no mail");

    if (FLAGS_log_dns_lookups) {
      auto const best = std::min_element(
          begin(mxs), end(mxs), [](auto const& a, auto const& b) {
            return a.preference < b.preference;
          });
      LOG(INFO) << "MX " << domain << ": " << mxs.size() << " records, "
                << best->exchange << " preferred at " << best->preference;
    }
    return Resolution{true, {}};
  }
  catch (std::exception const& e) {
    return not_found(domain, e.what());
  }
}
