#include "Options.hpp"

#include <gflags/gflags.h>

DEFINE_uint64(max_email_length, 254, "longest email address accepted");
DEFINE_uint64(min_domain_length, 1, "shortest domain accepted");

DEFINE_int32(dns_timeout_ms, 3000, "MX lookup timeout in milliseconds");
DEFINE_int32(dns_cache_ttl_s, 3600, "seconds an MX lookup result is trusted");
DEFINE_uint64(dns_cache_size, 1000, "MX lookup results kept");

DEFINE_uint64(max_concurrency,
              0,
              "threads used to validate a batch, 0 for one per address");

DEFINE_string(
    disposable_list_url,
    "https://disposable.github.io/disposable-email-domains/domains.json",
    "JSON array of disposable domains, file:// or http(s)://");
DEFINE_string(free_providers_url,
              "",
              "JSON array of free email provider domains");

Options Options::defaults() { return Options{}.with_defaults(); }

Options Options::with_defaults() const
{
  auto opts{*this};

  if (opts.max_email_length == 0)
    opts.max_email_length = FLAGS_max_email_length;
  if (opts.min_domain_length == 0)
    opts.min_domain_length = FLAGS_min_domain_length;

  if (opts.dns_timeout.count() <= 0)
    opts.dns_timeout = std::chrono::milliseconds(FLAGS_dns_timeout_ms);
  if (opts.dns_cache_ttl.count() <= 0)
    opts.dns_cache_ttl = std::chrono::seconds(FLAGS_dns_cache_ttl_s);
  if (opts.dns_cache_size == 0)
    opts.dns_cache_size = FLAGS_dns_cache_size;

  if (opts.max_concurrency == 0)
    opts.max_concurrency = FLAGS_max_concurrency;

  if (opts.disposable_list_url.empty())
    opts.disposable_list_url = FLAGS_disposable_list_url;
  if (opts.free_providers_url.empty())
    opts.free_providers_url = FLAGS_free_providers_url;

  return opts;
}
