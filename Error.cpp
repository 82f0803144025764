#include "Error.hpp"

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
char const* describe(Error_kind kind)
{
  switch (kind) {
  case Error_kind::length_exceeded: return "email exceeds maximum length";
  case Error_kind::parse_failure: return "invalid email format";
  case Error_kind::named_address_not_allowed:
    return "named email addresses are not allowed";
  case Error_kind::domain_too_short: return "domain too short";
  case Error_kind::ip_domain_rejected:
    return "IP address domains are not allowed";
  case Error_kind::reserved_domain_rejected: return "reserved domain";
  case Error_kind::disposable_domain_rejected: return "disposable domain";
  case Error_kind::free_provider_rejected: return "free email provider";
  case Error_kind::dns_timeout: return "DNS lookup timeout";
  case Error_kind::dns_lookup_failure: return "invalid domain";
  case Error_kind::list_load_failure: return "failed to load domain list";
  case Error_kind::filter_not_initialized:
    return "bloom filter not initialized";
  case Error_kind::filter_deserialize_failure:
    return "failed to read bloom filter";
  }
  LOG(FATAL) << "unknown error kind " << static_cast<int>(kind);
}
} // namespace

char const* kind_c_str(Error_kind kind)
{
  switch (kind) {
  case Error_kind::length_exceeded: return "LengthExceeded";
  case Error_kind::parse_failure: return "ParseFailure";
  case Error_kind::named_address_not_allowed: return "NamedAddressNotAllowed";
  case Error_kind::domain_too_short: return "DomainTooShort";
  case Error_kind::ip_domain_rejected: return "IPDomainRejected";
  case Error_kind::reserved_domain_rejected: return "ReservedDomainRejected";
  case Error_kind::disposable_domain_rejected:
    return "DisposableDomainRejected";
  case Error_kind::free_provider_rejected: return "FreeProviderRejected";
  case Error_kind::dns_timeout: return "DNSTimeout";
  case Error_kind::dns_lookup_failure: return "DNSLookupFailure";
  case Error_kind::list_load_failure: return "ListLoadFailure";
  case Error_kind::filter_not_initialized: return "FilterNotInitialized";
  case Error_kind::filter_deserialize_failure:
    return "FilterDeserializeFailure";
  }
  LOG(FATAL) << "unknown error kind " << static_cast<int>(kind);
}

std::string Error::message() const
{
  if (context.empty() && detail.empty())
    return describe(kind);
  if (detail.empty())
    return fmt::format("{} «{}»", describe(kind), context);
  if (context.empty())
    return fmt::format("{}: {}", describe(kind), detail);
  return fmt::format("{} «{}»: {}", describe(kind), context, detail);
}
