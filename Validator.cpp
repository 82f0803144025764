#include "Validator.hpp"

#include "Address.hpp"
#include "Domain-list.hpp"
#include "Domain.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <mutex>
#include <sstream>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::literals::string_view_literals;

namespace {
constexpr std::string_view default_free_providers[]{
    "gmail.com"sv,   "yahoo.com"sv, "hotmail.com"sv,
    "outlook.com"sv, "aol.com"sv,
};

std::vector<std::string> keys(std::vector<std::string> const& domains)
{
  std::vector<std::string> ret;
  ret.reserve(domains.size());
  std::transform(begin(domains), end(domains), std::back_inserter(ret),
                 [](std::string const& dom) { return domain::key(dom); });
  return ret;
}
} // namespace

std::ostream& operator<<(std::ostream& os, Validation_result const& res)
{
  os << "«" << res.original << "» ";
  if (res.is_valid)
    os << "valid";
  else if (res.error)
    os << "invalid: " << *res.error;
  else
    os << "invalid";
  if (res.is_ip_domain)
    os << " [ip]";
  if (res.is_reserved)
    os << " [reserved]";
  if (res.is_disposable)
    os << " [disposable]";
  if (res.is_free_provider)
    os << " [free]";
  return os;
}

Validator::Validator(Options const&               options,
                     std::shared_ptr<MX_resolver> resolver)
  : options_(options.with_defaults())
  , dns_cache_(mtx_,
               std::move(resolver),
               options_.dns_timeout,
               options_.dns_cache_ttl,
               options_.dns_cache_size)
{
  for (auto const dom : default_free_providers)
    free_providers_.emplace(dom);
}

std::unique_ptr<Validator>
Validator::create(Options const&               options,
                  std::optional<Error>&        err,
                  std::shared_ptr<MX_resolver> resolver)
{
  auto v = std::make_unique<Validator>(options, std::move(resolver));

  err = v->load_disposable_domains(v->options().disposable_list_url);
  if (err)
    return nullptr;

  err = v->load_free_providers(v->options().free_providers_url);
  if (err)
    return nullptr;

  return v;
}

Validation_result Validator::validate(std::string_view email)
{
  auto const start = std::chrono::steady_clock::now();

  Validation_result res;
  try {
    validate_(email, res);
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "validating «" << email << "»: " << e.what();
    // Past the parser only the domain checks are left.
    auto const kind = res.address.empty() ? Error_kind::parse_failure
                                          : Error_kind::dns_lookup_failure;
    res.is_valid = false;
    res.error    = Error{kind, std::string(email), e.what()};
  }
  res.validation_time = std::chrono::steady_clock::now() - start;

  VLOG(1) << res;
  return res;
}

void Validator::validate_(std::string_view email, Validation_result& res)
{
  res.original = email;

  auto const reject = [&res](Error_kind kind, std::string_view context) {
    res.error = Error{kind, std::string(context), ""};
  };

  if (email.length() > options_.max_email_length) {
    res.error = Error{Error_kind::length_exceeded, std::string(email),
                      fmt::format("longer than {} octets",
                                  options_.max_email_length)};
    return;
  }

  std::string msg;
  Address     addr;
  if (!Address::validate(email, msg, addr)) {
    res.error = Error{Error_kind::parse_failure, std::string(email), msg};
    return;
  }

  res.name    = addr.name();
  res.address = addr.as_string();

  if (options_.reject_named_emails && (res.address != email))
    return reject(Error_kind::named_address_not_allowed, email);

  auto const& dom = addr.domain();

  if (dom.length() < options_.min_domain_length) {
    res.error = Error{Error_kind::domain_too_short, dom,
                      fmt::format("shorter than {} octets",
                                  options_.min_domain_length)};
    return;
  }

  res.is_ip_domain = domain::is_ip_domain(dom);
  if (res.is_ip_domain && options_.reject_ip_domains)
    return reject(Error_kind::ip_domain_rejected, dom);

  res.is_reserved = domain::is_reserved(dom);
  if (res.is_reserved && options_.reject_reserved)
    return reject(Error_kind::reserved_domain_rejected, dom);

  auto const key = domain::key(dom);

  if (options_.check_disposable) {
    res.is_disposable = is_disposable_(key);
    if (res.is_disposable && options_.reject_disposable)
      return reject(Error_kind::disposable_domain_rejected, dom);
  }

  if (options_.check_free_provider) {
    res.is_free_provider = is_free_provider_(key);
    if (res.is_free_provider && options_.reject_free_provider)
      return reject(Error_kind::free_provider_rejected, dom);
  }

  if (options_.check_dns) {
    Resolution mx;
    try {
      mx = dns_cache_.resolve(key);
    }
    catch (std::exception const& e) {
      LOG(WARNING) << "MX lookup for " << key << ": " << e.what();
      res.error = Error{Error_kind::dns_lookup_failure, key, e.what()};
      return;
    }
    if (!mx.found) {
      res.error = mx.error;
      if (!res.error)
        res.error = Error{Error_kind::dns_lookup_failure, key, ""};
      return;
    }
  }

  res.is_valid = true;
}

bool Validator::is_disposable_(std::string const& key) const
{
  std::shared_lock lock(mtx_);
  return disposable_.is_disposable(key);
}

bool Validator::is_free_provider_(std::string const& key) const
{
  std::shared_lock lock(mtx_);
  return free_providers_.contains(key);
}

void Validator::register_free_providers(
    std::vector<std::string> const& domains)
{
  auto const ks = keys(domains);

  std::unique_lock lock(mtx_);
  free_providers_.insert(begin(ks), end(ks));
}

void Validator::register_disposable_domains(
    std::vector<std::string> const& domains)
{
  auto const ks = keys(domains);

  std::unique_lock lock(mtx_);
  disposable_.register_domains(ks);
}

std::optional<Error> Validator::load_disposable_domains(std::string_view uri)
{
  if (!options_.check_disposable || uri.empty())
    return {};

  std::vector<std::string> domains;
  if (auto err = domain_list::fetch(uri, domains))
    return err;

  register_disposable_domains(domains);
  return {};
}

std::optional<Error> Validator::load_free_providers(std::string_view uri)
{
  if (!options_.check_free_provider || uri.empty())
    return {};

  std::vector<std::string> domains;
  if (auto err = domain_list::fetch(uri, domains))
    return err;

  register_free_providers(domains);
  return {};
}

std::optional<Error> Validator::use_bloom_filter(std::string_view     uri,
                                                 Bloom_options const& opts)
{
  std::vector<std::string> domains;
  if (auto err = domain_list::fetch(uri, domains))
    return err;

  auto const source = keys(domains);

  auto normalized            = opts;
  normalized.trusted_domains = keys(opts.trusted_domains);

  std::unique_lock lock(mtx_);
  auto             err = disposable_.upgrade(source, normalized);
  if (err)
    err->context = uri;
  return err;
}

std::optional<Error> Validator::save_bloom_filter(std::ostream& os) const
{
  std::shared_lock lock(mtx_);
  return disposable_.save(os);
}

std::optional<Error> Validator::load_bloom_filter(std::istream& is)
{
  // Read it all before taking the lock.
  std::stringstream blob;
  blob << is.rdbuf();

  std::unique_lock lock(mtx_);
  return disposable_.load(blob);
}

Membership_mode Validator::membership_mode() const
{
  std::shared_lock lock(mtx_);
  return disposable_.mode();
}

std::size_t Validator::disposable_count() const
{
  std::shared_lock lock(mtx_);
  return disposable_.size();
}

std::size_t Validator::free_provider_count() const
{
  std::shared_lock lock(mtx_);
  return free_providers_.size();
}

std::size_t Validator::dns_cache_size() const { return dns_cache_.size(); }
