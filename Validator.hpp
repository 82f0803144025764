#ifndef VALIDATOR_DOT_HPP
#define VALIDATOR_DOT_HPP

#include "Cache.hpp"
#include "Error.hpp"
#include "MX.hpp"
#include "Membership.hpp"
#include "Options.hpp"

#include <chrono>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

struct Validation_result {
  std::string original; // input, as given
  std::string name;     // display name, if any
  std::string address;  // local-part@domain

  bool is_ip_domain{false};
  bool is_reserved{false};
  bool is_disposable{false};
  bool is_free_provider{false};

  bool is_valid{false};

  std::chrono::nanoseconds validation_time{0};

  std::optional<Error> error; // why not valid
};

std::ostream& operator<<(std::ostream& os, Validation_result const& res);

// Thread safe: any number of threads may validate while others register or
// load domains.

class Validator {
public:
  Validator(Validator const&) = delete;
  Validator& operator=(Validator const&) = delete;

  // No lists are loaded; see create().
  explicit Validator(Options const&               options,
                     std::shared_ptr<MX_resolver> resolver =
                         std::make_shared<MX_resolver_ldns>());

  // A validator with its initial disposable and free provider lists
  // loaded, or nullptr and err set.
  static std::unique_ptr<Validator>
  create(Options const&               options,
         std::optional<Error>&        err,
         std::shared_ptr<MX_resolver> resolver =
             std::make_shared<MX_resolver_ldns>());

  Validation_result validate(std::string_view email);

  void register_free_providers(std::vector<std::string> const& domains);
  void register_disposable_domains(std::vector<std::string> const& domains);

  // Nothing to do when the matching check is off or the URI is empty.  On
  // failure nothing is added.
  std::optional<Error> load_disposable_domains(std::string_view uri);
  std::optional<Error> load_free_providers(std::string_view uri);

  // Switch the disposable set to a Bloom filter built from the list at uri
  // and everything registered so far.
  std::optional<Error> use_bloom_filter(std::string_view     uri,
                                        Bloom_options const& opts);

  std::optional<Error> save_bloom_filter(std::ostream& os) const;
  std::optional<Error> load_bloom_filter(std::istream& is);

  Options const& options() const { return options_; }

  Membership_mode membership_mode() const;
  std::size_t     disposable_count() const;
  std::size_t     free_provider_count() const;
  std::size_t     dns_cache_size() const;

private:
  // Fills in res as it goes.
  void validate_(std::string_view email, Validation_result& res);

  bool is_disposable_(std::string const& key) const;
  bool is_free_provider_(std::string const& key) const;

  Options const options_;

  // Guards everything below, the cache included.
  mutable std::shared_mutex mtx_;

  Membership_index                disposable_;
  std::unordered_set<std::string> free_providers_;
  Resolution_cache                dns_cache_;
};

#endif // VALIDATOR_DOT_HPP
