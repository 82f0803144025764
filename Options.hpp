#ifndef OPTIONS_DOT_HPP
#define OPTIONS_DOT_HPP

#include <chrono>
#include <cstddef>
#include <string>

// Validator configuration.  Zero and empty fields are filled in from the
// command line flags (see Options.cpp) when a Validator is constructed.

struct Options {
  bool check_dns{true};
  bool check_disposable{false};
  bool check_free_provider{false};

  bool reject_disposable{false};
  bool reject_free_provider{false};
  bool reject_ip_domains{true};
  bool reject_reserved{false};
  bool reject_named_emails{false};

  std::size_t max_email_length{0};
  std::size_t min_domain_length{0};

  std::chrono::milliseconds dns_timeout{0};
  std::chrono::seconds      dns_cache_ttl{0};
  std::size_t               dns_cache_size{0};

  // Worker threads for a batch, zero for one per address.
  std::size_t max_concurrency{0};

  std::string disposable_list_url;
  std::string free_providers_url;

  // All fields from the flags.
  static Options defaults();

  // This, with unset fields filled in from the flags.
  Options with_defaults() const;
};

#endif // OPTIONS_DOT_HPP
