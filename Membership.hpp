#ifndef MEMBERSHIP_DOT_HPP
#define MEMBERSHIP_DOT_HPP

#include "Bloom.hpp"
#include "Error.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

struct Bloom_options {
  double fp_rate{0.001};

  // Never reported disposable, whatever the filter says.
  std::vector<std::string> trusted_domains;

  // Independent filter probes that must all hit.
  uint32_t verification_attempts{1};
};

enum class Membership_mode : uint8_t { exact, bloom };

std::ostream& operator<<(std::ostream& os, Membership_mode mode);

// The set of disposable domains.  Starts out as an exact set; upgrade()
// moves it, once, to a Bloom filter.  Keys are expected to be normalized by
// the caller.  Not thread safe.

class Membership_index {
public:
  bool is_disposable(std::string_view dom) const;

  void register_domains(std::vector<std::string> const& domains);

  // Build a filter from source plus everything registered so far.  An empty
  // source is an error and leaves the index as it was.
  std::optional<Error> upgrade(std::vector<std::string> const& source,
                               Bloom_options const&            opts);

  // Bloom mode only.
  std::optional<Error> trust(std::vector<std::string> const& domains);

  std::optional<Error> save(std::ostream& os) const;
  std::optional<Error> load(std::istream& is);

  Membership_mode mode() const;

  // Domains in the exact set, or added to the filter.
  std::size_t size() const;
  uint64_t    bit_count() const;
  uint32_t    verification_attempts() const;
  std::size_t memory_bytes() const;

private:
  struct exact_set {
    std::unordered_set<std::string> domains;
  };
  struct bloom_set {
    Bloom_filter                    filter;
    std::unordered_set<std::string> trusted;
  };

  std::variant<exact_set, bloom_set> state_;
};

#endif // MEMBERSHIP_DOT_HPP
