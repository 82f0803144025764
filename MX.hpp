#ifndef MX_DOT_HPP
#define MX_DOT_HPP

#include "Error.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

// The outcome of looking for a domain's mail exchangers.
struct Resolution {
  bool                 found{false};
  std::optional<Error> error; // set iff !found
};

class MX_resolver {
public:
  virtual ~MX_resolver() = default;

  // Implementations bound their own wait by timeout and give up early once
  // stop is requested; the caller no longer wants the answer.
  virtual Resolution lookup(std::string const&        domain,
                            std::chrono::milliseconds timeout,
                            std::stop_token           stop) = 0;
};

// MX lookup with ldns.  A domain that doesn't exist, has no MX records, or
// publishes a null MX (RFC 7505) is not found.
class MX_resolver_ldns : public MX_resolver {
public:
  Resolution lookup(std::string const&        domain,
                    std::chrono::milliseconds timeout,
                    std::stop_token           stop) override;
};

#endif // MX_DOT_HPP
