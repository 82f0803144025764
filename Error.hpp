#ifndef ERROR_DOT_HPP
#define ERROR_DOT_HPP

#include <cstdint>
#include <ostream>
#include <string>

enum class Error_kind : uint8_t {
  length_exceeded,
  parse_failure,
  named_address_not_allowed,
  domain_too_short,
  ip_domain_rejected,
  reserved_domain_rejected,
  disposable_domain_rejected,
  free_provider_rejected,
  dns_timeout,
  dns_lookup_failure,
  list_load_failure,
  filter_not_initialized,
  filter_deserialize_failure,
};

char const* kind_c_str(Error_kind kind);

struct Error {
  Error_kind  kind;
  std::string context; // offending value: address, domain or URI
  std::string detail;  // lower level cause, may be empty

  std::string message() const;

  bool operator==(Error const& rhs) const = default;
};

inline std::ostream& operator<<(std::ostream& os, Error_kind kind)
{
  return os << kind_c_str(kind);
}

inline std::ostream& operator<<(std::ostream& os, Error const& err)
{
  return os << err.message();
}

#endif // ERROR_DOT_HPP
