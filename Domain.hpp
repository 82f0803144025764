#ifndef DOMAIN_DOT_HPP
#define DOMAIN_DOT_HPP

#include <string>
#include <string_view>

// Stateless predicates on the domain part of an email address.

namespace domain {

// Bracketed IPv4 or IPv6 address literal, "[192.0.2.1]" or "[IPv6:::1]".  A
// bare dotted-quad is a (strange) domain name, not a literal.
bool is_ip_domain(std::string_view dom);

// IANA example domains and the RFC 2606 / RFC 6761 special use TLDs.
bool is_reserved(std::string_view dom);

// The form used for list membership: lower case A-labels.
std::string key(std::string_view dom);

} // namespace domain

#endif // DOMAIN_DOT_HPP
