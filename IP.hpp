#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include <string_view>

namespace IP {
using namespace std::literals::string_view_literals;

auto constexpr lit_pfx{"["sv};
auto constexpr lit_sfx{"]"sv};
auto constexpr ip6_tag{"IPv6:"sv};

bool is_address4(std::string_view addr);
bool is_address6(std::string_view addr);
bool is_address(std::string_view addr);

// A bracketed IPv4 or IPv6 address, as found in the domain part of an email
// address: "[192.0.2.1]", "[IPv6:2001:db8::1]" or "[2001:db8::1]".  The tag is
// optional, matched without regard to case, and may front either family:
// "[IPv6:192.0.2.1]" is a literal too.  A bare address is not a literal.
bool is_address_literal(std::string_view lit);

// The address inside a literal, without brackets or tag.
std::string_view as_address(std::string_view lit);
} // namespace IP

#endif // IP_DOT_HPP
