#include "Domain.hpp"

#include "IP.hpp"
#include "iequal.hpp"

#include <algorithm>

#include <idn2.h>

#include <glog/logging.h>

using namespace std::literals::string_view_literals;

namespace {
constexpr std::string_view reserved_domains[]{
    "example.com"sv, "example.net"sv, "example.org"sv,
    "example.edu"sv, "localhost"sv,
};

constexpr std::string_view reserved_tlds[]{
    "test"sv,
    "example"sv,
    "invalid"sv,
    "localhost"sv,
};

bool is_ascii(std::string_view str)
{
  return std::all_of(begin(str), end(str),
                     [](unsigned char c) { return c < 0x80; });
}

// The TLD must be the whole last label: "domain.test" yes, "mytest" no.
bool in_tld(std::string_view dom, std::string_view tld)
{
  if (iequal(dom, tld))
    return true;
  return (dom.size() > tld.size()) && iends_with(dom, tld) &&
         (dom[dom.size() - tld.size() - 1] == '.');
}
} // namespace

namespace domain {

bool is_ip_domain(std::string_view dom) { return IP::is_address_literal(dom); }

bool is_reserved(std::string_view dom)
{
  for (auto const reserved : reserved_domains) {
    if (iequal(dom, reserved))
      return true;
  }
  for (auto const tld : reserved_tlds) {
    if (in_tld(dom, tld))
      return true;
  }
  return false;
}

std::string key(std::string_view dom)
{
  if (is_ascii(dom) || is_ip_domain(dom))
    return ascii_lower(dom);

  // idn2_to_ascii_8z() converts to lower case

  std::string const u8{dom};

  char*      ptr  = nullptr;
  auto const code = idn2_to_ascii_8z(u8.c_str(), &ptr, IDN2_TRANSITIONAL);
  if (code != IDN2_OK) {
    VLOG(1) << "idn2 rejected «" << dom << "»: " << idn2_strerror(code);
    return ascii_lower(dom);
  }
  std::string ascii{ptr};
  idn2_free(ptr);
  return ascii;
}

} // namespace domain
