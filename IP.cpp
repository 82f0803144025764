#include "IP.hpp"

#include "iequal.hpp"

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::rep_opt;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;
using tao::pegtl::two;

using tao::pegtl::abnf::DIGIT;
using tao::pegtl::abnf::HEXDIG;

namespace IP {

using dot   = one<'.'>;
using colon = one<':'>;

// Leading zeros are not accepted, "001" could be read as octal by some
// resolvers.

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<one<'1'>, rep<2, DIGIT>>,
                       seq<range<'1','9'>, DIGIT>,
                       DIGIT> {};

struct ipv4_address : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet> {};

struct h16 : rep_min_max<1, 4, HEXDIG> {};

struct ls32 : sor<seq<h16, colon, h16>, ipv4_address> {};

struct dcolon : two<':'> {};

struct ipv6_address : sor<seq<                                          rep<6, h16, colon>, ls32>,
                          seq<                                  dcolon, rep<5, h16, colon>, ls32>,
                          seq<opt<h16                        >, dcolon, rep<4, h16, colon>, ls32>,
                          seq<opt<h16,     opt<   colon, h16>>, dcolon, rep<3, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<2, colon, h16>>, dcolon, rep<2, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<3, colon, h16>>, dcolon,        h16, colon,  ls32>,
                          seq<opt<h16, rep_opt<4, colon, h16>>, dcolon,                     ls32>,
                          seq<opt<h16, rep_opt<5, colon, h16>>, dcolon,                      h16>,
                          seq<opt<h16, rep_opt<6, colon, h16>>, dcolon                          >> {};
// clang-format on

struct ipv4_address_only : seq<ipv4_address, eof> {};
struct ipv6_address_only : seq<ipv6_address, eof> {};

bool is_address4(std::string_view addr)
{
  memory_input<> in{addr.data(), addr.size(), "ip4"};
  return parse<ipv4_address_only>(in);
}

bool is_address6(std::string_view addr)
{
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  return parse<ipv6_address_only>(in);
}

bool is_address(std::string_view addr)
{
  return is_address4(addr) || is_address6(addr);
}

namespace {
bool is_bracketed(std::string_view lit)
{
  return (lit.size() > lit_pfx.size() + lit_sfx.size()) &&
         (lit.substr(0, lit_pfx.size()) == lit_pfx) &&
         (lit.substr(lit.size() - lit_sfx.size()) == lit_sfx);
}

std::string_view strip_brackets(std::string_view lit)
{
  return lit.substr(lit_pfx.size(),
                    lit.size() - lit_pfx.size() - lit_sfx.size());
}
} // namespace

bool is_address_literal(std::string_view lit)
{
  if (!is_bracketed(lit))
    return false;

  auto content{strip_brackets(lit)};
  if (istarts_with(content, ip6_tag))
    content.remove_prefix(ip6_tag.size());

  return is_address(content);
}

std::string_view as_address(std::string_view lit)
{
  CHECK(is_address_literal(lit)) << "not an address literal " << lit;
  auto const content{strip_brackets(lit)};
  if (istarts_with(content, ip6_tag))
    return content.substr(ip6_tag.size());
  return content;
}
} // namespace IP
