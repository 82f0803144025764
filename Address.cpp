#include "Address.hpp"

#include "UTF8.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC5322 {
// <https://tools.ietf.org/html/rfc5322#section-3.4>

// clang-format off

using dot = one<'.'>;

struct FWS : plus<WSP> {};

// excluded from atext: "(),.:;<>@[\]
struct atext : sor<ALPHA, DIGIT,
                   one<'!', '#',
                       '$', '%',
                       '&', '\'',
                       '*', '+',
                       '-', '/',
                       '=', '?',
                       '^', '_',
                       '`', '{',
                       '|', '}',
                       '~'>,
                   RFC3629::non_ascii> {};

struct atom : plus<atext> {};
struct dot_atom_text : list<atom, dot> {};

struct qtext : sor<one<33>, ranges<35, 91, 93, 126>, RFC3629::non_ascii> {};
struct quoted_pair : seq<one<'\\'>, sor<VCHAR, WSP>> {};
struct qcontent : sor<qtext, quoted_pair> {};
struct quoted_string : seq<DQUOTE, star<opt<FWS>, qcontent>, opt<FWS>, DQUOTE> {};

struct word : sor<atom, quoted_string> {};

// A phrase, with the obsolete "." allowed between words: John Q. Public
struct display_name : seq<word, star<sor<seq<opt<FWS>, word>,
                                         seq<opt<FWS>, dot>>>> {};

struct dtext : ranges<33, 90, 94, 126> {};
struct domain_literal : seq<one<'['>, star<dtext>, one<']'>> {};

struct local_part : sor<dot_atom_text, quoted_string> {};
struct domain : sor<dot_atom_text, domain_literal> {};
struct addr_spec : seq<local_part, one<'@'>, domain> {};

struct angle_addr : seq<one<'<'>, addr_spec, one<'>'>> {};
struct name_addr : seq<opt<display_name, opt<FWS>>, angle_addr> {};

struct address : seq<opt<FWS>, sor<addr_spec, name_addr>, opt<FWS>> {};
struct address_only : seq<address, eof> {};

// clang-format on

// Actions

// Remove the quoting from a phrase: "Joe \"Q\"" Public -> Joe "Q" Public
std::string unquote(std::string_view phrase)
{
  std::string ret;
  ret.reserve(phrase.length());
  auto in_quotes = false;
  for (auto p = begin(phrase); p != end(phrase); ++p) {
    if (*p == '"') {
      in_quotes = !in_quotes;
    }
    else if (in_quotes && (*p == '\\') && (p + 1 != end(phrase))) {
      ret += *++p;
    }
    else {
      ret += *p;
    }
  }
  return ret;
}

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<display_name> {
  template <typename Input>
  static void apply(Input const& in, Address& addr)
  {
    addr.set_name(unquote(in.string_view()));
  }
};

template <>
struct action<local_part> {
  template <typename Input>
  static void apply(Input const& in, Address& addr)
  {
    addr.set_local(in.string_view());
  }
};

template <>
struct action<domain> {
  template <typename Input>
  static void apply(Input const& in, Address& addr)
  {
    addr.set_domain(in.string_view());
  }
};
} // namespace RFC5322

std::string Address::as_string() const
{
  return fmt::format("{}@{}", local_part_, domain_);
}

bool Address::set_(std::string_view address,
                   bool             should_throw,
                   std::string&     msg)
{
  clear();

  memory_input<> in(address.data(), address.size(), "address");
  if (address.empty() ||
      !parse<RFC5322::address_only, RFC5322::action>(in, *this)) {
    clear();
    msg = fmt::format("invalid address syntax «{}»", address);
    if (should_throw)
      throw std::invalid_argument("invalid address syntax");
    return false;
  }

  // RFC-5321 section 4.5.3.1.  Size Limits and Minimums

  if (local_part_.length() > 64) { // Section 4.5.3.1.1.  Local-part
    msg = fmt::format("local part «{}» > 64 octets", local_part_);
    clear();
    if (should_throw)
      throw std::invalid_argument("local part > 64 octets");
    return false;
  }
  if (domain_.length() > 255) { // Section 4.5.3.1.2.
    msg = fmt::format("domain «{}» > 255 octets", domain_);
    clear();
    if (should_throw)
      throw std::invalid_argument("domain > 255 octets");
    return false;
  }

  return true;
}
