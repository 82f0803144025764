#ifndef ADDRESS_DOT_HPP
#define ADDRESS_DOT_HPP

#include <ostream>
#include <string>
#include <string_view>

// An RFC-5322 address: a bare addr-spec, or a name-addr with an optional
// display name and the addr-spec in angle brackets.  Comments, groups and
// the obsolete syntax are not supported.

class Address {
public:
  Address() = default;

  // Parse, throw std::invalid_argument on failure.
  inline explicit Address(std::string_view address);

  inline static bool
  validate(std::string_view address, std::string& msg, Address& addr);

  inline void set_name(std::string_view name);
  inline void set_local(std::string_view local_part);
  inline void set_domain(std::string_view domain);
  inline void clear();

  inline std::string const& name() const;
  inline std::string const& local_part() const;
  inline std::string const& domain() const;

  // local-part "@" domain, as written in the input.
  std::string as_string() const;

  inline bool empty() const;

private:
  bool set_(std::string_view address, bool should_throw, std::string& msg);

  std::string name_;
  std::string local_part_;
  std::string domain_;
};

Address::Address(std::string_view address)
{
  std::string msg;
  set_(address, true /* throw */, msg);
}

bool Address::validate(std::string_view address,
                       std::string&     msg,
                       Address&         addr)
{
  return addr.set_(address, false /* don't throw */, msg);
}

void Address::set_name(std::string_view name) { name_ = name; }
void Address::set_local(std::string_view local_part)
{
  local_part_ = local_part;
}
void Address::set_domain(std::string_view domain) { domain_ = domain; }

void Address::clear()
{
  name_.clear();
  local_part_.clear();
  domain_.clear();
}

std::string const& Address::name() const { return name_; }
std::string const& Address::local_part() const { return local_part_; }
std::string const& Address::domain() const { return domain_; }

bool Address::empty() const { return local_part_.empty() && domain_.empty(); }

inline std::ostream& operator<<(std::ostream& s, Address const& addr)
{
  if (!addr.name().empty())
    return s << addr.name() << " <" << addr.as_string() << '>';
  return s << addr.as_string();
}

#endif // ADDRESS_DOT_HPP
