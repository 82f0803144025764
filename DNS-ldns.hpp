#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// forward decl
typedef struct ldns_struct_pkt      ldns_pkt;
typedef struct ldns_struct_resolver ldns_resolver;

namespace DNS_ldns {

// A stub resolver configured from /etc/resolv.conf, each query bounded by
// timeout, tried once per name server.  Not thread safe; make one per
// thread.
class Resolver {
public:
  Resolver(Resolver const&) = delete;
  Resolver& operator=(Resolver const&) = delete;

  // Throws std::runtime_error if the resolver can't be set up.
  explicit Resolver(std::chrono::milliseconds timeout);
  ~Resolver();

  ldns_resolver* get() const { return res_; }

private:
  ldns_resolver* res_{nullptr};
};

struct MX_record {
  std::string exchange; // empty for the root, a "null MX"
  uint16_t    preference;
};

enum class Answer : uint8_t {
  no_error,  // records, if any, in records()
  nx_domain, // name does not exist
  failed,    // no usable answer: timeout, SERVFAIL, refused
};

// One MX question for a domain and the answer to it.
class MX_query {
public:
  MX_query(MX_query const&) = delete;
  MX_query& operator=(MX_query const&) = delete;

  // Throws std::invalid_argument if domain isn't a valid DNS name.
  MX_query(Resolver const& res, std::string const& domain);
  ~MX_query();

  Answer answer() const { return answer_; }

  // MX records from the answer section, CNAMEs skipped.
  std::vector<MX_record> records() const;

private:
  ldns_pkt* pkt_{nullptr};

  Answer answer_{Answer::failed};
};

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP
