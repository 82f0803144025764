#include "DNS-ldns.hpp"

#include <algorithm>
#include <stdexcept>

#include <cstdbool> // needs to be above ldns includes
#include <ldns/ldns.h>
#include <ldns/packet.h>
#include <ldns/rr.h>

#include <sys/time.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
// Owns the wire form of a name for the length of a query.
class Name {
public:
  Name(Name const&) = delete;
  Name& operator=(Name const&) = delete;

  explicit Name(std::string const& name)
    : rdf_(ldns_dname_new_frm_str(name.c_str()))
  {
    if (!rdf_)
      throw std::invalid_argument(fmt::format("bad domain name «{}»", name));
  }
  ~Name() { ldns_rdf_deep_free(rdf_); }

  ldns_rdf* get() const { return rdf_; }

private:
  ldns_rdf* rdf_;
};

// Presentation form of a DNAME rdata, without the trailing dot; "" for the
// root.
std::string dname_str(ldns_rdf const* rdf)
{
  auto const size = ldns_rdf_size(rdf);
  if (size > LDNS_MAX_DOMAINLEN) {
    LOG(WARNING) << "MX exchange of " << size << " octets";
    return "<too long>";
  }

  auto const wire = ldns_rdf_data(rdf);

  std::string name;
  name.reserve(size);

  // length prefixed labels ending with the zero length root label
  for (std::size_t pos = 0; (pos < size) && (wire[pos] != 0);) {
    auto const label_len = static_cast<std::size_t>(wire[pos++]);
    if (!name.empty())
      name += '.';
    for (auto const end = std::min(pos + label_len, size); pos < end; ++pos) {
      auto const c = static_cast<char>(wire[pos]);
      if ((c == '.') || (c == '\\'))
        name += '\\';
      name += c;
    }
  }

  return name;
}
} // namespace

namespace DNS_ldns {

Resolver::Resolver(std::chrono::milliseconds timeout)
{
  auto const status = ldns_resolver_new_frm_file(&res_, nullptr);
  if (status != LDNS_STATUS_OK) {
    res_ = nullptr;
    throw std::runtime_error(
        fmt::format("failed to initialize DNS resolver: {}",
                    ldns_get_errorstr_by_id(status)));
  }

  auto const usec =
      std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();

  timeval tv;
  tv.tv_sec  = usec / 1'000'000;
  tv.tv_usec = usec % 1'000'000;
  ldns_resolver_set_timeout(res_, tv);
  ldns_resolver_set_retry(res_, 1);
}

Resolver::~Resolver()
{
  if (res_)
    ldns_resolver_deep_free(res_);
}

MX_query::MX_query(Resolver const& res, std::string const& domain)
{
  Name const name(domain);

  auto const status =
      ldns_resolver_query_status(&pkt_, res.get(), name.get(), LDNS_RR_TYPE_MX,
                                 LDNS_RR_CLASS_IN, LDNS_RD);
  if (status != LDNS_STATUS_OK) {
    VLOG(1) << "MX query for " << domain << " failed: "
            << ldns_get_errorstr_by_id(status);
  }
  if (!pkt_)
    return;

  switch (auto const rcode = ldns_pkt_get_rcode(pkt_)) {
  case LDNS_RCODE_NOERROR:
    answer_ = (status == LDNS_STATUS_OK) ? Answer::no_error : Answer::failed;
    break;
  case LDNS_RCODE_NXDOMAIN: answer_ = Answer::nx_domain; break;
  case LDNS_RCODE_SERVFAIL: answer_ = Answer::failed; break;
  default:
    LOG(WARNING) << "MX query for " << domain << " got rcode "
                 << static_cast<int>(rcode);
    answer_ = Answer::failed;
    break;
  }
}

MX_query::~MX_query()
{
  if (pkt_)
    ldns_pkt_free(pkt_);
}

std::vector<MX_record> MX_query::records() const
{
  std::vector<MX_record> mxs;
  if (!pkt_ || (answer_ != Answer::no_error))
    return mxs;

  // owned by the packet
  auto const rrs = ldns_pkt_answer(pkt_);
  if (!rrs)
    return mxs;

  auto const count = ldns_rr_list_rr_count(rrs);
  mxs.reserve(count);

  for (std::size_t i = 0; i < count; ++i) {
    auto const rr = ldns_rr_list_rr(rrs, i);
    if (!rr || (ldns_rr_get_type(rr) != LDNS_RR_TYPE_MX))
      continue;

    if (ldns_rr_rd_count(rr) != 2) {
      LOG(WARNING) << "malformed MX record, " << ldns_rr_rd_count(rr)
                   << " rdata fields";
      continue;
    }
    auto const pref = ldns_rr_rdf(rr, 0);
    auto const exch = ldns_rr_rdf(rr, 1);
    if ((ldns_rdf_get_type(pref) != LDNS_RDF_TYPE_INT16) ||
        (ldns_rdf_get_type(exch) != LDNS_RDF_TYPE_DNAME)) {
      LOG(WARNING) << "malformed MX record";
      continue;
    }
    mxs.push_back(MX_record{dname_str(exch), ldns_rdf2native_int16(pref)});
  }

  return mxs;
}

} // namespace DNS_ldns
