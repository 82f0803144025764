#include "Error.hpp"

#include <sstream>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK_EQ(std::string(kind_c_str(Error_kind::dns_timeout)), "DNSTimeout");
  CHECK_EQ(std::string(kind_c_str(Error_kind::parse_failure)), "ParseFailure");

  Error const bare{Error_kind::filter_not_initialized, "", ""};
  CHECK_EQ(bare.message(), "bloom filter not initialized");

  Error const reserved{Error_kind::reserved_domain_rejected, "example.com", ""};
  CHECK_EQ(reserved.message(), "reserved domain «example.com»");

  Error const dns{Error_kind::dns_lookup_failure, "nx.com", "no such domain"};
  CHECK_EQ(dns.message(), "invalid domain «nx.com»: no such domain");

  Error const load{Error_kind::list_load_failure, "", "no domains"};
  CHECK_EQ(load.message(), "failed to load domain list: no domains");

  CHECK(dns == dns);
  CHECK(!(dns == reserved));

  std::ostringstream os;
  os << Error_kind::length_exceeded << ' ' << reserved;
  CHECK_EQ(os.str(), "LengthExceeded reserved domain «example.com»");
}
