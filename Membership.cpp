#include "Membership.hpp"

#include <algorithm>
#include <new>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
constexpr uint32_t max_attempts = 255;

std::size_t string_bytes(std::unordered_set<std::string> const& set)
{
  std::size_t bytes = set.bucket_count() * sizeof(void*);
  for (auto const& str : set)
    bytes += sizeof(str) + str.capacity() + sizeof(void*);
  return bytes;
}

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

std::ostream& operator<<(std::ostream& os, Membership_mode mode)
{
  switch (mode) {
  case Membership_mode::exact: return os << "exact";
  case Membership_mode::bloom: return os << "bloom";
  }
  return os << "unknown";
}

bool Membership_index::is_disposable(std::string_view dom) const
{
  std::string const key{dom};
  return std::visit(overloaded{
                        [&key](exact_set const& ex) {
                          return ex.domains.contains(key);
                        },
                        [&key](bloom_set const& bl) {
                          if (bl.trusted.contains(key))
                            return false;
                          for (uint32_t f = 0; f < bl.filter.families(); ++f) {
                            if (!bl.filter.test(key, f))
                              return false;
                          }
                          return true;
                        },
                    },
                    state_);
}

void Membership_index::register_domains(std::vector<std::string> const& domains)
{
  std::visit(overloaded{
                 [&domains](exact_set& ex) {
                   ex.domains.insert(begin(domains), end(domains));
                 },
                 [&domains](bloom_set& bl) {
                   for (auto const& dom : domains)
                     bl.filter.add(dom);
                 },
             },
             state_);
}

std::optional<Error>
Membership_index::upgrade(std::vector<std::string> const& source,
                          Bloom_options const&            opts)
{
  if (source.empty()) {
    return Error{Error_kind::list_load_failure, "",
                 "no domains to build a bloom filter from"};
  }

  auto fp_rate = opts.fp_rate;
  if (!((0.0 < fp_rate) && (fp_rate < 1.0))) {
    LOG(WARNING) << "false positive rate " << fp_rate
                 << " out of range, using " << Bloom_options{}.fp_rate;
    fp_rate = Bloom_options{}.fp_rate;
  }
  auto const attempts =
      std::clamp<uint32_t>(opts.verification_attempts, 1, max_attempts);

  std::vector<std::string> registered;
  auto const               ex = std::get_if<exact_set>(&state_);
  if (ex)
    registered.assign(begin(ex->domains), end(ex->domains));

  auto const expected = source.size() + registered.size();
  auto const bits     = Bloom_filter::optimal_bits(expected, fp_rate, attempts);
  if (bits > static_cast<double>(Bloom_filter::max_bits)) {
    LOG(WARNING) << "bloom filter of " << expected << " domains at rate "
                 << fp_rate << " with " << attempts << " attempts needs "
                 << bits << " bits";
    return Error{Error_kind::list_load_failure, "",
                 fmt::format("filter too large: {:.0f} bits, at most {}", bits,
                             Bloom_filter::max_bits)};
  }

  if (!ex) {
    LOG(WARNING) << "replacing bloom filter of "
                 << std::get<bloom_set>(state_).filter.inserted()
                 << " domains";
  }

  bloom_set bl{Bloom_filter(expected, fp_rate, attempts),
               {begin(opts.trusted_domains), end(opts.trusted_domains)}};
  for (auto const& dom : source)
    bl.filter.add(dom);
  for (auto const& dom : registered)
    bl.filter.add(dom);

  LOG(INFO) << "bloom filter of " << bl.filter.inserted() << " domains: "
            << bl.filter.bit_count() << " bits, " << bl.filter.hash_count()
            << " hashes, " << bl.filter.families() << " families, "
            << bl.trusted.size() << " trusted";

  state_ = std::move(bl);
  return {};
}

std::optional<Error>
Membership_index::trust(std::vector<std::string> const& domains)
{
  auto const bl = std::get_if<bloom_set>(&state_);
  if (!bl)
    return Error{Error_kind::filter_not_initialized, "", ""};
  bl->trusted.insert(begin(domains), end(domains));
  return {};
}

std::optional<Error> Membership_index::save(std::ostream& os) const
{
  auto const bl = std::get_if<bloom_set>(&state_);
  if (!bl)
    return Error{Error_kind::filter_not_initialized, "", ""};
  bl->filter.write(os);
  if (!os)
    return Error{Error_kind::filter_not_initialized, "",
                 "output stream failed, filter not saved"};
  return {};
}

std::optional<Error> Membership_index::load(std::istream& is)
{
  std::string                 msg;
  std::optional<Bloom_filter> filter;
  try {
    filter = Bloom_filter::read(is, msg);
  }
  catch (std::bad_alloc const&) {
    msg = "no memory for the bit array";
  }
  if (!filter) {
    LOG(WARNING) << "can't load bloom filter: " << msg;
    return Error{Error_kind::filter_deserialize_failure, "", msg};
  }

  LOG(INFO) << "loaded bloom filter of " << filter->inserted() << " domains, "
            << filter->bit_count() << " bits";

  if (auto const bl = std::get_if<bloom_set>(&state_)) {
    bl->filter = std::move(*filter);
  }
  else {
    state_ = bloom_set{std::move(*filter), {}};
  }
  return {};
}

Membership_mode Membership_index::mode() const
{
  return std::holds_alternative<exact_set>(state_) ? Membership_mode::exact
                                                   : Membership_mode::bloom;
}

std::size_t Membership_index::size() const
{
  return std::visit(overloaded{
                        [](exact_set const& ex) -> std::size_t {
                          return ex.domains.size();
                        },
                        [](bloom_set const& bl) -> std::size_t {
                          return bl.filter.inserted();
                        },
                    },
                    state_);
}

uint64_t Membership_index::bit_count() const
{
  auto const bl = std::get_if<bloom_set>(&state_);
  return bl ? bl->filter.bit_count() : 0;
}

uint32_t Membership_index::verification_attempts() const
{
  auto const bl = std::get_if<bloom_set>(&state_);
  return bl ? bl->filter.families() : 0;
}

std::size_t Membership_index::memory_bytes() const
{
  return std::visit(overloaded{
                        [](exact_set const& ex) {
                          return string_bytes(ex.domains);
                        },
                        [](bloom_set const& bl) {
                          return bl.filter.memory_bytes() +
                                 string_bytes(bl.trusted);
                        },
                    },
                    state_);
}
