#include "Bloom.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include <openssl/sha.h>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::literals::string_view_literals;

namespace {
constexpr auto     magic{"MCBF"sv};
constexpr uint32_t version    = 1;
constexpr uint32_t max_hashes = 64;
constexpr uint32_t max_family = 255;
constexpr uint64_t word_bits  = 64;

uint64_t words_for(uint64_t bits) { return (bits + word_bits - 1) / word_bits; }

// Every family sets its own bits, so the filter holds n * families keys.
double keys_for(std::size_t expected_items, uint32_t families)
{
  return static_cast<double>(std::max<std::size_t>(expected_items, 1)) *
         families;
}

uint64_t get_le64(unsigned char const* p)
{
  uint64_t v{0};
  for (auto i = 8; i > 0; --i)
    v = (v << 8) | p[i - 1];
  return v;
}

void put_u32(std::ostream& os, uint32_t v)
{
  std::array<char, 4> buf;
  for (auto& c : buf) {
    c = static_cast<char>(v & 0xFF);
    v >>= 8;
  }
  os.write(buf.data(), buf.size());
}

void put_u64(std::ostream& os, uint64_t v)
{
  std::array<char, 8> buf;
  for (auto& c : buf) {
    c = static_cast<char>(v & 0xFF);
    v >>= 8;
  }
  os.write(buf.data(), buf.size());
}

bool get_u32(std::istream& is, uint32_t& v)
{
  std::array<unsigned char, 4> buf;
  if (!is.read(reinterpret_cast<char*>(buf.data()), buf.size()))
    return false;
  v = 0;
  for (auto i = buf.size(); i > 0; --i)
    v = (v << 8) | buf[i - 1];
  return true;
}

bool get_u64(std::istream& is, uint64_t& v)
{
  std::array<unsigned char, 8> buf;
  if (!is.read(reinterpret_cast<char*>(buf.data()), buf.size()))
    return false;
  v = get_le64(buf.data());
  return true;
}
} // namespace

double Bloom_filter::optimal_bits(std::size_t expected_items,
                                  double      fp_rate,
                                  uint32_t    families)
{
  auto const n   = keys_for(expected_items, families);
  auto const ln2 = std::log(2.0);
  return std::ceil(-n * std::log(fp_rate) / (ln2 * ln2));
}

Bloom_filter::Bloom_filter(std::size_t expected_items,
                           double      fp_rate,
                           uint32_t    families)
  : families_(families)
{
  CHECK((0.0 < fp_rate) && (fp_rate < 1.0)) << "fp_rate " << fp_rate;
  CHECK((0 < families) && (families <= max_family)) << "families " << families;

  auto const m = optimal_bits(expected_items, fp_rate, families);
  CHECK_LE(m, static_cast<double>(max_bits)) << "filter too large";
  bits_ = std::max<uint64_t>(static_cast<uint64_t>(m), word_bits);

  auto const k = std::ceil(std::log(2.0) * static_cast<double>(bits_) /
                           keys_for(expected_items, families));
  hashes_ = std::clamp<uint32_t>(static_cast<uint32_t>(k), 1, max_hashes);

  words_.resize(words_for(bits_));
}

// Double hashing, Kirsch and Mitzenmacher: position i is h1 + i*h2 mod m,
// with h1 and h2 taken from SHA-256 of the family number and the item.
template <typename Fn>
void Bloom_filter::for_each_bit(std::string_view item,
                                uint32_t         family,
                                Fn               fn) const
{
  std::string salted;
  salted.reserve(item.size() + 4);
  for (auto i = 0; i < 4; ++i)
    salted += static_cast<char>((family >> (8 * i)) & 0xFF);
  salted.append(item.data(), item.size());

  std::array<unsigned char, SHA256_DIGEST_LENGTH> md;
  SHA256(reinterpret_cast<unsigned char const*>(salted.data()), salted.size(),
         md.data());

  auto const h1 = get_le64(md.data());
  auto const h2 = get_le64(md.data() + 8) | 1;

  for (uint64_t i = 0; i < hashes_; ++i) {
    if (!fn((h1 + i * h2) % bits_))
      return;
  }
}

void Bloom_filter::add(std::string_view item)
{
  for (uint32_t family = 0; family < families_; ++family) {
    for_each_bit(item, family, [this](uint64_t bit) {
      words_[bit / word_bits] |= uint64_t{1} << (bit % word_bits);
      return true;
    });
  }
  ++inserted_;
}

bool Bloom_filter::test(std::string_view item, uint32_t family) const
{
  CHECK_LT(family, families_);
  auto found = true;
  for_each_bit(item, family, [this, &found](uint64_t bit) {
    found = (words_[bit / word_bits] >> (bit % word_bits)) & 1;
    return found;
  });
  return found;
}

bool Bloom_filter::contains(std::string_view item) const
{
  for (uint32_t family = 0; family < families_; ++family) {
    if (!test(item, family))
      return false;
  }
  return true;
}

void Bloom_filter::write(std::ostream& os) const
{
  os.write(magic.data(), magic.size());
  put_u32(os, version);
  put_u64(os, bits_);
  put_u32(os, hashes_);
  put_u32(os, families_);
  put_u64(os, inserted_);
  for (auto const word : words_)
    put_u64(os, word);
}

std::optional<Bloom_filter> Bloom_filter::read(std::istream& is,
                                               std::string&  msg)
{
  std::array<char, 4> hdr;
  if (!is.read(hdr.data(), hdr.size()) ||
      std::string_view(hdr.data(), hdr.size()) != magic) {
    msg = "not a bloom filter";
    return {};
  }

  uint32_t ver{0};
  if (!get_u32(is, ver) || (ver != version)) {
    msg = fmt::format("unsupported bloom filter version {}", ver);
    return {};
  }

  Bloom_filter bf;
  if (!get_u64(is, bf.bits_) || !get_u32(is, bf.hashes_) ||
      !get_u32(is, bf.families_) || !get_u64(is, bf.inserted_)) {
    msg = "truncated bloom filter header";
    return {};
  }

  if ((bf.bits_ == 0) || (bf.bits_ > max_bits) || (bf.hashes_ == 0) ||
      (bf.hashes_ > max_hashes) || (bf.families_ == 0) ||
      (bf.families_ > max_family)) {
    msg = fmt::format("bad bloom filter parameters: {} bits, {} hashes, {} "
                      "families",
                      bf.bits_, bf.hashes_, bf.families_);
    return {};
  }

  // Grow with the data, the header alone must not decide the allocation.
  auto const words = words_for(bf.bits_);
  for (uint64_t i = 0; i < words; ++i) {
    uint64_t word{0};
    if (!get_u64(is, word)) {
      msg = fmt::format("truncated bloom filter: {} of {} words", i, words);
      return {};
    }
    bf.words_.push_back(word);
  }

  return bf;
}
