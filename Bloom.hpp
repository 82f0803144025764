#ifndef BLOOM_DOT_HPP
#define BLOOM_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// A Bloom filter over strings with one or more independent hash families.
// Every item is added under each family; test() checks one family, so a
// caller can make several independent probes of the same item.  The bit
// array is sized so each family alone has the requested false positive
// rate.

class Bloom_filter {
public:
  // 1 GiB of bits.
  static constexpr uint64_t max_bits = uint64_t{1} << 33;

  // Bits needed for expected_items under each of families at fp_rate.  Not
  // rounded or capped, so a caller can check it against max_bits first.
  static double
  optimal_bits(std::size_t expected_items, double fp_rate, uint32_t families);

  Bloom_filter(std::size_t expected_items,
               double      fp_rate,
               uint32_t    families = 1);

  void add(std::string_view item);

  // False means definitely absent.
  bool test(std::string_view item, uint32_t family) const;

  // True under every family.
  bool contains(std::string_view item) const;

  uint64_t    bit_count() const { return bits_; }
  uint32_t    hash_count() const { return hashes_; }
  uint32_t    families() const { return families_; }
  uint64_t    inserted() const { return inserted_; }
  std::size_t memory_bytes() const { return words_.size() * sizeof(uint64_t); }

  // "MCBF", version, bit count, hash count, families, inserted count, then
  // the bit array as little-endian 64-bit words.
  void write(std::ostream& os) const;

  static std::optional<Bloom_filter> read(std::istream& is, std::string& msg);

private:
  Bloom_filter() = default;

  template <typename Fn>
  void for_each_bit(std::string_view item, uint32_t family, Fn fn) const;

  uint64_t bits_{0};
  uint32_t hashes_{0};
  uint32_t families_{0};
  uint64_t inserted_{0};

  std::vector<uint64_t> words_;
};

#endif // BLOOM_DOT_HPP
