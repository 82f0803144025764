#include "Bloom.hpp"

#include <sstream>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
std::string member(int i) { return fmt::format("member-{}.example", i); }
std::string stranger(int i) { return fmt::format("stranger-{}.example", i); }

constexpr int n_members   = 1000;
constexpr int n_strangers = 20000;

template <typename T>
void put_le(std::string& out, T v)
{
  for (auto i = 0u; i < sizeof(T); ++i, v >>= 8)
    out += static_cast<char>(v & 0xFF);
}

// Just the header, no bit array after it.
std::string header_only(uint64_t bits)
{
  std::string hdr{"MCBF"};
  put_le<uint32_t>(hdr, 1); // version
  put_le<uint64_t>(hdr, bits);
  put_le<uint32_t>(hdr, 1); // hashes
  put_le<uint32_t>(hdr, 1); // families
  put_le<uint64_t>(hdr, 0); // inserted
  return hdr;
}

double false_positive_rate(Bloom_filter const& bf)
{
  auto fp = 0;
  for (auto i = 0; i < n_strangers; ++i) {
    if (bf.contains(stranger(i)))
      ++fp;
  }
  return static_cast<double>(fp) / n_strangers;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Bloom_filter sized(1000, 0.01);
  CHECK_GT(sized.bit_count(), 9500);
  CHECK_LT(sized.bit_count(), 9700);
  CHECK_EQ(sized.hash_count(), 7);
  CHECK_EQ(sized.families(), 1);
  CHECK_EQ(sized.inserted(), 0);
  CHECK_GE(sized.memory_bytes() * 8, sized.bit_count());

  // Nothing is in an empty filter.
  for (auto i = 0; i < 100; ++i)
    CHECK(!sized.contains(member(i)));

  // Room for each family.
  Bloom_filter two(1000, 0.01, 2);
  CHECK_GT(two.bit_count(), 2 * 9500);

  CHECK_EQ(Bloom_filter::optimal_bits(1000, 0.01, 1),
           static_cast<double>(sized.bit_count()));
  CHECK_GT(Bloom_filter::optimal_bits(200'000, 1e-300, 255),
           static_cast<double>(Bloom_filter::max_bits));

  // More probes, fewer false positives.
  auto last_rate = 1.0;
  for (uint32_t families = 1; families <= 3; ++families) {
    Bloom_filter bf(n_members, 0.05, families);
    for (auto i = 0; i < n_members; ++i)
      bf.add(member(i));
    CHECK_EQ(bf.inserted(), n_members);

    for (auto i = 0; i < n_members; ++i) {
      CHECK(bf.contains(member(i))) << member(i);
      for (uint32_t f = 0; f < families; ++f)
        CHECK(bf.test(member(i), f));
    }

    auto const rate = false_positive_rate(bf);
    LOG(INFO) << families << " families: false positive rate " << rate;
    CHECK_LT(rate, 0.1);
    CHECK_LT(rate, last_rate);
    last_rate = rate;
  }
  CHECK_LT(last_rate, 0.01);

  // Round trip.
  Bloom_filter bf(n_members, 0.01, 2);
  for (auto i = 0; i < n_members; ++i)
    bf.add(member(i));

  std::stringstream blob;
  bf.write(blob);

  std::string msg;
  auto const  copy = Bloom_filter::read(blob, msg);
  CHECK(copy) << msg;
  CHECK_EQ(copy->bit_count(), bf.bit_count());
  CHECK_EQ(copy->hash_count(), bf.hash_count());
  CHECK_EQ(copy->families(), bf.families());
  CHECK_EQ(copy->inserted(), bf.inserted());
  for (auto i = 0; i < n_members; ++i)
    CHECK(copy->contains(member(i)));
  for (auto i = 0; i < 1000; ++i)
    CHECK_EQ(copy->contains(stranger(i)), bf.contains(stranger(i)));

  // Bad blobs.
  std::stringstream empty;
  CHECK(!Bloom_filter::read(empty, msg));

  std::stringstream wrong_magic("XXXX\x01\x00\x00\x00");
  CHECK(!Bloom_filter::read(wrong_magic, msg));

  std::stringstream full;
  bf.write(full);
  auto const        bytes = full.str();
  std::stringstream truncated(bytes.substr(0, bytes.size() - 3));
  CHECK(!Bloom_filter::read(truncated, msg));
  CHECK(!msg.empty());

  auto              bad_version = bytes;
  bad_version[4]                = 9;
  std::stringstream wrong_version(bad_version);
  CHECK(!Bloom_filter::read(wrong_version, msg));

  // A header claiming the largest filter, with no bits behind it, is
  // rejected without allocating the whole array.
  auto const huge = header_only(Bloom_filter::max_bits);
  CHECK_EQ(huge.size(), 32);
  std::stringstream huge_blob(huge);
  CHECK(!Bloom_filter::read(huge_blob, msg));
  CHECK(msg.starts_with("truncated bloom filter")) << msg;

  std::stringstream too_big(header_only(Bloom_filter::max_bits + 1));
  CHECK(!Bloom_filter::read(too_big, msg));
  CHECK(msg.starts_with("bad bloom filter parameters")) << msg;
}
