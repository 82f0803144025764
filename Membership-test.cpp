#include "Membership.hpp"

#include <sstream>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
std::vector<std::string> numbered(std::string_view pfx, int count)
{
  std::vector<std::string> doms;
  for (auto i = 0; i < count; ++i)
    doms.push_back(fmt::format("{}{}.com", pfx, i));
  return doms;
}

int false_positives(Membership_index const& idx)
{
  auto fp = 0;
  for (auto const& dom : numbered("clean", 20000)) {
    if (idx.is_disposable(dom))
      ++fp;
  }
  return fp;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Membership_index idx;
  CHECK_EQ(idx.mode(), Membership_mode::exact);
  CHECK_EQ(idx.size(), 0);
  CHECK(!idx.is_disposable("mailinator.com"));

  idx.register_domains({"mailinator.com", "10minutemail.com"});
  CHECK(idx.is_disposable("mailinator.com"));
  CHECK(idx.is_disposable("10minutemail.com"));
  CHECK(!idx.is_disposable("gmail.com"));
  CHECK_EQ(idx.size(), 2);

  // Stays registered.
  idx.register_domains(numbered("more", 100));
  idx.register_domains({"mailinator.com"});
  CHECK(idx.is_disposable("mailinator.com"));
  CHECK_EQ(idx.size(), 102);
  CHECK_GT(idx.memory_bytes(), 0);
  CHECK_EQ(idx.bit_count(), 0);

  std::stringstream blob;
  auto              err = idx.save(blob);
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::filter_not_initialized);

  err = idx.trust({"mailinator.com"});
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::filter_not_initialized);
  CHECK(idx.is_disposable("mailinator.com"));

  // Nothing to build from.
  err = idx.upgrade({}, Bloom_options{});
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::list_load_failure);
  CHECK_EQ(idx.mode(), Membership_mode::exact);
  CHECK(idx.is_disposable("mailinator.com"));

  Bloom_options opts;
  opts.trusted_domains = {"trusted.com"};
  err = idx.upgrade({"guerrillamail.com", "trusted.com", "yopmail.com"}, opts);
  CHECK(!err) << *err;
  CHECK_EQ(idx.mode(), Membership_mode::bloom);
  CHECK_EQ(idx.verification_attempts(), 1);
  CHECK_GT(idx.bit_count(), 0);
  CHECK_EQ(idx.size(), 105);

  // Source and earlier registrations both made it in.
  CHECK(idx.is_disposable("guerrillamail.com"));
  CHECK(idx.is_disposable("yopmail.com"));
  CHECK(idx.is_disposable("mailinator.com"));
  CHECK(idx.is_disposable("more42.com"));

  // Trusted always wins.
  CHECK(!idx.is_disposable("trusted.com"));
  CHECK(!idx.trust({"yopmail.com"}));
  CHECK(!idx.is_disposable("yopmail.com"));

  idx.register_domains({"fresh-after-upgrade.com"});
  CHECK(idx.is_disposable("fresh-after-upgrade.com"));
  CHECK_EQ(idx.size(), 106);

  // Save, load into a new index.
  CHECK(!idx.save(blob));

  Membership_index copy;
  err = copy.load(blob);
  CHECK(!err) << *err;
  CHECK_EQ(copy.mode(), Membership_mode::bloom);
  CHECK_EQ(copy.size(), idx.size());
  CHECK_EQ(copy.bit_count(), idx.bit_count());
  for (auto const dom : {"guerrillamail.com", "mailinator.com", "more42.com",
                         "fresh-after-upgrade.com"}) {
    CHECK(copy.is_disposable(dom)) << dom;
  }
  // The trusted set is not part of the filter.
  CHECK(copy.is_disposable("trusted.com"));
  for (auto const& dom : numbered("clean", 500))
    CHECK_EQ(copy.is_disposable(dom), idx.is_disposable(dom));

  // Loading into a bloom index keeps its trusted set.
  std::stringstream blob2;
  CHECK(!idx.save(blob2));
  CHECK(!idx.load(blob2));
  CHECK(!idx.is_disposable("trusted.com"));

  // A bad blob changes nothing.
  Membership_index  untouched;
  std::stringstream junk("not a filter at all");
  err = untouched.load(junk);
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::filter_deserialize_failure);
  CHECK_EQ(untouched.mode(), Membership_mode::exact);

  std::stringstream junk2("garbage");
  CHECK(copy.load(junk2));
  CHECK(copy.is_disposable("mailinator.com"));

  // More verification attempts, fewer false positives.
  auto const disposable = numbered("disposable", 1000);

  Membership_index one;
  Bloom_options    loose;
  loose.fp_rate = 0.05;
  CHECK(!one.upgrade(disposable, loose));

  Membership_index three;
  loose.verification_attempts = 3;
  CHECK(!three.upgrade(disposable, loose));
  CHECK_EQ(three.verification_attempts(), 3);

  for (auto const& dom : disposable) {
    CHECK(one.is_disposable(dom));
    CHECK(three.is_disposable(dom));
  }

  auto const fp_one   = false_positives(one);
  auto const fp_three = false_positives(three);
  LOG(INFO) << "false positives: " << fp_one << " with one attempt, "
            << fp_three << " with three";
  CHECK_LT(fp_one, 2000);
  CHECK_LT(fp_three, fp_one);
  CHECK_LT(fp_three, 20);

  // Out of range options fall back to the defaults.
  Membership_index odd;
  Bloom_options    silly;
  silly.fp_rate               = 2.0;
  silly.verification_attempts = 0;
  CHECK(!odd.upgrade({"a.com"}, silly));
  CHECK_EQ(odd.verification_attempts(), 1);
  CHECK(odd.is_disposable("a.com"));

  // A filter too big to build is an error, not a crash, and changes nothing.
  Bloom_options greedy;
  greedy.fp_rate               = 1e-300;
  greedy.verification_attempts = 255;
  auto const many              = numbered("bulk", 30'000);

  Membership_index small;
  small.register_domains({"kept.com"});
  err = small.upgrade(many, greedy);
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::list_load_failure);
  CHECK(err->detail.starts_with("filter too large")) << err->detail;
  CHECK_EQ(small.mode(), Membership_mode::exact);
  CHECK_EQ(small.size(), 1);
  CHECK(small.is_disposable("kept.com"));

  err = odd.upgrade(many, greedy);
  CHECK(err);
  CHECK_EQ(odd.verification_attempts(), 1);
  CHECK(odd.is_disposable("a.com"));

  // A header promising the largest filter, and nothing after it.
  std::string hdr{"MCBF"};
  auto const  put = [&hdr](uint64_t v, int octets) {
    for (auto i = 0; i < octets; ++i, v >>= 8)
      hdr += static_cast<char>(v & 0xFF);
  };
  put(1, 4); // version
  put(Bloom_filter::max_bits, 8);
  put(1, 4); // hashes
  put(1, 4); // families
  put(0, 8); // inserted
  std::stringstream hollow(hdr);
  err = odd.load(hollow);
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::filter_deserialize_failure);
  CHECK(odd.is_disposable("a.com"));

  // Saving to a broken stream.
  std::stringstream broken;
  broken.setstate(std::ios::badbit);
  err = odd.save(broken);
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::filter_not_initialized);
  CHECK_EQ(err->detail, "output stream failed, filter not saved");
}
