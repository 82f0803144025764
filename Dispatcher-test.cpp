#include "Dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
// Slow enough that lookups overlap.
class Sleepy_resolver : public MX_resolver {
public:
  Resolution lookup(std::string const&        domain,
                    std::chrono::milliseconds timeout,
                    std::stop_token           stop) override
  {
    auto const now = ++active;
    auto       max = most.load();
    while ((now > max) && !most.compare_exchange_weak(max, now)) {
    }
    std::this_thread::sleep_for(20ms);
    --active;
    return Resolution{true, {}};
  }

  std::atomic<int> active{0};
  std::atomic<int> most{0};
};

Options offline()
{
  Options opts;
  opts.check_dns = false;
  return opts;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    Validator v(offline());
    CHECK(validate_many(v, {}).empty());

    auto const results = validate_many(v, {"ok@x.com", "bad@"});
    CHECK_EQ(results.size(), 2);

    std::map<std::string, Validation_result> by_original;
    for (auto const& r : results)
      by_original.emplace(r.original, r);
    CHECK_EQ(by_original.size(), 2);

    CHECK(by_original.at("ok@x.com").is_valid);
    CHECK(!by_original.at("bad@").is_valid);
    CHECK_EQ(by_original.at("bad@").error->kind, Error_kind::parse_failure);
  }

  {
    auto opts            = offline();
    opts.max_concurrency = 4;
    Validator v(opts);

    std::vector<std::string> emails;
    for (auto i = 0; i < 200; ++i) {
      emails.push_back(i % 10 ? fmt::format("user{}@example{}.com", i, i)
                              : fmt::format("broken{}@", i));
    }

    auto const results = validate_many(v, emails);
    CHECK_EQ(results.size(), emails.size());

    std::vector<std::string> seen;
    for (auto const& r : results) {
      seen.push_back(r.original);
      CHECK_EQ(r.is_valid, !r.original.starts_with("broken")) << r;
    }
    std::sort(begin(seen), end(seen));
    auto sorted = emails;
    std::sort(begin(sorted), end(sorted));
    CHECK(seen == sorted);
  }

  {
    // Bounded by max_concurrency.
    auto resolver        = std::make_shared<Sleepy_resolver>();
    auto opts            = offline();
    opts.check_dns       = true;
    opts.max_concurrency = 3;
    Validator v(opts, resolver);

    std::vector<std::string> emails;
    for (auto i = 0; i < 12; ++i)
      emails.push_back(fmt::format("user@host{}.com", i));

    auto const results = validate_many(v, emails);
    CHECK_EQ(results.size(), 12);
    for (auto const& r : results)
      CHECK(r.is_valid) << r;
    CHECK_LE(resolver->most.load(), 3);
    CHECK_GE(resolver->most.load(), 1);
  }
}
