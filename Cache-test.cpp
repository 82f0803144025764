#include "Cache.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
// Domains starting with "nx" don't exist, anything else has an MX.
class Counting_resolver : public MX_resolver {
public:
  Resolution lookup(std::string const&        domain,
                    std::chrono::milliseconds timeout,
                    std::stop_token           stop) override
  {
    ++calls;
    if (domain.starts_with("nx")) {
      return Resolution{false, Error{Error_kind::dns_lookup_failure, domain,
                                     "no such domain"}};
    }
    return Resolution{true, {}};
  }

  std::atomic<int> calls{0};
};

// Never answers until told to stop.
class Slow_resolver : public MX_resolver {
public:
  Resolution lookup(std::string const&        domain,
                    std::chrono::milliseconds timeout,
                    std::stop_token           stop) override
  {
    ++calls;
    for (auto i = 0; (i < 500) && !stop.stop_requested(); ++i)
      std::this_thread::sleep_for(10ms);
    if (stop.stop_requested())
      ++cancelled;
    return Resolution{true, {}};
  }

  std::atomic<int> calls{0};
  std::atomic<int> cancelled{0};
};

class Throwing_resolver : public MX_resolver {
public:
  Resolution lookup(std::string const&        domain,
                    std::chrono::milliseconds timeout,
                    std::stop_token           stop) override
  {
    throw std::runtime_error("resolver exploded");
  }
};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::shared_mutex mtx;

  auto       now  = Resolution_cache::time_point{} + 1h;
  auto const fake = [&now] { return now; };

  {
    auto             res = std::make_shared<Counting_resolver>();
    Resolution_cache cache(mtx, res, 1s, 60s, 100, fake);

    auto r = cache.resolve("example.com");
    CHECK(r.found);
    CHECK(!r.error);
    CHECK_EQ(res->calls.load(), 1);

    // Hit.
    r = cache.resolve("example.com");
    CHECK(r.found);
    CHECK_EQ(res->calls.load(), 1);

    // Not found is remembered too.
    r = cache.resolve("nx.example.com");
    CHECK(!r.found);
    CHECK(r.error);
    CHECK_EQ(r.error->kind, Error_kind::dns_lookup_failure);
    CHECK_EQ(r.error->context, "nx.example.com");
    r = cache.resolve("nx.example.com");
    CHECK(!r.found);
    CHECK_EQ(res->calls.load(), 2);
    CHECK_EQ(cache.size(), 2);

    // Still good one second short of the TTL.
    now += 59s;
    cache.resolve("example.com");
    CHECK_EQ(res->calls.load(), 2);

    // Never served once the TTL has passed.
    now += 1s;
    cache.resolve("example.com");
    CHECK_EQ(res->calls.load(), 3);
    cache.resolve("example.com");
    CHECK_EQ(res->calls.load(), 3);
    CHECK_EQ(cache.size(), 2);
  }

  {
    // Least recently read goes first.
    auto             res = std::make_shared<Counting_resolver>();
    Resolution_cache cache(mtx, res, 1s, 60s, 2, fake);

    cache.resolve("a.com");
    now += 1s;
    cache.resolve("b.com");
    now += 1s;
    cache.resolve("a.com"); // hit, a is now newer than b
    now += 1s;
    cache.resolve("c.com"); // b out
    CHECK_EQ(res->calls.load(), 3);
    CHECK_EQ(cache.size(), 2);

    now += 1s;
    cache.resolve("a.com");
    CHECK_EQ(res->calls.load(), 3);
    cache.resolve("b.com"); // c out
    CHECK_EQ(res->calls.load(), 4);
    cache.resolve("a.com");
    CHECK_EQ(res->calls.load(), 4);
    cache.resolve("c.com");
    CHECK_EQ(res->calls.load(), 5);
    CHECK_EQ(cache.size(), 2);
  }

  {
    // Expired entries go before the least recently read.
    auto             res = std::make_shared<Counting_resolver>();
    Resolution_cache cache(mtx, res, 1s, 10s, 2, fake);

    cache.resolve("a.com");
    now += 5s;
    cache.resolve("b.com");
    now += 1s;
    cache.resolve("a.com"); // hit, b is least recently read
    CHECK_EQ(res->calls.load(), 2);

    now += 6s;              // a expired, b not
    cache.resolve("c.com"); // a out, b stays
    CHECK_EQ(res->calls.load(), 3);
    cache.resolve("b.com");
    CHECK_EQ(res->calls.load(), 3);
    CHECK_EQ(cache.size(), 2);
  }

  {
    // Never more than capacity.
    auto             res = std::make_shared<Counting_resolver>();
    Resolution_cache cache(mtx, res, 1s, 3600s, 5, fake);
    for (auto i = 0; i < 50; ++i) {
      now += 1s;
      cache.resolve(fmt::format("host{}.com", i));
      CHECK_LE(cache.size(), 5);
    }
    CHECK_EQ(res->calls.load(), 50);
  }

  {
    // A lookup that doesn't answer in time is cancelled.
    auto             res = std::make_shared<Slow_resolver>();
    Resolution_cache cache(mtx, res, 50ms, 60s, 10, fake);

    auto const start = std::chrono::steady_clock::now();
    auto const r     = cache.resolve("slow.com");
    auto const took  = std::chrono::steady_clock::now() - start;
    CHECK(!r.found);
    CHECK(r.error);
    CHECK_EQ(r.error->kind, Error_kind::dns_timeout);
    CHECK_EQ(r.error->context, "slow.com");
    CHECK(took < 2s);

    for (auto i = 0; (i < 200) && (res->cancelled == 0); ++i)
      std::this_thread::sleep_for(10ms);
    CHECK_EQ(res->cancelled.load(), 1);

    // The timeout is remembered like any other failure.
    auto const again = cache.resolve("slow.com");
    CHECK(again.error);
    CHECK_EQ(again.error->kind, Error_kind::dns_timeout);
    CHECK_EQ(res->calls.load(), 1);
  }

  {
    auto             res = std::make_shared<Throwing_resolver>();
    Resolution_cache cache(mtx, res, 1s, 60s, 10, fake);
    auto const       r = cache.resolve("boom.com");
    CHECK(!r.found);
    CHECK(r.error);
    CHECK_EQ(r.error->kind, Error_kind::dns_lookup_failure);
    CHECK_EQ(r.error->detail, "resolver exploded");
  }

  {
    // Many readers and writers at once.
    auto             res = std::make_shared<Counting_resolver>();
    Resolution_cache cache(mtx, res, 1s, 3600s, 8,
                           std::chrono::steady_clock::now);

    std::vector<std::thread> threads;
    for (auto t = 0; t < 8; ++t) {
      threads.emplace_back([&cache, t] {
        for (auto i = 0; i < 200; ++i) {
          auto const dom = fmt::format("d{}.com", (i * 7 + t) % 20);
          auto const r   = cache.resolve(dom);
          CHECK(r.found);
          CHECK_LE(cache.size(), 8);
        }
      });
    }
    for (auto& thread : threads)
      thread.join();
    CHECK_LE(cache.size(), 8);
  }
}
