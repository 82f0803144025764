#include "Cache.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <thread>

#include <fmt/format.h>

#include <glog/logging.h>

Resolution_cache::Resolution_cache(std::shared_mutex&           mtx,
                                   std::shared_ptr<MX_resolver> resolver,
                                   std::chrono::milliseconds    timeout,
                                   std::chrono::seconds         ttl,
                                   std::size_t                  capacity,
                                   clock_fn                     now)
  : mtx_(mtx)
  , resolver_(std::move(resolver))
  , timeout_(timeout)
  , ttl_(ttl)
  , capacity_(capacity)
  , now_(std::move(now))
{
  CHECK(resolver_);
  CHECK(now_);
  CHECK_GT(capacity_, 0);
  CHECK_GT(timeout_.count(), 0);
}

bool Resolution_cache::fresh_(entry const& e, time_point now) const
{
  return (now - e.cached) < ttl_;
}

Resolution Resolution_cache::resolve(std::string const& domain)
{
  Resolution cached;
  auto       hit = false;
  {
    std::shared_lock lock(mtx_);
    auto const       it = entries_.find(domain);
    if ((it != end(entries_)) && fresh_(it->second, now_())) {
      cached = it->second.result;
      hit    = true;
    }
  }

  if (hit) {
    // Might have been evicted in between, that's fine.
    std::unique_lock lock(mtx_);
    if (auto const it = entries_.find(domain); it != end(entries_))
      it->second.last_read = now_();
    return cached;
  }

  auto const result = lookup_(domain);

  std::unique_lock lock(mtx_);
  store_(domain, result);
  return result;
}

std::size_t Resolution_cache::size() const
{
  std::shared_lock lock(mtx_);
  return entries_.size();
}

Resolution Resolution_cache::lookup_(std::string const& domain) const
{
  auto promise = std::make_shared<std::promise<Resolution>>();
  auto answer  = promise->get_future();

  std::jthread worker([promise, resolver = resolver_, domain,
                       timeout = timeout_](std::stop_token stop) {
    try {
      promise->set_value(resolver->lookup(domain, timeout, stop));
    }
    catch (...) {
      promise->set_exception(std::current_exception());
    }
  });
  auto stop = worker.get_stop_source();
  worker.detach();

  if (answer.wait_for(timeout_) == std::future_status::timeout) {
    stop.request_stop();
    LOG(WARNING) << "MX lookup for " << domain << " timed out after "
                 << timeout_.count() << "ms";
    return Resolution{
        false, Error{Error_kind::dns_timeout, domain,
                     fmt::format("no answer after {}ms", timeout_.count())}};
  }

  try {
    return answer.get();
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "MX lookup for " << domain << " failed: " << e.what();
    return Resolution{
        false, Error{Error_kind::dns_lookup_failure, domain, e.what()}};
  }
}

void Resolution_cache::store_(std::string const& domain,
                              Resolution const&  result)
{
  auto const now = now_();

  if (!entries_.contains(domain) && (entries_.size() >= capacity_))
    evict_(now);

  entries_.insert_or_assign(domain, entry{result, now, now});
}

void Resolution_cache::evict_(time_point now)
{
  std::erase_if(entries_, [this, now](auto const& kv) {
    return !fresh_(kv.second, now);
  });

  if (entries_.size() < capacity_)
    return;

  auto const lru = std::min_element(
      begin(entries_), end(entries_), [](auto const& a, auto const& b) {
        return a.second.last_read < b.second.last_read;
      });
  VLOG(1) << "evicting MX result for " << lru->first;
  entries_.erase(lru);
}
