#ifndef CACHE_DOT_HPP
#define CACHE_DOT_HPP

#include "MX.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

// MX lookup results, good for ttl, at most capacity of them.  Found and
// not found are both remembered.  When full, expired entries go first, then
// the one read least recently.
//
// The mutex belongs to the owner and guards the owner's other state too.
// It is never held across a lookup.

class Resolution_cache {
public:
  using clock      = std::chrono::steady_clock;
  using time_point = clock::time_point;
  using clock_fn   = std::function<time_point()>;

  Resolution_cache(std::shared_mutex&           mtx,
                   std::shared_ptr<MX_resolver> resolver,
                   std::chrono::milliseconds    timeout,
                   std::chrono::seconds         ttl,
                   std::size_t                  capacity,
                   clock_fn                     now = clock::now);

  Resolution resolve(std::string const& domain);

  std::size_t size() const;

private:
  struct entry {
    Resolution result;
    time_point cached;
    time_point last_read;
  };

  bool fresh_(entry const& e, time_point now) const;

  // Live lookup bounded by timeout_.
  Resolution lookup_(std::string const& domain) const;

  // Exclusive lock held.
  void store_(std::string const& domain, Resolution const& result);
  void evict_(time_point now);

  std::shared_mutex&           mtx_;
  std::shared_ptr<MX_resolver> resolver_;

  std::chrono::milliseconds const timeout_;
  std::chrono::seconds const      ttl_;
  std::size_t const               capacity_;
  clock_fn const                  now_;

  std::unordered_map<std::string, entry> entries_;
};

#endif // CACHE_DOT_HPP
