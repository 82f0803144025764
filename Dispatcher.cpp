#include "Dispatcher.hpp"

#include <algorithm>
#include <mutex>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <glog/logging.h>

std::vector<Validation_result>
validate_many(Validator& validator, std::vector<std::string> const& emails)
{
  std::vector<Validation_result> results;
  if (emails.empty())
    return results;

  results.reserve(emails.size());

  auto const limit   = validator.options().max_concurrency;
  auto const threads = (limit == 0) ? emails.size()
                                    : std::min(limit, emails.size());

  VLOG(1) << "validating " << emails.size() << " addresses on " << threads
          << " threads";

  std::mutex              results_mtx;
  boost::asio::thread_pool pool(threads);

  for (auto const& email : emails) {
    boost::asio::post(pool, [&validator, &email, &results, &results_mtx] {
      auto res = validator.validate(email);

      std::lock_guard<std::mutex> lock(results_mtx);
      results.push_back(std::move(res));
    });
  }

  pool.join();

  CHECK_EQ(results.size(), emails.size());
  return results;
}
