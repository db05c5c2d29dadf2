#include "utils/parallel.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <vector>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace shardpack {
namespace utils {

void run_indexed(std::size_t count, std::size_t max_parallel, const IndexedTask& task) {
  if (count == 0) {
    return;
  }

  // Sequential mode stops at the first failure
  if (max_parallel <= 1 || count == 1) {
    BOOST_LOG_TRIVIAL(trace) << "Parallel: Running " << count << " tasks sequentially";
    for (std::size_t i = 0; i < count; ++i) {
      task(i);
    }
    return;
  }

  const std::size_t threads = std::min(max_parallel, count);
  BOOST_LOG_TRIVIAL(trace) << "Parallel: Running " << count << " tasks on " << threads << " threads";

  std::vector<std::exception_ptr> errors(count);
  // Lowest index that has failed so far, count while none has
  std::atomic<std::size_t> first_failure{count};

  boost::asio::thread_pool pool(threads);
  for (std::size_t i = 0; i < count; ++i) {
    boost::asio::post(pool, [i, &task, &errors, &first_failure]() {
      // Tasks below a failure still run so the lowest failing index is found
      if (i > first_failure.load()) {
        return;
      }
      try {
        task(i);
      } catch (...) {
        // Captured and rethrown on the calling thread once the pool drains
        errors[i] = std::current_exception();
        std::size_t current = first_failure.load();
        while (i < current && !first_failure.compare_exchange_weak(current, i)) {
        }
      }
    });
  }
  pool.join();

  for (std::size_t i = 0; i < count; ++i) {
    if (errors[i]) {
      BOOST_LOG_TRIVIAL(debug) << "Parallel: Task " << i << " failed, rethrowing";
      std::rethrow_exception(errors[i]);
    }
  }
}

} // namespace utils
} // namespace shardpack
