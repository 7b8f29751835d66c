#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace fscmp {

inline namespace detail_v1 {

// outcome of one task: either a value or the message of what it threw
template <typename Tp>
class task_result_t {
  std::optional<Tp> _value;
  std::string _error;

 public:
  task_result_t() = default;

  void set_value(Tp &&value) { _value.emplace(std::move(value)); }
  void set_error(std::string error) { _error = std::move(error); }

  bool ok() const noexcept { return _value.has_value(); }
  const Tp &value() const { return _value.value(); }
  Tp &value() { return _value.value(); }
  const std::string &error() const noexcept { return _error; }
};

// called from pool threads with the number of tasks finished so far
using progress_fn = std::function<void(std::size_t done, std::size_t total)>;

/**
 * @brief run independent tasks on a bounded thread pool and block until all
 * of them finished.
 *
 * Completion order is unspecified, but result i always belongs to task i:
 * each task writes only its own slot. A task that throws does not affect
 * the others; its exception message is kept in its slot.
 *
 * @param tasks tasks to run, each invoked exactly once
 * @param max_thread pool size, must be >= 1
 * @param progress optional completion callback
 * @throws std::invalid_argument if max_thread is 0
 */
template <typename Tp>
std::vector<task_result_t<Tp>> run_all(
    const std::vector<std::function<Tp()>> &tasks, const uint32_t max_thread,
    const progress_fn &progress = {}) {
  if (max_thread == 0) {
    throw std::invalid_argument("worker count must be >= 1");
  }
  std::vector<task_result_t<Tp>> results(tasks.size());
  if (tasks.empty()) {
    return results;
  }

  std::atomic<std::size_t> done_cnt(0);
  const auto total = tasks.size();
  {
    boost::asio::thread_pool pool(max_thread);
    for (std::size_t i = 0; i < total; ++i) {
      boost::asio::post(pool, [&tasks, &results, &done_cnt, &progress, total,
                               i] {
        try {
          results[i].set_value(tasks[i]());
        } catch (const std::exception &e) {
          results[i].set_error(e.what());
        }
        const auto done = ++done_cnt;
        if (progress) {
          progress(done, total);
        }
      });
    }
    pool.join();
  }
  return results;
}

}  // namespace detail_v1

}  // namespace fscmp
