#pragma once

#include <chrono>

namespace fscmp {

inline namespace detail_v1 {

// phase timing for the "[log] elapsed" lines
class timer_t {
  std::chrono::steady_clock::time_point _start_time;
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept
      : _start_time(std::chrono::steady_clock::now()),
        _prev_time(_start_time) {}

  // time since the previous lap, or since construction
  std::chrono::milliseconds lap() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }

  std::chrono::milliseconds total() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - _start_time);
  }
};

}  // namespace detail_v1

}  // namespace fscmp
