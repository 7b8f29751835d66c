#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "log.hh"

namespace fscmp {

inline namespace detail_v1 {

// 1MiB
constexpr auto default_buf_sz = 1024UL * 1024UL;

constexpr auto default_max_thread = 8U;

// log progress every N finished tasks
constexpr auto progress_interval = 500UL;

constexpr auto default_hash_algo = "BLAKE2b512";

/**
 * @brief engine configuration, copied into each engine at construction and
 * never modified afterwards.
 */
struct config_t {
  // exact file names to skip (macOS metadata)
  std::vector<std::string> excluded_names{".DS_Store"};
  // file name prefixes to skip (AppleDouble resource forks)
  std::vector<std::string> excluded_prefixes{"._"};
  // ECMAScript regex matched against root-relative paths
  std::vector<std::string> exclude_regex;
  uint64_t buf_sz = default_buf_sz;
  uint32_t max_thread = default_max_thread;
  // digest name known to libcrypto
  std::string hash_algo = default_hash_algo;
  logger_t logger;
};

}  // namespace detail_v1

}  // namespace fscmp
