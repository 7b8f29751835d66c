#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "config.hh"
#include "exclude.hh"
#include "file_entry.hh"
#include "hasher.hh"

namespace fscmp {

inline namespace detail_v1 {

// result of a check that may not have been performed
enum class tri_t : uint8_t {
  unknown,  // not checked, or check failed
  yes,
  no
};

constexpr tri_t to_tri(const bool value) noexcept {
  return value ? tri_t::yes : tri_t::no;
}

enum class cmp_mode_t {
  checksum,  // digest both files, compare digests
  byte       // read both files in lockstep
};

struct cmp_outcome_t {
  std::string rel_path;
  bool in_a = false;
  bool in_b = false;
  tri_t size_same = tri_t::unknown;
  tri_t content_same = tri_t::unknown;

  bool operator==(const cmp_outcome_t &rhs) const = default;
};

// disjoint split of the relative paths of two scans, each list sorted
struct path_partition_t {
  std::vector<std::string> only_a;
  std::vector<std::string> only_b;
  std::vector<std::string> both;
};

struct cmp_stats_t {
  uint64_t only_a = 0;
  uint64_t only_b = 0;
  uint64_t both = 0;
  uint64_t same = 0;
  uint64_t differ = 0;
  uint64_t size_differ = 0;
  uint64_t read_errors = 0;
  // files handed to the checksum engine, always 0 in byte mode
  uint64_t hashed = 0;
};

struct cmp_report_t {
  std::vector<cmp_outcome_t> outcomes;
  cmp_stats_t stats;
};

path_partition_t partition(const scan_result_t &scan_a,
                           const scan_result_t &scan_b);

/**
 * @brief two-tree comparison pipeline
 */
class tree_cmp_t {
  const config_t _cfg;
  const cmp_mode_t _mode;
  const exclude_t _exclude;
  const checksum_t _checksum;

 public:
  /**
   * @throws std::invalid_argument on bad configuration (unknown digest)
   * @throws std::regex_error on a malformed exclude pattern
   */
  tree_cmp_t(config_t cfg, const cmp_mode_t mode);

  /**
   * @brief scan both roots concurrently, one pool thread each
   *
   * @throws scan_error_t if either root cannot be scanned
   */
  std::pair<scan_result_t, scan_result_t> scan(
      const std::filesystem::path &root_a,
      const std::filesystem::path &root_b) const;

  /**
   * @brief compare two files found under the same relative path; content is
   * only examined when the scanned sizes are equal
   *
   * @throws read_error_t if content had to be read and could not be
   */
  cmp_outcome_t compare_pair(const file_entry_t &file_a,
                             const file_entry_t &file_b) const;

  /**
   * @brief compare two scans, sorted by relative path
   *
   * @param include_all keep pairs with identical content
   */
  cmp_report_t compare(const scan_result_t &scan_a,
                       const scan_result_t &scan_b,
                       const bool include_all = false) const;

  // scan then compare
  cmp_report_t run(const std::filesystem::path &root_a,
                   const std::filesystem::path &root_b,
                   const bool include_all = false) const;

  cmp_mode_t mode() const noexcept { return _mode; }
};

}  // namespace detail_v1

}  // namespace fscmp
