#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "config.hh"
#include "exclude.hh"
#include "file_entry.hh"
#include "hasher.hh"

namespace fscmp {

inline namespace detail_v1 {

// files sharing size and digest, at least two, sorted by path
struct dupe_group_t {
  digest_t digest;
  uint64_t size = 0;
  std::vector<file_entry_t> files;
};

struct dupe_stats_t {
  uint64_t scanned = 0;
  uint64_t below_min = 0;
  uint64_t unique_size = 0;
  uint64_t hashed = 0;
  uint64_t read_errors = 0;
  uint64_t groups = 0;
  uint64_t dupe_files = 0;
  // bytes held by every copy but one
  uint64_t wasted = 0;
};

struct dupe_report_t {
  std::vector<dupe_group_t> groups;
  dupe_stats_t stats;
};

/**
 * @brief duplicate detection pipeline for a single tree
 */
class dedupe_t {
  const config_t _cfg;
  const exclude_t _exclude;
  const checksum_t _checksum;

 public:
  /**
   * @throws std::invalid_argument on bad configuration (unknown digest)
   * @throws std::regex_error on a malformed exclude pattern
   */
  explicit dedupe_t(config_t cfg);

  /**
   * @brief detects duplicate files using file size and digest, a file whose
   * size is shared by no other file is never read.
   *
   * @param scan scanned tree
   * @param min_sz files smaller than this are ignored
   * @return duplicate groups, largest size first
   */
  dupe_report_t find(const scan_result_t &scan, const uint64_t min_sz = 0) const;

  /**
   * @brief scan root then find duplicates
   *
   * @throws scan_error_t if root cannot be scanned
   */
  dupe_report_t run(const std::filesystem::path &root,
                    const uint64_t min_sz = 0) const;

  // files handed to the checksum engine over the lifetime of this object
  uint64_t hashed_count() const noexcept { return _checksum.hashed_count(); }
};

}  // namespace detail_v1

}  // namespace fscmp
