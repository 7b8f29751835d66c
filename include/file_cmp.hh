#pragma once

#include <cstdint>
#include <filesystem>

#include "config.hh"
#include "file_entry.hh"

namespace fscmp {

inline namespace detail_v1 {

/**
 * @brief byte-for-byte content comparison.
 *
 * Sizes are compared first from stat and a mismatch returns false without
 * opening either file. Otherwise both files are read in lockstep with
 * buffers of buf_sz bytes, stopping at the first chunk pair that differs.
 *
 * @param lhs first file
 * @param rhs second file
 * @param buf_sz chunk size used for each of the two read buffers
 * @return true if both files have identical content
 * @throws read_error_t if a file cannot be stat'ed, opened or read, or the
 * two streams end at different offsets despite equal sizes
 */
bool bytes_equal(const std::filesystem::path &lhs,
                 const std::filesystem::path &rhs,
                 const uint64_t buf_sz = default_buf_sz);

/**
 * @brief as above for two scanned files; the current size of each file must
 * still match the size recorded at scan time
 *
 * @throws read_error_t also if a file size changed since the scan
 */
bool bytes_equal(const file_entry_t &lhs, const file_entry_t &rhs,
                 const uint64_t buf_sz = default_buf_sz);

}  // namespace detail_v1

}  // namespace fscmp
