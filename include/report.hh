#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "dedupe.hh"
#include "tree_cmp.hh"

namespace fscmp {

inline namespace detail_v1 {

// "True", "False", or empty for unknown
std::string_view to_csv(const tri_t value) noexcept;
std::string_view to_csv(const bool value) noexcept;

// quote a field containing ',', '"', CR or LF, doubling inner quotes
std::string csv_field(std::string_view field);

/**
 * @brief comparison report: file_name, exist_in_folder_1,
 * exist_in_folder_2, size_same, content_same
 */
void write_cmp_csv(std::ostream &os, const std::vector<cmp_outcome_t> &outcomes);

/**
 * @brief duplicate report: checksum, size, count, paths ('|' joined, each
 * the scanned root as given joined with the relative path)
 */
void write_dupe_csv(std::ostream &os, const std::vector<dupe_group_t> &groups);

/**
 * @brief console summary of a comparison run
 */
void write_cmp_summary(std::ostream &os, const cmp_stats_t &stats);

/**
 * @brief console summary of a duplicate search. Counts files at or above the
 * minimum size; when none of them shares a size only a "no potential
 * duplicates" line is written.
 */
void write_dupe_summary(std::ostream &os, const dupe_stats_t &stats);

/**
 * @brief write to a file, truncating it
 *
 * @throws std::runtime_error if the file cannot be opened or written
 */
void write_cmp_csv(const std::filesystem::path &path,
                   const std::vector<cmp_outcome_t> &outcomes);
void write_dupe_csv(const std::filesystem::path &path,
                    const std::vector<dupe_group_t> &groups);

}  // namespace detail_v1

}  // namespace fscmp
