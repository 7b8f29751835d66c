#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "exclude.hh"
#include "file_entry.hh"
#include "log.hh"

namespace fscmp {

inline namespace detail_v1 {

/**
 * @brief checks that root names an existing directory, filesystem errors
 * are reported, not thrown
 *
 * @return reason root cannot be scanned, nullopt if it can
 */
std::optional<std::string> scan_root_error(const std::filesystem::path &root);

/**
 * @brief list directory recursively, symlinks and special files are
 * skipped, unreadable subdirectories and files are skipped with a warning.
 * Sizes come from stat, content is never read.
 *
 * @param root directory to scan, made absolute before listing
 * @param exclude file name and relative path filter
 * @param logger sink for skip warnings
 * @return regular files keyed by root-relative path
 * @throws scan_error_t if root is missing, not a directory or unlistable
 */
scan_result_t ls_dir_rec(const std::filesystem::path &root,
                         const exclude_t &exclude, const logger_t &logger);

}  // namespace detail_v1

}  // namespace fscmp
