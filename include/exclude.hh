#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "config.hh"

namespace fscmp {

inline namespace detail_v1 {

class exclude_t {
  std::unordered_set<std::string> _names;
  std::vector<std::string> _prefixes;
  std::vector<std::regex> _regex;

 public:
  /**
   * @brief build the filter from configuration
   *
   * @throws std::regex_error if a pattern of cfg.exclude_regex is malformed
   */
  explicit exclude_t(const config_t &cfg);

  /**
   * @brief platform metadata check on a base file name, never a path
   */
  bool is_excluded(std::string_view name) const;

  /**
   * @brief user pattern check on a root-relative path ('/' separated),
   * applies to directories and files alike
   */
  bool is_excluded_rel(const std::string &rel_path) const;
};

}  // namespace detail_v1

}  // namespace fscmp
