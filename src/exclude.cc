#include "exclude.hh"

namespace fscmp {

inline namespace detail_v1 {

exclude_t::exclude_t(const config_t &cfg)
    : _names(cfg.excluded_names.begin(), cfg.excluded_names.end()),
      _prefixes(cfg.excluded_prefixes) {
  _regex.reserve(cfg.exclude_regex.size());
  for (const auto &pattern : cfg.exclude_regex) {
    _regex.emplace_back(pattern, std::regex::ECMAScript);
  }
}

bool exclude_t::is_excluded(std::string_view name) const {
  if (_names.find(std::string(name)) != _names.end()) {
    return true;
  }
  for (const auto &prefix : _prefixes) {
    if (name.starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

bool exclude_t::is_excluded_rel(const std::string &rel_path) const {
  for (const auto &regex : _regex) {
    if (std::regex_match(rel_path, regex)) {
      return true;
    }
  }
  return false;
}

}  // namespace detail_v1

}  // namespace fscmp
