#include "parse_size.hh"

#include <array>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace utils {

namespace {

bool is_num(const char c) { return c >= '0' && c <= '9'; }

char to_upper(const char c) { return (c >= 'a' && c <= 'z') ? c - 32 : c; }

[[noreturn]] void invalid(std::string_view size_str) {
  throw std::invalid_argument("invalid size string: " + std::string(size_str));
}

}  // namespace

uint64_t parse_size(std::string_view size_str) {
  constexpr std::array<char, 6> unit_dict({'K', 'M', 'G', 'T', 'P', 'E'});
  constexpr auto max_val = std::numeric_limits<uint64_t>::max();

  std::size_t i = 0;
  uint64_t size_num = 0;
  for (; i < size_str.size() && is_num(size_str[i]); ++i) {
    const auto digit = (uint64_t)(size_str[i] - '0');
    if (size_num > (max_val - digit) / 10) {
      invalid(size_str);
    }
    size_num = size_num * 10 + digit;
  }
  if (i == 0) {
    invalid(size_str);
  }

  // unit
  std::size_t scale = 0;
  if (i < size_str.size()) {
    for (std::size_t j = 0; j < unit_dict.size(); ++j) {
      if (to_upper(size_str[i]) == unit_dict[j]) {
        scale = j + 1;
        ++i;
        break;
      }
    }
  }
  bool as_bibyte = false;
  if (scale > 0 && i < size_str.size() && size_str[i] == 'i') {
    as_bibyte = true;
    ++i;
  }
  bool as_bit = false;
  if (i < size_str.size()) {
    if (size_str[i] == 'b') {
      as_bit = true;
    } else if (size_str[i] != 'B') {
      invalid(size_str);
    }
    ++i;
  }
  if (i != size_str.size()) {
    invalid(size_str);
  }

  const uint64_t base = as_bibyte ? 1024 : 1000;
  for (std::size_t s = 0; s < scale; ++s) {
    if (size_num > max_val / base) {
      invalid(size_str);
    }
    size_num *= base;
  }
  return as_bit ? size_num / 8 : size_num;
}

std::string format_size(uint64_t size) {
  constexpr std::array<const char *, 5> units({"KB", "MB", "GB", "TB", "PB"});
  if (size < 1024) {
    return std::to_string(size) + " B";
  }
  auto value = (double)size / 1024.0;
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < units.size()) {
    value /= 1024.0;
    ++unit;
  }
  std::array<char, 32> buf{};
  std::snprintf(buf.data(), buf.size(), "%.1f %s", value, units[unit]);
  return std::string(buf.data());
}

}  // namespace utils
