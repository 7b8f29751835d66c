#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>

namespace fscmp {

inline namespace detail_v1 {

class file_entry_t {
  std::string _rel_path;
  std::filesystem::path _path;
  std::filesystem::path _shown_path;
  uint64_t _size = 0;

 public:
  template <typename Sp, typename Tp>
  inline file_entry_t(Sp &&rel_path, Tp &&path, const uint64_t size)
      : _rel_path(std::forward<Sp>(rel_path)),
        _path(std::forward<Tp>(path)),
        _shown_path(_path),
        _size(size) {}
  template <typename Sp, typename Tp, typename Rp>
  inline file_entry_t(Sp &&rel_path, Tp &&path, Rp &&shown_path,
                      const uint64_t size)
      : _rel_path(std::forward<Sp>(rel_path)),
        _path(std::forward<Tp>(path)),
        _shown_path(std::forward<Rp>(shown_path)),
        _size(size) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  // relative to the scanned root, '/' separated
  inline const std::string &rel_path() const noexcept { return _rel_path; }
  // absolute path used for I/O
  inline const std::filesystem::path &path() const noexcept { return _path; }
  // root as the user gave it, joined with rel_path, for reports
  inline const std::filesystem::path &shown_path() const noexcept {
    return _shown_path;
  }
  // size at scan time
  inline uint64_t size() const noexcept { return _size; }
};

// one scanned root, keyed and ordered by relative path
using scan_result_t = std::map<std::string, file_entry_t>;

}  // namespace detail_v1

}  // namespace fscmp
