#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fscmp {

inline namespace detail_v1 {

// root of a scan is missing or cannot be listed, aborts the run
class scan_error_t : public std::runtime_error {
  std::filesystem::path _path;

 public:
  scan_error_t(const std::filesystem::path &path, const std::string &reason)
      : std::runtime_error("cannot scan " + path.string() + ": " + reason),
        _path(path) {}

  const std::filesystem::path &path() const noexcept { return _path; }
};

// one file could not be opened, read completely, or changed since it was
// scanned; only the task touching that file fails
class read_error_t : public std::runtime_error {
  std::filesystem::path _path;

 public:
  read_error_t(const std::filesystem::path &path, const std::string &reason)
      : std::runtime_error("cannot read " + path.string() + ": " + reason),
        _path(path) {}

  const std::filesystem::path &path() const noexcept { return _path; }
};

}  // namespace detail_v1

}  // namespace fscmp
