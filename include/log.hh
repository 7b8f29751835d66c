#pragma once

#include <iostream>
#include <ostream>

#include "oss.hh"

namespace fscmp {

inline namespace detail_v1 {

/**
 * @brief line oriented console log, safe to call from pool threads.
 *
 * Every line carries a level tag: "[log]" for progress, "[warn]" for
 * skipped entries and per-file failures, "[err]" for fatal errors. Quiet
 * mode drops "[log]" lines only.
 */
class logger_t {
  std::ostream *_os;
  bool _verbose;

  template <typename... Args>
  void write(const char *tag, const Args &...args) const {
    oss _oss(*_os);
    ((_oss << tag) << ... << args) << '\n';
  }

 public:
  logger_t() noexcept : _os(&std::cerr), _verbose(true) {}
  explicit logger_t(std::ostream &os, bool verbose = true) noexcept
      : _os(&os), _verbose(verbose) {}

  bool verbose() const noexcept { return _verbose; }

  template <typename... Args>
  void log(const Args &...args) const {
    if (_verbose) {
      write("[log] ", args...);
    }
  }
  template <typename... Args>
  void warn(const Args &...args) const {
    write("[warn] ", args...);
  }
  template <typename... Args>
  void err(const Args &...args) const {
    write("[err] ", args...);
  }
};

}  // namespace detail_v1

}  // namespace fscmp
