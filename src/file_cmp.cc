#include "file_cmp.hh"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "error.hh"

namespace fscmp {

inline namespace detail_v1 {

namespace {

uint64_t stat_size(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw read_error_t(path, ec.message());
  }
  return size;
}

uint64_t read_chunk(std::ifstream &ifs, std::vector<char> &buf,
                    const std::filesystem::path &path) {
  ifs.read(buf.data(), (std::streamsize)buf.size());
  if (ifs.bad()) {
    throw read_error_t(path, "read failed");
  }
  return (uint64_t)ifs.gcount();
}

// sizes are known equal
bool content_equal(const std::filesystem::path &lhs,
                   const std::filesystem::path &rhs, const uint64_t buf_sz) {
  if (buf_sz == 0) {
    throw std::invalid_argument("read buffer size must be > 0");
  }
  std::ifstream lhs_ifs(lhs, std::ios::binary);
  if (!lhs_ifs.is_open()) {
    throw read_error_t(lhs, "open failed");
  }
  std::ifstream rhs_ifs(rhs, std::ios::binary);
  if (!rhs_ifs.is_open()) {
    throw read_error_t(rhs, "open failed");
  }

  std::vector<char> lhs_buf(buf_sz);
  std::vector<char> rhs_buf(buf_sz);
  while (true) {
    const auto lhs_len = read_chunk(lhs_ifs, lhs_buf, lhs);
    const auto rhs_len = read_chunk(rhs_ifs, rhs_buf, rhs);
    if (lhs_len != rhs_len) {
      throw read_error_t(lhs_len < rhs_len ? lhs : rhs,
                         "file changed during comparison");
    }
    if (!std::equal(lhs_buf.begin(), lhs_buf.begin() + (int64_t)lhs_len,
                    rhs_buf.begin())) {
      return false;
    }
    if (lhs_ifs.eof() || rhs_ifs.eof()) {
      return lhs_ifs.eof() && rhs_ifs.eof();
    }
  }
}

}  // namespace

bool bytes_equal(const std::filesystem::path &lhs,
                 const std::filesystem::path &rhs, const uint64_t buf_sz) {
  if (stat_size(lhs) != stat_size(rhs)) {
    return false;
  }
  return content_equal(lhs, rhs, buf_sz);
}

bool bytes_equal(const file_entry_t &lhs, const file_entry_t &rhs,
                 const uint64_t buf_sz) {
  const auto lhs_sz = stat_size(lhs.path());
  const auto rhs_sz = stat_size(rhs.path());
  if (lhs_sz != lhs.size()) {
    throw read_error_t(lhs.path(), "size changed since scan");
  }
  if (rhs_sz != rhs.size()) {
    throw read_error_t(rhs.path(), "size changed since scan");
  }
  if (lhs_sz != rhs_sz) {
    return false;
  }
  return content_equal(lhs.path(), rhs.path(), buf_sz);
}

}  // namespace detail_v1

}  // namespace fscmp
