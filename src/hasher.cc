#include "hasher.hh"

#include <fstream>
#include <stdexcept>
#include <vector>

#include "error.hh"

namespace fscmp {

inline namespace detail_v1 {

const EVP_MD *find_digest(const std::string &hash_algo) {
  const EVP_MD *md = EVP_get_digestbyname(hash_algo.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("unknown hash algorithm: " + hash_algo);
  }
  return md;
}

hasher_t::hasher_t(const EVP_MD *md) : _ctx(EVP_MD_CTX_new()), _md(md) {
  if (_ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  reset();
}

hasher_t::~hasher_t() noexcept {
  if (_ctx != nullptr) {
    EVP_MD_CTX_free(_ctx);
  }
}

void hasher_t::reset() {
  if (EVP_DigestInit_ex(_ctx, _md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void hasher_t::update(const char *data, const uint64_t size) {
  if (EVP_DigestUpdate(_ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

digest_t hasher_t::digest() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(_ctx, md, &md_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  constexpr char hex[] = "0123456789abcdef";
  digest_t result;
  result.reserve(md_len * 2U);
  for (auto i = 0U; i < md_len; ++i) {
    result += hex[md[i] >> 4U];
    result += hex[md[i] & 0x0fU];
  }
  return result;
}

checksum_t::checksum_t(const config_t &cfg)
    : _md(find_digest(cfg.hash_algo)), _buf_sz(cfg.buf_sz) {
  if (_buf_sz == 0) {
    throw std::invalid_argument("read buffer size must be > 0");
  }
}

digest_t checksum_t::hash_file(const std::filesystem::path &path,
                               uint64_t &read_total) const {
  ++_hashed_cnt;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw read_error_t(path, "open failed");
  }
  std::vector<char> buf(_buf_sz);
  hasher_t hasher(_md);
  read_total = 0;
  while (true) {
    ifs.read(buf.data(), (std::streamsize)buf.size());
    if (ifs.bad()) {
      throw read_error_t(path, "read failed");
    }
    const auto read_len = (uint64_t)ifs.gcount();
    if (read_len > 0) {
      hasher.update(buf.data(), read_len);
      read_total += read_len;
    }
    // short read, end of file
    if (ifs.eof()) {
      break;
    }
  }
  return hasher.digest();
}

digest_t checksum_t::checksum(const std::filesystem::path &path) const {
  uint64_t read_total = 0;
  return hash_file(path, read_total);
}

digest_t checksum_t::checksum(const file_entry_t &file) const {
  uint64_t read_total = 0;
  auto digest = hash_file(file.path(), read_total);
  if (read_total != file.size()) {
    throw read_error_t(file.path(), "size changed since scan");
  }
  return digest;
}

}  // namespace detail_v1

}  // namespace fscmp
