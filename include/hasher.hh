#pragma once

#include <openssl/evp.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

#include "config.hh"
#include "file_entry.hh"

namespace fscmp {

inline namespace detail_v1 {

// lowercase hex of the raw digest
using digest_t = std::string;

/**
 * @brief look up a digest by name in libcrypto
 *
 * @throws std::invalid_argument if libcrypto has no such digest
 */
const EVP_MD *find_digest(const std::string &hash_algo);

// RAII wrapper for an EVP digest context.
class hasher_t {
  EVP_MD_CTX *_ctx;
  const EVP_MD *_md;

 public:
  explicit hasher_t(const EVP_MD *md);
  ~hasher_t() noexcept;

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void reset();
  void update(const char *data, const uint64_t size);
  digest_t digest();
};

/**
 * @brief whole-file digest with a fixed read buffer, safe to share between
 * pool threads
 */
class checksum_t {
  const EVP_MD *_md;
  uint64_t _buf_sz;
  mutable std::atomic<uint64_t> _hashed_cnt{0};

  digest_t hash_file(const std::filesystem::path &path,
                     uint64_t &read_total) const;

 public:
  /**
   * @throws std::invalid_argument on an unknown cfg.hash_algo or zero buf_sz
   */
  explicit checksum_t(const config_t &cfg);

  checksum_t(const checksum_t &) = delete;
  checksum_t &operator=(const checksum_t &) = delete;

  /**
   * @throws read_error_t if the file cannot be opened or read
   */
  digest_t checksum(const std::filesystem::path &path) const;

  /**
   * @brief as above, and the amount of data hashed must match the size
   * recorded at scan time
   *
   * @throws read_error_t also if the file size changed since the scan
   */
  digest_t checksum(const file_entry_t &file) const;

  // number of files handed to this engine so far
  uint64_t hashed_count() const noexcept { return _hashed_cnt.load(); }
};

}  // namespace detail_v1

}  // namespace fscmp
