#include "ls_dir_rec.hh"

#include <string>
#include <system_error>

#include "error.hh"

namespace fscmp {

inline namespace detail_v1 {

namespace {

void ls_dir(std::filesystem::directory_iterator dir_itr,
            const std::filesystem::path &dir, const std::string &rel_dir,
            const std::filesystem::path &shown_root, const exclude_t &exclude, const logger_t &logger,
            scan_result_t &result) {
  try {
    for (const auto &dir_entry : dir_itr) {
      const auto name = dir_entry.path().filename().string();
      const auto rel_path = rel_dir.empty() ? name : rel_dir + '/' + name;

      if (exclude.is_excluded_rel(rel_path)) {
        // user pattern, skip
        logger.log("exclude: ", dir_entry.path());

      } else if (dir_entry.is_symlink()) {
        // symlink, never followed
        logger.warn("skip symlink: ", dir_entry.path());

      } else if (dir_entry.is_directory()) {
        // directory, descend
        std::error_code ec;
        std::filesystem::directory_iterator sub_itr(dir_entry.path(), ec);
        if (ec) {
          logger.warn("skip directory: ", dir_entry.path(), " - ",
                      ec.message());
          continue;
        }
        ls_dir(std::move(sub_itr), dir_entry.path(), rel_path, shown_root,
               exclude, logger, result);

      } else if (dir_entry.is_regular_file()) {
        if (exclude.is_excluded(name)) {
          // platform metadata, skip
          continue;
        }
        std::error_code ec;
        auto file_size = dir_entry.file_size(ec);
        if (ec) {
          logger.warn("skip file: ", dir_entry.path(), " - ", ec.message());
        } else {
          // "./a" and "a" both show as "a"
          auto shown_path = (shown_root / rel_path).lexically_normal();
          result.emplace(rel_path,
                         file_entry_t(rel_path, dir_entry.path(),
                                      std::move(shown_path), file_size));
        }

      } else {
        // device, socket, fifo
        logger.warn("skip unsupported file: ", dir_entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    // error iterating directory, keep what was listed so far
    logger.warn("skip rest of directory: ", dir, " - ", e.code().message());
  }
}

}  // namespace

std::optional<std::string> scan_root_error(const std::filesystem::path &root) {
  std::error_code ec;
  const auto abs_root = std::filesystem::absolute(root, ec).lexically_normal();
  if (ec) {
    return ec.message();
  }
  const auto status = std::filesystem::status(abs_root, ec);
  if (ec && status.type() != std::filesystem::file_type::not_found) {
    // ENAMETOOLONG, EACCES on a parent, ELOOP
    return ec.message();
  }
  if (!std::filesystem::exists(status)) {
    return "no such directory";
  }
  if (!std::filesystem::is_directory(status)) {
    return "not a directory";
  }
  return std::nullopt;
}

scan_result_t ls_dir_rec(const std::filesystem::path &root,
                         const exclude_t &exclude, const logger_t &logger) {
  if (auto reason = scan_root_error(root)) {
    throw scan_error_t(root, *reason);
  }
  std::error_code ec;
  const auto abs_root = std::filesystem::absolute(root, ec).lexically_normal();
  if (ec) {
    throw scan_error_t(root, ec.message());
  }
  std::filesystem::directory_iterator root_itr(abs_root, ec);
  if (ec) {
    throw scan_error_t(root, ec.message());
  }

  scan_result_t result;
  ls_dir(std::move(root_itr), abs_root, "", root, exclude, logger, result);
  return result;
}

}  // namespace detail_v1

}  // namespace fscmp
