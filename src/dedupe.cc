#include "dedupe.hh"

#include <algorithm>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <tuple>
#include <utility>

#include "ls_dir_rec.hh"
#include "task_pool.hh"
#include "timer.hh"

namespace fscmp {

inline namespace detail_v1 {

namespace {

struct hashed_file_t {
  digest_t digest;
  const file_entry_t *file;
};

}  // namespace

dedupe_t::dedupe_t(config_t cfg)
    : _cfg(std::move(cfg)), _exclude(_cfg), _checksum(_cfg) {
  if (_cfg.max_thread == 0) {
    throw std::invalid_argument("worker count must be >= 1");
  }
}

dupe_report_t dedupe_t::find(const scan_result_t &scan,
                             const uint64_t min_sz) const {
  const auto &logger = _cfg.logger;
  const auto hashed_before = _checksum.hashed_count();
  dupe_report_t report;
  auto &stats = report.stats;
  stats.scanned = scan.size();

  // filter by minimum size
  std::vector<const file_entry_t *> file_list;
  file_list.reserve(scan.size());
  for (const auto &[rel_path, file] : scan) {
    if (file.size() >= min_sz) {
      file_list.push_back(&file);
    }
  }
  stats.below_min = scan.size() - file_list.size();
  if (min_sz > 0) {
    logger.log(file_list.size(), " files >= ", min_sz, " bytes");
  }

  // sort files by size, path order kept within a size
  std::stable_sort(
      file_list.begin(), file_list.end(),
      [](const auto *lhs, const auto *rhs) { return lhs->size() < rhs->size(); });

  // finding union of same file size, only unions > 1 are hashed
  std::vector<const file_entry_t *> candidates;
  if (!file_list.empty()) {
    auto union_st = file_list.begin();
    auto union_ed = union_st + 1;
    while (true) {
      if (union_ed == file_list.end() ||
          (*union_ed)->size() != (*union_st)->size()) {
        if (std::distance(union_st, union_ed) > 1) {
          candidates.insert(candidates.end(), union_st, union_ed);
        }
        if (union_ed == file_list.end()) {
          break;
        }
        union_st = union_ed;
      }
      ++union_ed;
    }
  }
  stats.unique_size = file_list.size() - candidates.size();
  logger.log(stats.unique_size, " files unique by size (skipping checksum)");
  logger.log(candidates.size(), " files to checksum...");

  std::vector<std::function<digest_t()>> tasks;
  tasks.reserve(candidates.size());
  for (const auto *file : candidates) {
    tasks.emplace_back([this, file] { return _checksum.checksum(*file); });
  }
  auto results = run_all(
      tasks, _cfg.max_thread,
      [&logger](const std::size_t done, const std::size_t total) {
        if (done % progress_interval == 0) {
          logger.log("checksummed ", done, '/', total, "...");
        }
      });

  std::vector<hashed_file_t> hashed_list;
  hashed_list.reserve(results.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (!results[i].ok()) {
      logger.warn(results[i].error());
      ++stats.read_errors;
      continue;
    }
    hashed_list.push_back({std::move(results[i].value()), candidates[i]});
  }
  stats.hashed = _checksum.hashed_count() - hashed_before;
  if (stats.read_errors > 0) {
    logger.log(stats.read_errors, " files could not be read");
  }

  // sort by (size, digest, path) and take unions of equal size and digest
  std::sort(hashed_list.begin(), hashed_list.end(),
            [](const auto &lhs, const auto &rhs) {
              return std::forward_as_tuple(lhs.file->size(), lhs.digest,
                                           lhs.file->path()) <
                     std::forward_as_tuple(rhs.file->size(), rhs.digest,
                                           rhs.file->path());
            });
  if (!hashed_list.empty()) {
    auto union_st = hashed_list.begin();
    auto union_ed = union_st + 1;
    while (true) {
      if (union_ed == hashed_list.end() ||
          union_ed->file->size() != union_st->file->size() ||
          union_ed->digest != union_st->digest) {
        const auto union_sz = std::distance(union_st, union_ed);
        if (union_sz > 1) {
          auto &group = report.groups.emplace_back();
          group.digest = union_st->digest;
          group.size = union_st->file->size();
          group.files.reserve((uint64_t)union_sz);
          for (auto itr = union_st; itr != union_ed; ++itr) {
            group.files.push_back(*itr->file);
          }
          stats.dupe_files += (uint64_t)union_sz;
          stats.wasted += group.size * ((uint64_t)union_sz - 1U);
        }
        if (union_ed == hashed_list.end()) {
          break;
        }
        union_st = union_ed;
      }
      ++union_ed;
    }
  }
  stats.groups = report.groups.size();

  // largest first
  std::sort(report.groups.begin(), report.groups.end(),
            [](const auto &lhs, const auto &rhs) {
              if (lhs.size != rhs.size) {
                return lhs.size > rhs.size;
              }
              return lhs.digest < rhs.digest;
            });
  return report;
}

dupe_report_t dedupe_t::run(const std::filesystem::path &root,
                            const uint64_t min_sz) const {
  const auto &logger = _cfg.logger;
  timer_t timer;
  logger.log("scanning folder: ", root);
  const auto scan = ls_dir_rec(root, _exclude, logger);
  logger.log("found ", scan.size(), " files");
  logger.log("elapsed: ", timer.lap().count(), "ms");

  auto report = find(scan, min_sz);
  logger.log("elapsed: ", timer.lap().count(), "ms");
  logger.log("duplicate group count: ", report.groups.size());
  return report;
}

}  // namespace detail_v1

}  // namespace fscmp
