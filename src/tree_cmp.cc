#include "tree_cmp.hh"

#include <algorithm>
#include <functional>
#include <future>
#include <stdexcept>
#include <utility>

#include "file_cmp.hh"
#include "ls_dir_rec.hh"
#include "task_pool.hh"
#include "timer.hh"

namespace fscmp {

inline namespace detail_v1 {

path_partition_t partition(const scan_result_t &scan_a,
                           const scan_result_t &scan_b) {
  path_partition_t parts;
  // both maps are ordered by relative path, walk them side by side
  auto itr_a = scan_a.begin();
  auto itr_b = scan_b.begin();
  while (itr_a != scan_a.end() && itr_b != scan_b.end()) {
    if (itr_a->first < itr_b->first) {
      parts.only_a.push_back(itr_a->first);
      ++itr_a;
    } else if (itr_b->first < itr_a->first) {
      parts.only_b.push_back(itr_b->first);
      ++itr_b;
    } else {
      parts.both.push_back(itr_a->first);
      ++itr_a;
      ++itr_b;
    }
  }
  for (; itr_a != scan_a.end(); ++itr_a) {
    parts.only_a.push_back(itr_a->first);
  }
  for (; itr_b != scan_b.end(); ++itr_b) {
    parts.only_b.push_back(itr_b->first);
  }
  return parts;
}

tree_cmp_t::tree_cmp_t(config_t cfg, const cmp_mode_t mode)
    : _cfg(std::move(cfg)), _mode(mode), _exclude(_cfg), _checksum(_cfg) {
  if (_cfg.max_thread == 0) {
    throw std::invalid_argument("worker count must be >= 1");
  }
}

std::pair<scan_result_t, scan_result_t> tree_cmp_t::scan(
    const std::filesystem::path &root_a,
    const std::filesystem::path &root_b) const {
  std::packaged_task<scan_result_t()> task_a(
      [this, &root_a] { return ls_dir_rec(root_a, _exclude, _cfg.logger); });
  std::packaged_task<scan_result_t()> task_b(
      [this, &root_b] { return ls_dir_rec(root_b, _exclude, _cfg.logger); });
  auto future_a = task_a.get_future();
  auto future_b = task_b.get_future();
  {
    boost::asio::thread_pool pool(2);
    boost::asio::post(pool, std::move(task_a));
    boost::asio::post(pool, std::move(task_b));
    pool.join();
  }
  // rethrows scan_error_t
  auto scan_a = future_a.get();
  auto scan_b = future_b.get();
  return {std::move(scan_a), std::move(scan_b)};
}

cmp_outcome_t tree_cmp_t::compare_pair(const file_entry_t &file_a,
                                       const file_entry_t &file_b) const {
  cmp_outcome_t outcome{file_a.rel_path(), true, true};
  if (file_a.size() != file_b.size()) {
    outcome.size_same = tri_t::no;
    return outcome;
  }
  outcome.size_same = tri_t::yes;
  if (_mode == cmp_mode_t::byte) {
    outcome.content_same = to_tri(bytes_equal(file_a, file_b, _cfg.buf_sz));
  } else {
    const auto digest_a = _checksum.checksum(file_a);
    const auto digest_b = _checksum.checksum(file_b);
    outcome.content_same = to_tri(digest_a == digest_b);
  }
  return outcome;
}

cmp_report_t tree_cmp_t::compare(const scan_result_t &scan_a,
                                 const scan_result_t &scan_b,
                                 const bool include_all) const {
  const auto &logger = _cfg.logger;
  const auto parts = partition(scan_a, scan_b);
  const auto hashed_before = _checksum.hashed_count();

  cmp_report_t report;
  auto &stats = report.stats;
  stats.only_a = parts.only_a.size();
  stats.only_b = parts.only_b.size();
  stats.both = parts.both.size();

  // dispatch pairs present on both sides
  std::vector<std::function<cmp_outcome_t()>> tasks;
  tasks.reserve(parts.both.size());
  for (const auto &rel_path : parts.both) {
    const auto &file_a = scan_a.at(rel_path);
    const auto &file_b = scan_b.at(rel_path);
    tasks.emplace_back(
        [this, &file_a, &file_b] { return compare_pair(file_a, file_b); });
  }
  logger.log("comparing ", tasks.size(), " common files...");
  auto results = run_all(
      tasks, _cfg.max_thread,
      [&logger](const std::size_t done, const std::size_t total) {
        if (done % progress_interval == 0) {
          logger.log("compared ", done, '/', total, "...");
        }
      });

  // collect
  std::vector<cmp_outcome_t> outcomes;
  outcomes.reserve(parts.only_a.size() + parts.only_b.size() +
                   parts.both.size());
  for (const auto &rel_path : parts.only_a) {
    outcomes.push_back(cmp_outcome_t{rel_path, true, false});
  }
  for (const auto &rel_path : parts.only_b) {
    outcomes.push_back(cmp_outcome_t{rel_path, false, true});
  }
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (!results[i].ok()) {
      // sizes matched, content could not be read
      logger.warn(results[i].error());
      ++stats.read_errors;
      outcomes.push_back(
          cmp_outcome_t{parts.both[i], true, true, tri_t::yes, tri_t::unknown});
      continue;
    }
    auto &outcome = results[i].value();
    if (outcome.size_same == tri_t::no) {
      ++stats.size_differ;
    } else if (outcome.content_same == tri_t::yes) {
      ++stats.same;
    } else {
      ++stats.differ;
    }
    outcomes.push_back(std::move(outcome));
  }
  stats.hashed = _checksum.hashed_count() - hashed_before;

  if (!include_all) {
    std::erase_if(outcomes, [](const cmp_outcome_t &outcome) {
      return outcome.in_a && outcome.in_b &&
             outcome.content_same == tri_t::yes;
    });
  }
  std::sort(outcomes.begin(), outcomes.end(),
            [](const auto &lhs, const auto &rhs) {
              return lhs.rel_path < rhs.rel_path;
            });
  report.outcomes = std::move(outcomes);
  return report;
}

cmp_report_t tree_cmp_t::run(const std::filesystem::path &root_a,
                             const std::filesystem::path &root_b,
                             const bool include_all) const {
  const auto &logger = _cfg.logger;
  timer_t timer;
  logger.log("scanning folders...");
  const auto [scan_a, scan_b] = scan(root_a, root_b);
  logger.log("folder 1: ", scan_a.size(), " files");
  logger.log("folder 2: ", scan_b.size(), " files");
  logger.log("elapsed: ", timer.lap().count(), "ms");

  auto report = compare(scan_a, scan_b, include_all);
  logger.log("elapsed: ", timer.lap().count(), "ms");
  return report;
}

}  // namespace detail_v1

}  // namespace fscmp
