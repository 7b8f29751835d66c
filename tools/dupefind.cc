#include <charconv>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "config.hh"
#include "dedupe.hh"
#include "ls_dir_rec.hh"
#include "parse_size.hh"
#include "report.hh"
#include "timer.hh"

using namespace std::literals;

namespace {

void usage() {
  std::cerr << "usage: dupefind folder [-o/--output file] "
               "[-w/--workers jobs] [-m/--min-size size] "
               "[-e/--exclude regex] [--hash name] [-q/--quiet] [-h/--help]"
            << std::endl;
}

bool parse_workers(std::string_view arg, uint32_t& max_thread) {
  const auto* end = arg.data() + arg.size();
  auto [ptr, ec] = std::from_chars(arg.data(), end, max_thread);
  return ec == std::errc() && ptr == end && max_thread > 0 &&
         max_thread <= 256;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::filesystem::path folder;
  std::filesystem::path output = "duplicates.csv";
  fscmp::config_t cfg;
  uint64_t min_sz = 0;
  bool quiet = false;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-o"sv || arg == "--output"sv) {
      if (++i >= argc) {
        std::cerr << "missing output file" << std::endl;
        return 1;
      }
      output = argv[i];
    } else if (arg == "-w"sv || arg == "--workers"sv) {
      if (++i >= argc) {
        std::cerr << "missing worker count" << std::endl;
        return 1;
      }
      if (!parse_workers(argv[i], cfg.max_thread)) {
        std::cerr << "workers must be > 0 and <= 256" << std::endl;
        return 1;
      }
    } else if (arg == "-m"sv || arg == "--min-size"sv) {
      if (++i >= argc) {
        std::cerr << "missing minimum size" << std::endl;
        return 1;
      }
      try {
        min_sz = utils::parse_size(argv[i]);
      } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
      }
    } else if (arg == "-e"sv || arg == "--exclude"sv) {
      if (++i >= argc) {
        std::cerr << "missing exclude regex" << std::endl;
        return 1;
      }
      cfg.exclude_regex.emplace_back(argv[i]);
    } else if (arg == "--hash"sv) {
      if (++i >= argc) {
        std::cerr << "missing hash algorithm" << std::endl;
        return 1;
      }
      cfg.hash_algo = argv[i];
    } else if (arg == "-q"sv || arg == "--quiet"sv) {
      quiet = true;
    } else if (arg == "-h"sv || arg == "--help"sv) {
      usage();
      return 0;
    } else if (arg.starts_with('-')) {
      std::cerr << "unknown option: " << arg << std::endl;
      return 1;
    } else if (folder.empty()) {
      folder = arg;
    } else {
      usage();
      return 1;
    }
  }

  if (folder.empty()) {
    usage();
    return 1;
  }
  if (const auto reason = fscmp::scan_root_error(folder)) {
    std::cerr << "Error: " << folder << " - " << *reason << std::endl;
    return 1;
  }
  cfg.logger = fscmp::logger_t(std::cerr, !quiet);
  const auto logger = cfg.logger;

  try {
    const fscmp::dedupe_t dedupe(std::move(cfg));
    fscmp::timer_t timer;
    const auto report = dedupe.run(folder, min_sz);

    logger.log("writing results to: ", output);
    fscmp::write_dupe_csv(output, report.groups);

    fscmp::write_dupe_summary(std::cout, report.stats);
    logger.log("total elapsed: ", timer.total().count(), "ms");
  } catch (const std::regex_error& e) {
    logger.err("invalid exclude regex: ", e.what());
    return 1;
  } catch (const std::exception& e) {
    logger.err(e.what());
    return 1;
  }
  return 0;
}
