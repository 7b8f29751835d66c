#include "report.hh"

#include <fstream>
#include <stdexcept>

#include "parse_size.hh"

namespace fscmp {

inline namespace detail_v1 {

namespace {

constexpr auto eol = "\r\n";

std::ofstream open_csv(const std::filesystem::path &path) {
  std::ofstream ofs(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!ofs.is_open()) {
    throw std::runtime_error("cannot open output file: " + path.string());
  }
  return ofs;
}

void close_csv(std::ofstream &ofs, const std::filesystem::path &path) {
  ofs.close();
  if (ofs.fail()) {
    throw std::runtime_error("cannot write output file: " + path.string());
  }
}

}  // namespace

std::string_view to_csv(const tri_t value) noexcept {
  switch (value) {
    case tri_t::yes:
      return "True";
    case tri_t::no:
      return "False";
    case tri_t::unknown:
      break;
  }
  return "";
}

std::string_view to_csv(const bool value) noexcept {
  return value ? "True" : "False";
}

std::string csv_field(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }
  std::string quoted;
  quoted.reserve(field.size() + 2U);
  quoted += '"';
  for (const auto c : field) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void write_cmp_csv(std::ostream &os,
                   const std::vector<cmp_outcome_t> &outcomes) {
  os << "file_name,exist_in_folder_1,exist_in_folder_2,size_same,content_same"
     << eol;
  for (const auto &outcome : outcomes) {
    os << csv_field(outcome.rel_path) << ',' << to_csv(outcome.in_a) << ','
       << to_csv(outcome.in_b) << ',' << to_csv(outcome.size_same) << ','
       << to_csv(outcome.content_same) << eol;
  }
}

void write_dupe_csv(std::ostream &os, const std::vector<dupe_group_t> &groups) {
  os << "checksum,size,count,paths" << eol;
  for (const auto &group : groups) {
    std::string paths;
    for (const auto &file : group.files) {
      if (!paths.empty()) {
        paths += '|';
      }
      paths += file.shown_path().string();
    }
    os << group.digest << ',' << group.size << ',' << group.files.size() << ','
       << csv_field(paths) << eol;
  }
}

void write_cmp_summary(std::ostream &os, const cmp_stats_t &stats) {
  os << "\nSummary:\n"
     << "  Only in folder 1: " << stats.only_a << '\n'
     << "  Only in folder 2: " << stats.only_b << '\n'
     << "  In both folders: " << stats.both << '\n'
     << "    - Same content: " << stats.same << '\n'
     << "    - Different content: " << stats.differ << '\n'
     << "    - Different size: " << stats.size_differ << '\n'
     << "    - Unreadable: " << stats.read_errors << '\n';
}

void write_dupe_summary(std::ostream &os, const dupe_stats_t &stats) {
  const auto considered = stats.scanned - stats.below_min;
  if (considered == stats.unique_size) {
    os << "\nNo potential duplicates found.\n";
    return;
  }
  os << "\nSummary:\n"
     << "  Total files scanned: " << considered << '\n'
     << "  Duplicate groups:    " << stats.groups << '\n'
     << "  Files in duplicates: " << stats.dupe_files << '\n'
     << "  Wasted space:        " << utils::format_size(stats.wasted) << '\n'
     << "  Unreadable files:    " << stats.read_errors << '\n';
}

void write_cmp_csv(const std::filesystem::path &path,
                   const std::vector<cmp_outcome_t> &outcomes) {
  auto ofs = open_csv(path);
  write_cmp_csv(ofs, outcomes);
  close_csv(ofs, path);
}

void write_dupe_csv(const std::filesystem::path &path,
                    const std::vector<dupe_group_t> &groups) {
  auto ofs = open_csv(path);
  write_dupe_csv(ofs, groups);
  close_csv(ofs, path);
}

}  // namespace detail_v1

}  // namespace fscmp
