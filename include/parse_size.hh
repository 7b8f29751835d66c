#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace utils {

/**
 * @brief Parse a size string into a byte count.
 *
 * Accepts a plain number ("4096") or a number followed by a unit:
 * K, M, G, T, P, E (case insensitive), optionally followed by "i" for
 * 1024-based units and by "B" (bytes) or "b" (bits), e.g. "4KiB", "1MB",
 * "10Kb".
 *
 * @throws std::invalid_argument if not a valid size string or too large.
 */
uint64_t parse_size(std::string_view size_str);

/**
 * @brief Human-readable size, 1024-based: "512 B", "1.5 KB", "2.0 GB".
 */
std::string format_size(uint64_t size);

}  // namespace utils
