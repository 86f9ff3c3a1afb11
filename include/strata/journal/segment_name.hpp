#pragma once

#include "strata/journal/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace strata::journal {

constexpr const char* kSegmentPrefix = "chunk_";
constexpr const char* kSegmentExtension = ".dat";

/// Minimum zero-padded width of the timestamp field (epoch seconds until 2286).
constexpr int kTimestampWidth = 10;
constexpr int kSequenceWidth = 3;

/**
 * @brief Build `chunk_<timestamp>_<seq>.dat` with fixed-width, zero-padded fields
 */
std::string make_segment_name(std::int64_t timestamp, std::uint32_t sequence);

/**
 * @brief True if the file name matches the `chunk_*.dat` pattern
 */
bool is_segment_candidate(const std::filesystem::path& path);

/**
 * @brief Parse timestamp and sequence out of a segment file name
 *
 * Accepts any digit width so legacy unpadded names are still ordered
 * numerically. Returns nullopt when the name does not follow the format.
 */
std::optional<SegmentInfo> parse_segment_name(const std::filesystem::path& path);

} // namespace strata::journal
