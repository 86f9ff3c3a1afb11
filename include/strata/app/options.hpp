#pragma once

#include "strata/core/result.hpp"
#include "strata/journal/journal_writer.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata::app {

enum class Mode {
    Watch,
    Restore,
    Help
};

// One year; keeps the watch loop's sleep deadline within steady_clock range
inline constexpr std::int64_t kMaxRefreshSeconds = 365LL * 24 * 60 * 60;

/**
 * @brief Validated settings for one run of the executable
 */
struct Options {
    Mode mode = Mode::Help;
    std::filesystem::path watch_root;
    std::filesystem::path backup_root;
    std::filesystem::path restore_root;
    std::int64_t refresh_seconds = 60;
    std::optional<std::int64_t> until;
    std::size_t segment_limit = journal::JournalWriter::kDefaultSegmentLimit;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

/**
 * @brief Raw, unvalidated values from the command line or a config file
 *
 * Every field is optional so the two sources can be layered.
 */
struct RawSettings {
    std::optional<std::string> watch;
    std::optional<std::string> backup;
    std::optional<std::string> restore;
    std::optional<std::int64_t> refresh;
    std::optional<std::int64_t> until;
    std::optional<std::int64_t> segment_limit;
    std::optional<std::string> log_level;
    std::optional<std::string> config;
    bool help = false;
};

Result<RawSettings> parse_arguments(const std::vector<std::string>& args);

/**
 * @brief Read a JSON config file with the same keys as the long flags
 */
Result<RawSettings> load_config_file(const std::filesystem::path& path);

Result<RawSettings> parse_config_text(const std::string& text);

/**
 * @brief Overlay: values present in `overrides` replace those in `base`
 */
RawSettings merge_settings(RawSettings base, const RawSettings& overrides);

Result<Options> validate(const RawSettings& settings);

/**
 * @brief Full pipeline: argv, optional --config file, then validation
 */
Result<Options> parse_options(int argc, char* argv[]);

std::string usage(const std::string& program);

} // namespace strata::app
