/**
 * @file events.hpp
 * @brief Event types emitted by the backup and restore drivers
 *
 * NAMING CONVENTION:
 * Events are past-tense: SegmentWrittenEvent, RestoreCompletedEvent
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace strata::events {

// ════════════════════════════════════════════════════════
// Backup Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after every successful differencing pass, even an empty one
 *
 * WHO SUBSCRIBES:
 * - Logger (report what changed)
 * - Metrics (count cycles and files)
 */
struct ChangesDetectedEvent {
    std::filesystem::path watch_root;
    std::size_t added = 0;
    std::size_t modified = 0;
    std::size_t deleted = 0;
    std::chrono::milliseconds scan_duration{0};

    [[nodiscard]] std::size_t total() const noexcept { return added + modified + deleted; }
};

/**
 * @brief Emitted once per segment file published to the journal
 */
struct SegmentWrittenEvent {
    std::filesystem::path path;
    std::int64_t timestamp = 0;
    std::uint32_t sequence = 0;
    std::size_t record_count = 0;
    std::uint64_t bytes = 0;
};

/**
 * @brief Emitted when a watch cycle fails; the loop carries on
 */
struct BackupFailedEvent {
    std::string stage;    ///< "scan" or "write"
    std::string message;
};

// ════════════════════════════════════════════════════════
// Restore Events
// ════════════════════════════════════════════════════════

struct SegmentSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

struct RestoreCompletedEvent {
    std::filesystem::path target_root;
    std::size_t files_restored = 0;
    std::size_t tombstones = 0;
    std::size_t segments_applied = 0;
    std::size_t segments_skipped = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace strata::events
