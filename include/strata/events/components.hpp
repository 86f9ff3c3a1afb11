/**
 * @file components.hpp
 * @brief Ready-made subscribers for backup and restore events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Drivers emit, components react
 */

#pragma once

#include "strata/events/event_bus.hpp"
#include "strata/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace strata::events {

/**
 * @brief Logs every backup and restore event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChangesDetectedEvent>([this](const ChangesDetectedEvent& e) {
            on_changes_detected(e);
        });

        bus_.subscribe<SegmentWrittenEvent>([this](const SegmentWrittenEvent& e) {
            on_segment_written(e);
        });

        bus_.subscribe<BackupFailedEvent>([this](const BackupFailedEvent& e) {
            on_backup_failed(e);
        });

        bus_.subscribe<SegmentSkippedEvent>([this](const SegmentSkippedEvent& e) {
            on_segment_skipped(e);
        });

        bus_.subscribe<RestoreCompletedEvent>([this](const RestoreCompletedEvent& e) {
            on_restore_completed(e);
        });
    }

private:
    void on_changes_detected(const ChangesDetectedEvent& e) {
        if (e.total() == 0) {
            spdlog::debug("[Scan] root={} no changes ({}ms)", e.watch_root.string(), e.scan_duration.count());
            return;
        }
        spdlog::info("[Scan] root={} added={} modified={} deleted={} ({}ms)",
                     e.watch_root.string(), e.added, e.modified, e.deleted, e.scan_duration.count());
    }

    void on_segment_written(const SegmentWrittenEvent& e) {
        spdlog::info("[SegmentWritten] file={} records={} bytes={}",
                     e.path.filename().string(), e.record_count, e.bytes);
    }

    void on_backup_failed(const BackupFailedEvent& e) {
        spdlog::error("[BackupFailed] stage={} error={}", e.stage, e.message);
    }

    void on_segment_skipped(const SegmentSkippedEvent& e) {
        spdlog::warn("[SegmentSkipped] file={} reason={}", e.path.filename().string(), e.reason);
    }

    void on_restore_completed(const RestoreCompletedEvent& e) {
        spdlog::info("[RestoreCompleted] target={} files={} tombstones={} segments={} skipped={} duration={}ms",
                     e.target_root.string(), e.files_restored, e.tombstones,
                     e.segments_applied, e.segments_skipped, e.duration.count());
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - accumulates counters across a session
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> cycles{0};
        std::atomic<std::uint64_t> files_added{0};
        std::atomic<std::uint64_t> files_modified{0};
        std::atomic<std::uint64_t> files_deleted{0};
        std::atomic<std::uint64_t> segments_written{0};
        std::atomic<std::uint64_t> bytes_written{0};
        std::atomic<std::uint64_t> backup_failures{0};
        std::atomic<std::uint64_t> segments_skipped{0};
        std::atomic<std::uint64_t> files_restored{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChangesDetectedEvent>([this](const ChangesDetectedEvent& e) {
            stats_.cycles++;
            stats_.files_added += e.added;
            stats_.files_modified += e.modified;
            stats_.files_deleted += e.deleted;
        });

        bus_.subscribe<SegmentWrittenEvent>([this](const SegmentWrittenEvent& e) {
            stats_.segments_written++;
            stats_.bytes_written += e.bytes;
        });

        bus_.subscribe<BackupFailedEvent>([this](const BackupFailedEvent&) {
            stats_.backup_failures++;
        });

        bus_.subscribe<SegmentSkippedEvent>([this](const SegmentSkippedEvent&) {
            stats_.segments_skipped++;
        });

        bus_.subscribe<RestoreCompletedEvent>([this](const RestoreCompletedEvent& e) {
            stats_.files_restored += e.files_restored;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Scan cycles:      {}", stats_.cycles.load());
        spdlog::info("  Files added:      {}", stats_.files_added.load());
        spdlog::info("  Files modified:   {}", stats_.files_modified.load());
        spdlog::info("  Files deleted:    {}", stats_.files_deleted.load());
        spdlog::info("  Segments written: {}", stats_.segments_written.load());
        spdlog::info("  Bytes written:    {}", stats_.bytes_written.load());
        spdlog::info("  Backup failures:  {}", stats_.backup_failures.load());
        spdlog::info("  Segments skipped: {}", stats_.segments_skipped.load());
        spdlog::info("  Files restored:   {}", stats_.files_restored.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace strata::events
