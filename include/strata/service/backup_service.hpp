#pragma once

#include "strata/core/result.hpp"
#include "strata/events/event_bus.hpp"
#include "strata/journal/journal_writer.hpp"
#include "strata/journal/snapshot_differ.hpp"
#include "strata/journal/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>

namespace strata::service {

struct BackupSettings {
    std::filesystem::path watch_root;
    std::filesystem::path backup_root;
    std::chrono::seconds interval{60};
    std::size_t segment_limit = journal::JournalWriter::kDefaultSegmentLimit;
};

/**
 * @brief Outcome of one scan-and-write cycle
 */
struct CycleReport {
    std::size_t changes = 0;
    std::size_t segments_written = 0;
};

/**
 * @brief Watch loop: scan, diff, write, sleep, repeat
 *
 * Owns the in-memory Snapshot for the lifetime of the session. A cycle
 * whose write fails restores the snapshot taken before the scan, so the
 * same changes are detected and written again on the next cycle.
 */
class BackupService {
public:
    BackupService(BackupSettings settings,
                  events::EventBus& bus,
                  journal::JournalWriter::Clock clock = {});

    /**
     * @brief Check the watch root and create the backup root
     */
    Result<void> prepare() const;

    Result<CycleReport> run_once();

    /**
     * @brief Run cycles every interval until stop becomes true
     *
     * Errors are reported through BackupFailedEvent and the loop continues.
     */
    void run(const std::atomic<bool>& stop);

    [[nodiscard]] const journal::Snapshot& snapshot() const noexcept { return snapshot_; }
    [[nodiscard]] const BackupSettings& settings() const noexcept { return settings_; }

private:
    void sleep_interval(const std::atomic<bool>& stop) const;

    BackupSettings settings_;
    events::EventBus& event_bus_;
    journal::SnapshotDiffer differ_;
    journal::JournalWriter writer_;
    journal::Snapshot snapshot_;
};

} // namespace strata::service
