#include "strata/service/backup_service.hpp"
#include "strata/events/events.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <thread>
#include <utility>

namespace strata::service {
namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kStopPollInterval{200};

} // namespace

BackupService::BackupService(BackupSettings settings,
                             events::EventBus& bus,
                             journal::JournalWriter::Clock clock)
    : settings_(std::move(settings)),
      event_bus_(bus),
      writer_(settings_.backup_root, settings_.segment_limit, std::move(clock)) {}

Result<void> BackupService::prepare() const {
    std::error_code ec;
    if (!fs::is_directory(settings_.watch_root, ec)) {
        return Err<void>(Error(ErrorKind::Io, "Watch root is not a directory: " + settings_.watch_root.string()));
    }

    fs::create_directories(settings_.backup_root, ec);
    if (ec && !fs::is_directory(settings_.backup_root)) {
        return Err<void>(Error(ErrorKind::Io, "Failed to create backup directory " +
                                                  settings_.backup_root.string() + ": " + ec.message()));
    }
    return Ok();
}

Result<CycleReport> BackupService::run_once() {
    const auto started = std::chrono::steady_clock::now();
    const journal::Snapshot previous = snapshot_;

    auto diff = differ_.diff(settings_.watch_root, snapshot_);
    if (diff.is_error()) {
        event_bus_.emit(events::BackupFailedEvent{"scan", diff.error().message});
        return Err<CycleReport>(diff.error());
    }

    const auto& change_set = diff.value();
    events::ChangesDetectedEvent detected;
    detected.watch_root = settings_.watch_root;
    detected.added = change_set.added;
    detected.modified = change_set.modified;
    detected.deleted = change_set.deleted;
    detected.scan_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    event_bus_.emit(detected);

    CycleReport report;
    report.changes = change_set.changes.size();
    if (change_set.empty()) {
        return Ok(report);
    }

    auto written = writer_.write(change_set.changes);
    if (written.is_error()) {
        snapshot_ = previous;
        event_bus_.emit(events::BackupFailedEvent{"write", written.error().message});
        return Err<CycleReport>(written.error());
    }

    for (const auto& segment : written.value().segments) {
        events::SegmentWrittenEvent event;
        event.path = segment.info.path;
        event.timestamp = segment.info.timestamp;
        event.sequence = segment.info.sequence;
        event.record_count = segment.record_count;
        event.bytes = segment.bytes;
        event_bus_.emit(event);
    }
    report.segments_written = written.value().segments.size();
    return Ok(report);
}

void BackupService::run(const std::atomic<bool>& stop) {
    spdlog::info("Watching {}, backing up to {} every {} seconds",
                 settings_.watch_root.string(), settings_.backup_root.string(), settings_.interval.count());

    while (!stop.load()) {
        auto cycle = run_once();
        if (cycle.is_error()) {
            spdlog::debug("Cycle failed, retrying next interval: {}", to_string(cycle.error()));
        }
        sleep_interval(stop);
    }

    spdlog::info("Watch loop stopped");
}

void BackupService::sleep_interval(const std::atomic<bool>& stop) const {
    const auto deadline = std::chrono::steady_clock::now() + settings_.interval;
    while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kStopPollInterval);
    }
}

} // namespace strata::service
