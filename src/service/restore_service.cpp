#include "strata/service/restore_service.hpp"
#include "strata/events/events.hpp"

#include <chrono>

namespace strata::service {

RestoreService::RestoreService(events::EventBus& bus)
    : event_bus_(bus) {}

Result<journal::RestoreSummary> RestoreService::restore(const std::filesystem::path& backup_root,
                                                        const std::filesystem::path& target_root,
                                                        const journal::RestoreOptions& options) {
    const auto started = std::chrono::steady_clock::now();

    auto result = restorer_.restore(backup_root, target_root, options);
    if (result.is_error()) {
        return result;
    }

    const auto& summary = result.value();
    for (const auto& skipped : summary.skipped) {
        event_bus_.emit(events::SegmentSkippedEvent{skipped.info.path, skipped.reason});
    }

    events::RestoreCompletedEvent completed;
    completed.target_root = target_root;
    completed.files_restored = summary.files_restored;
    completed.tombstones = summary.tombstones;
    completed.segments_applied = summary.segments_applied;
    completed.segments_skipped = summary.skipped.size();
    completed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    event_bus_.emit(completed);

    return result;
}

} // namespace strata::service
