#pragma once

#include "strata/core/result.hpp"
#include "strata/events/event_bus.hpp"
#include "strata/journal/restorer.hpp"

#include <filesystem>

namespace strata::service {

/**
 * @brief One-shot restore driver; reports skipped segments and completion on the bus
 */
class RestoreService {
public:
    explicit RestoreService(events::EventBus& bus);

    Result<journal::RestoreSummary> restore(const std::filesystem::path& backup_root,
                                            const std::filesystem::path& target_root,
                                            const journal::RestoreOptions& options = {});

private:
    events::EventBus& event_bus_;
    journal::Restorer restorer_;
};

} // namespace strata::service
