#pragma once

#include "strata/journal/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata::journal {

/**
 * @brief Latest state per path, folded from the journal oldest to newest
 *
 * A tombstone discards any earlier live record for its path; a live record
 * overwrites whatever came before, including a tombstone. Last writer wins.
 *
 * Holds every live record (content included) in memory, so peak usage is
 * bounded by the total size of the live tree being restored.
 */
class RestoreState {
public:
    void apply(ChangeRecord record);

    void apply_all(std::vector<ChangeRecord> records);

    [[nodiscard]] bool is_live(const std::string& path) const;
    [[nodiscard]] bool is_tombstoned(const std::string& path) const;

    /// Live record for the path, or nullptr when tombstoned or never seen.
    [[nodiscard]] const ChangeRecord* find(const std::string& path) const;

    /// Live records ordered by path.
    [[nodiscard]] std::vector<const ChangeRecord*> live_records() const;

    [[nodiscard]] std::size_t live_count() const noexcept { return live_count_; }
    [[nodiscard]] std::size_t tombstone_count() const noexcept { return entries_.size() - live_count_; }

private:
    std::map<std::string, std::optional<ChangeRecord>> entries_; // nullopt == tombstoned
    std::size_t live_count_ = 0;
};

} // namespace strata::journal
