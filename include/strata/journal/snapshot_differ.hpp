#pragma once

#include "strata/core/result.hpp"
#include "strata/journal/types.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace strata::journal {

/**
 * @brief Changes discovered by one differencing pass
 */
struct ChangeSet {
    std::vector<ChangeRecord> changes; ///< Sorted by path; each path at most once
    std::size_t added = 0;
    std::size_t modified = 0;
    std::size_t deleted = 0;

    [[nodiscard]] bool empty() const noexcept { return changes.empty(); }
};

/**
 * @brief Walks a directory tree and diffs content fingerprints against a Snapshot
 *
 * Directories produce no records. Every other entry is fingerprinted, with
 * symlinks to files followed; a path that is new or whose fingerprint changed
 * yields a full ChangeRecord, and a path that vanished yields a tombstone.
 * A symlink to a directory fails the pass with an Io error.
 *
 * The snapshot is committed only after the whole walk succeeds. On error it
 * is left exactly as it was and no changes are returned.
 */
class SnapshotDiffer {
public:
    Result<ChangeSet> diff(const std::filesystem::path& root, Snapshot& snapshot) const;

private:
    static Result<ChangeRecord> capture(const std::filesystem::path& absolute_path,
                                        std::string relative_path);
};

} // namespace strata::journal
