#pragma once

#include "strata/core/result.hpp"
#include "strata/journal/journal_reader.hpp"
#include "strata/journal/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace strata::journal {

struct RestoreOptions {
    /// Replay only segments written at or before this epoch second.
    std::optional<std::int64_t> until;
};

struct RestoreSummary {
    std::size_t files_restored = 0;
    std::size_t tombstones = 0;
    std::size_t segments_applied = 0;
    std::size_t segments_after_cutoff = 0;
    std::size_t rejected_paths = 0;        ///< Absolute or escaping paths left unmaterialised
    std::vector<CorruptSegment> skipped;   ///< Segments that could not be read or decoded
};

/**
 * @brief Replays a journal and materialises its latest live state onto a directory
 *
 * Restore is additive: live paths are created or overwritten, tombstoned
 * paths and unrelated files already present at the target are left alone.
 * Corrupt segments are skipped and listed in the summary. Fatal errors are
 * NotFound (no segments at all) and Io (target cannot be prepared or a live
 * file cannot be written).
 */
class Restorer {
public:
    Result<RestoreSummary> restore(const std::filesystem::path& backup_root,
                                   const std::filesystem::path& target_root,
                                   const RestoreOptions& options = {}) const;

    /// True if the journal path stays inside the restore root.
    static bool is_safe_relative_path(const std::string& path);

private:
    static Result<void> materialize(const std::filesystem::path& target_root, const ChangeRecord& record);

    static Result<void> write_content(const std::filesystem::path& path, const std::vector<std::uint8_t>& content);
};

} // namespace strata::journal
