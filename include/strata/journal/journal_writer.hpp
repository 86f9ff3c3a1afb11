#pragma once

#include "strata/core/result.hpp"
#include "strata/journal/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace strata::journal {

struct WrittenSegment {
    SegmentInfo info;
    std::size_t record_count = 0;
    std::uint64_t bytes = 0; ///< Encoded size on disk
};

struct WriteSummary {
    std::int64_t timestamp = 0;
    std::vector<WrittenSegment> segments;

    [[nodiscard]] std::uint64_t total_bytes() const noexcept {
        std::uint64_t total = 0;
        for (const auto& segment : segments) {
            total += segment.bytes;
        }
        return total;
    }
};

/**
 * @brief Packs ordered change records into bounded-size journal segments
 *
 * One write() call is one chunk: every segment it produces shares a single
 * timestamp and gets consecutive sequence numbers. Records are packed
 * greedily in input order; a new segment starts when adding the next record
 * would exceed the soft limit and the current segment is not empty. A record
 * larger than the limit still goes into a segment of its own.
 *
 * Already-written segments are never rolled back if a later one fails.
 */
class JournalWriter {
public:
    static constexpr std::size_t kDefaultSegmentLimit = 5 * 1024 * 1024;
    static constexpr std::size_t kEntryOverhead = 1024;

    /// Returns Unix epoch seconds for the invocation being written.
    using Clock = std::function<std::int64_t()>;

    explicit JournalWriter(std::filesystem::path backup_root,
                           std::size_t segment_limit = kDefaultSegmentLimit,
                           Clock clock = {});

    /**
     * @brief Write one chunk; an empty change list creates nothing
     */
    Result<WriteSummary> write(const std::vector<ChangeRecord>& changes) const;

    /**
     * @brief Group record indices into segments without touching the disk
     */
    static std::vector<std::vector<std::size_t>> plan_segments(const std::vector<ChangeRecord>& changes,
                                                               std::size_t segment_limit);

    static std::int64_t system_clock_seconds();

private:
    Result<std::uint32_t> next_sequence(std::int64_t timestamp) const;

    static Result<std::uint64_t> write_segment_file(const std::filesystem::path& final_path,
                                                    const std::vector<std::uint8_t>& bytes);

    std::filesystem::path backup_root_;
    std::size_t segment_limit_;
    Clock clock_;
};

} // namespace strata::journal
