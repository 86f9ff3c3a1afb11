#pragma once

#include "strata/core/result.hpp"
#include "strata/journal/types.hpp"

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace strata::journal {

struct DecodedSegment {
    SegmentInfo info;
    std::vector<ChangeRecord> records;
};

struct CorruptSegment {
    SegmentInfo info;
    std::string reason;
};

/// Outcome of reading one segment; corrupt segments are reported, not fatal.
using SegmentReadResult = std::variant<DecodedSegment, CorruptSegment>;

struct JournalListing {
    std::vector<SegmentInfo> segments;      ///< Chronological: (timestamp, sequence)
    std::vector<CorruptSegment> malformed;  ///< chunk_*.dat files whose name does not parse
};

/**
 * @brief Locates and decodes the segments of a journal
 */
class JournalReader {
public:
    explicit JournalReader(std::filesystem::path backup_root);

    /**
     * @brief List segments in chronological order
     *
     * Fails with NotFound when the location holds no chunk_*.dat file at all.
     */
    Result<JournalListing> list_segments() const;

    /**
     * @brief Read and decode one segment
     */
    SegmentReadResult read_segment(const SegmentInfo& info) const;

private:
    std::filesystem::path backup_root_;
};

} // namespace strata::journal
