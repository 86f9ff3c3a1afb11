#pragma once

/**
 * @file segment_codec.hpp
 * @brief Self-describing binary encoding of one journal segment
 *
 * FORMAT (MessagePack map):
 * {
 *   "format":    "strata-segment",
 *   "version":   1,
 *   "timestamp": <epoch seconds>,
 *   "sequence":  <uint>,
 *   "records": [
 *     { "path": str, "mode": uint, "mtime_ns": int, "size": uint,
 *       "content": bin, "deleted": bool },
 *     ...
 *   ]
 * }
 *
 * Content travels as a MessagePack bin field, so bytes, permission bits and
 * nanosecond timestamps round-trip exactly.
 */

#include "strata/core/result.hpp"
#include "strata/journal/types.hpp"

#include <cstdint>
#include <vector>

namespace strata::journal {

constexpr const char* kSegmentFormat = "strata-segment";
constexpr std::uint32_t kSegmentVersion = 1;

struct SegmentPayload {
    std::int64_t timestamp = 0;
    std::uint32_t sequence = 0;
    std::vector<ChangeRecord> records;
};

class SegmentCodec {
public:
    static std::vector<std::uint8_t> encode(std::int64_t timestamp,
                                            std::uint32_t sequence,
                                            const std::vector<const ChangeRecord*>& records);

    static std::vector<std::uint8_t> encode(const SegmentPayload& payload);

    /**
     * @brief Parse a segment; any structural problem is a Decode error
     */
    static Result<SegmentPayload> decode(const std::vector<std::uint8_t>& bytes);
};

} // namespace strata::journal
