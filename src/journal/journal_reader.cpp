#include "strata/journal/journal_reader.hpp"
#include "strata/core/file_io.hpp"
#include "strata/journal/segment_codec.hpp"
#include "strata/journal/segment_name.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace strata::journal {
namespace fs = std::filesystem;

JournalReader::JournalReader(fs::path backup_root)
    : backup_root_(std::move(backup_root)) {}

Result<JournalListing> JournalReader::list_segments() const {
    std::error_code ec;
    if (!fs::is_directory(backup_root_, ec)) {
        return Err<JournalListing>(ErrorKind::NotFound, "No backup chunks found in " + backup_root_.string());
    }

    JournalListing listing;
    fs::directory_iterator it(backup_root_, ec);
    for (const fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !is_segment_candidate(it->path())) {
            continue;
        }

        if (auto info = parse_segment_name(it->path())) {
            listing.segments.push_back(std::move(*info));
        } else {
            CorruptSegment malformed;
            malformed.info.path = it->path();
            malformed.reason = "segment name does not encode timestamp and sequence";
            listing.malformed.push_back(std::move(malformed));
        }
    }

    if (ec) {
        return Err<JournalListing>(ErrorKind::Io,
                                   "Failed to list " + backup_root_.string() + ": " + ec.message());
    }

    if (listing.segments.empty() && listing.malformed.empty()) {
        return Err<JournalListing>(ErrorKind::NotFound, "No backup chunks found in " + backup_root_.string());
    }

    std::sort(listing.segments.begin(), listing.segments.end());
    return Ok(std::move(listing));
}

SegmentReadResult JournalReader::read_segment(const SegmentInfo& info) const {
    auto bytes = read_file_bytes(info.path);
    if (bytes.is_error()) {
        return CorruptSegment{info, bytes.error().message};
    }

    auto payload = SegmentCodec::decode(bytes.value());
    if (payload.is_error()) {
        return CorruptSegment{info, payload.error().message};
    }

    if (payload.value().timestamp != info.timestamp || payload.value().sequence != info.sequence) {
        spdlog::warn("Segment {} header says {}/{}; ordering by file name",
                     info.path.filename().string(), payload.value().timestamp, payload.value().sequence);
    }

    return DecodedSegment{info, std::move(payload.value().records)};
}

} // namespace strata::journal
