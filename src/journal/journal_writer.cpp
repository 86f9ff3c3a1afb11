#include "strata/journal/journal_writer.hpp"
#include "strata/journal/segment_codec.hpp"
#include "strata/journal/segment_name.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>
#include <utility>

namespace strata::journal {
namespace fs = std::filesystem;

namespace {

void discard_staging(const fs::path& staging_path) {
    std::error_code ec;
    fs::remove(staging_path, ec);
    if (ec) {
        spdlog::warn("Could not remove staging file {}: {}", staging_path.string(), ec.message());
    }
}

} // namespace

JournalWriter::JournalWriter(fs::path backup_root, std::size_t segment_limit, Clock clock)
    : backup_root_(std::move(backup_root)),
      segment_limit_(segment_limit),
      clock_(clock ? std::move(clock) : Clock(&JournalWriter::system_clock_seconds)) {}

std::int64_t JournalWriter::system_clock_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::vector<std::vector<std::size_t>> JournalWriter::plan_segments(const std::vector<ChangeRecord>& changes,
                                                                   std::size_t segment_limit) {
    std::vector<std::vector<std::size_t>> segments;
    std::vector<std::size_t> current;
    std::size_t current_size = 0;

    for (std::size_t i = 0; i < changes.size(); ++i) {
        const std::size_t entry_size = changes[i].content.size() + kEntryOverhead;
        if (current_size + entry_size > segment_limit && !current.empty()) {
            segments.push_back(std::move(current));
            current.clear();
            current_size = 0;
        }
        current.push_back(i);
        current_size += entry_size;
    }

    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

Result<WriteSummary> JournalWriter::write(const std::vector<ChangeRecord>& changes) const {
    WriteSummary summary;
    if (changes.empty()) {
        return Ok(summary);
    }

    std::error_code ec;
    fs::create_directories(backup_root_, ec);
    if (ec && !fs::is_directory(backup_root_)) {
        return Err<WriteSummary>(ErrorKind::Io,
                                 "Failed to create backup directory " + backup_root_.string() + ": " + ec.message());
    }

    summary.timestamp = clock_();
    auto first_sequence = next_sequence(summary.timestamp);
    if (first_sequence.is_error()) {
        return Err<WriteSummary>(first_sequence.error());
    }

    std::uint32_t sequence = first_sequence.value();
    for (const auto& indices : plan_segments(changes, segment_limit_)) {
        std::vector<const ChangeRecord*> records;
        records.reserve(indices.size());
        for (auto index : indices) {
            records.push_back(&changes[index]);
        }

        const auto bytes = SegmentCodec::encode(summary.timestamp, sequence, records);
        const fs::path path = backup_root_ / make_segment_name(summary.timestamp, sequence);

        auto written = write_segment_file(path, bytes);
        if (written.is_error()) {
            return Err<WriteSummary>(written.error());
        }

        WrittenSegment segment;
        segment.info.path = path;
        segment.info.timestamp = summary.timestamp;
        segment.info.sequence = sequence;
        segment.record_count = records.size();
        segment.bytes = written.value();
        summary.segments.push_back(std::move(segment));

        spdlog::debug("Wrote segment {} ({} records, {} bytes)", path.filename().string(),
                      records.size(), written.value());
        ++sequence;
    }

    return Ok(std::move(summary));
}

Result<std::uint32_t> JournalWriter::next_sequence(std::int64_t timestamp) const {
    std::error_code ec;
    fs::directory_iterator it(backup_root_, ec);
    if (ec) {
        return Err<std::uint32_t>(ErrorKind::Io,
                                  "Failed to list backup directory " + backup_root_.string() + ": " + ec.message());
    }

    // Another chunk in the same second must not overwrite this one's segments
    bool found = false;
    std::uint32_t highest = 0;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        auto info = parse_segment_name(it->path());
        if (info && info->timestamp == timestamp) {
            highest = found ? std::max(highest, info->sequence) : info->sequence;
            found = true;
        }
    }
    if (ec) {
        return Err<std::uint32_t>(ErrorKind::Io,
                                  "Failed to list backup directory " + backup_root_.string() + ": " + ec.message());
    }
    return Ok(found ? highest + 1 : 0u);
}

Result<std::uint64_t> JournalWriter::write_segment_file(const fs::path& final_path,
                                                        const std::vector<std::uint8_t>& bytes) {
    // Hidden staging name never matches chunk_*.dat
    const fs::path staging_path = final_path.parent_path() / ("." + final_path.filename().string() + ".tmp");

    {
        std::ofstream output(staging_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<std::uint64_t>(ErrorKind::Io, "Failed to create segment: " + staging_path.string());
        }
        output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        output.flush();
        if (!output) {
            output.close();
            discard_staging(staging_path);
            return Err<std::uint64_t>(ErrorKind::Io, "Failed to write segment: " + staging_path.string());
        }
    }

    std::error_code ec;
    fs::rename(staging_path, final_path, ec);
    if (ec) {
        discard_staging(staging_path);
        return Err<std::uint64_t>(ErrorKind::Io,
                                  "Failed to publish segment " + final_path.string() + ": " + ec.message());
    }
    return Ok(static_cast<std::uint64_t>(bytes.size()));
}

} // namespace strata::journal
