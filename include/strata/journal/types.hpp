#pragma once

/**
 * @file types.hpp
 * @brief Core journal types: change records, snapshots and segment identities
 *
 * A backup location holds a journal: an append-only collection of segment
 * files, each carrying an ordered list of ChangeRecords. Replaying every
 * segment oldest-to-newest reproduces the latest state of the watched tree.
 *
 * HOW IT INTEGRATES:
 * - SnapshotDiffer produces ChangeRecords from a directory walk
 * - JournalWriter packs ChangeRecords into segments
 * - JournalReader decodes segments back into ChangeRecords
 * - RestoreState folds ChangeRecords into the latest live/tombstoned view
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace strata::journal {

/**
 * @brief One file's state at one point in time
 *
 * A tombstone (deleted == true) carries only the path; every other field
 * is meaningless and content is always empty.
 */
struct ChangeRecord {
    std::string path;                  ///< Relative to the watched root, '/' separated
    std::uint32_t permissions = 0;     ///< POSIX permission bits
    std::int64_t modified_time_ns = 0; ///< Unix epoch nanoseconds
    std::uint64_t size = 0;            ///< Informational; content length governs restore
    std::vector<std::uint8_t> content;
    bool deleted = false;

    static ChangeRecord tombstone(std::string relative_path) {
        ChangeRecord record;
        record.path = std::move(relative_path);
        record.deleted = true;
        return record;
    }
};

/**
 * @brief Last-known fingerprint per relative path
 *
 * Owned by a single watch session and passed by reference into each
 * differencing pass, which mutates it in place.
 */
class Snapshot {
public:
    using Map = std::unordered_map<std::string, std::string>;

    [[nodiscard]] bool contains(const std::string& path) const { return entries_.count(path) > 0; }

    [[nodiscard]] const std::string* fingerprint(const std::string& path) const {
        auto it = entries_.find(path);
        return it == entries_.end() ? nullptr : &it->second;
    }

    void set(const std::string& path, std::string fingerprint) { entries_[path] = std::move(fingerprint); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const Map& entries() const noexcept { return entries_; }

    /// Replace the whole mapping at once; used to commit a completed pass.
    void replace(Map entries) { entries_ = std::move(entries); }

private:
    Map entries_;
};

/**
 * @brief Identity of one physical journal segment
 *
 * Ordering is (timestamp, sequence) compared numerically, with the file
 * name as a final tie-breaker so sorting is total.
 */
struct SegmentInfo {
    std::filesystem::path path;
    std::int64_t timestamp = 0;   ///< Unix epoch seconds of the writer invocation
    std::uint32_t sequence = 0;   ///< Position within that invocation

    bool operator<(const SegmentInfo& other) const {
        return std::make_tuple(timestamp, sequence, path.filename().string()) <
               std::make_tuple(other.timestamp, other.sequence, other.path.filename().string());
    }
};

} // namespace strata::journal
