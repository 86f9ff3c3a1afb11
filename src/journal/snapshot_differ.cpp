#include "strata/journal/snapshot_differ.hpp"
#include "strata/core/file_attributes.hpp"
#include "strata/core/file_io.hpp"
#include "strata/journal/fingerprint.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace strata::journal {
namespace fs = std::filesystem;

Result<ChangeSet> SnapshotDiffer::diff(const fs::path& root, Snapshot& snapshot) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Err<ChangeSet>(ErrorKind::Io, "Watch root is not a readable directory: " + root.string());
    }

    ChangeSet result;
    Snapshot::Map current;

    const fs::recursive_directory_iterator end;
    fs::recursive_directory_iterator it(root, ec);
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;

        std::error_code type_ec;
        const bool is_directory = entry.is_directory(type_ec);
        if (type_ec && type_ec != std::errc::no_such_file_or_directory) {
            return Err<ChangeSet>(ErrorKind::Io,
                                  "Failed to stat " + entry.path().string() + ": " + type_ec.message());
        }
        if (is_directory) {
            // The iterator does not descend through links, so the subtree would go unseen
            if (entry.is_symlink(type_ec)) {
                return Err<ChangeSet>(ErrorKind::Io,
                                      "Symlink to a directory cannot be backed up: " + entry.path().string());
            }
            continue;
        }

        std::string relative = entry.path().lexically_relative(root).generic_string();
        if (relative.empty() || relative == ".") {
            continue;
        }

        auto fingerprint = fingerprint_file(entry.path());
        if (fingerprint.is_error()) {
            return Err<ChangeSet>(fingerprint.error());
        }

        const std::string* known = snapshot.fingerprint(relative);
        if (known == nullptr || *known != fingerprint.value()) {
            auto record = capture(entry.path(), relative);
            if (record.is_error()) {
                return Err<ChangeSet>(record.error());
            }
            if (known == nullptr) {
                ++result.added;
            } else {
                ++result.modified;
            }
            result.changes.push_back(std::move(record.value()));
        }

        current.emplace(std::move(relative), std::move(fingerprint.value()));
    }

    if (ec) {
        return Err<ChangeSet>(ErrorKind::Io, "Failed to walk " + root.string() + ": " + ec.message());
    }

    // Detect deletions
    for (const auto& [path, _] : snapshot.entries()) {
        if (current.find(path) == current.end()) {
            result.changes.push_back(ChangeRecord::tombstone(path));
            ++result.deleted;
        }
    }

    std::sort(result.changes.begin(), result.changes.end(),
              [](const ChangeRecord& lhs, const ChangeRecord& rhs) { return lhs.path < rhs.path; });

    snapshot.replace(std::move(current));

    spdlog::debug("Scanned {}: {} tracked, {} added, {} modified, {} deleted",
                  root.string(), snapshot.size(), result.added, result.modified, result.deleted);
    return Ok(std::move(result));
}

Result<ChangeRecord> SnapshotDiffer::capture(const fs::path& absolute_path, std::string relative_path) {
    auto attributes = read_attributes(absolute_path);
    if (attributes.is_error()) {
        return Err<ChangeRecord>(attributes.error());
    }

    auto content = read_file_bytes(absolute_path);
    if (content.is_error()) {
        return Err<ChangeRecord>(content.error());
    }

    ChangeRecord record;
    record.path = std::move(relative_path);
    record.permissions = attributes.value().permissions;
    record.modified_time_ns = attributes.value().modified_time_ns;
    record.size = attributes.value().size;
    record.content = std::move(content.value());
    record.deleted = false;
    return Ok(std::move(record));
}

} // namespace strata::journal
