#include "strata/journal/restorer.hpp"
#include "strata/core/file_attributes.hpp"
#include "strata/journal/restore_state.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <type_traits>

namespace strata::journal {
namespace fs = std::filesystem;

namespace {

Result<void> ensure_directory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec || !fs::is_directory(path)) {
        return Err<void>(Error(ErrorKind::Io, "Failed to create directory " + path.string() +
                                                  (ec ? ": " + ec.message() : std::string{})));
    }
    return Ok();
}

bool try_write(const fs::path& path, const std::vector<std::uint8_t>& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return false;
    }
    output.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    output.flush();
    return static_cast<bool>(output);
}

} // namespace

bool Restorer::is_safe_relative_path(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    const fs::path relative(path);
    if (relative.has_root_name() || relative.has_root_directory()) {
        return false;
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

Result<RestoreSummary> Restorer::restore(const fs::path& backup_root,
                                         const fs::path& target_root,
                                         const RestoreOptions& options) const {
    spdlog::info("Restoring from {} to {}", backup_root.string(), target_root.string());

    if (auto prepared = ensure_directory(target_root); prepared.is_error()) {
        return Err<RestoreSummary>(prepared.error());
    }

    JournalReader reader(backup_root);
    auto listing = reader.list_segments();
    if (listing.is_error()) {
        return Err<RestoreSummary>(listing.error());
    }

    RestoreSummary summary;
    for (auto& malformed : listing.value().malformed) {
        spdlog::debug("Skipping {}: {}", malformed.info.path.filename().string(), malformed.reason);
        summary.skipped.push_back(std::move(malformed));
    }

    RestoreState state;
    for (const auto& info : listing.value().segments) {
        if (options.until && info.timestamp > *options.until) {
            ++summary.segments_after_cutoff;
            continue;
        }

        auto segment = reader.read_segment(info);
        std::visit([&](auto&& outcome) {
            using Outcome = std::decay_t<decltype(outcome)>;
            if constexpr (std::is_same_v<Outcome, DecodedSegment>) {
                state.apply_all(std::move(outcome.records));
                ++summary.segments_applied;
            } else {
                spdlog::debug("Skipping corrupt segment {}: {}", info.path.filename().string(), outcome.reason);
                summary.skipped.push_back(std::move(outcome));
            }
        }, std::move(segment));
    }

    summary.tombstones = state.tombstone_count();
    for (const auto* record : state.live_records()) {
        if (!is_safe_relative_path(record->path)) {
            spdlog::warn("Refusing to restore path outside target: {}", record->path);
            ++summary.rejected_paths;
            continue;
        }
        if (auto written = materialize(target_root, *record); written.is_error()) {
            return Err<RestoreSummary>(written.error());
        }
        ++summary.files_restored;
    }

    spdlog::info("Restored {} files from {} segments ({} skipped)",
                 summary.files_restored, summary.segments_applied, summary.skipped.size());
    return Ok(std::move(summary));
}

Result<void> Restorer::materialize(const fs::path& target_root, const ChangeRecord& record) {
    const fs::path destination = target_root / fs::path(record.path);

    if (auto parent = ensure_directory(destination.parent_path()); parent.is_error()) {
        return parent;
    }

    if (auto written = write_content(destination, record.content); written.is_error()) {
        return written;
    }

    if (auto perms = apply_permissions(destination, record.permissions); perms.is_error()) {
        spdlog::warn("Could not restore permissions for {}: {}", record.path, perms.error().message);
    }
    if (auto times = apply_modified_time(destination, record.modified_time_ns); times.is_error()) {
        spdlog::warn("Could not restore times for {}: {}", record.path, times.error().message);
    }
    return Ok();
}

Result<void> Restorer::write_content(const fs::path& path, const std::vector<std::uint8_t>& content) {
    if (try_write(path, content)) {
        return Ok();
    }

    // A previous restore may have left a read-only copy in place
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        fs::permissions(path, fs::perms::owner_write, fs::perm_options::add, ec);
        if (!ec && try_write(path, content)) {
            return Ok();
        }
    }
    return Err<void>(Error(ErrorKind::Io, "Failed to write " + path.string()));
}

} // namespace strata::journal
