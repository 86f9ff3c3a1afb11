#include "strata/journal/restore_state.hpp"

namespace strata::journal {

void RestoreState::apply(ChangeRecord record) {
    auto it = entries_.find(record.path);
    const bool was_live = it != entries_.end() && it->second.has_value();

    if (record.deleted) {
        if (it == entries_.end()) {
            entries_.emplace(record.path, std::nullopt);
        } else {
            it->second.reset();
        }
        if (was_live) {
            --live_count_;
        }
        return;
    }

    if (it == entries_.end()) {
        std::string key = record.path;
        entries_.emplace(std::move(key), std::move(record));
    } else {
        it->second = std::move(record);
    }
    if (!was_live) {
        ++live_count_;
    }
}

void RestoreState::apply_all(std::vector<ChangeRecord> records) {
    for (auto& record : records) {
        apply(std::move(record));
    }
}

bool RestoreState::is_live(const std::string& path) const {
    auto it = entries_.find(path);
    return it != entries_.end() && it->second.has_value();
}

bool RestoreState::is_tombstoned(const std::string& path) const {
    auto it = entries_.find(path);
    return it != entries_.end() && !it->second.has_value();
}

const ChangeRecord* RestoreState::find(const std::string& path) const {
    auto it = entries_.find(path);
    if (it == entries_.end() || !it->second) {
        return nullptr;
    }
    return &*it->second;
}

std::vector<const ChangeRecord*> RestoreState::live_records() const {
    std::vector<const ChangeRecord*> live;
    live.reserve(live_count_);
    for (const auto& [_, entry] : entries_) {
        if (entry) {
            live.push_back(&*entry);
        }
    }
    return live;
}

} // namespace strata::journal
