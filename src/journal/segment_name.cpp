#include "strata/journal/segment_name.hpp"

#include <charconv>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <system_error>

namespace strata::journal {

namespace {

template<typename Integer>
bool parse_digits(std::string_view text, Integer& out) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

bool has_affixes(std::string_view name) {
    const std::string_view prefix(kSegmentPrefix);
    const std::string_view extension(kSegmentExtension);
    return name.size() > prefix.size() + extension.size() &&
           name.substr(0, prefix.size()) == prefix &&
           name.substr(name.size() - extension.size()) == extension;
}

} // namespace

std::string make_segment_name(std::int64_t timestamp, std::uint32_t sequence) {
    std::ostringstream oss;
    oss << kSegmentPrefix
        << std::setw(kTimestampWidth) << std::setfill('0') << timestamp
        << '_'
        << std::setw(kSequenceWidth) << std::setfill('0') << sequence
        << kSegmentExtension;
    return oss.str();
}

bool is_segment_candidate(const std::filesystem::path& path) {
    return has_affixes(path.filename().string());
}

std::optional<SegmentInfo> parse_segment_name(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    if (!has_affixes(name)) {
        return std::nullopt;
    }

    std::string_view body(name);
    body.remove_prefix(std::strlen(kSegmentPrefix));
    body.remove_suffix(std::strlen(kSegmentExtension));

    const auto separator = body.find('_');
    if (separator == std::string_view::npos) {
        return std::nullopt;
    }

    SegmentInfo info;
    info.path = path;
    if (!parse_digits(body.substr(0, separator), info.timestamp) ||
        !parse_digits(body.substr(separator + 1), info.sequence)) {
        return std::nullopt;
    }
    return info;
}

} // namespace strata::journal
