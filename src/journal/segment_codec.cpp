#include "strata/journal/segment_codec.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace strata::journal {

using json = nlohmann::json;

namespace {

json record_to_json(const ChangeRecord& record) {
    json j;
    j["path"] = record.path;
    j["deleted"] = record.deleted;
    if (record.deleted) {
        j["mode"] = 0u;
        j["mtime_ns"] = 0;
        j["size"] = 0u;
        j["content"] = json::binary(std::vector<std::uint8_t>{});
    } else {
        j["mode"] = record.permissions;
        j["mtime_ns"] = record.modified_time_ns;
        j["size"] = record.size;
        j["content"] = json::binary(record.content);
    }
    return j;
}

Result<ChangeRecord> record_from_json(const json& j, std::size_t index) {
    const std::string where = "record " + std::to_string(index) + ": ";
    if (!j.is_object()) {
        return Err<ChangeRecord>(ErrorKind::Decode, where + "not a map");
    }

    const auto& path = j.at("path");
    const auto& mode = j.at("mode");
    const auto& mtime = j.at("mtime_ns");
    const auto& size = j.at("size");
    const auto& content = j.at("content");
    const auto& deleted = j.at("deleted");

    if (!path.is_string() || !mode.is_number_unsigned() || !mtime.is_number_integer() ||
        !size.is_number_unsigned() || !content.is_binary() || !deleted.is_boolean()) {
        return Err<ChangeRecord>(ErrorKind::Decode, where + "field has wrong type");
    }

    ChangeRecord record;
    record.path = path.get<std::string>();
    record.permissions = mode.get<std::uint32_t>();
    record.modified_time_ns = mtime.get<std::int64_t>();
    record.size = size.get<std::uint64_t>();
    record.content = content.get_binary();
    record.deleted = deleted.get<bool>();

    if (record.path.empty()) {
        return Err<ChangeRecord>(ErrorKind::Decode, where + "empty path");
    }
    if (record.deleted && !record.content.empty()) {
        return Err<ChangeRecord>(ErrorKind::Decode, where + "tombstone carries content");
    }
    return Ok(std::move(record));
}

std::vector<std::uint8_t> encode_document(std::int64_t timestamp, std::uint32_t sequence, json records) {
    json document;
    document["format"] = kSegmentFormat;
    document["version"] = kSegmentVersion;
    document["timestamp"] = timestamp;
    document["sequence"] = sequence;
    document["records"] = std::move(records);
    return json::to_msgpack(document);
}

} // namespace

std::vector<std::uint8_t> SegmentCodec::encode(std::int64_t timestamp,
                                               std::uint32_t sequence,
                                               const std::vector<const ChangeRecord*>& records) {
    json list = json::array();
    for (const auto* record : records) {
        list.push_back(record_to_json(*record));
    }
    return encode_document(timestamp, sequence, std::move(list));
}

std::vector<std::uint8_t> SegmentCodec::encode(const SegmentPayload& payload) {
    json list = json::array();
    for (const auto& record : payload.records) {
        list.push_back(record_to_json(record));
    }
    return encode_document(payload.timestamp, payload.sequence, std::move(list));
}

Result<SegmentPayload> SegmentCodec::decode(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) {
        return Err<SegmentPayload>(ErrorKind::Decode, "empty segment");
    }

    const json document = json::from_msgpack(bytes, true, false);
    if (document.is_discarded()) {
        return Err<SegmentPayload>(ErrorKind::Decode, "not valid MessagePack");
    }
    if (!document.is_object()) {
        return Err<SegmentPayload>(ErrorKind::Decode, "top level is not a map");
    }

    try {
        const auto& format = document.at("format");
        if (!format.is_string() || format.get<std::string>() != kSegmentFormat) {
            return Err<SegmentPayload>(ErrorKind::Decode, "unrecognised format tag");
        }
        const auto& version = document.at("version");
        if (!version.is_number_unsigned() || version.get<std::uint32_t>() != kSegmentVersion) {
            return Err<SegmentPayload>(ErrorKind::Decode, "unsupported segment version");
        }

        const auto& timestamp = document.at("timestamp");
        const auto& sequence = document.at("sequence");
        const auto& records = document.at("records");
        if (!timestamp.is_number_integer() || !sequence.is_number_unsigned() || !records.is_array()) {
            return Err<SegmentPayload>(ErrorKind::Decode, "header field has wrong type");
        }

        SegmentPayload payload;
        payload.timestamp = timestamp.get<std::int64_t>();
        payload.sequence = sequence.get<std::uint32_t>();
        payload.records.reserve(records.size());

        for (std::size_t i = 0; i < records.size(); ++i) {
            auto record = record_from_json(records[i], i);
            if (record.is_error()) {
                return Err<SegmentPayload>(record.error());
            }
            payload.records.push_back(std::move(record.value()));
        }
        return Ok(std::move(payload));
    } catch (const json::exception& e) {
        return Err<SegmentPayload>(ErrorKind::Decode, std::string("malformed segment: ") + e.what());
    }
}

} // namespace strata::journal
