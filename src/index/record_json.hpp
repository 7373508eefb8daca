#pragma once
#include "../similarity_index.hpp"
#include <nlohmann/json.hpp>

namespace engram {

// JSON <-> IndexRecord conversion for the JsonIndex file format.

inline IndexRecord record_from_json(const nlohmann::json& item) {
    IndexRecord record;
    if (!item.is_object()) return record;
    record.id = item.value("id", "");
    record.text = item.value("text", "");
    if (item.contains("metadata") && item["metadata"].is_object()) {
        record.metadata = item["metadata"];
    }
    return record;
}

inline nlohmann::json record_to_json(const IndexRecord& record) {
    return {
        {"id", record.id},
        {"text", record.text},
        {"metadata", record.metadata}
    };
}

} // namespace engram
