#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ms::types {

struct FileRecord {
    std::string key;
    std::string file_name;
    uintmax_t size_bytes = 0;
    std::string storage_reference;
    std::optional<std::string> mime_type;

    FileRecord() = default;
    explicit FileRecord(const nlohmann::json& j);
};

void from_json(const nlohmann::json& j, FileRecord& r);
void to_json(nlohmann::json& j, const FileRecord& r);

}
