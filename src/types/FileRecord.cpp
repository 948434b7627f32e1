#include "types/FileRecord.hpp"

#include <nlohmann/json.hpp>

namespace ms::types {

FileRecord::FileRecord(const nlohmann::json& j)
    : key(j.at("key").get<std::string>()),
      file_name(j.at("file_name").get<std::string>()),
      size_bytes(j.value("size_bytes", static_cast<uintmax_t>(0))),
      storage_reference(j.value("storage_reference", std::string{})) {
    if (j.contains("mime_type") && j["mime_type"].is_string()) mime_type = j["mime_type"].get<std::string>();
}

void from_json(const nlohmann::json& j, FileRecord& r) {
    r = FileRecord(j);
}

void to_json(nlohmann::json& j, const FileRecord& r) {
    j = {
        {"key", r.key},
        {"file_name", r.file_name},
        {"size_bytes", r.size_bytes},
        {"storage_reference", r.storage_reference}
    };
    if (r.mime_type) j["mime_type"] = *r.mime_type;
}

}
