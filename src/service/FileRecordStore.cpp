#include "service/FileRecordStore.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace ms::service;
using namespace ms::types;
using ms::log::Registry;

namespace fs = std::filesystem;

namespace {

bool isUrl(const std::string& ref) { return ref.find("://") != std::string::npos; }

}

ManifestRecordStore::ManifestRecordStore(const fs::path& manifest) {
    std::ifstream in(manifest);
    if (!in.is_open()) throw std::runtime_error("Failed to open manifest: " + manifest.string());

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid manifest " + manifest.string() + ": " + e.what());
    }

    const auto& files = doc.is_object() && doc.contains("files") ? doc.at("files") : doc;
    if (!files.is_array()) throw std::runtime_error("Manifest " + manifest.string() + " has no file list");

    const auto base = manifest.parent_path();
    for (const auto& entry : files) {
        FileRecord rec(entry);
        if (!rec.storage_reference.empty() && !isUrl(rec.storage_reference) && fs::path(rec.storage_reference).is_relative())
            rec.storage_reference = (base / rec.storage_reference).string();

        const auto key = rec.key;
        if (!records_.insert_or_assign(key, std::move(rec)).second)
            Registry::service()->warn("[ManifestRecordStore] Duplicate key '{}' in {}, last entry wins", key,
                                      manifest.string());
    }

    Registry::service()->debug("[ManifestRecordStore] Loaded {} records from {}", records_.size(), manifest.string());
}

std::optional<FileRecord> ManifestRecordStore::lookup(const std::string& key) const {
    if (const auto it = records_.find(key); it != records_.end()) return it->second;
    return std::nullopt;
}

std::optional<FileRecord> LocalRecordStore::lookup(const std::string& key) const {
    std::error_code ec;
    const fs::path path(key);
    if (key.empty() || !fs::is_regular_file(path, ec)) return std::nullopt;

    const auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;

    FileRecord rec;
    rec.key = key;
    rec.file_name = path.filename().string();
    rec.size_bytes = size;
    rec.storage_reference = fs::absolute(path, ec).string();
    if (ec) rec.storage_reference = key;
    return rec;
}
