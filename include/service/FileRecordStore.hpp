#pragma once

#include "types/FileRecord.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace ms::service {

// Where file keys are resolved into records. The file-sharing side supplies its own.
class FileRecordStore {
public:
    virtual ~FileRecordStore() = default;
    [[nodiscard]] virtual std::optional<types::FileRecord> lookup(const std::string& key) const = 0;
};

// Records loaded once from a JSON manifest, either a top-level array or {"files": [...]}.
// Relative local storage references resolve against the manifest's directory.
class ManifestRecordStore final : public FileRecordStore {
public:
    explicit ManifestRecordStore(const std::filesystem::path& manifest);

    [[nodiscard]] std::optional<types::FileRecord> lookup(const std::string& key) const override;
    [[nodiscard]] size_t size() const { return records_.size(); }

private:
    std::unordered_map<std::string, types::FileRecord> records_;
};

// The key is a path on this host.
class LocalRecordStore final : public FileRecordStore {
public:
    [[nodiscard]] std::optional<types::FileRecord> lookup(const std::string& key) const override;
};

}
