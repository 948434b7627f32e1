#pragma once

#include <filesystem>
#include <string>

namespace ms::fetch {

// Uniquely named file that is removed when the owner goes out of scope.
class TempFile {
public:
    explicit TempFile(const std::filesystem::path& dir, const std::string& prefix = "mediascope");
    ~TempFile();

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;

    void release() noexcept;
};

}
