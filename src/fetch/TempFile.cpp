#include "fetch/TempFile.hpp"

#include <stdexcept>
#include <unistd.h>
#include <vector>

using namespace ms::fetch;

TempFile::TempFile(const std::filesystem::path& dir, const std::string& prefix) {
    std::filesystem::create_directories(dir);

    const std::string pattern = (dir / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    const int fd = mkstemp(buf.data());
    if (fd < 0) throw std::runtime_error("Failed to create temporary file under " + dir.string());
    close(fd);

    path_ = buf.data();
}

TempFile::~TempFile() { release(); }

TempFile::TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempFile::release() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    path_.clear();
}
