#pragma once

#include <filesystem>
#include <string>
#include <magic.h>

namespace ms::util {

class Magic {
public:
    Magic();
    ~Magic();

    Magic(const Magic&) = delete;
    Magic& operator=(const Magic&) = delete;

    std::string mime_type(const std::filesystem::path& path) const;

    // libmagic cookies are not thread-safe; each thread gets its own.
    static std::string get_mime_type(const std::filesystem::path& path);

private:
    magic_t cookie;
};

}
