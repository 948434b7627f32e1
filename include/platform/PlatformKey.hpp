#pragma once

#include <string>

namespace ms::platform {

struct PlatformKey {
    std::string os_family;  // "linux", "darwin", ...
    std::string cpu_arch;   // "x86_64", "arm64", or the raw machine name

    // Computed once per process from uname(2).
    static const PlatformKey& host();

    static PlatformKey fromUname(const std::string& sysname, const std::string& machine);

    // "<os>_<arch>", the download table key
    [[nodiscard]] std::string str() const { return os_family + "_" + cpu_arch; }

    bool operator==(const PlatformKey&) const = default;
};

}
