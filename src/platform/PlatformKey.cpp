#include "platform/PlatformKey.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <sys/utsname.h>

using namespace ms::platform;

static std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

PlatformKey PlatformKey::fromUname(const std::string& sysname, const std::string& machine) {
    PlatformKey key;
    key.os_family = lower(sysname);

    const auto arch = lower(machine);
    if (arch == "x86_64" || arch == "amd64") key.cpu_arch = "x86_64";
    else if (arch == "aarch64" || arch == "arm64") key.cpu_arch = "arm64";
    else key.cpu_arch = arch;

    return key;
}

const PlatformKey& PlatformKey::host() {
    static const PlatformKey key = [] {
        utsname u{};
        if (uname(&u) != 0) throw std::runtime_error("uname() failed while detecting host platform");
        return fromUname(u.sysname, u.machine);
    }();
    return key;
}
