#include <gtest/gtest.h>
#include "platform/PlatformKey.hpp"

using ms::platform::PlatformKey;

TEST(PlatformKeyTest, NormalizesIntelAliases) {
    EXPECT_EQ(PlatformKey::fromUname("Linux", "x86_64").str(), "linux_x86_64");
    EXPECT_EQ(PlatformKey::fromUname("Linux", "AMD64").str(), "linux_x86_64");
}

TEST(PlatformKeyTest, NormalizesArmAliases) {
    EXPECT_EQ(PlatformKey::fromUname("Linux", "aarch64").str(), "linux_arm64");
    EXPECT_EQ(PlatformKey::fromUname("Darwin", "arm64").str(), "darwin_arm64");
}

TEST(PlatformKeyTest, KeepsUnknownArchitectureVerbatim) {
    const auto key = PlatformKey::fromUname("Linux", "riscv64");
    EXPECT_EQ(key.os_family, "linux");
    EXPECT_EQ(key.cpu_arch, "riscv64");
    EXPECT_EQ(key.str(), "linux_riscv64");
}

TEST(PlatformKeyTest, HostIsStable) {
    const auto& a = PlatformKey::host();
    const auto& b = PlatformKey::host();
    EXPECT_EQ(&a, &b);
    EXPECT_FALSE(a.os_family.empty());
    EXPECT_FALSE(a.cpu_arch.empty());
}
