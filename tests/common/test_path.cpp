/**
 * @file test_path.cpp
 * @brief Path normalization tests
 */

#include "kcfgvex/common.hpp"

#include <gtest/gtest.h>

using namespace kcfgvex::common;

TEST(PathNormalization, UnixPaths)
{
    EXPECT_EQ(normalize_path("/usr/src/linux"), "/usr/src/linux");
    EXPECT_EQ(normalize_path("/usr/src/linux/"), "/usr/src/linux");
    EXPECT_EQ(normalize_path("/usr/src/../src/linux"), "/usr/src/linux");
    EXPECT_EQ(normalize_path("/usr/./src/linux"), "/usr/src/linux");
}

TEST(PathNormalization, Backslashes)
{
    EXPECT_EQ(normalize_path("drivers\\net\\Kconfig"), "drivers/net/Kconfig");
}

TEST(PathNormalization, DotDot)
{
    EXPECT_EQ(normalize_path("arch/x86/../arm64/Kconfig"), "arch/arm64/Kconfig");
    EXPECT_EQ(normalize_path("a/b/c/../../d"), "a/d");
    EXPECT_EQ(normalize_path("../a/b"), "../a/b");
    EXPECT_EQ(normalize_path("/../a"), "/a");
}

TEST(PathNormalization, Dot)
{
    EXPECT_EQ(normalize_path("./net/ipv4/tcp.c"), "net/ipv4/tcp.c");
    EXPECT_EQ(normalize_path("a/./b"), "a/b");
    EXPECT_EQ(normalize_path("a/b/."), "a/b");
}

TEST(PathNormalization, Empty)
{
    EXPECT_EQ(normalize_path(""), ".");
    EXPECT_EQ(normalize_path("./"), ".");
}

TEST(PathNormalization, IsAbsolute)
{
    EXPECT_TRUE(is_absolute_path("/usr/src"));
    EXPECT_FALSE(is_absolute_path("relative/path"));
    EXPECT_FALSE(is_absolute_path("./relative"));
    EXPECT_FALSE(is_absolute_path(""));
}

TEST(PathNormalization, ParentPath)
{
    EXPECT_EQ(parent_path("drivers/net/Kconfig"), "drivers/net");
    EXPECT_EQ(parent_path("Kconfig"), ".");
    EXPECT_EQ(parent_path("/Kconfig"), "/");
}

TEST(PathNormalization, JoinPath)
{
    EXPECT_EQ(join_path("drivers/net", "wireless/Kconfig"), "drivers/net/wireless/Kconfig");
    EXPECT_EQ(join_path("drivers/net", "../usb/Kconfig"), "drivers/usb/Kconfig");
    EXPECT_EQ(join_path(".", "init/Kconfig"), "init/Kconfig");
    EXPECT_EQ(join_path("drivers", "/abs/Kconfig"), "/abs/Kconfig");
}
