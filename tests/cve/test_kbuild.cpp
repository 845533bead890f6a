/**
 * @file test_kbuild.cpp
 * @brief Kbuild Makefile gate tracer tests
 */

#include "kcfgvex/kbuild.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace kcfgvex::kbuild::test {

namespace {

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

void write_file(const std::filesystem::path& path, const std::string& text)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << text;
}

bool has_edge(const KbuildTrace& trace, const std::string& dst, const std::string& via)
{
    return std::ranges::any_of(trace.edges, [&](const TraceEdge& edge) {
        return edge.dst.starts_with(dst) && edge.via == via;
    });
}

}  // namespace

TEST(KbuildTest, ReadsLogicalLines)
{
    TempDir temp_dir("kcfgvex_kbuild_lines_test");
    write_file(temp_dir.path() / "Makefile",
               "# SPDX-License-Identifier: GPL-2.0\n"
               "obj-$(CONFIG_FOO)\t+=   foo.o # the driver\n"
               "\n"
               "foo-y := core.o \\\n"
               "\t\tutil.o\n");
    auto lines = read_makefile_lines(temp_dir.path() / "Makefile");
    ASSERT_TRUE(lines) << lines.error().message;
    EXPECT_EQ(*lines, (std::vector<std::string>{"obj-$(CONFIG_FOO) += foo.o", "foo-y := core.o util.o"}));

    auto missing = read_makefile_lines(temp_dir.path() / "nope" / "Makefile");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "IOError");
}

TEST(KbuildTest, DirectRuleAndDirectoryGate)
{
    TempDir temp_dir("kcfgvex_kbuild_direct_test");
    write_file(temp_dir.path() / "drivers/net/foo.c", "");
    write_file(temp_dir.path() / "drivers/net/Makefile", "obj-$(CONFIG_FOO) += foo.o\nobj-$(CONFIG_FOOBAR) += foobar.o\n");
    write_file(temp_dir.path() / "drivers/Makefile", "obj-$(CONFIG_NET) += net/ base/\nobj-$(CONFIG_NETX) += netx/\n");

    auto trace = trace_kbuild_gates("./drivers/net/foo.c", temp_dir.path());
    ASSERT_TRUE(trace) << trace.error().message;
    EXPECT_FALSE(trace->error);
    EXPECT_EQ(trace->symbols, (std::set<std::string>{"CONFIG_FOO", "CONFIG_NET"}));
    EXPECT_EQ(trace->objects, (std::set<std::string>{"foo.o"}));

    const std::string file_dir = (temp_dir.path() / "drivers/net").lexically_normal().generic_string();
    ASSERT_FALSE(trace->edges.empty());
    EXPECT_EQ(trace->edges[0],
              (TraceEdge{.src = "foo.o@" + file_dir, .dst = "CONFIG:CONFIG_FOO", .via = "makefile rule"}));
    EXPECT_TRUE(has_edge(*trace, "CONFIG:CONFIG_NET", "parent directory gate"));
}

TEST(KbuildTest, CompositeObjectsAreFollowed)
{
    TempDir temp_dir("kcfgvex_kbuild_composite_test");
    write_file(temp_dir.path() / "drivers/usb/helper.c", "");
    write_file(temp_dir.path() / "drivers/usb/Makefile",
               "obj-$(CONFIG_USB_BAR) += bar.o\n"
               "bar-y := core.o \\\n"
               "\thelper.o\n"
               "bar-$(CONFIG_USB_BAR_DEBUG) += debug.o\n"
               "ccflags-y += -DHELPER\n");

    auto trace = trace_kbuild_gates("drivers/usb/helper.c", temp_dir.path());
    ASSERT_TRUE(trace) << trace.error().message;
    EXPECT_EQ(trace->symbols, (std::set<std::string>{"CONFIG_USB_BAR"}));
    EXPECT_EQ(trace->objects, (std::set<std::string>{"bar.o", "helper.o"}));
    EXPECT_TRUE(has_edge(*trace, "bar.o@", "container includes target"));
    EXPECT_TRUE(has_edge(*trace, "CONFIG:CONFIG_USB_BAR", "makefile rule"));
}

TEST(KbuildTest, ConditionalCompositeMember)
{
    TempDir temp_dir("kcfgvex_kbuild_objs_test");
    write_file(temp_dir.path() / "fs/ext9/xattr.c", "");
    write_file(temp_dir.path() / "fs/ext9/Makefile",
               "obj-$(CONFIG_EXT9_FS) += ext9.o\n"
               "ext9-objs := super.o inode.o\n"
               "ext9-$(CONFIG_EXT9_XATTR) += xattr.o\n");

    auto trace = trace_kbuild_gates("fs/ext9/xattr.c", temp_dir.path());
    ASSERT_TRUE(trace) << trace.error().message;
    EXPECT_EQ(trace->symbols, (std::set<std::string>{"CONFIG_EXT9_FS", "CONFIG_EXT9_XATTR"}));
}

TEST(KbuildTest, MissingFileIsReportedInTrace)
{
    TempDir temp_dir("kcfgvex_kbuild_missing_test");
    auto trace = trace_kbuild_gates("drivers/gone.c", temp_dir.path());
    ASSERT_TRUE(trace);
    ASSERT_TRUE(trace->error);
    EXPECT_TRUE(trace->error->starts_with("File not found in source tree: "));
    EXPECT_TRUE(trace->symbols.empty());
}

TEST(KbuildTest, UngatedFileHasNoSymbols)
{
    TempDir temp_dir("kcfgvex_kbuild_ungated_test");
    write_file(temp_dir.path() / "lib/sort.c", "");
    write_file(temp_dir.path() / "lib/Makefile", "obj-y += sort.o\nlib-y += string.o\n");

    auto trace = trace_kbuild_gates("lib/sort.c", temp_dir.path());
    ASSERT_TRUE(trace);
    EXPECT_FALSE(trace->error);
    EXPECT_TRUE(trace->symbols.empty());
    EXPECT_EQ(trace->objects, (std::set<std::string>{"sort.o"}));
}

}  // namespace kcfgvex::kbuild::test
