/**
 * @file test_graph.cpp
 * @brief Dependency graph construction tests
 */

#include "kcfgvex/kconfig/graph.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace kcfgvex::kconfig::test {

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

DependencyGraph graph_from(const std::string& kconfig)
{
    KconfigParser parser(make_memory_resolver({{"Kconfig", kconfig}}));
    auto parsed = parser.parse("Kconfig");
    EXPECT_TRUE(parsed);
    return DependencyGraph::build(parsed ? std::move(*parsed) : ParseResult{});
}

}  // namespace

TEST(DependencyGraphTest, SelectAndImplyEdges)
{
    const auto graph = graph_from(R"(config X
	bool "X"
	select Y if Z
	imply W
config Y
	bool
config Z
	bool
config W
	bool
)");
    const SymbolId x = graph.find("X").value();
    const SymbolId y = graph.find("CONFIG_Y").value();
    const SymbolId w = graph.find("W").value();

    ASSERT_EQ(graph.selects_of(x).size(), 2U);
    const SelectEdge& select = graph.edge(graph.selects_of(x)[0]);
    EXPECT_EQ(select.kind, SelectKind::kSelect);
    EXPECT_EQ(select.target, y);
    EXPECT_EQ(select.force_value, Tristate::kYes);
    EXPECT_EQ(to_string(select.guard), "Z");

    ASSERT_EQ(graph.selected_by(w).size(), 1U);
    const SelectEdge& imply = graph.edge(graph.selected_by(w)[0]);
    EXPECT_EQ(imply.kind, SelectKind::kImply);
    EXPECT_EQ(imply.source, x);
    EXPECT_TRUE(graph.selected_by(x).empty());
    EXPECT_TRUE(graph.diagnostics().empty());
}

TEST(DependencyGraphTest, GuardsAccumulateOverDefinitions)
{
    const auto graph = graph_from(R"(config A
	bool
	depends on B
config B
	bool
config C
	bool
config A
	depends on C || !B
)");
    const SymbolId a = graph.find("A").value();
    EXPECT_EQ(to_string(graph.depends_guard(a)), "B && (C || !B)");
    EXPECT_EQ(graph.dependencies_of(a), (std::set<std::string>{"B", "C"}));
    EXPECT_EQ(graph.depends_guard(graph.find("B").value()), nullptr);
}

TEST(DependencyGraphTest, UnresolvedReferencesAreDiagnostics)
{
    const auto graph = graph_from(R"(config FOO
	bool
	depends on MISSING_DEP
	select MISSING_TARGET
	default y if ALSO_MISSING
)");
    EXPECT_TRUE(graph.is_unresolved("MISSING_DEP"));
    EXPECT_TRUE(graph.is_unresolved("CONFIG_MISSING_TARGET"));
    EXPECT_TRUE(graph.is_unresolved("ALSO_MISSING"));
    EXPECT_FALSE(graph.is_unresolved("FOO"));
    EXPECT_TRUE(graph.edges().empty());
    ASSERT_EQ(graph.diagnostics().size(), 3U);
    EXPECT_EQ(graph.diagnostics()[0].code, "UnresolvedReference");
    EXPECT_NE(graph.diagnostics()[0].message.find("ALSO_MISSING"), std::string::npos);
    EXPECT_NE(graph.diagnostics()[2].message.find("MISSING_TARGET"), std::string::npos);
    EXPECT_FALSE(graph.find("MISSING_DEP"));
}

TEST(DependencyGraphTest, LoadsTreeFromDisk)
{
    TempDir temp_dir("kcfgvex_graph_load_test");
    write_file(temp_dir.path() / "Kconfig",
               "mainmenu \"Linux/$(ARCH) Kernel Configuration\"\n"
               "source \"arch/$(SRCARCH)/Kconfig\"\nsource \"init/Kconfig\"\n");
    write_file(temp_dir.path() / "arch/arm64/Kconfig", "config ARM64\n\tdef_bool y\n\tselect GENERIC_IRQ\n");
    write_file(temp_dir.path() / "init/Kconfig", "config GENERIC_IRQ\n\tbool\n");

    auto graph = load_dependency_graph("Kconfig", LoadOptions{.srctree = temp_dir.path(), .srcarch = "arm64"});
    ASSERT_TRUE(graph) << graph.error().message;
    EXPECT_EQ(graph->size(), 2U);
    EXPECT_TRUE(graph->diagnostics().empty());
    EXPECT_EQ(graph->files().size(), 3U);
    EXPECT_EQ(graph->mainmenu(), "Linux/$(ARCH) Kernel Configuration");
    EXPECT_EQ(graph->selected_by(graph->find("GENERIC_IRQ").value()).size(), 1U);
}

TEST(DependencyGraphTest, MissingRootFails)
{
    TempDir temp_dir("kcfgvex_graph_missing_test");
    auto graph = load_dependency_graph("Kconfig", LoadOptions{.srctree = temp_dir.path()});
    ASSERT_FALSE(graph);
    EXPECT_EQ(graph.error().code, "IOError");
}

}  // namespace kcfgvex::kconfig::test
