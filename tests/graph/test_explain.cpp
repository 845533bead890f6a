/**
 * @file test_explain.cpp
 * @brief Trace rendering, DOT export and symbol description tests
 */

#include "kcfgvex/report/explain.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace kcfgvex::report::test {

namespace {

constexpr std::string_view kTree = R"(config FOO
	tristate "foo driver"
	depends on BAR && MISSING
	default m if BAR
	select HELPER
	imply EXTRA if BAR

config BAR
	bool "bar"

config HELPER
	bool

config EXTRA
	bool "extra"

config USER
	bool "user"
	select FOO
)";

kconfig::DependencyGraph make_graph()
{
    kconfig::KconfigParser parser(kconfig::make_memory_resolver({{"Kconfig", std::string(kTree)}}));
    auto parsed = parser.parse("Kconfig");
    EXPECT_TRUE(parsed);
    return kconfig::DependencyGraph::build(parsed ? std::move(*parsed) : kconfig::ParseResult{});
}

}  // namespace

TEST(ExplainTest, DependencyDotCoversClosure)
{
    const auto graph = make_graph();
    const std::vector<std::string> roots = {"CONFIG_FOO"};
    const std::string dot = render_dependency_dot(graph, roots);

    EXPECT_TRUE(dot.starts_with("digraph kconfig {\n  rankdir=LR;\n  node [shape=box];\n"));
    EXPECT_TRUE(dot.ends_with("}\n"));
    EXPECT_NE(dot.find("  \"FOO\" -> \"BAR\" [label=\"depends\"];"), std::string::npos);
    EXPECT_NE(dot.find("  \"FOO\" -> \"MISSING\" [label=\"depends\"];"), std::string::npos);
    EXPECT_NE(dot.find("  \"USER\" -> \"FOO\" [label=\"select\", style=bold];"), std::string::npos);
    EXPECT_NE(dot.find("  \"MISSING\" [style=dashed];"), std::string::npos);
    EXPECT_NE(dot.find("  \"USER\";"), std::string::npos);
    // Only reverse select edges are followed.
    EXPECT_EQ(dot.find("\"HELPER\""), std::string::npos);
}

TEST(ExplainTest, DependencyDotIsStable)
{
    const auto graph = make_graph();
    const std::vector<std::string> forward = {"EXTRA", "FOO"};
    const std::vector<std::string> reverse = {"FOO", "EXTRA"};
    const std::string dot = render_dependency_dot(graph, forward);
    EXPECT_EQ(dot, render_dependency_dot(graph, reverse));
    EXPECT_NE(dot.find("  \"FOO\" -> \"EXTRA\" [label=\"imply\", style=dotted];"), std::string::npos);
}

TEST(ExplainTest, DescribeSymbol)
{
    const auto graph = make_graph();
    auto described = describe_symbol(graph, "CONFIG_FOO");
    ASSERT_TRUE(described) << described.error().message;
    const nlohmann::json& doc = *described;

    EXPECT_EQ(doc.at("name"), "FOO");
    EXPECT_EQ(doc.at("kind"), "tristate");
    EXPECT_EQ(doc.at("prompt"), "foo driver");
    EXPECT_EQ(doc.at("depends_on"), "BAR && MISSING");
    ASSERT_EQ(doc.at("defaults").size(), 1U);
    EXPECT_EQ(doc.at("defaults")[0].at("value"), "m");
    EXPECT_EQ(doc.at("defaults")[0].at("if"), "BAR");
    ASSERT_EQ(doc.at("selects").size(), 1U);
    EXPECT_EQ(doc.at("selects")[0].at("symbol"), "HELPER");
    ASSERT_EQ(doc.at("implies").size(), 1U);
    EXPECT_EQ(doc.at("implies")[0].at("if"), "BAR");
    ASSERT_EQ(doc.at("selected_by").size(), 1U);
    EXPECT_EQ(doc.at("selected_by")[0].at("symbol"), "USER");
    EXPECT_TRUE(doc.at("implied_by").empty());
    ASSERT_EQ(doc.at("locations").size(), 1U);
    EXPECT_TRUE(doc.at("locations")[0].get<std::string>().starts_with("Kconfig:"));
    EXPECT_FALSE(doc.contains("choice"));
}

TEST(ExplainTest, DescribeUnknownSymbolFails)
{
    const auto graph = make_graph();
    auto described = describe_symbol(graph, "MISSING");
    ASSERT_FALSE(described);
    EXPECT_EQ(described.error().code, "InvalidQuery");
    EXPECT_NE(described.error().message.find("CONFIG_MISSING"), std::string::npos);
}

TEST(ExplainTest, TraceTextAndJson)
{
    const auto graph = make_graph();
    const auto state = kconfig::BuildState::from_text("CONFIG_USER=y\n");
    const kconfig::Evaluator evaluator(graph, state);
    const std::vector<std::string> targets = {"FOO", "UNDEFINED_THING"};
    auto result = evaluator.evaluate(targets);
    ASSERT_TRUE(result) << result.error().message;

    const std::string text = render_trace_text(*result);
    EXPECT_TRUE(text.starts_with("verdict: under_investigation\ntargets:\n"));
    EXPECT_NE(text.find("  CONFIG_FOO = n [dependencies unmet]\n"), std::string::npos);
    EXPECT_NE(text.find("  CONFIG_UNDEFINED_THING = <undefined>\n"), std::string::npos);
    EXPECT_NE(text.find("evidence:\n  1. "), std::string::npos);
    EXPECT_NE(text.find("[select_forced] selected by CONFIG_USER=y"), std::string::npos);

    const nlohmann::json json = trace_to_json(*result);
    EXPECT_EQ(json.at("verdict"), "under_investigation");
    EXPECT_FALSE(json.contains("justification"));
    ASSERT_EQ(json.at("targets").size(), 2U);
    EXPECT_EQ(json.at("targets")[0].at("dependency"), "n");
    EXPECT_EQ(json.at("targets")[1].at("known"), false);
    EXPECT_EQ(json.at("evidence").size(), result->evidence.size());
}

}  // namespace kcfgvex::report::test
