/**
 * @file test_evaluator.cpp
 * @brief Reachability verdict tests
 */

#include "kcfgvex/kconfig/evaluator.hpp"
#include "kcfgvex/report/explain.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace kcfgvex::kconfig::test {

namespace {

constexpr std::string_view kTree = R"(config BAR
	bool "bar"

config FOO
	bool "foo"
	default y
	depends on BAR

config OTHER
	bool "other"

config X
	bool "x"
	select Y

config Y
	bool
	depends on Z

config Z
	bool "z"
)";

class EvaluatorTest : public ::testing::Test
{
protected:
    void load(std::string_view dotconfig)
    {
        KconfigParser parser(make_memory_resolver({{"Kconfig", std::string(kTree)}}));
        auto parsed = parser.parse("Kconfig");
        ASSERT_TRUE(parsed) << parsed.error().message;
        m_graph.emplace(DependencyGraph::build(std::move(*parsed)));
        m_state = BuildState::from_text(dotconfig);
    }

    [[nodiscard]] TraceResult evaluate(std::vector<std::string> targets) const
    {
        const Evaluator evaluator(*m_graph, m_state);
        auto result = evaluator.evaluate(targets);
        EXPECT_TRUE(result) << result.error().message;
        return result ? *result : TraceResult{};
    }

    std::optional<DependencyGraph> m_graph;
    BuildState m_state;
};

}  // namespace

TEST_F(EvaluatorTest, UnmetDependencyIsCodeNotReachable)
{
    load("");
    const TraceResult result = evaluate({"CONFIG_FOO"});
    EXPECT_EQ(result.verdict, Verdict::kNotAffected);
    EXPECT_EQ(result.justification, Justification::kCodeNotReachable);
    ASSERT_EQ(result.targets.size(), 1U);
    EXPECT_EQ(result.targets[0].symbol, "FOO");
    EXPECT_TRUE(result.targets[0].known);
    EXPECT_FALSE(result.evidence.empty());
}

TEST_F(EvaluatorTest, SatisfiedDependencyWithDefaultIsAffected)
{
    load("CONFIG_BAR=y\n");
    const TraceResult result = evaluate({"FOO"});
    EXPECT_EQ(result.verdict, Verdict::kAffected);
    EXPECT_EQ(result.justification, Justification::kNone);
    EXPECT_EQ(result.targets[0].resolution.value.text, "y");
}

TEST_F(EvaluatorTest, DisabledButReachableRequiresConfiguration)
{
    load("CONFIG_BAR=y\n");
    const TraceResult result = evaluate({"OTHER", "NOT_IN_TREE", "FOO"});
    EXPECT_EQ(result.verdict, Verdict::kAffected);

    const TraceResult disabled = evaluate({"OTHER"});
    EXPECT_EQ(disabled.verdict, Verdict::kNotAffected);
    EXPECT_EQ(disabled.justification, Justification::kRequiresConfiguration);
}

TEST_F(EvaluatorTest, ExplicitlyDisabledIsCodeNotReachable)
{
    load("CONFIG_BAR=y\n# CONFIG_OTHER is not set\n");
    const TraceResult disabled = evaluate({"OTHER"});
    EXPECT_EQ(disabled.verdict, Verdict::kNotAffected);
    EXPECT_EQ(disabled.justification, Justification::kCodeNotReachable);
    EXPECT_TRUE(disabled.targets[0].resolution.explicit_value);
    EXPECT_FALSE(disabled.targets[0].resolution.dependency_blocked());

    load("CONFIG_BAR=y\n");
    const TraceResult unset = evaluate({"OTHER"});
    EXPECT_EQ(unset.verdict, Verdict::kNotAffected);
    EXPECT_EQ(unset.justification, Justification::kRequiresConfiguration);
}

TEST_F(EvaluatorTest, MixedBlockedAndUnsetIsCodeNotReachable)
{
    load("");
    const TraceResult result = evaluate({"FOO", "OTHER"});
    EXPECT_EQ(result.verdict, Verdict::kNotAffected);
    EXPECT_EQ(result.justification, Justification::kCodeNotReachable);
}

TEST_F(EvaluatorTest, UnknownSymbolNeedsInvestigation)
{
    load("");
    const TraceResult result = evaluate({"CONFIG_NOT_IN_TREE", "OTHER"});
    EXPECT_EQ(result.verdict, Verdict::kUnderInvestigation);
    EXPECT_EQ(result.justification, Justification::kNone);
    ASSERT_EQ(result.targets.size(), 2U);
    EXPECT_FALSE(result.targets[0].known);
    EXPECT_EQ(result.evidence.front().kind, StepKind::kUnknownTarget);
}

TEST_F(EvaluatorTest, EnabledTargetOutranksUnknownTarget)
{
    load("CONFIG_OTHER=y\n");
    const TraceResult result = evaluate({"NOT_IN_TREE", "OTHER"});
    EXPECT_EQ(result.verdict, Verdict::kAffected);
}

TEST_F(EvaluatorTest, SelectDoesNotBypassDependencies)
{
    load("CONFIG_X=y\n# CONFIG_Z is not set\n");
    const TraceResult result = evaluate({"Y"});
    EXPECT_EQ(result.verdict, Verdict::kNotAffected);
    EXPECT_EQ(result.justification, Justification::kCodeNotReachable);
    EXPECT_EQ(result.targets[0].resolution.value.text, "n");
}

TEST_F(EvaluatorTest, DuplicateTargetsCollapse)
{
    load("");
    const TraceResult result = evaluate({"FOO", "CONFIG_FOO", "FOO"});
    EXPECT_EQ(result.targets.size(), 1U);
}

TEST_F(EvaluatorTest, RepeatedEvaluationIsIdentical)
{
    load("CONFIG_X=y\nCONFIG_Z=y\nCONFIG_BAR=y\n");
    const std::vector<std::string> targets = {"Y", "FOO", "UNKNOWN"};
    const TraceResult first = evaluate(targets);
    const TraceResult second = evaluate(targets);
    EXPECT_EQ(first, second);
    EXPECT_EQ(report::render_trace_text(first), report::render_trace_text(second));
}

TEST_F(EvaluatorTest, EmptyTargetSetIsInvalid)
{
    load("");
    const Evaluator evaluator(*m_graph, m_state);
    auto result = evaluator.evaluate(std::vector<std::string>{});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "InvalidQuery");

    auto blank = evaluator.evaluate(std::vector<std::string>{"CONFIG_"});
    ASSERT_FALSE(blank);
    EXPECT_EQ(blank.error().code, "InvalidQuery");
}

TEST_F(EvaluatorTest, ExpressionVerdicts)
{
    load("CONFIG_BAR=y\n");
    const Evaluator evaluator(*m_graph, m_state);

    auto enabled = evaluator.evaluate_expression("FOO && !OTHER");
    ASSERT_TRUE(enabled);
    EXPECT_EQ(enabled->verdict, Verdict::kAffected);
    EXPECT_EQ(enabled->targets.size(), 2U);

    auto disabled = evaluator.evaluate_expression("FOO && OTHER");
    ASSERT_TRUE(disabled);
    EXPECT_EQ(disabled->verdict, Verdict::kNotAffected);
    EXPECT_EQ(disabled->justification, Justification::kRequiresConfiguration);

    auto constant = evaluator.evaluate_expression("n");
    ASSERT_TRUE(constant);
    EXPECT_EQ(constant->verdict, Verdict::kNotAffected);
    EXPECT_EQ(constant->justification, Justification::kCodeNotReachable);

    auto unknown = evaluator.evaluate_expression("OTHER || MYSTERY");
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->verdict, Verdict::kUnderInvestigation);

    auto malformed = evaluator.evaluate_expression("FOO &&");
    ASSERT_FALSE(malformed);
    EXPECT_EQ(malformed.error().code, "InvalidQuery");
}

TEST(VerdictNamesTest, StableStrings)
{
    EXPECT_EQ(to_string(Verdict::kAffected), "affected");
    EXPECT_EQ(to_string(Verdict::kNotAffected), "not_affected");
    EXPECT_EQ(to_string(Verdict::kUnderInvestigation), "under_investigation");
    EXPECT_EQ(to_string(Justification::kCodeNotReachable), "code_not_reachable");
    EXPECT_EQ(to_string(Justification::kRequiresConfiguration), "requires_configuration");
    EXPECT_EQ(to_string(StepKind::kSelectForced), "select_forced");
}

}  // namespace kcfgvex::kconfig::test
