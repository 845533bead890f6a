/**
 * @file test_build_state.cpp
 * @brief .config parsing tests
 */

#include "kcfgvex/kconfig/build_state.hpp"

#include <gtest/gtest.h>

namespace kcfgvex::kconfig::test {

TEST(BuildStateTest, ParsesAssignmentsAndNotSet)
{
    const BuildState state = BuildState::from_text(R"(#
# Automatically generated file; DO NOT EDIT.
#
CONFIG_NET=y
CONFIG_USB=m
# CONFIG_DEBUG_FS is not set
CONFIG_HZ=250
CONFIG_LOCALVERSION="-custom \"x\""
  CONFIG_INDENTED=y
NOT_A_CONFIG=y
CONFIG_BROKEN
)");
    EXPECT_EQ(state.explicit_value("NET"), "y");
    EXPECT_EQ(state.explicit_value("CONFIG_USB"), "m");
    EXPECT_EQ(state.explicit_value("DEBUG_FS"), "n");
    EXPECT_EQ(state.explicit_value("HZ"), "250");
    EXPECT_EQ(state.explicit_value("LOCALVERSION"), "-custom \"x\"");
    EXPECT_EQ(state.explicit_value("INDENTED"), "y");
    EXPECT_FALSE(state.explicit_value("NOT_A_CONFIG"));
    EXPECT_FALSE(state.explicit_value("BROKEN"));
    EXPECT_FALSE(state.explicit_value("UNSET"));
    EXPECT_EQ(state.size(), 6U);
}

TEST(BuildStateTest, EnabledSymbols)
{
    const BuildState state =
        BuildState::from_text("CONFIG_B=y\nCONFIG_A=m\n# CONFIG_C is not set\nCONFIG_D=0\n");
    EXPECT_EQ(state.enabled_symbols(), (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(state.enabled_symbols(false), (std::vector<std::string>{"B"}));
    EXPECT_TRUE(state.is_enabled("CONFIG_A"));
    EXPECT_FALSE(state.is_enabled("A", false));
    EXPECT_FALSE(state.is_enabled("C"));
}

TEST(BuildStateTest, LaterAssignmentWins)
{
    BuildState state = BuildState::from_text("CONFIG_X=y\n# CONFIG_X is not set\n");
    EXPECT_EQ(state.explicit_value("X"), "n");
    state.set("CONFIG_X", "m");
    EXPECT_EQ(state.explicit_value("X"), "m");
}

TEST(BuildStateTest, MissingFile)
{
    auto state = BuildState::from_path("/nonexistent/kcfgvex/.config");
    ASSERT_FALSE(state);
    EXPECT_EQ(state.error().code, "IOError");
}

}  // namespace kcfgvex::kconfig::test
