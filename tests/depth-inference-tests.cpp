#include <gtest/gtest.h>

#include <map>

#include "depth-inference.h"

// Lookup backed by a fixed map instead of the process environment.
inline EnvLookup fake_env(std::map<std::string, std::string> vars)
{
    return [vars = std::move(vars)](const std::string & name) -> std::optional<std::string>
    {
        auto it = vars.find(name);

        if (it == vars.end())
        {
            return std::nullopt;
        }

        return it->second;
    };
}

TEST(DepthInferenceTests, EmptyEnvironmentIsLow)
{
    EXPECT_EQ(infer_depth(fake_env({})), Depth::Low);
}

TEST(DepthInferenceTests, NoColor)
{
    EXPECT_FALSE(infer_depth(fake_env({{"NO_COLOR", "1"}})));
    EXPECT_FALSE(infer_depth(fake_env({{"NO_COLOR", "true"}})));
    EXPECT_FALSE(infer_depth(fake_env({{"NO_COLOR", "TRUE"}, {"COLORTERM", "24bit"}})));

    // Other values do not disable color.
    EXPECT_EQ(infer_depth(fake_env({{"NO_COLOR", "0"}})), Depth::Low);
    EXPECT_EQ(infer_depth(fake_env({{"NO_COLOR", ""}, {"COLORTERM", "24bit"}})), Depth::High);
}

TEST(DepthInferenceTests, ColorTerm)
{
    EXPECT_EQ(infer_depth(fake_env({{"COLORTERM", "24bit"}})), Depth::High);
    EXPECT_EQ(infer_depth(fake_env({{"COLORTERM", "truecolor"}})), Depth::High);

    // COLORTERM wins over TERM.
    EXPECT_EQ(infer_depth(fake_env({{"COLORTERM", "24bit"}, {"TERM", "dumb"}})), Depth::High);

    // Anything else falls through to TERM.
    EXPECT_EQ(infer_depth(fake_env({{"COLORTERM", "yes"}, {"TERM", "xterm-256color"}})),
              Depth::Medium);
}

TEST(DepthInferenceTests, Term)
{
    EXPECT_FALSE(infer_depth(fake_env({{"TERM", "dumb"}})));

    EXPECT_EQ(infer_depth(fake_env({{"TERM", "xterm-24bit"}})), Depth::High);
    EXPECT_EQ(infer_depth(fake_env({{"TERM", "terminator"}})), Depth::High);
    EXPECT_EQ(infer_depth(fake_env({{"TERM", "mosh"}})), Depth::High);

    EXPECT_EQ(infer_depth(fake_env({{"TERM", "xterm-256color"}})), Depth::Medium);
    EXPECT_EQ(infer_depth(fake_env({{"TERM", "screen-256color"}})), Depth::Medium);

    EXPECT_EQ(infer_depth(fake_env({{"TERM", "xterm"}})), Depth::Low);
    EXPECT_EQ(infer_depth(fake_env({{"TERM", "linux"}})), Depth::Low);
}

TEST(DepthInferenceTests, ProcessEnvironment)
{
    EXPECT_FALSE(process_env("DAHLIA_TEST_VARIABLE_THAT_IS_NEVER_SET"));
    EXPECT_TRUE(process_env("PATH"));
}
