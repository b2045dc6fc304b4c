#include <gtest/gtest.h>
#include "cli/cli.hpp"

using namespace onto;

class CommandLineTest : public ::testing::Test {
protected:
    Command analyze;

    void SetUp() override {
        analyze.name = "analyze";
        analyze.summary = "Analyze";
        analyze.options = {
            {"output", "o", "Report path", "analysis_report.json", false},
            {"seed", "s", "Random seed", "", false},
            {"apply", "a", "Apply decisions", "", true}
        };
    }
};

TEST_F(CommandLineTest, DefaultsFillUnsetOptions) {
    Options options = CommandLine::parse(analyze, {});
    EXPECT_EQ(options.get("output").text, "analysis_report.json");
    EXPECT_FALSE(options.has("seed"));
    EXPECT_FALSE(options.has("apply"));
    EXPECT_EQ(options.get("seed", "none").text, "none");
}

TEST_F(CommandLineTest, LongShortAndInlineForms) {
    Options options = CommandLine::parse(analyze, {"-o", "out.json", "--seed=42", "--apply"});
    EXPECT_EQ(options.get("output").text, "out.json");
    EXPECT_EQ(options.get("seed").as_uint64(), 42u);
    EXPECT_TRUE(options.has("apply"));
}

TEST_F(CommandLineTest, ParseErrors) {
    EXPECT_THROW(CommandLine::parse(analyze, {"--unknown"}), std::runtime_error);
    EXPECT_THROW(CommandLine::parse(analyze, {"--seed"}), std::runtime_error);
    EXPECT_THROW(CommandLine::parse(analyze, {"--apply=yes"}), std::runtime_error);
}

TEST(OptionValueTest, StrictUnsignedParsing) {
    EXPECT_EQ((OptionValue{"7", true}).as_uint64(), 7u);
    EXPECT_THROW((OptionValue{"7x", true}).as_uint64(), std::invalid_argument);
    EXPECT_THROW((OptionValue{"-3", true}).as_uint64(), std::invalid_argument);
    EXPECT_THROW((OptionValue{"", false}).as_uint64(), std::invalid_argument);
}
