#include "arbor_test_utils.hpp"

#include <cstdlib>

using namespace arbor;
using namespace arbor::testing;

// ============================================================================
// CompileConfig
// ============================================================================

TEST(CompileConfig, Defaults) {
    CompileConfig c;
    EXPECT_EQ(c.optimization_level, 2);
    EXPECT_EQ(c.execution_mode, ExecutionMode::Compiled);
    EXPECT_TRUE(c.inplace_enabled);
    EXPECT_EQ(c.test_value_policy, TestValuePolicy::Off);
    EXPECT_FALSE(c.passes.has_value());
}

TEST(CompileConfig, ParsesFlags) {
    auto c = CompileConfig::parse(
        "opt=1, mode=verify,inplace=false,test_value_policy=warn,"
        "passes=merge:output_guard,verify_rtol=0.001");
    EXPECT_EQ(c.optimization_level, 1);
    EXPECT_EQ(c.execution_mode, ExecutionMode::Verify);
    EXPECT_FALSE(c.inplace_enabled);
    EXPECT_EQ(c.test_value_policy, TestValuePolicy::Warn);
    ASSERT_TRUE(c.passes.has_value());
    EXPECT_EQ(*c.passes, (std::vector<std::string>{"merge", "output_guard"}));
    EXPECT_DOUBLE_EQ(c.verify_rtol, 0.001);

    auto empty = CompileConfig::parse("");
    EXPECT_EQ(empty.str(), CompileConfig().str());
}

TEST(CompileConfig, LaterFlagsOverrideEarlierOnes) {
    CompileConfig c;
    c.apply("mode=interpreted");
    c.apply("optimization_level=0,mode=compiled");
    EXPECT_EQ(c.execution_mode, ExecutionMode::Compiled);
    EXPECT_EQ(c.optimization_level, 0);
}

TEST(CompileConfig, RejectsUnknownKeysAndValues) {
    EXPECT_THROW(CompileConfig::parse("speed=fast"), ValueError);
    EXPECT_THROW(CompileConfig::parse("opt=3"), ValueError);
    EXPECT_THROW(CompileConfig::parse("mode=jit"), ValueError);
    EXPECT_THROW(CompileConfig::parse("inplace=maybe"), ValueError);
    EXPECT_THROW(CompileConfig::parse("verify_atol=-1"), ValueError);
    EXPECT_THROW(CompileConfig::parse("verify_atol=1e-3x"), ValueError);
    EXPECT_THROW(CompileConfig::parse("opt"), ValueError);
}

TEST(CompileConfig, StrRoundTripsThroughParse) {
    CompileConfig c;
    c.optimization_level = 1;
    c.execution_mode = ExecutionMode::Interpreted;
    c.passes = std::vector<std::string>{"constant_folding", "output_guard"};
    auto text = c.str();
    EXPECT_NE(text.find("mode=interpreted"), std::string::npos) << text;
    EXPECT_NE(text.find("passes=constant_folding:output_guard"),
              std::string::npos)
        << text;

    auto back = CompileConfig::parse(text);
    EXPECT_EQ(back.str(), text);
}

TEST(CompileConfig, ReadsEnvironment) {
    ::setenv("ARBOR_FLAGS", "mode=interpreted,opt=0", 1);
    auto c = CompileConfig::from_env();
    ::unsetenv("ARBOR_FLAGS");
    EXPECT_EQ(c.execution_mode, ExecutionMode::Interpreted);
    EXPECT_EQ(c.optimization_level, 0);

    auto defaults = CompileConfig::from_env();
    EXPECT_EQ(defaults.str(), CompileConfig().str());
}

TEST(CompileConfig, EnumNames) {
    for (auto mode : AllModes())
        EXPECT_EQ(parse_execution_mode(execution_mode_name(mode)), mode);
    for (auto p : {TestValuePolicy::Off, TestValuePolicy::Ignore,
                   TestValuePolicy::Warn, TestValuePolicy::Raise})
        EXPECT_EQ(parse_test_value_policy(test_value_policy_name(p)), p);
    EXPECT_THROW(parse_test_value_policy("loud"), ValueError);
}

// ============================================================================
// Logging
// ============================================================================

TEST(Logging, ParseLevel) {
    EXPECT_EQ(logging::parse_level("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("off"), spdlog::level::off);
    EXPECT_THROW(logging::parse_level("verbose"), ValueError);
}

TEST(Logging, SetLevel) {
    logging::set_level(spdlog::level::debug);
    EXPECT_TRUE(logging::logger()->should_log(spdlog::level::debug));
    logging::set_level(spdlog::level::err);
    EXPECT_FALSE(logging::logger()->should_log(spdlog::level::warn));
    EXPECT_EQ(logging::logger()->name(), "arbor");
}
