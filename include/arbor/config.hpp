#pragma once

#include <optional>
#include <string>
#include <vector>

namespace arbor {

enum class ExecutionMode { Interpreted, Compiled, Verify };

// What graph construction does with test values attached to variables.
enum class TestValuePolicy { Off, Ignore, Warn, Raise };

std::string execution_mode_name(ExecutionMode mode);
ExecutionMode parse_execution_mode(const std::string &name);

std::string test_value_policy_name(TestValuePolicy policy);
TestValuePolicy parse_test_value_policy(const std::string &name);

// ============================================================================
// Compile options
// ============================================================================

struct CompileConfig {
    // 0: output_guard only, 1: + constant_folding and merge, 2: all passes
    int optimization_level = 2;
    ExecutionMode execution_mode = ExecutionMode::Compiled;
    bool inplace_enabled = true;
    TestValuePolicy test_value_policy = TestValuePolicy::Off;

    // Explicit pass pipeline; overrides optimization_level when set.
    std::optional<std::vector<std::string>> passes;

    // Tolerances for comparing float intermediates in verify mode
    double verify_rtol = 1e-5;
    double verify_atol = 1e-8;

    // Applies "key=value,key=value" on top of the current settings.
    // Recognized keys: optimization_level (alias opt), mode, inplace,
    // test_value_policy, passes (colon separated), verify_rtol,
    // verify_atol. Unknown keys or values throw ValueError.
    void apply(const std::string &flags);

    static CompileConfig parse(const std::string &flags);

    // Defaults with ARBOR_FLAGS applied, if set.
    static CompileConfig from_env();

    std::string str() const;
};

// ============================================================================
// Per-thread test value policy for graph construction
// ============================================================================

TestValuePolicy current_test_value_policy();

// RAII helper to set the test value policy for the current thread
class TestValueScope {
  public:
    explicit TestValueScope(TestValuePolicy policy);
    ~TestValueScope();

    TestValueScope(const TestValueScope &) = delete;
    TestValueScope &operator=(const TestValueScope &) = delete;

  private:
    TestValuePolicy previous_;
};

} // namespace arbor
