#include "arbor/config.hpp"
#include "arbor/error.hpp"

#include <cstdlib>
#include <sstream>

namespace arbor {

namespace {

thread_local TestValuePolicy tl_test_value_policy = TestValuePolicy::Off;

std::string trim(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\n");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split(const std::string &s, char sep) {
    std::vector<std::string> parts;
    std::string item;
    std::istringstream iss(s);
    while (std::getline(iss, item, sep)) {
        item = trim(item);
        if (!item.empty())
            parts.push_back(item);
    }
    return parts;
}

bool parse_bool(const std::string &key, const std::string &value) {
    if (value == "1" || value == "true" || value == "True" || value == "on")
        return true;
    if (value == "0" || value == "false" || value == "False" || value == "off")
        return false;
    throw ValueError::invalid_option(key, value);
}

double parse_double(const std::string &key, const std::string &value) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &pos);
    } catch (const std::logic_error &) {
        throw ValueError::invalid_option(key, value);
    }
    if (pos != value.size() || v < 0.0)
        throw ValueError::invalid_option(key, value);
    return v;
}

} // namespace

std::string execution_mode_name(ExecutionMode mode) {
    switch (mode) {
    case ExecutionMode::Interpreted:
        return "interpreted";
    case ExecutionMode::Compiled:
        return "compiled";
    case ExecutionMode::Verify:
        return "verify";
    }
    return "unknown";
}

ExecutionMode parse_execution_mode(const std::string &name) {
    if (name == "interpreted")
        return ExecutionMode::Interpreted;
    if (name == "compiled")
        return ExecutionMode::Compiled;
    if (name == "verify")
        return ExecutionMode::Verify;
    throw ValueError::invalid_option("mode", name);
}

std::string test_value_policy_name(TestValuePolicy policy) {
    switch (policy) {
    case TestValuePolicy::Off:
        return "off";
    case TestValuePolicy::Ignore:
        return "ignore";
    case TestValuePolicy::Warn:
        return "warn";
    case TestValuePolicy::Raise:
        return "raise";
    }
    return "unknown";
}

TestValuePolicy parse_test_value_policy(const std::string &name) {
    if (name == "off")
        return TestValuePolicy::Off;
    if (name == "ignore")
        return TestValuePolicy::Ignore;
    if (name == "warn")
        return TestValuePolicy::Warn;
    if (name == "raise")
        return TestValuePolicy::Raise;
    throw ValueError::invalid_option("test_value_policy", name);
}

// ============================================================================
// CompileConfig
// ============================================================================

void CompileConfig::apply(const std::string &flags) {
    for (const auto &entry : split(flags, ',')) {
        size_t eq = entry.find('=');
        if (eq == std::string::npos)
            throw ValueError("malformed option '" + entry +
                             "', expected key=value");
        std::string key = trim(entry.substr(0, eq));
        std::string value = trim(entry.substr(eq + 1));

        if (key == "optimization_level" || key == "opt") {
            if (value == "0" || value == "1" || value == "2")
                optimization_level = value[0] - '0';
            else
                throw ValueError::invalid_option(key, value);
        } else if (key == "mode" || key == "execution_mode") {
            execution_mode = parse_execution_mode(value);
        } else if (key == "inplace" || key == "inplace_enabled") {
            inplace_enabled = parse_bool(key, value);
        } else if (key == "test_value_policy") {
            test_value_policy = parse_test_value_policy(value);
        } else if (key == "passes") {
            passes = split(value, ':');
        } else if (key == "verify_rtol") {
            verify_rtol = parse_double(key, value);
        } else if (key == "verify_atol") {
            verify_atol = parse_double(key, value);
        } else {
            throw ValueError::unknown_option(key);
        }
    }
}

CompileConfig CompileConfig::parse(const std::string &flags) {
    CompileConfig config;
    config.apply(flags);
    return config;
}

CompileConfig CompileConfig::from_env() {
    CompileConfig config;
    if (const char *env = std::getenv("ARBOR_FLAGS"))
        config.apply(env);
    return config;
}

std::string CompileConfig::str() const {
    std::ostringstream oss;
    oss << "optimization_level=" << optimization_level
        << ",mode=" << execution_mode_name(execution_mode)
        << ",inplace=" << (inplace_enabled ? "true" : "false")
        << ",test_value_policy=" << test_value_policy_name(test_value_policy);
    if (passes) {
        oss << ",passes=";
        for (size_t i = 0; i < passes->size(); ++i)
            oss << (i ? ":" : "") << (*passes)[i];
    }
    oss << ",verify_rtol=" << verify_rtol << ",verify_atol=" << verify_atol;
    return oss.str();
}

// ============================================================================
// TestValueScope
// ============================================================================

TestValuePolicy current_test_value_policy() { return tl_test_value_policy; }

TestValueScope::TestValueScope(TestValuePolicy policy)
    : previous_(tl_test_value_policy) {
    tl_test_value_policy = policy;
}

TestValueScope::~TestValueScope() { tl_test_value_policy = previous_; }

} // namespace arbor
