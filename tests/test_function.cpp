#include "arbor_test_utils.hpp"

#include <string>

using namespace arbor;
using namespace arbor::testing;

class FunctionTest : public ModeTest {};

// ============================================================================
// Argument binding
// ============================================================================

TEST_P(FunctionTest, ChecksArgumentCountAndRank) {
    auto x = input("x", DType::Float64, 1);
    auto f = function({x}, {x * 2.0}, {}, config());
    EXPECT_EQ(f.n_inputs(), 1u);
    EXPECT_EQ(f.n_outputs(), 1u);
    EXPECT_EQ(f.mode(), GetParam());

    EXPECT_THROW(f({}), ValueError);
    EXPECT_THROW(f({Vec({1}), Vec({2})}), ValueError);
    EXPECT_THROW(f({Mat({1, 2}, 1, 2)}), TypeShapeError);
    EXPECT_THROW(f({Tensor()}), ValueError);
}

TEST_P(FunctionTest, ArgumentsUpcastSafely) {
    auto x = input("x", DType::Float64, 1);
    auto f = function({x}, {x / 2.0}, {}, config());
    auto r = f({Tensor::from_vector<int32_t>({1, 3})})[0];
    EXPECT_EQ(r.dtype(), DType::Float64);
    ExpectTensorEquals<double>(r, {0.5, 1.5});

    auto i = input("i", DType::Int32, 1);
    auto g = function({i}, {i + i}, {}, config());
    EXPECT_THROW(g({Vec({1.5})}), TypeShapeError);
    EXPECT_THROW(g({Tensor::from_vector<int64_t>({1})}), TypeShapeError);
}

TEST_P(FunctionTest, OutputsNeverAliasArguments) {
    auto x = input("x", DType::Float64, 1);
    auto f = function({x}, {x, subtensor(x, 0, 0)}, {}, config());
    auto arg = Vec({1, 2, 3});
    auto r = f({arg});
    EXPECT_FALSE(r[0].shares_memory(arg));
    EXPECT_FALSE(r[1].shares_memory(arg));
    ExpectTensorEquals<double>(r[0], {1, 2, 3});
}

// ============================================================================
// Shared variables
// ============================================================================

TEST_P(FunctionTest, UpdatesPersistAcrossCalls) {
    auto w = shared(Vec({1, 1}), "w");
    auto x = input("x", DType::Float64, 1);
    auto f = function({x}, {w * x}, {{w, w + x}}, config());
    ASSERT_EQ(f.update_targets().size(), 1u);

    // Outputs see the value from before this call's updates
    ExpectTensorEquals<double>(f({Vec({2, 3})})[0], {2, 3});
    ExpectTensorEquals<double>(w.get_value(), {3, 4});
    ExpectTensorEquals<double>(f({Vec({1, 1})})[0], {3, 4});
    ExpectTensorEquals<double>(w.get_value(), {4, 5});

    w.set_value(Vec({0, 0}));
    ExpectTensorEquals<double>(f({Vec({5, 5})})[0], {0, 0});
}

TEST_P(FunctionTest, UpdatesApplySimultaneously) {
    auto a = shared(Vec({1}), "a");
    auto b = shared(Vec({2}), "b");
    auto swap = function({}, {}, {{a, b}, {b, a}}, config());
    swap({});
    ExpectTensorEquals<double>(a.get_value(), {2});
    ExpectTensorEquals<double>(b.get_value(), {1});
}

TEST_P(FunctionTest, FunctionsShareStateThroughVariables) {
    auto count = shared(Tensor::scalar<int64_t>(0), "count");
    auto increment = function({}, {}, {{count, count + 1.0}}, config());
    auto read = function({}, {count * 1.0}, {}, config());

    increment({});
    increment({});
    EXPECT_EQ(read({})[0].item<int64_t>(), 2);

    auto names = increment.shared_variables();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], count);
}

TEST_P(FunctionTest, ReturnedSharedValueIsACopy) {
    auto s = shared(Vec({1, 2}), "s");
    auto f = function({}, {s}, {}, config());
    auto r = f({})[0];
    EXPECT_FALSE(r.shares_memory(s.get_value()));
    r.copy_from(Vec({9, 9}));
    ExpectTensorEquals<double>(s.get_value(), {1, 2});
}

INSTANTIATE_TEST_SUITE_P(AllModes, FunctionTest,
                         ::testing::ValuesIn(AllModes()), ModeName);

TEST(Function, RejectsInvalidUpdates) {
    auto w = shared(Vec({1, 2}), "w");
    auto x = input("x", DType::Float64, 1);
    EXPECT_THROW(function({x}, {}, {{w, x}, {w, x * 2.0}}), ValueError);
    EXPECT_THROW(function({x}, {}, {{w, sum(x)}}), TypeShapeError);

    auto counter = shared(Tensor::scalar<int64_t>(0), "counter");
    EXPECT_THROW(function({}, {}, {{counter, constant(0.5)}}), TypeShapeError);

    // A safe dtype change is cast to the shared variable's dtype
    auto i = input("i", DType::Int32, 1);
    auto f = function({i}, {}, {{w, i}});
    f({Tensor::from_vector<int32_t>({4, 5})});
    EXPECT_EQ(w.get_value().dtype(), DType::Float64);
    ExpectTensorEquals<double>(w.get_value(), {4, 5});
}

TEST(Function, UndeclaredInputsAreReported) {
    auto x = input("x", DType::Float64, 1);
    auto y = input("y", DType::Float64, 1);
    EXPECT_THROW(function({x}, {x + y}), MissingInputError);
}

// ============================================================================
// Test values at compile time
// ============================================================================

TEST(FunctionTestValues, RaisePolicyRejectsFailingGraphs) {
    auto a = input("a", DType::Float64, 1, Vec({1, 2, 3}));
    auto b = input("b", DType::Float64, 1, Vec({1, 2}));
    auto out = a + b;

    CompileConfig config;
    config.test_value_policy = TestValuePolicy::Raise;
    EXPECT_THROW(function({a, b}, {out}, {}, config), TypeShapeError);

    config.test_value_policy = TestValuePolicy::Warn;
    EXPECT_NO_THROW(function({a, b}, {out}, {}, config));
    config.test_value_policy = TestValuePolicy::Ignore;
    EXPECT_NO_THROW(function({a, b}, {out}, {}, config));
    config.test_value_policy = TestValuePolicy::Off;
    EXPECT_NO_THROW(function({a, b}, {out}, {}, config));
}

TEST(FunctionTestValues, MissingInputValue) {
    auto a = input("a", DType::Float64, 1, Vec({1, 2, 3}));
    auto b = input("b", DType::Float64, 1);

    CompileConfig config;
    config.test_value_policy = TestValuePolicy::Raise;
    EXPECT_THROW(function({a, b}, {a + b}, {}, config), TypeShapeError);
    try {
        function({a, b}, {a + b}, {}, config);
        FAIL() << "expected TypeShapeError";
    } catch (const TypeShapeError &e) {
        EXPECT_NE(std::string(e.what()).find("'b' has no test value"),
                  std::string::npos)
            << e.what();
    }

    // The same condition only logs under the softer policies
    for (auto policy : {TestValuePolicy::Warn, TestValuePolicy::Ignore,
                        TestValuePolicy::Off}) {
        config.test_value_policy = policy;
        auto f = function({a, b}, {a + b}, {}, config);
        ExpectTensorEquals<double>(f({Vec({1, 2}), Vec({3, 4})})[0], {4, 6});
    }
}

TEST(FunctionTestValues, ConsistentValuesCompile) {
    auto a = input("a", DType::Float64, 1, Vec({1, 2}));
    auto b = input("b", DType::Float64, 1, Vec({3, 4}));

    CompileConfig config;
    config.test_value_policy = TestValuePolicy::Raise;
    auto f = function({a, b}, {a * b}, {}, config);
    ExpectTensorEquals<double>(f({Vec({2, 2}), Vec({3, 3})})[0], {6, 6});
}
