#include "arbor_test_utils.hpp"

#include "arbor/opt/optimizer.hpp"
#include "arbor/scan/scan_info.hpp"

#include <cmath>

using namespace arbor;
using namespace arbor::testing;
using graph::OpKind;

namespace {

Variable Steps(int64_t n) { return constant(n); }

const graph::ScanInfo &InfoOf(const graph::Graph &g) {
    for (const auto &node : g.apply_nodes()) {
        if (node->op() == OpKind::Scan)
            return *graph::get_params<graph::ScanParams>(node->params()).info;
    }
    throw RuntimeError("graph has no scan node");
}

} // namespace

class ScanTest : public ModeTest {};

// ============================================================================
// Step counts
// ============================================================================

TEST_P(ScanTest, FixedStepCountProducesOneRowPerStep) {
    auto x0 = input("x0", DType::Float64, 0);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] + 1.0};
    };
    spec.outputs_info = {OutputInfo(x0)};
    spec.n_steps = Steps(4);
    auto r = scan(spec);

    auto f = function({x0}, {r.outputs[0]}, {}, config());
    auto out = f({Tensor::scalar<double>(0.0)})[0];
    EXPECT_EQ(out.shape(), (Shape{4}));
    ExpectTensorEquals<double>(out, {1, 2, 3, 4});
}

TEST_P(ScanTest, ShortestSequenceSetsStepCount) {
    auto a = input("a", DType::Float64, 1);
    auto b = input("b", DType::Float64, 1);
    auto c = input("c", DType::Float64, 1);
    auto r = scan_map(
        [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
            return {p[0] + p[1] + p[2]};
        },
        {a, b, c});

    auto f = function({a, b, c}, {r.outputs[0]}, {}, config());
    auto out = f({Vec({1, 2, 3, 4, 5}), Vec({10, 20, 30}),
                  Vec({100, 200, 300, 400, 500, 600, 700})})[0];
    ExpectTensorEquals<double>(out, {111, 222, 333});
}

TEST_P(ScanTest, UntilStopsAfterTheStepThatSatisfiesIt) {
    auto x0 = input("x0", DType::Float64, 0);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        auto next = p[0] + 1.0;
        return {next, Until{ge(next, constant(4.0))}};
    };
    spec.outputs_info = {OutputInfo(x0)};
    spec.n_steps = Steps(100);
    auto r = scan(spec);

    auto f = function({x0}, {r.outputs[0]}, {}, config());
    ExpectTensorEquals<double>(f({Tensor::scalar<double>(0.0)})[0],
                               {1, 2, 3, 4});
    ExpectTensorEquals<double>(f({Tensor::scalar<double>(10.0)})[0], {11});
}

TEST_P(ScanTest, ZeroStepsGiveEmptyHistory) {
    auto x0 = input("x0", DType::Float64, 0);
    auto n = input("n", DType::Int64, 0);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] * 2.0};
    };
    spec.outputs_info = {OutputInfo(x0)};
    spec.n_steps = n;
    auto r = scan(spec);

    auto f = function({x0, n}, {r.outputs[0]}, {}, config());
    auto out = f({Tensor::scalar<double>(1.0), Tensor::scalar<int64_t>(0)})[0];
    EXPECT_EQ(out.shape(), (Shape{0}));
}

TEST_P(ScanTest, StepCountBeyondSequenceLengthThrows) {
    auto x = input("x", DType::Float64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] * 2.0};
    };
    spec.sequences = {Sequence{x}};
    spec.n_steps = Steps(5);
    auto r = scan(spec);

    auto f = function({x}, {r.outputs[0]}, {}, config());
    EXPECT_THROW(f({Vec({1, 2, 3})}), ValueError);
    ExpectTensorEquals<double>(f({Vec({1, 2, 3, 4, 5, 6})})[0],
                               {2, 4, 6, 8, 10});
}

// ============================================================================
// Classic loops
// ============================================================================

TEST_P(ScanTest, PowerByRepeatedMultiplication) {
    auto A = input("A", DType::Float64, 1);
    auto k = input("k", DType::Int64, 0);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] * p[1]};
    };
    spec.outputs_info = {OutputInfo(ones_like(A))};
    spec.non_sequences = {A};
    spec.n_steps = k;
    auto r = scan(spec);
    auto power = subtensor(r.outputs[0], 0, -1);

    auto f = function({A, k}, {power}, {}, config());
    auto a = Tensor::arange(10).astype(DType::Float64);
    for (int64_t exponent : {2, 4}) {
        std::vector<double> expected;
        for (int i = 0; i < 10; ++i)
            expected.push_back(std::pow(double(i), double(exponent)));
        ExpectTensorEquals<double>(
            f({a, Tensor::scalar<int64_t>(exponent)})[0], expected, 1e-9);
    }
}

TEST_P(ScanTest, PolynomialEvaluation) {
    auto coefficients = input("coefficients", DType::Float64, 1);
    auto x = input("x", DType::Float64, 0);
    auto exponents = constant(Tensor::arange(1000));
    auto r = scan_map(
        [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
            return {p[0] * pow(p[2], p[1])};
        },
        {coefficients, exponents}, {x}, "polynomial");
    auto value = sum(r.outputs[0]);

    auto f = function({coefficients, x}, {value}, {}, config());
    auto out = f({Vec({1, 0, 2}), Tensor::scalar<double>(3.0)})[0];
    EXPECT_DOUBLE_EQ(out.item<double>(), 19.0);
}

TEST_P(ScanTest, TriangularNumbersFromRunningSum) {
    auto x = input("x", DType::Int64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[1] + p[0]};
    };
    spec.sequences = {Sequence{x}};
    spec.outputs_info = {OutputInfo(constant(int64_t(0)))};
    auto r = scan(spec);

    auto f = function({x}, {r.outputs[0]}, {}, config());
    auto out = f({Tensor::arange(15)})[0];
    std::vector<int64_t> expected;
    for (int64_t n = 0; n < 15; ++n)
        expected.push_back(n * (n + 1) / 2);
    ExpectTensorEquals<int64_t>(out, expected);
}

TEST_P(ScanTest, FoldDirections) {
    auto digits = input("digits", DType::Float64, 1);
    auto step = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[1] * 10.0 + p[0]};
    };
    auto left = foldl(step, {digits}, constant(0.0)).outputs[0];
    auto right = foldr(step, {digits}, constant(0.0)).outputs[0];

    auto f = function({digits}, {left, right}, {}, config());
    auto out = f({Vec({1, 2, 3})});
    EXPECT_DOUBLE_EQ(out[0].item<double>(), 123.0);
    EXPECT_DOUBLE_EQ(out[1].item<double>(), 321.0);
}

TEST_P(ScanTest, GoBackwardsReversesSequences) {
    auto x = input("x", DType::Float64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] * 10.0};
    };
    spec.sequences = {Sequence{x}};
    spec.go_backwards = true;
    auto r = scan(spec);

    auto f = function({x}, {r.outputs[0]}, {}, config());
    ExpectTensorEquals<double>(f({Vec({1, 2, 3})})[0], {30, 20, 10});
}

TEST_P(ScanTest, CapturedOuterVariablesBecomeNonSequences) {
    auto x = input("x", DType::Float64, 1);
    auto w = input("w", DType::Float64, 0);
    auto r = scan_map(
        [&](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
            return {p[0] * w};
        },
        {x});

    auto f = function({x, w}, {r.outputs[0]}, {}, config());
    ExpectTensorEquals<double>(f({Vec({1, 2}), Tensor::scalar<double>(3.0)})[0],
                               {3, 6});
}

// ============================================================================
// Taps
// ============================================================================

TEST_P(ScanTest, OutputTapsReadEarlierSteps) {
    auto init = input("init", DType::Float64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] + p[1]};
    };
    spec.outputs_info = {OutputInfo(init, {-2, -1})};
    spec.n_steps = Steps(8);
    auto r = scan(spec);

    auto f = function({init}, {r.outputs[0]}, {}, config());
    ExpectTensorEquals<double>(f({Vec({0, 1})})[0],
                               {1, 2, 3, 5, 8, 13, 21, 34});
    // Only the trailing two rows of a longer buffer are used
    ExpectTensorEquals<double>(f({Vec({100, 0, 1})})[0],
                               {1, 2, 3, 5, 8, 13, 21, 34});
    EXPECT_THROW(f({Vec({1})}), TapWindowError);
}

TEST_P(ScanTest, SequenceTapsBindNeighbouringRows) {
    auto x = input("x", DType::Float64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[1] - p[0]};
    };
    spec.sequences = {Sequence{x, {-1, 0}}};
    auto r = scan(spec);

    auto f = function({x}, {r.outputs[0]}, {}, config());
    ExpectTensorEquals<double>(f({Vec({1, 4, 9, 16})})[0], {3, 5, 7});
}

// ============================================================================
// Shared state
// ============================================================================

TEST_P(ScanTest, SharedCounterPersistsAcrossCalls) {
    auto counter = shared(Tensor::scalar<int64_t>(0), "counter");
    ScanSpec spec;
    spec.fn = [&](const std::vector<Variable> &) -> std::vector<ScanReturn> {
        return {Updates{{counter, counter + 1.0}}};
    };
    spec.n_steps = Steps(10);
    auto r = scan(spec);
    ASSERT_EQ(r.updates.size(), 1u);
    EXPECT_TRUE(r.outputs.empty());

    auto f = function({}, {}, r.updates, config());
    f({});
    EXPECT_EQ(counter.get_value().item<int64_t>(), 10);
    f({});
    EXPECT_EQ(counter.get_value().item<int64_t>(), 20);

    // A second function over the same variable sees the same state
    auto g = function({}, {}, r.updates, config());
    g({});
    EXPECT_EQ(counter.get_value().item<int64_t>(), 30);
}

TEST_P(ScanTest, SharedOnlySubexpressionIsRecomputedEachStep) {
    auto acc = shared(Vec({1, 1}), "acc");
    auto x = input("x", DType::Float64, 2);
    ScanSpec spec;
    spec.fn = [&](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        // acc * 2.0 reads only the shared variable
        return {Updates{{acc, acc * 2.0 + p[0]}}};
    };
    spec.sequences = {Sequence{x}};
    auto r = scan(spec);

    auto f = function({x}, {}, r.updates, config());
    f({Tensor::zeros({3, 2})});
    ExpectTensorEquals<double>(acc.get_value(), {8, 8});
    f({Mat({1, 2}, 1, 2)});
    ExpectTensorEquals<double>(acc.get_value(), {17, 18});
}

TEST_P(ScanTest, SharedFinalValueIsReturnedAsCopy) {
    auto acc = shared(Vec({0, 0}), "acc");
    auto x = input("x", DType::Float64, 2);
    ScanSpec spec;
    spec.fn = [&](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {Updates{{acc, acc + p[0]}}};
    };
    spec.sequences = {Sequence{x}};
    auto r = scan(spec);

    auto f = function({x}, {r.updates[0].second}, {}, config());
    auto out = f({Mat({1, 2, 3, 4}, 2, 2)})[0];
    ExpectTensorEquals<double>(out, {4, 6});
    // Without an update the shared value itself is unchanged
    ExpectTensorEquals<double>(acc.get_value(), {0, 0});
}

// ============================================================================
// Memory retention
// ============================================================================

TEST_P(ScanTest, LastStepReadsKeepRollingWindow) {
    auto x = input("x", DType::Float64, 1);
    auto step = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[1] + p[0]};
    };
    auto total = foldl(step, {x}, constant(5.0)).outputs[0];

    auto optimized = function({x}, {total}, {}, config(2));
    auto reference = function({x}, {total}, {}, config(0));
    EXPECT_EQ(InfoOf(optimized.graph()).retention, (std::vector<size_t>{1}));
    EXPECT_EQ(InfoOf(reference.graph()).retention, (std::vector<size_t>{0}));

    auto arg = Vec({1, 2, 3, 4});
    EXPECT_DOUBLE_EQ(optimized({arg})[0].item<double>(), 15.0);
    EXPECT_DOUBLE_EQ(reference({arg})[0].item<double>(), 15.0);

}

TEST_P(ScanTest, RollingWindowHoldsOnlyExecutedSteps) {
    auto x = input("x", DType::Float64, 1);
    auto step = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[1] + p[0]};
    };
    auto total = foldl(step, {x}, constant(5.0)).outputs[0];
    auto optimized = function({x}, {total}, {}, config(2));
    auto reference = function({x}, {total}, {}, config(0));
    ASSERT_EQ(InfoOf(optimized.graph()).retention, (std::vector<size_t>{1}));

    // No step ran: both pipelines index an empty history
    auto empty = Tensor::zeros({0});
    EXPECT_THROW(reference({empty}), IndexError);
    EXPECT_THROW(optimized({empty}), IndexError);

    // A tap window longer than the number of executed steps
    auto seed = input("seed", DType::Float64, 1);
    auto n = input("n", DType::Int64, 0);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] + p[1] + p[2]};
    };
    spec.outputs_info = {OutputInfo(seed, {-3, -2, -1})};
    spec.n_steps = n;
    auto last = subtensor(scan(spec).outputs[0], 0, -1);
    auto windowed = function({seed, n}, {last}, {}, config(2));
    auto full = function({seed, n}, {last}, {}, config(0));
    ASSERT_EQ(InfoOf(windowed.graph()).retention, (std::vector<size_t>{3}));

    auto init = Vec({1, 2, 3});
    auto one = Tensor::scalar<int64_t>(1);
    EXPECT_DOUBLE_EQ(windowed({init, one})[0].item<double>(), 6.0);
    EXPECT_DOUBLE_EQ(full({init, one})[0].item<double>(), 6.0);
    EXPECT_THROW(windowed({init, Tensor::scalar<int64_t>(0)}), IndexError);
    EXPECT_THROW(full({init, Tensor::scalar<int64_t>(0)}), IndexError);
}

INSTANTIATE_TEST_SUITE_P(AllModes, ScanTest, ::testing::ValuesIn(AllModes()),
                         ModeName);

TEST(ScanSaveMem, FullHistoryOutputKeepsEveryStep) {
    auto x = input("x", DType::Float64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[1] + p[0]};
    };
    spec.sequences = {Sequence{x}};
    spec.outputs_info = {OutputInfo(constant(0.0))};
    auto history = scan(spec).outputs[0];

    graph::Graph g({x}, {history, subtensor(history, 0, -1)});
    auto after = opt::apply_pass(g, "scan_save_mem", CompileConfig());
    EXPECT_EQ(InfoOf(after).retention, (std::vector<size_t>{0}));
}

TEST(ScanSaveMem, WindowCoversLongestTap) {
    auto init = input("init", DType::Float64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] + p[1] + p[2]};
    };
    spec.outputs_info = {OutputInfo(init, {-3, -2, -1})};
    spec.n_steps = Steps(6);
    auto last = subtensor(scan(spec).outputs[0], 0, -1);

    graph::Graph g({init}, {last});
    auto after = opt::apply_pass(g, "scan_save_mem", CompileConfig());
    EXPECT_EQ(InfoOf(after).retention, (std::vector<size_t>{3}));

    auto f = function({init}, {last}, {}, ConfigFor(ExecutionMode::Compiled));
    // 0 0 1 | 1 2 4 7 13 24
    EXPECT_DOUBLE_EQ(f({Vec({0, 0, 1})})[0].item<double>(), 24.0);
}

// ============================================================================
// Aliasing of scan results
// ============================================================================

TEST(ScanAliasing, HistoriesAreNotDestroyedInPlace) {
    auto x = input("x", DType::Float64, 1);
    auto r = scan_map(
        [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
            return {p[0] * 2.0};
        },
        {x});
    graph::Graph g({x}, {exp(r.outputs[0])});
    auto after = opt::apply_pass(g, "inplace", CompileConfig());
    for (const auto &node : after.apply_nodes()) {
        if (node->op() == OpKind::Exp)
            EXPECT_TRUE(node->destroy_map().empty());
    }
}

TEST(ScanAliasing, SharedFinalOutputsAreGuarded) {
    auto s = shared(Vec({1, 2}), "s");
    ScanSpec spec;
    spec.fn = [&](const std::vector<Variable> &) -> std::vector<ScanReturn> {
        return {Updates{{s, s * 2.0}}};
    };
    spec.n_steps = Steps(3);
    auto r = scan(spec);

    graph::Graph g({}, {r.updates[0].second});
    auto after = opt::apply_pass(g, "output_guard", CompileConfig());
    EXPECT_EQ(after.outputs()[0].op(), OpKind::DeepCopy);
}

TEST(ScanAliasing, InnerGraphsAreOptimizedWithoutInplace) {
    auto x = input("x", DType::Float64, 1);
    auto r = scan_map(
        [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
            return {exp(p[0] * 2.0 + 1.0)};
        },
        {x});
    auto f = function({x}, {r.outputs[0]}, {}, ConfigFor(ExecutionMode::Compiled));

    const auto &inner = InfoOf(f.graph()).inner;
    EXPECT_FALSE(inner.applied_passes().empty());
    EXPECT_FALSE(inner.has_applied("inplace"));
    for (const auto &node : inner.apply_nodes())
        EXPECT_TRUE(node->destroy_map().empty());
    ExpectTensorEquals<double>(f({Vec({0.0})})[0], {std::exp(1.0)}, 1e-12);
}

// ============================================================================
// Declaration errors
// ============================================================================

TEST(ScanSignature, RejectsInvalidTaps) {
    auto x = input("x", DType::Float64, 1);
    auto id = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0]};
    };

    ScanSpec positive;
    positive.fn = id;
    positive.sequences = {Sequence{x, {1}}};
    EXPECT_THROW(scan(positive), ScanSignatureError);

    ScanSpec zero_out;
    zero_out.fn = id;
    zero_out.outputs_info = {OutputInfo(constant(0.0), {0})};
    zero_out.n_steps = Steps(2);
    EXPECT_THROW(scan(zero_out), ScanSignatureError);

    ScanSpec no_initial;
    no_initial.fn = id;
    no_initial.sequences = {Sequence{x}};
    no_initial.outputs_info = {OutputInfo()};
    no_initial.outputs_info[0].taps = {-1};
    EXPECT_THROW(scan(no_initial), ScanSignatureError);
}

TEST(ScanSignature, RejectsReturnMismatches) {
    auto x0 = input("x0", DType::Float64, 0);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] + 1.0};
    };
    spec.outputs_info = {OutputInfo(x0), OutputInfo(x0)};
    spec.n_steps = Steps(3);
    EXPECT_THROW(scan(spec), ScanSignatureError);

    ScanSpec early_until;
    early_until.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {Until{p[0] > 1.0}, p[0] + 1.0};
    };
    early_until.outputs_info = {OutputInfo(x0)};
    early_until.n_steps = Steps(3);
    EXPECT_THROW(scan(early_until), ScanSignatureError);
}

TEST(ScanSignature, RejectsArityAndMissingStepCount) {
    auto x = input("x", DType::Float64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0]};
    };
    spec.sequences = {Sequence{x}};
    spec.fn_arity = 2;
    EXPECT_THROW(scan(spec), ScanSignatureError);

    ScanSpec no_steps;
    no_steps.fn = spec.fn;
    no_steps.outputs_info = {OutputInfo(constant(0.0))};
    EXPECT_THROW(scan(no_steps), ScanSignatureError);
}

TEST(ScanSignature, RejectsTypeChangesAndBadStepCounts) {
    auto x0 = input("x0", DType::Float64, 0);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {cast(p[0], DType::Float32)};
    };
    spec.outputs_info = {OutputInfo(x0)};
    spec.n_steps = Steps(3);
    EXPECT_THROW(scan(spec), TypeShapeError);

    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0]};
    };
    spec.n_steps = Steps(-1);
    EXPECT_THROW(scan(spec), ValueError);
    spec.n_steps = constant(2.0);
    EXPECT_THROW(scan(spec), TypeShapeError);
}
