// Scan benchmarks
// Measures loop overhead per step and the effect of keeping a rolling
// window (scan_save_mem) instead of the full output history.
//
// Usage:
//   ./build/benchmarks/bench_scan

#include <benchmark/benchmark.h>

#include <arbor/arbor.hpp>
#include <benchmark_utils.hpp>

using namespace arbor;

namespace {

constexpr size_t kStateSize = 4096;

// Final state of x <- tanh(x * w + b), repeated `steps` times
CompiledFunction build_recurrence(const CompileConfig &config) {
    auto x0 = input("x0", DType::Float64, 1);
    auto w = input("w", DType::Float64, 1);
    auto b = input("b", DType::Float64, 1);
    auto steps = input("steps", DType::Int64, 0);

    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {tanh(p[0] * p[1] + p[2])};
    };
    spec.outputs_info = {OutputInfo(x0)};
    spec.non_sequences = {w, b};
    spec.n_steps = steps;
    spec.name = "recurrence";
    auto history = scan(spec).outputs[0];
    return function({x0, w, b, steps}, {subtensor(history, 0, -1)}, {}, config);
}

void run_recurrence(benchmark::State &state, ExecutionMode mode, int level) {
    const int64_t steps = state.range(0);
    auto f = build_recurrence(bench::config_for(mode, level));
    std::vector<Tensor> args{bench::uniform_vector(kStateSize, 1),
                             bench::uniform_vector(kStateSize, 2),
                             bench::uniform_vector(kStateSize, 3),
                             Tensor::scalar<int64_t>(steps)};

    for (auto _ : state) {
        auto out = f(args);
        benchmark::DoNotOptimize(out[0].data());
    }
    state.counters["Steps"] = static_cast<double>(steps);
    state.counters["StepRate"] =
        benchmark::Counter(static_cast<double>(steps),
                           benchmark::Counter::kIsIterationInvariantRate);
}

} // namespace

// ============================================================================
// Output retention
// ============================================================================

// Level 0 keeps every step of the history
static void BM_Scan_FullHistory(benchmark::State &state) {
    run_recurrence(state, ExecutionMode::Compiled, 0);
}

// Level 2 keeps only the last step
static void BM_Scan_RollingWindow(benchmark::State &state) {
    run_recurrence(state, ExecutionMode::Compiled, 2);
}

static void BM_Scan_Interpreted(benchmark::State &state) {
    run_recurrence(state, ExecutionMode::Interpreted, 2);
}

BENCHMARK(BM_Scan_FullHistory)->Apply(bench::step_args);
BENCHMARK(BM_Scan_RollingWindow)->Apply(bench::step_args);
BENCHMARK(BM_Scan_Interpreted)->Apply(bench::step_args);

// ============================================================================
// Per-step overhead on tiny states
// ============================================================================

static void BM_Scan_CumulativeSum(benchmark::State &state) {
    const int64_t n = state.range(0);
    auto x = input("x", DType::Float64, 1);
    ScanSpec spec;
    spec.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[1] + p[0]};
    };
    spec.sequences = {Sequence{x}};
    spec.outputs_info = {OutputInfo(constant(0.0))};
    auto f = function({x}, {scan(spec).outputs[0]});
    std::vector<Tensor> args{bench::uniform_vector(static_cast<size_t>(n))};

    for (auto _ : state) {
        auto out = f(args);
        benchmark::DoNotOptimize(out[0].data());
    }
    state.SetItemsProcessed(state.iterations() * n);
}

BENCHMARK(BM_Scan_CumulativeSum)->Apply(bench::step_args);

BENCHMARK_MAIN();
