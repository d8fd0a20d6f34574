// Elementwise fusion benchmarks
// Compares a chain of elementwise nodes run one kernel per node (level 0)
// with the same chain fused into a single composite kernel (level 2).
//
// Usage:
//   ./build/benchmarks/bench_fusion
//   ARBOR_FLAGS=inplace=false ./build/benchmarks/bench_fusion

#include <benchmark/benchmark.h>

#include <arbor/arbor.hpp>
#include <benchmark_utils.hpp>
#include <cstdlib>

using namespace arbor;

namespace {

// tanh(x * y + z) * 0.5 + x
CompiledFunction build_chain(const CompileConfig &config) {
    auto x = input("x", DType::Float64, 1);
    auto y = input("y", DType::Float64, 1);
    auto z = input("z", DType::Float64, 1);
    return function({x, y, z}, {tanh(x * y + z) * 0.5 + x}, {}, config);
}

void run_chain(benchmark::State &state, ExecutionMode mode, int level) {
    const size_t n = static_cast<size_t>(state.range(0));
    CompileConfig config = bench::config_for(mode, level);
    if (const char *flags = std::getenv("ARBOR_FLAGS"))
        config.apply(flags);
    auto f = build_chain(config);

    std::vector<Tensor> args{bench::uniform_vector(n, 1),
                             bench::uniform_vector(n, 2),
                             bench::uniform_vector(n, 3)};

    // Warmup
    for (int i = 0; i < 3; ++i)
        f(args);

    for (auto _ : state) {
        auto out = f(args);
        benchmark::DoNotOptimize(out[0].data());
    }
    bench::set_elementwise_counters(state, static_cast<int64_t>(n), 3,
                                    sizeof(double));
}

} // namespace

// ============================================================================
// Compiled plans
// ============================================================================

static void BM_Chain_Compiled_Unfused(benchmark::State &state) {
    run_chain(state, ExecutionMode::Compiled, 0);
}

static void BM_Chain_Compiled_Fused(benchmark::State &state) {
    run_chain(state, ExecutionMode::Compiled, 2);
}

// ============================================================================
// Reference interpreter
// ============================================================================

static void BM_Chain_Interpreted_Unfused(benchmark::State &state) {
    run_chain(state, ExecutionMode::Interpreted, 0);
}

static void BM_Chain_Interpreted_Fused(benchmark::State &state) {
    run_chain(state, ExecutionMode::Interpreted, 2);
}

BENCHMARK(BM_Chain_Compiled_Unfused)->Apply(bench::vector_args);
BENCHMARK(BM_Chain_Compiled_Fused)->Apply(bench::vector_args);
BENCHMARK(BM_Chain_Interpreted_Unfused)->Apply(bench::vector_args);
BENCHMARK(BM_Chain_Interpreted_Fused)->Apply(bench::vector_args);

// ============================================================================
// Compilation cost
// ============================================================================

static void BM_Compile_Chain(benchmark::State &state) {
    const int level = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto f = build_chain(bench::config_for(ExecutionMode::Compiled, level));
        benchmark::DoNotOptimize(f.graph().nodes().size());
    }
}

BENCHMARK(BM_Compile_Chain)->Arg(0)->Arg(1)->Arg(2);

BENCHMARK_MAIN();
