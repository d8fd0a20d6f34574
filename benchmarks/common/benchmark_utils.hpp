#pragma once

#include <benchmark/benchmark.h>

#include <arbor/arbor.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace arbor::bench {

// ============================================================================
// Standard Sizes for Benchmarking
// ============================================================================

// Elementwise vector lengths: overhead-dominated up to bandwidth-bound
constexpr int kVectorSizes[] = {1 << 10, 1 << 14, 1 << 18, 1 << 22};

// Scan step counts
constexpr int kStepCounts[] = {16, 128, 1024};

// ============================================================================
// Configurations
// ============================================================================

inline CompileConfig config_for(ExecutionMode mode, int level) {
    CompileConfig config;
    config.execution_mode = mode;
    config.optimization_level = level;
    return config;
}

/// Deterministic pseudo-random inputs in [-1, 1)
inline Tensor uniform_vector(size_t n, uint64_t seed = 42) {
    std::vector<double> values(n);
    uint64_t state = seed;
    for (auto &v : values) {
        state = state * 6364136223846793005ULL + 1442695040888963407ULL;
        v = static_cast<double>(state >> 11) / static_cast<double>(1ULL << 53) *
                2.0 -
            1.0;
    }
    return Tensor::from_vector(values);
}

// ============================================================================
// Registration Helpers
// ============================================================================

inline void vector_args(benchmark::internal::Benchmark *b) {
    for (int size : kVectorSizes)
        b->Arg(size);
}

inline void step_args(benchmark::internal::Benchmark *b) {
    for (int steps : kStepCounts)
        b->Arg(steps);
}

// ============================================================================
// Benchmark State Helpers
// ============================================================================

/// Bytes read and written per iteration for an elementwise expression
inline void set_elementwise_counters(benchmark::State &state, int64_t n,
                                     int n_inputs, size_t element_bytes) {
    state.counters["Elements"] = static_cast<double>(n);
    int64_t bytes = static_cast<int64_t>(element_bytes) * n * (n_inputs + 1);
    state.counters["Bandwidth"] =
        benchmark::Counter(static_cast<double>(bytes),
                           benchmark::Counter::kIsIterationInvariantRate,
                           benchmark::Counter::kIs1024);
}

} // namespace arbor::bench
