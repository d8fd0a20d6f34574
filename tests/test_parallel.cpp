#include "arbor_test_utils.hpp"

#include "arbor/parallel.hpp"

#include <cmath>

using namespace arbor;
using namespace arbor::testing;

namespace {

// Pins the OpenMP thread count for a scope
class ScopedThreads {
  public:
    explicit ScopedThreads(size_t n) : prev_(parallel::max_threads()) {
#ifdef ARBOR_USE_OPENMP
        omp_set_num_threads(static_cast<int>(n));
#else
        (void)n;
#endif
    }
    ~ScopedThreads() {
#ifdef ARBOR_USE_OPENMP
        omp_set_num_threads(static_cast<int>(prev_));
#endif
    }
    ScopedThreads(const ScopedThreads &) = delete;
    ScopedThreads &operator=(const ScopedThreads &) = delete;

  private:
    size_t prev_;
};

} // namespace

TEST(Parallel, ShouldParallelize) {
    const size_t orig_threads = parallel::max_threads();
    EXPECT_GE(orig_threads, 1u);

    // Small loops always stay serial
    EXPECT_FALSE(parallel::should_parallelize(100));
    EXPECT_FALSE(
        parallel::should_parallelize(parallel::DEFAULT_MIN_ELEMENTS - 1));
    EXPECT_FALSE(parallel::should_parallelize(100, 1000));

#ifdef ARBOR_USE_OPENMP
    {
        ScopedThreads threads(2);
        EXPECT_EQ(parallel::max_threads(), 2u);
        EXPECT_TRUE(parallel::should_parallelize(1 << 20));
        EXPECT_TRUE(parallel::should_parallelize(1000, 1000));
    }
#else
    EXPECT_EQ(orig_threads, 1u);
    EXPECT_FALSE(parallel::should_parallelize(1 << 20));
#endif
    {
        ScopedThreads threads(1);
        EXPECT_FALSE(parallel::should_parallelize(1 << 20));
    }
    EXPECT_EQ(parallel::max_threads(), orig_threads);
}

class ParallelKernels : public ModeTest {};

TEST_P(ParallelKernels, LargeInputsMatchSerialResults) {
    const int64_t n = int64_t(parallel::DEFAULT_MIN_ELEMENTS) * 4;
    auto x = input("x", DType::Float64, 1);
    auto y = input("y", DType::Float64, 1);
    // Fused at level 2, one kernel per node at level 0
    auto expr = tanh(x * 0.001) + y * 2.0;
    auto fused = function({x, y}, {expr, sum(expr)}, {}, config(2));
    auto plain = function({x, y}, {expr, sum(expr)}, {}, config(0));

    auto a = Tensor::arange(n).astype(DType::Float64);
    auto b = Tensor::ones({size_t(n)});

    std::vector<Tensor> serial;
    {
        ScopedThreads threads(1);
        serial = plain({a, b});
    }
    for (const auto *f : {&fused, &plain}) {
        auto threaded = (*f)({a, b});
        ExpectTensorsClose(threaded[0], serial[0], 1e-12, 1e-12);
        EXPECT_NEAR(threaded[1].item<double>(), serial[1].item<double>(),
                    1e-9 * std::abs(serial[1].item<double>()));
    }
}

INSTANTIATE_TEST_SUITE_P(AllModes, ParallelKernels,
                         ::testing::ValuesIn(AllModes()), ModeName);
