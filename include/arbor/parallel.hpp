#pragma once

#include <cstddef>

#ifdef ARBOR_USE_OPENMP
#include <omp.h>
#endif

namespace arbor {
namespace parallel {

// Elementwise loops and fused tiles below this many elements stay serial.
constexpr size_t DEFAULT_MIN_ELEMENTS = 65536;

// Threads an OpenMP region started now would use; 1 without OpenMP.
inline size_t max_threads() {
#ifdef ARBOR_USE_OPENMP
    return static_cast<size_t>(omp_get_max_threads());
#else
    return 1;
#endif
}

// Kernels pass this as the `if` clause of their `omp parallel` pragmas.
inline bool should_parallelize(size_t elements,
                               size_t min_elements = DEFAULT_MIN_ELEMENTS) {
    return elements >= min_elements && max_threads() > 1;
}

} // namespace parallel
} // namespace arbor
