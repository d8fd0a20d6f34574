#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "arbor/shape.hpp"

namespace arbor {

// ============================================================================
// Row-major walk over `shape` for N operands with independent strides
// ============================================================================

// Calls fn(offsets) once per element, where offsets[k] is the element offset
// of operand k (base[k] + sum(index[d] * strides[k][d])). Strides must all
// have shape.size() entries; broadcast dimensions use stride 0.
template <size_t N, typename Fn>
void strided_for_each(const Shape &shape,
                      const std::array<const Strides *, N> &strides,
                      std::array<int64_t, N> base, Fn &&fn) {
    const size_t ndim = shape.size();
    for (size_t d : shape) {
        if (d == 0)
            return;
    }
    if (ndim == 0) {
        fn(base);
        return;
    }

    const size_t inner = shape[ndim - 1];
    std::array<int64_t, N> inner_stride;
    for (size_t k = 0; k < N; ++k)
        inner_stride[k] = (*strides[k])[ndim - 1];

    std::vector<size_t> index(ndim, 0);
    std::array<int64_t, N> offsets = base;

    while (true) {
        std::array<int64_t, N> cur = offsets;
        for (size_t i = 0; i < inner; ++i) {
            fn(cur);
            for (size_t k = 0; k < N; ++k)
                cur[k] += inner_stride[k];
        }

        // Carry into the outer dimensions
        size_t d = ndim - 1;
        while (d-- > 0) {
            ++index[d];
            for (size_t k = 0; k < N; ++k)
                offsets[k] += (*strides[k])[d];
            if (index[d] < shape[d])
                break;
            for (size_t k = 0; k < N; ++k)
                offsets[k] -=
                    (*strides[k])[d] * static_cast<int64_t>(shape[d]);
            index[d] = 0;
            if (d == 0)
                return;
        }
        if (ndim == 1)
            return;
    }
}

} // namespace arbor
