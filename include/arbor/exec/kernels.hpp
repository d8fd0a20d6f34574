#pragma once

#include <functional>
#include <vector>

#include "arbor/graph/node.hpp"
#include "arbor/tensor.hpp"

namespace arbor {
namespace exec {

// Source of fresh contiguous output buffers. The compiled executor hands
// out pooled storage; the default allocates.
using Allocator = std::function<Tensor(const Shape &, DType)>;

struct KernelOptions {
    const Allocator *alloc = nullptr;
    // When false, destroy_map is ignored and every output is fresh.
    bool allow_inplace = true;
};

struct KernelResult {
    std::vector<Tensor> outputs;
    bool inplace = false; // An output reused a destroyed input's buffer
};

// ============================================================================
// Reference kernels
// ============================================================================

// Evaluates one non-scan node on concrete inputs. Leaves: constants and
// shared values return their current value; inputs are bound by the
// caller and throw here.
KernelResult run_kernel(const graph::Node &node,
                        const std::vector<Tensor> &inputs,
                        const KernelOptions &options = {});

// Elementwise building blocks, also used by constant folding and the
// composite interpreter. `dest`, when given, must have the output shape
// and dtype and a contiguous layout; the result is written into it.
Tensor elementwise_binary(graph::OpKind op, const Tensor &a, const Tensor &b,
                          DType out_dtype, Tensor *dest = nullptr,
                          const Allocator *alloc = nullptr);
Tensor elementwise_unary(graph::OpKind op, const Tensor &a, DType out_dtype,
                         Tensor *dest = nullptr,
                         const Allocator *alloc = nullptr);

// Evaluates a fused program one instruction at a time over whole arrays.
Tensor evaluate_composite(const graph::CompositeProgram &program,
                          const std::vector<Tensor> &inputs,
                          Tensor *dest = nullptr,
                          const Allocator *alloc = nullptr);

// True when `candidate` can receive an output of `shape`/`dtype` in place.
bool can_write_inplace(const Tensor &candidate, const Shape &shape,
                       DType dtype);

// Region of `x` addressed by a subtensor op, as a view.
Tensor subtensor_view(const Tensor &x, const graph::SubtensorParams &p);

// Resolves a single -1 entry against `size`; throws ShapeError.
Shape resolve_reshape(const std::vector<int64_t> &shape, size_t size);

} // namespace exec
} // namespace arbor
