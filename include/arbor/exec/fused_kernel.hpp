#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "arbor/dtype.hpp"
#include "arbor/graph/composite.hpp"
#include "arbor/tensor.hpp"

namespace arbor {
namespace exec {

// Devirtualized function pointer types for the tiled fused loop.
using UnaryFn = void (*)(const void *in, void *out, size_t n);
using BinaryFn = void (*)(const void *a, const void *b, void *out, size_t n);

// Typed loop for a unary op + dtype, or nullptr if the combination is not
// supported.
UnaryFn get_unary_fn(graph::OpKind op, DType dtype);

// Typed loop for a binary op + dtype, or nullptr if the combination is not
// supported.
BinaryFn get_binary_fn(graph::OpKind op, DType dtype);

// Tile size: 4K elements = 32KB per register for float64
constexpr size_t TILE_ELEMENTS = 4096;

// ============================================================================
// Composite program resolved to typed loops
// ============================================================================

class FusedKernel {
  public:
    explicit FusedKernel(std::shared_ptr<const graph::CompositeProgram> program);

    // False when some instruction has no typed loop for the program dtype;
    // callers then use evaluate_composite.
    bool supported() const { return supported_; }

    const graph::CompositeProgram &program() const { return *program_; }

    // Writes the program result into `out`, which must be contiguous with
    // the broadcast shape of `inputs` and the program dtype. Inputs are
    // read directly when contiguous and full-size, splatted when they hold
    // one element, and materialized otherwise.
    void run(const std::vector<Tensor> &inputs, Tensor &out) const;

  private:
    struct Instr {
        UnaryFn unary = nullptr;
        BinaryFn binary = nullptr;
        graph::CompositeArg a;
        graph::CompositeArg b;
    };

    std::shared_ptr<const graph::CompositeProgram> program_;
    std::vector<Instr> instrs_;
    bool supported_ = true;
};

} // namespace exec
} // namespace arbor
