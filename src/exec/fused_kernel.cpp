#include "arbor/exec/fused_kernel.hpp"
#include "arbor/error.hpp"
#include "arbor/exec/scalar_ops.hpp"
#include "arbor/parallel.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <type_traits>

#ifdef ARBOR_USE_XSIMD
#include <xsimd/xsimd.hpp>
#endif

namespace arbor {
namespace exec {

namespace {

// ============================================================================
// Typed loops over one tile
// ============================================================================

#ifdef ARBOR_USE_XSIMD
// Ops with a plain vector equivalent; the rest stay scalar.
template <typename Op> struct SimdArith : std::false_type {};

template <> struct SimdArith<scalar::Add> : std::true_type {
    template <typename B> static B apply(const B &a, const B &b) { return a + b; }
};
template <> struct SimdArith<scalar::Sub> : std::true_type {
    template <typename B> static B apply(const B &a, const B &b) { return a - b; }
};
template <> struct SimdArith<scalar::Mul> : std::true_type {
    template <typename B> static B apply(const B &a, const B &b) { return a * b; }
};
template <> struct SimdArith<scalar::TrueDiv> : std::true_type {
    template <typename B> static B apply(const B &a, const B &b) { return a / b; }
};
#endif

template <typename T, typename Op>
void binary_loop(const void *a, const void *b, void *out, size_t n) {
    const T *pa = static_cast<const T *>(a);
    const T *pb = static_cast<const T *>(b);
    T *po = static_cast<T *>(out);
    size_t i = 0;
#ifdef ARBOR_USE_XSIMD
    if constexpr (std::is_floating_point_v<T> && SimdArith<Op>::value) {
        using batch = xsimd::batch<T>;
        constexpr size_t W = batch::size;
        for (; i + W <= n; i += W) {
            batch va = batch::load_unaligned(pa + i);
            batch vb = batch::load_unaligned(pb + i);
            SimdArith<Op>::apply(va, vb).store_unaligned(po + i);
        }
    }
#endif
    for (; i < n; ++i)
        po[i] = static_cast<T>(Op::template apply<T>(pa[i], pb[i]));
}

template <typename T, typename Op>
void unary_loop(const void *in, void *out, size_t n) {
    const T *pi = static_cast<const T *>(in);
    T *po = static_cast<T *>(out);
    for (size_t i = 0; i < n; ++i)
        po[i] = static_cast<T>(Op::template apply<T>(pi[i]));
}

// Scratch tile for one register
struct alignas(64) TileBuffer {
    char data[TILE_ELEMENTS * sizeof(double)]; // worst case: float64
};

} // namespace

// ============================================================================
// Dispatch tables
// ============================================================================

UnaryFn get_unary_fn(graph::OpKind op, DType dtype) {
    if (!graph::is_unary_op(op) || !graph::is_fusable_op(op))
        return nullptr;
    return dispatch_unary_op(op, [dtype](auto functor) -> UnaryFn {
        using Op = decltype(functor);
        return dispatch_dtype(dtype, [](auto tag) -> UnaryFn {
            using T = typename decltype(tag)::type;
            return &unary_loop<T, Op>;
        });
    });
}

BinaryFn get_binary_fn(graph::OpKind op, DType dtype) {
    if (!graph::is_binary_op(op) || !graph::is_fusable_op(op))
        return nullptr;
    return dispatch_binary_op(op, [dtype](auto functor) -> BinaryFn {
        using Op = decltype(functor);
        return dispatch_dtype(dtype, [](auto tag) -> BinaryFn {
            using T = typename decltype(tag)::type;
            return &binary_loop<T, Op>;
        });
    });
}

// ============================================================================
// FusedKernel
// ============================================================================

FusedKernel::FusedKernel(std::shared_ptr<const graph::CompositeProgram> program)
    : program_(std::move(program)) {
    program_->validate();
    instrs_.reserve(program_->instrs.size());
    for (const auto &ci : program_->instrs) {
        Instr instr;
        instr.a = ci.args[0];
        if (graph::is_unary_op(ci.op)) {
            instr.unary = get_unary_fn(ci.op, program_->dtype);
            supported_ = supported_ && instr.unary != nullptr;
        } else {
            instr.b = ci.args[1];
            instr.binary = get_binary_fn(ci.op, program_->dtype);
            supported_ = supported_ && instr.binary != nullptr;
        }
        instrs_.push_back(instr);
    }
}

void FusedKernel::run(const std::vector<Tensor> &inputs, Tensor &out) const {
    if (!supported_)
        throw RuntimeError::internal("fused kernel cannot run " +
                                     program_->str());
    if (inputs.size() != program_->n_inputs)
        throw RuntimeError::internal("fused kernel expects " +
                                     std::to_string(program_->n_inputs) +
                                     " inputs, got " +
                                     std::to_string(inputs.size()));

    const DType dtype = program_->dtype;
    const size_t elem_size = dtype_size(dtype);
    const size_t total = out.size();
    if (total == 0)
        return;

    // Resolve every input to a full-size pointer or a splatted tile
    struct Source {
        const char *ptr = nullptr;
        bool splat = false;
    };
    std::vector<Tensor> held;
    held.reserve(inputs.size());
    std::vector<Source> sources(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        Tensor in = inputs[i].dtype() == dtype ? inputs[i] : inputs[i].astype(dtype);
        if (in.size() == 1 && total > 1) {
            Tensor tile(Shape{TILE_ELEMENTS}, dtype);
            tile.copy_from(in.reshape(Shape{1}));
            in = tile;
            sources[i].splat = true;
        } else if (!in.is_contiguous() || in.shape() != out.shape()) {
            in = in.broadcast_to(out.shape()).contiguous();
        }
        held.push_back(in);
        sources[i].ptr = static_cast<const char *>(held.back().data());
    }

    char *out_ptr = static_cast<char *>(out.data());
    const size_t n_regs = instrs_.size();
    const size_t tile_size = std::min(TILE_ELEMENTS, total);

    auto process_tile = [&](size_t base, size_t count, TileBuffer *regs) {
        auto operand = [&](const graph::CompositeArg &arg) -> const void * {
            if (arg.kind == graph::CompositeArg::Kind::Register)
                return regs[arg.index].data;
            const Source &s = sources[static_cast<size_t>(arg.index)];
            return s.splat ? s.ptr : s.ptr + base * elem_size;
        };
        for (size_t r = 0; r < n_regs; ++r) {
            const Instr &instr = instrs_[r];
            void *dst = (r + 1 == n_regs) ? out_ptr + base * elem_size
                                          : regs[r].data;
            if (instr.unary)
                instr.unary(operand(instr.a), dst, count);
            else
                instr.binary(operand(instr.a), operand(instr.b), dst, count);
        }
    };

    const size_t n_buffers = std::max<size_t>(n_regs - 1, 1);
    const ptrdiff_t num_tiles =
        static_cast<ptrdiff_t>((total + tile_size - 1) / tile_size);

    if (parallel::should_parallelize(total)) {
#pragma omp parallel
        {
            std::unique_ptr<TileBuffer[]> regs(new TileBuffer[n_buffers]);
#pragma omp for schedule(static)
            for (ptrdiff_t ti = 0; ti < num_tiles; ++ti) {
                size_t base = static_cast<size_t>(ti) * tile_size;
                process_tile(base, std::min(tile_size, total - base),
                             regs.get());
            }
        }
    } else {
        std::unique_ptr<TileBuffer[]> regs(new TileBuffer[n_buffers]);
        for (size_t base = 0; base < total; base += tile_size)
            process_tile(base, std::min(tile_size, total - base), regs.get());
    }
}

} // namespace exec
} // namespace arbor
