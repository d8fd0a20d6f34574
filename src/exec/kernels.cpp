#include "arbor/exec/kernels.hpp"
#include "arbor/exec/scalar_ops.hpp"
#include "arbor/parallel.hpp"
#include "arbor/strided.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace arbor {
namespace exec {

using graph::OpKind;

namespace {

Tensor allocate(const Shape &shape, DType dtype, const Allocator *alloc) {
    if (alloc && *alloc)
        return (*alloc)(shape, dtype);
    return Tensor(shape, dtype);
}

Tensor as_dtype(const Tensor &t, DType dtype) {
    return t.dtype() == dtype ? t : t.astype(dtype);
}

Tensor output_buffer(const Shape &shape, DType dtype, Tensor *dest,
                     const Allocator *alloc) {
    if (dest) {
        if (!can_write_inplace(*dest, shape, dtype))
            throw RuntimeError::internal(
                "in-place destination does not match the output layout");
        return *dest;
    }
    return allocate(shape, dtype, alloc);
}

} // namespace

bool can_write_inplace(const Tensor &candidate, const Shape &shape,
                       DType dtype) {
    return candidate.defined() && candidate.dtype() == dtype &&
           candidate.shape() == shape && candidate.is_contiguous();
}

// ============================================================================
// Elementwise
// ============================================================================

Tensor elementwise_binary(OpKind op, const Tensor &a, const Tensor &b,
                          DType out_dtype, Tensor *dest,
                          const Allocator *alloc) {
    DType compute = out_dtype;
    if (graph::is_comparison_op(op))
        compute = promote_types(a.dtype(), b.dtype());
    else if (graph::is_logical_op(op))
        compute = DType::Bool;

    Tensor lhs = as_dtype(a, compute);
    Tensor rhs = as_dtype(b, compute);
    Shape shape = ShapeUtils::broadcast_shape(lhs.shape(), rhs.shape());
    Tensor out = output_buffer(shape, out_dtype, dest, alloc);

    const size_t n = ShapeUtils::size(shape);
    const bool flat = lhs.is_contiguous() && rhs.is_contiguous() &&
                      lhs.shape() == shape && rhs.shape() == shape;

    dispatch_dtype(compute, [&](auto tag) {
        using T = typename decltype(tag)::type;
        dispatch_binary_op(op, [&](auto fn) {
            using F = decltype(fn);
            using R = decltype(F::template apply<T>(T{}, T{}));
            if (out.dtype() != dtype_of_v<R>)
                throw RuntimeError::internal(
                    std::string(graph::op_name(op)) +
                    ": output dtype does not match the kernel result");
            const T *pa = static_cast<const T *>(lhs.data());
            const T *pb = static_cast<const T *>(rhs.data());
            R *po = static_cast<R *>(out.data());

            if (flat) {
                const int64_t count = static_cast<int64_t>(n);
#ifdef ARBOR_USE_OPENMP
#pragma omp parallel for if (parallel::should_parallelize(n))
#endif
                for (int64_t i = 0; i < count; ++i)
                    po[i] = F::apply(pa[i], pb[i]);
                return;
            }

            Strides sa = ShapeUtils::broadcast_strides(lhs.shape(),
                                                       lhs.strides(), shape);
            Strides sb = ShapeUtils::broadcast_strides(rhs.shape(),
                                                       rhs.strides(), shape);
            strided_for_each<3>(
                shape, {&out.strides(), &sa, &sb}, {0, 0, 0},
                [&](const std::array<int64_t, 3> &off) {
                    po[off[0]] = F::apply(pa[off[1]], pb[off[2]]);
                });
        });
    });
    return out;
}

Tensor elementwise_unary(OpKind op, const Tensor &a, DType out_dtype,
                         Tensor *dest, const Allocator *alloc) {
    Tensor in = as_dtype(a, op == OpKind::Not ? DType::Bool : out_dtype);
    Tensor out = output_buffer(in.shape(), out_dtype, dest, alloc);
    const size_t n = in.size();

    dispatch_dtype(out_dtype, [&](auto tag) {
        using T = typename decltype(tag)::type;
        dispatch_unary_op(op, [&](auto fn) {
            using F = decltype(fn);
            const T *pa = static_cast<const T *>(in.data());
            T *po = static_cast<T *>(out.data());
            if (in.is_contiguous()) {
                const int64_t count = static_cast<int64_t>(n);
#ifdef ARBOR_USE_OPENMP
#pragma omp parallel for if (parallel::should_parallelize(n))
#endif
                for (int64_t i = 0; i < count; ++i)
                    po[i] = F::template apply<T>(pa[i]);
                return;
            }
            strided_for_each<2>(in.shape(), {&out.strides(), &in.strides()},
                                {0, 0},
                                [&](const std::array<int64_t, 2> &off) {
                                    po[off[0]] =
                                        F::template apply<T>(pa[off[1]]);
                                });
        });
    });
    return out;
}

Tensor evaluate_composite(const graph::CompositeProgram &program,
                          const std::vector<Tensor> &inputs, Tensor *dest,
                          const Allocator *alloc) {
    if (inputs.size() != program.n_inputs)
        throw RuntimeError::internal("composite expects " +
                                     std::to_string(program.n_inputs) +
                                     " inputs, got " +
                                     std::to_string(inputs.size()));
    std::vector<Tensor> regs;
    regs.reserve(program.instrs.size());
    auto operand = [&](const graph::CompositeArg &arg) -> const Tensor & {
        return arg.kind == graph::CompositeArg::Kind::Input ? inputs[arg.index]
                                                            : regs[arg.index];
    };

    for (size_t i = 0; i < program.instrs.size(); ++i) {
        const auto &instr = program.instrs[i];
        if (instr.args.size() == 2)
            regs.push_back(elementwise_binary(instr.op, operand(instr.args[0]),
                                              operand(instr.args[1]),
                                              program.dtype));
        else
            regs.push_back(elementwise_unary(instr.op, operand(instr.args[0]),
                                             program.dtype));
    }

    // Registers may broadcast smaller than the full output when the last
    // instruction reads only some inputs.
    Shape shape;
    for (const auto &in : inputs)
        shape = ShapeUtils::broadcast_shape(shape, in.shape());
    Tensor out = output_buffer(shape, program.dtype, dest, alloc);
    out.copy_from(regs.back());
    return out;
}

// ============================================================================
// Reductions
// ============================================================================

namespace {

struct ReduceGeometry {
    Shape keep_shape; // Reduced axes kept with length 1
    Shape out_shape;
    Strides in_to_out; // Output offsets in the input's index space
    size_t count = 1;  // Elements folded into each output
};

ReduceGeometry reduce_geometry(const Shape &in_shape,
                               const graph::ReduceParams &p) {
    ReduceGeometry g;
    std::vector<bool> reduced(in_shape.size(), p.axes.empty());
    for (int ax : p.axes)
        reduced[ax] = true;

    g.keep_shape = in_shape;
    for (size_t d = 0; d < in_shape.size(); ++d) {
        if (reduced[d]) {
            g.count *= in_shape[d];
            g.keep_shape[d] = 1;
        } else {
            g.out_shape.push_back(in_shape[d]);
        }
    }
    if (p.keepdims)
        g.out_shape = g.keep_shape;

    g.in_to_out = ShapeUtils::contiguous_strides(g.keep_shape);
    for (size_t d = 0; d < in_shape.size(); ++d) {
        if (reduced[d])
            g.in_to_out[d] = 0;
    }
    return g;
}

Tensor reduce(OpKind op, const Tensor &x, const graph::ReduceParams &p,
              DType out_dtype, const Allocator *alloc) {
    ReduceGeometry g = reduce_geometry(x.shape(), p);
    const size_t out_size = ShapeUtils::size(g.out_shape);
    if ((op == OpKind::Max || op == OpKind::Min) && g.count == 0 &&
        out_size > 0)
        throw ValueError(std::string("zero-size array to reduction ") +
                         graph::op_name(op) + " which has no identity");

    Tensor in = as_dtype(x, out_dtype);
    Tensor out = allocate(g.out_shape, out_dtype, alloc);

    dispatch_dtype(out_dtype, [&](auto tag) {
        using T = typename decltype(tag)::type;
        const T *src = static_cast<const T *>(in.data());
        T *dst = static_cast<T *>(out.data());

        T init{};
        if (op == OpKind::Prod)
            init = T(1);
        else if (op == OpKind::Max)
            init = std::numeric_limits<T>::lowest();
        else if (op == OpKind::Min)
            init = std::numeric_limits<T>::max();
        std::fill(dst, dst + out_size, init);

        Strides out_strides = g.in_to_out;
        strided_for_each<2>(
            in.shape(), {&in.strides(), &out_strides}, {0, 0},
            [&](const std::array<int64_t, 2> &off) {
                T v = src[off[0]];
                T &acc = dst[off[1]];
                switch (op) {
                case OpKind::Sum:
                case OpKind::Mean:
                    acc = scalar::Add::apply<T>(acc, v);
                    break;
                case OpKind::Prod:
                    acc = scalar::Mul::apply<T>(acc, v);
                    break;
                case OpKind::Max:
                    acc = scalar::Maximum::apply<T>(acc, v);
                    break;
                case OpKind::Min:
                    acc = scalar::Minimum::apply<T>(acc, v);
                    break;
                default:
                    break;
                }
            });

        if (op == OpKind::Mean) {
            for (size_t i = 0; i < out_size; ++i) {
                if constexpr (std::is_floating_point_v<T>)
                    dst[i] = g.count ? dst[i] / static_cast<T>(g.count)
                                     : std::numeric_limits<T>::quiet_NaN();
            }
        }
    });
    return out;
}

// ============================================================================
// Dot
// ============================================================================

Tensor dot(const Tensor &a, const Tensor &b, DType out_dtype,
           const Allocator *alloc) {
    Tensor lhs = as_dtype(a, out_dtype).contiguous();
    Tensor rhs = as_dtype(b, out_dtype).contiguous();

    // Promote to matrices: (m, k) x (k, n)
    size_t m = lhs.ndim() == 2 ? lhs.shape()[0] : 1;
    size_t k = lhs.shape().back();
    size_t kb = rhs.shape()[0];
    size_t n = rhs.ndim() == 2 ? rhs.shape()[1] : 1;
    if (k != kb)
        throw ShapeError("dot: shapes " + ShapeUtils::to_string(lhs.shape()) +
                         " and " + ShapeUtils::to_string(rhs.shape()) +
                         " not aligned");

    Shape shape;
    if (lhs.ndim() == 2)
        shape.push_back(m);
    if (rhs.ndim() == 2)
        shape.push_back(n);
    Tensor out = allocate(shape, out_dtype, alloc);

    dispatch_dtype(out_dtype, [&](auto tag) {
        using T = typename decltype(tag)::type;
        const T *pa = static_cast<const T *>(lhs.data());
        const T *pb = static_cast<const T *>(rhs.data());
        T *po = static_cast<T *>(out.data());
        std::fill(po, po + m * n, T{});
        for (size_t i = 0; i < m; ++i) {
            for (size_t p = 0; p < k; ++p) {
                T av = pa[i * k + p];
                for (size_t j = 0; j < n; ++j)
                    po[i * n + j] = scalar::Add::apply<T>(
                        po[i * n + j], scalar::Mul::apply<T>(av, pb[p * n + j]));
            }
        }
    });
    return out;
}

// ============================================================================
// Structural
// ============================================================================

Tensor dimshuffle(const Tensor &x, const std::vector<int> &pattern) {
    std::vector<bool> used(x.ndim(), false);
    Shape shape;
    Strides strides;
    for (int ax : pattern) {
        if (ax < 0) {
            shape.push_back(1);
            strides.push_back(0);
        } else {
            used[ax] = true;
            shape.push_back(x.shape()[ax]);
            strides.push_back(x.strides()[ax]);
        }
    }
    for (size_t d = 0; d < x.ndim(); ++d) {
        if (!used[d] && x.shape()[d] != 1)
            throw ShapeError("dimshuffle: dropped axis " + std::to_string(d) +
                             " has length " + std::to_string(x.shape()[d]) +
                             ", expected 1");
    }
    return Tensor(x.storage(), shape, strides, x.dtype(), x.offset());
}

Tensor update_subtensor(const graph::Node &node,
                        const std::vector<Tensor> &inputs, bool inplace,
                        const Allocator *alloc) {
    const auto &p = graph::get_params<graph::SubtensorParams>(node.params());
    const Tensor &x = inputs[0];
    Tensor out;
    if (inplace) {
        out = x;
    } else {
        out = allocate(x.shape(), x.dtype(), alloc);
        out.copy_from(x);
    }
    Tensor region = subtensor_view(out, p);
    if (node.op() == OpKind::SetSubtensor) {
        region.copy_from(inputs[1]);
    } else {
        Tensor sum = elementwise_binary(OpKind::Add, region, inputs[1],
                                        region.dtype());
        region.copy_from(sum);
    }
    return out;
}

} // namespace

Tensor subtensor_view(const Tensor &x, const graph::SubtensorParams &p) {
    if (p.is_index)
        return x.index(p.axis, p.index);
    return x.slice(p.axis, p.start, p.stop, p.step);
}

Shape resolve_reshape(const std::vector<int64_t> &shape, size_t size) {
    Shape result(shape.size());
    int infer = -1;
    size_t known = 1;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] == -1) {
            if (infer >= 0)
                throw ShapeError("reshape: only one dimension can be -1");
            infer = static_cast<int>(i);
        } else if (shape[i] < 0) {
            throw ShapeError("reshape: negative dimension " +
                             std::to_string(shape[i]));
        } else {
            result[i] = static_cast<size_t>(shape[i]);
            known *= result[i];
        }
    }
    if (infer >= 0) {
        if (known == 0 || size % known != 0)
            throw ShapeError::invalid_reshape(size, known);
        result[infer] = size / known;
    }
    return result;
}

// ============================================================================
// Node dispatch
// ============================================================================

KernelResult run_kernel(const graph::Node &node,
                        const std::vector<Tensor> &inputs,
                        const KernelOptions &options) {
    const OpKind op = node.op();
    const DType out_dtype = node.outputs()[0].dtype;
    const Allocator *alloc = options.alloc;
    KernelResult result;

    // Destroyed input that can take the output, or an undefined tensor
    auto inplace_target = [&](const Shape &shape) -> Tensor {
        if (!options.allow_inplace)
            return Tensor();
        auto in = node.destroyed_input(0);
        if (!in || !can_write_inplace(inputs[*in], shape, out_dtype))
            return Tensor();
        return inputs[*in];
    };

    switch (op) {
    case OpKind::Input:
        throw RuntimeError::internal("input " + node.output(0).str() +
                                     " must be bound by the executor");
    case OpKind::Constant:
        result.outputs.push_back(
            graph::get_params<graph::ConstantParams>(node.params()).value);
        return result;
    case OpKind::Shared:
        result.outputs.push_back(
            graph::get_params<graph::SharedParams>(node.params())
                .state->get_value());
        return result;
    case OpKind::Scan:
        throw RuntimeError::internal("scan nodes run through the scan runner");
    default:
        break;
    }

    if (graph::is_binary_op(op)) {
        Shape shape =
            ShapeUtils::broadcast_shape(inputs[0].shape(), inputs[1].shape());
        Tensor target = inplace_target(shape);
        Tensor *dest = target.defined() ? &target : nullptr;
        result.inplace = dest != nullptr;
        result.outputs.push_back(elementwise_binary(op, inputs[0], inputs[1],
                                                    out_dtype, dest, alloc));
        return result;
    }
    if (graph::is_unary_op(op) && op != OpKind::Cast &&
        op != OpKind::FillLike) {
        Tensor target = inplace_target(inputs[0].shape());
        Tensor *dest = target.defined() ? &target : nullptr;
        result.inplace = dest != nullptr;
        result.outputs.push_back(
            elementwise_unary(op, inputs[0], out_dtype, dest, alloc));
        return result;
    }
    if (graph::is_reduction_op(op)) {
        result.outputs.push_back(
            reduce(op, inputs[0],
                   graph::get_params<graph::ReduceParams>(node.params()),
                   out_dtype, alloc));
        return result;
    }

    switch (op) {
    case OpKind::Cast: {
        Tensor out = allocate(inputs[0].shape(), out_dtype, alloc);
        out.copy_from(inputs[0]);
        result.outputs.push_back(out);
        break;
    }
    case OpKind::FillLike: {
        const auto &p = graph::get_params<graph::FillParams>(node.params());
        Tensor out = allocate(inputs[0].shape(), p.dtype, alloc);
        out.fill<double>(p.value);
        result.outputs.push_back(out);
        break;
    }
    case OpKind::Switch: {
        const Tensor &cond = inputs[0];
        Tensor a = as_dtype(inputs[1], out_dtype);
        Tensor b = as_dtype(inputs[2], out_dtype);
        Shape shape = ShapeUtils::broadcast_shape(
            cond.shape(), ShapeUtils::broadcast_shape(a.shape(), b.shape()));
        Tensor target = inplace_target(shape);
        Tensor *dest = target.defined() ? &target : nullptr;
        result.inplace = dest != nullptr;
        Tensor out = output_buffer(shape, out_dtype, dest, alloc);
        Strides sc = ShapeUtils::broadcast_strides(cond.shape(),
                                                   cond.strides(), shape);
        Strides sa = ShapeUtils::broadcast_strides(a.shape(), a.strides(), shape);
        Strides sb = ShapeUtils::broadcast_strides(b.shape(), b.strides(), shape);
        dispatch_dtype(out_dtype, [&](auto tag) {
            using T = typename decltype(tag)::type;
            const bool *pc = static_cast<const bool *>(cond.data());
            const T *pa = static_cast<const T *>(a.data());
            const T *pb = static_cast<const T *>(b.data());
            T *po = static_cast<T *>(out.data());
            strided_for_each<4>(shape, {&out.strides(), &sc, &sa, &sb},
                                {0, 0, 0, 0},
                                [&](const std::array<int64_t, 4> &off) {
                                    po[off[0]] = pc[off[1]] ? pa[off[2]]
                                                            : pb[off[3]];
                                });
        });
        result.outputs.push_back(out);
        break;
    }
    case OpKind::Dot:
        result.outputs.push_back(dot(inputs[0], inputs[1], out_dtype, alloc));
        break;
    case OpKind::Subtensor:
        result.outputs.push_back(subtensor_view(
            inputs[0], graph::get_params<graph::SubtensorParams>(node.params())));
        break;
    case OpKind::SetSubtensor:
    case OpKind::IncSubtensor: {
        bool inplace = options.allow_inplace && node.destroyed_input(0) &&
                       can_write_inplace(inputs[0], inputs[0].shape(),
                                         out_dtype);
        result.inplace = inplace;
        result.outputs.push_back(
            update_subtensor(node, inputs, inplace, alloc));
        break;
    }
    case OpKind::Reshape: {
        const auto &p = graph::get_params<graph::ReshapeParams>(node.params());
        result.outputs.push_back(
            inputs[0].reshape(resolve_reshape(p.shape, inputs[0].size())));
        break;
    }
    case OpKind::Dimshuffle:
        result.outputs.push_back(dimshuffle(
            inputs[0],
            graph::get_params<graph::DimshuffleParams>(node.params()).pattern));
        break;
    case OpKind::Alloc: {
        Shape shape;
        for (size_t i = 1; i < inputs.size(); ++i) {
            int64_t dim = inputs[i].item<int64_t>();
            if (dim < 0)
                throw ValueError("alloc: negative dimension " +
                                 std::to_string(dim));
            shape.push_back(static_cast<size_t>(dim));
        }
        Tensor out = allocate(shape, out_dtype, alloc);
        out.copy_from(inputs[0]);
        result.outputs.push_back(out);
        break;
    }
    case OpKind::ShapeI: {
        const auto &p = graph::get_params<graph::ShapeIParams>(node.params());
        result.outputs.push_back(Tensor::scalar<int64_t>(
            static_cast<int64_t>(inputs[0].shape()[p.axis])));
        break;
    }
    case OpKind::DeepCopy: {
        Tensor out = allocate(inputs[0].shape(), inputs[0].dtype(), alloc);
        out.copy_from(inputs[0]);
        result.outputs.push_back(out);
        break;
    }
    case OpKind::Composite: {
        const auto &prog =
            *graph::get_params<graph::CompositeParams>(node.params()).program;
        Shape shape;
        for (const auto &in : inputs)
            shape = ShapeUtils::broadcast_shape(shape, in.shape());
        Tensor target = inplace_target(shape);
        Tensor *dest = target.defined() ? &target : nullptr;
        result.inplace = dest != nullptr;
        result.outputs.push_back(
            evaluate_composite(prog, inputs, dest, alloc));
        break;
    }
    default:
        throw RuntimeError::not_implemented(std::string("kernel for ") +
                                            node.op_name());
    }
    return result;
}

} // namespace exec
} // namespace arbor
