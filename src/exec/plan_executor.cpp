#include "arbor/error.hpp"
#include "arbor/exec/kernels.hpp"
#include "arbor/exec/plan_compiler.hpp"

#include <memory>
#include <type_traits>
#include <variant>

namespace arbor {
namespace exec {

// ============================================================================
// RAII guard to return arena to pool on scope exit
// ============================================================================

namespace {

struct ArenaGuard {
    const CompiledPlan &plan;
    std::unique_ptr<BufferArena> arena;
    ~ArenaGuard() {
        if (arena)
            plan.release_arena(std::move(arena));
    }
};

template <typename> constexpr bool always_false = false;

} // namespace

// ============================================================================
// Execute the full compiled plan
// ============================================================================

std::vector<Tensor> execute_plan(const CompiledPlan &plan,
                                 const std::vector<Tensor> &inputs,
                                 const RunOptions &options) {
    if (inputs.size() != plan.input_slots.size())
        throw RuntimeError::internal("plan expects " +
                                     std::to_string(plan.input_slots.size()) +
                                     " inputs, got " +
                                     std::to_string(inputs.size()));

    // One Tensor per slot
    std::vector<Tensor> buffers(plan.buffer_slots.size());
    for (size_t i = 0; i < inputs.size(); ++i)
        buffers[plan.input_slots[i]] = inputs[i];
    for (int s : plan.leaf_slots) {
        const BufferSlot &slot = plan.buffer_slots[s];
        const graph::Node &leaf = *slot.variable.node();
        if (slot.source == BufferSlot::Source::Constant)
            buffers[s] =
                graph::get_params<graph::ConstantParams>(leaf.params()).value;
        else
            buffers[s] = graph::get_params<graph::SharedParams>(leaf.params())
                             .state->get_value();
    }

    ArenaGuard guard{plan, plan.acquire_arena()};
    BufferArena &arena = *guard.arena;
    const Allocator alloc = [&arena](const Shape &shape, DType dtype) {
        size_t bytes = ShapeUtils::size(shape) * dtype_size(dtype);
        return Tensor(arena.acquire(bytes), shape,
                      ShapeUtils::contiguous_strides(shape), dtype, 0);
    };
    KernelOptions kernel_options;
    kernel_options.alloc = &alloc;
    kernel_options.allow_inplace = options.allow_inplace;

    for (const auto &step : plan.steps) {
        const StepBase &base = step_base(step);
        const graph::Node &node = *base.node;

        std::vector<Tensor> args;
        args.reserve(base.input_slots.size());
        for (int s : base.input_slots)
            args.push_back(buffers[s]);

        profile::NodeTimer timer(make_event(node), options.callback);
        std::vector<Tensor> outs;
        bool inplace = false;

        std::visit(
            [&](const auto &s) {
                using S = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<S, KernelStep>) {
                    KernelResult result = run_kernel(node, args, kernel_options);
                    inplace = result.inplace;
                    outs = std::move(result.outputs);
                } else if constexpr (std::is_same_v<S, FusedStep>) {
                    Shape shape = args[0].shape();
                    for (size_t i = 1; i < args.size(); ++i)
                        shape = ShapeUtils::broadcast_shape(shape, args[i].shape());
                    const DType dtype = s.kernel->program().dtype;
                    Tensor out;
                    if (options.allow_inplace && s.destroyed_input >= 0 &&
                        can_write_inplace(args[s.destroyed_input], shape, dtype)) {
                        out = args[s.destroyed_input];
                        inplace = true;
                    } else {
                        out = alloc(shape, dtype);
                    }
                    if (s.kernel->supported())
                        s.kernel->run(args, out);
                    else
                        evaluate_composite(s.kernel->program(), args, &out, &alloc);
                    outs.push_back(out);
                } else if constexpr (std::is_same_v<S, ScanStep>) {
                    outs = s.runner->run(args);
                } else if constexpr (std::is_same_v<S, CopyStep>) {
                    Tensor out = alloc(args[0].shape(), args[0].dtype());
                    out.copy_from(args[0]);
                    outs.push_back(out);
                } else {
                    static_assert(always_false<S>, "unhandled plan step");
                }
            },
            step);

        timer.event().inplace = inplace;
        for (const auto &t : outs)
            timer.event().output_bytes += t.nbytes();
        timer.stop();

        if (outs.size() != base.output_slots.size())
            throw RuntimeError::internal(node.str() + " produced " +
                                         std::to_string(outs.size()) +
                                         " values, expected " +
                                         std::to_string(base.output_slots.size()));
        for (size_t i = 0; i < outs.size(); ++i) {
            if (options.trace)
                options.trace->emplace_back(node.output(i), outs[i].copy());
            buffers[base.output_slots[i]] = std::move(outs[i]);
        }
        args.clear();

        // Dead buffers go back to the arena when nothing else holds them
        for (int s : base.release_slots) {
            Tensor dead = std::move(buffers[s]);
            buffers[s] = Tensor();
            if (dead.defined()) {
                std::shared_ptr<Storage> storage = dead.storage();
                dead = Tensor();
                arena.release(std::move(storage));
            }
        }
    }

    std::vector<Tensor> results;
    results.reserve(plan.output_slots.size());
    for (int s : plan.output_slots)
        results.push_back(buffers[s]);
    return results;
}

} // namespace exec
} // namespace arbor
