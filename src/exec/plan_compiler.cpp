#include "arbor/exec/plan_compiler.hpp"
#include "arbor/error.hpp"
#include "arbor/log.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <unordered_map>
#include <variant>

namespace arbor {
namespace exec {

// ============================================================================
// BufferArena
// ============================================================================

std::shared_ptr<Storage> BufferArena::acquire(size_t bytes) {
    bytes = std::max<size_t>(bytes, 1);
    auto it = free_.lower_bound(bytes);
    // Best fit, but never hand out more than twice the request
    if (it != free_.end() && it->first <= 2 * bytes) {
        auto storage = std::move(it->second);
        free_.erase(it);
        ++reused_;
        return storage;
    }
    return make_storage(bytes);
}

void BufferArena::release(std::shared_ptr<Storage> storage) {
    if (!storage || storage.use_count() != 1)
        return;
    size_t bytes = storage->size_bytes();
    free_.emplace(bytes, std::move(storage));
}

// ============================================================================
// Plan summary
// ============================================================================

std::string CompiledPlan::str() const {
    size_t kernels = 0, fused = 0, scans = 0, copies = 0;
    for (const auto &step : steps) {
        std::visit(
            [&](const auto &s) {
                using S = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<S, KernelStep>)
                    ++kernels;
                else if constexpr (std::is_same_v<S, FusedStep>)
                    ++fused;
                else if constexpr (std::is_same_v<S, ScanStep>)
                    ++scans;
                else
                    ++copies;
            },
            step);
    }
    std::ostringstream oss;
    oss << "plan{steps=" << steps.size() << " (kernel=" << kernels
        << ", fused=" << fused << ", scan=" << scans << ", copy=" << copies
        << "), slots=" << buffer_slots.size()
        << ", peak_live=" << peak_live_slots << "}";
    return oss.str();
}

// ============================================================================
// Compilation
// ============================================================================

namespace {

PlanStep make_step(const graph::NodePtr &node) {
    switch (node->op()) {
    case graph::OpKind::Composite: {
        FusedStep step;
        const auto &program =
            graph::get_params<graph::CompositeParams>(node->params()).program;
        step.kernel = std::make_shared<FusedKernel>(program);
        if (auto in = node->destroyed_input(0))
            step.destroyed_input = static_cast<int>(*in);
        return step;
    }
    case graph::OpKind::Scan: {
        ScanStep step;
        const auto &info =
            graph::get_params<graph::ScanParams>(node->params()).info;
        std::shared_ptr<const CompiledPlan> inner = compile_plan(info->inner);
        step.runner = std::make_shared<ScanRunner>(
            info, [inner](const std::vector<Tensor> &in) {
                return execute_plan(*inner, in);
            });
        return step;
    }
    case graph::OpKind::DeepCopy:
        return CopyStep{};
    default:
        return KernelStep{};
    }
}

} // namespace

std::shared_ptr<const CompiledPlan> compile_plan(const graph::Graph &graph) {
    auto plan = std::make_shared<CompiledPlan>();
    plan->signature = graph.signature();

    std::unordered_map<graph::Variable, int, graph::VariableHash> slot_of;
    auto new_slot = [&](const graph::Variable &v, BufferSlot::Source source) {
        BufferSlot slot;
        slot.source = source;
        slot.type = v.type();
        slot.variable = v;
        int index = static_cast<int>(plan->buffer_slots.size());
        plan->buffer_slots.push_back(slot);
        slot_of[v] = index;
        return index;
    };

    for (size_t i = 0; i < graph.inputs().size(); ++i) {
        int s = new_slot(graph.inputs()[i], BufferSlot::Source::Input);
        plan->buffer_slots[s].input_index = static_cast<int>(i);
        plan->input_slots.push_back(s);
    }

    for (const auto &node : graph.nodes()) {
        switch (node->op()) {
        case graph::OpKind::Input:
            continue;
        case graph::OpKind::Constant:
            plan->leaf_slots.push_back(
                new_slot(node->output(0), BufferSlot::Source::Constant));
            continue;
        case graph::OpKind::Shared:
            plan->leaf_slots.push_back(
                new_slot(node->output(0), BufferSlot::Source::Shared));
            continue;
        default:
            break;
        }

        const int step_idx = static_cast<int>(plan->steps.size());
        PlanStep step = make_step(node);
        StepBase &base = step_base(step);
        base.node = node;
        for (const auto &in : node->inputs()) {
            auto it = slot_of.find(in);
            if (it == slot_of.end())
                throw RuntimeError::internal("plan compiler: input " +
                                             in.str() + " of " + node->str() +
                                             " has no slot");
            base.input_slots.push_back(it->second);
            plan->buffer_slots[it->second].last_use = step_idx;
        }
        for (size_t i = 0; i < node->num_outputs(); ++i) {
            int s = new_slot(node->output(i), BufferSlot::Source::Computed);
            plan->buffer_slots[s].first_use = step_idx;
            base.output_slots.push_back(s);
        }
        plan->steps.push_back(std::move(step));
    }

    for (const auto &out : graph.outputs()) {
        int s = slot_of.at(out);
        plan->buffer_slots[s].is_output = true;
        plan->output_slots.push_back(s);
    }

    // Liveness: computed slots are released after their last reader, or
    // right after they are produced when nothing reads them
    size_t live = 0;
    std::vector<int> dying(plan->steps.size(), 0);
    for (size_t s = 0; s < plan->buffer_slots.size(); ++s) {
        const auto &slot = plan->buffer_slots[s];
        if (slot.source != BufferSlot::Source::Computed || slot.is_output)
            continue;
        int at = std::max(slot.last_use, slot.first_use);
        step_base(plan->steps[at]).release_slots.push_back(static_cast<int>(s));
        dying[at]++;
    }
    for (size_t i = 0; i < plan->steps.size(); ++i) {
        live += step_base(plan->steps[i]).output_slots.size();
        plan->peak_live_slots = std::max(plan->peak_live_slots, live);
        live -= static_cast<size_t>(dying[i]);
    }

    logging::logger()->debug("compiled {}", plan->str());
    return plan;
}

} // namespace exec
} // namespace arbor
