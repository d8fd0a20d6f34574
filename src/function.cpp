#include "arbor/function.hpp"
#include "arbor/error.hpp"
#include "arbor/exec/interpreter.hpp"
#include "arbor/log.hpp"
#include "arbor/opt/optimizer.hpp"

#include <unordered_set>

namespace arbor {

namespace {

// Brings an update value to its target's type: same rank, and a dtype the
// shared value can hold without loss.
Variable coerce_update(const SharedVariable &target, const Variable &value) {
    if (!value.defined())
        throw ValueError("update for shared variable '" + target.str() +
                         "' is undefined");
    if (value.ndim() != target.ndim())
        throw TypeShapeError("update for shared variable '" + target.str() +
                             "' has type " + value.type().str() + " but " +
                             target.type().str() + " is required");
    if (value.dtype() == target.dtype())
        return value;
    if (!can_cast_safely(value.dtype(), target.dtype()))
        throw TypeShapeError("update for shared variable '" + target.str() +
                             "' has dtype " + dtype_name(value.dtype()) +
                             " which does not convert safely to " +
                             dtype_name(target.dtype()));
    return cast(value, target.dtype());
}

// Evaluates the unoptimized graph on the inputs' test values and handles
// failures the way node construction does under `policy`.
void check_test_values(const graph::Graph &graph, TestValuePolicy policy) {
    if (policy == TestValuePolicy::Off)
        return;

    auto report = [&](const std::string &reason) {
        switch (policy) {
        case TestValuePolicy::Off:
        case TestValuePolicy::Ignore:
            logging::logger()->debug("function: test values not checked: {}",
                                     reason);
            return;
        case TestValuePolicy::Warn:
            logging::logger()->warn("function: test values not checked: {}",
                                    reason);
            return;
        case TestValuePolicy::Raise:
            throw TypeShapeError("test value evaluation failed: " + reason);
        }
    };

    std::vector<Tensor> values;
    for (const auto &in : graph.inputs()) {
        const auto &tv = in.test_value();
        if (!tv) {
            report("input '" + in.str() + "' has no test value");
            return;
        }
        values.push_back(*tv);
    }
    try {
        exec::RunOptions options;
        options.allow_inplace = false;
        exec::Interpreter(graph).run(values, options);
    } catch (const ArborError &e) {
        report(e.what());
    }
}

} // namespace

// ============================================================================
// CompiledFunction
// ============================================================================

CompiledFunction::CompiledFunction(graph::Graph graph, size_t n_outputs,
                                   std::vector<SharedVariable> update_targets,
                                   std::unique_ptr<exec::Linker> linker,
                                   CompileConfig config)
    : graph_(std::move(graph)), n_outputs_(n_outputs),
      update_targets_(std::move(update_targets)), linker_(std::move(linker)),
      config_(std::move(config)) {
    if (!linker_)
        throw RuntimeError::internal("compiled function without a linker");
    if (n_outputs_ + update_targets_.size() != graph_.outputs().size())
        throw RuntimeError::internal(
            "compiled function output count does not match its graph");
}

std::vector<Tensor>
CompiledFunction::bind(const std::vector<Tensor> &args) const {
    const auto &inputs = graph_.inputs();
    if (args.size() != inputs.size())
        throw ValueError("function expects " + std::to_string(inputs.size()) +
                         " arguments but got " + std::to_string(args.size()));

    std::vector<Tensor> bound;
    bound.reserve(args.size());
    for (size_t i = 0; i < args.size(); ++i) {
        const Tensor &arg = args[i];
        const Variable &in = inputs[i];
        if (!arg.defined())
            throw ValueError("argument " + std::to_string(i) + " ('" +
                             in.str() + "') is undefined");
        if (arg.ndim() != in.ndim())
            throw TypeShapeError::rank_mismatch(
                "function argument '" + in.str() + "'", i,
                std::to_string(in.ndim()), arg.ndim());
        if (arg.dtype() == in.dtype()) {
            bound.push_back(arg);
            continue;
        }
        if (!can_cast_safely(arg.dtype(), in.dtype()))
            throw TypeShapeError::dtype_mismatch(
                "function argument '" + in.str() + "'", i,
                dtype_name(in.dtype()), dtype_name(arg.dtype()));
        bound.push_back(arg.astype(in.dtype()));
    }
    return bound;
}

std::vector<Tensor>
CompiledFunction::operator()(const std::vector<Tensor> &args) const {
    std::vector<Tensor> results =
        linker_->run(bind(args), callback_ ? &callback_ : nullptr);
    if (results.size() != graph_.outputs().size())
        throw RuntimeError::internal("linker returned " +
                                     std::to_string(results.size()) +
                                     " values for " +
                                     std::to_string(graph_.outputs().size()) +
                                     " graph outputs");

    for (size_t j = 0; j < update_targets_.size(); ++j)
        update_targets_[j].set_value(results[n_outputs_ + j]);
    results.resize(n_outputs_);
    return results;
}

std::vector<SharedVariable> CompiledFunction::shared_variables() const {
    std::vector<SharedVariable> result;
    std::unordered_set<const graph::SharedState *> seen;
    for (const auto &v : graph_.shared_variables()) {
        SharedVariable sv(v);
        if (seen.insert(sv.state().get()).second)
            result.push_back(sv);
    }
    for (const auto &target : update_targets_) {
        if (seen.insert(target.state().get()).second)
            result.push_back(target);
    }
    return result;
}

void CompiledFunction::set_node_callback(profile::NodeCallback callback) {
    callback_ = std::move(callback);
}

// ============================================================================
// Compile entry point
// ============================================================================

CompiledFunction function(const std::vector<Variable> &inputs,
                          const std::vector<Variable> &outputs,
                          const Updates &updates, const CompileConfig &config) {
    std::vector<Variable> graph_outputs;
    graph_outputs.reserve(outputs.size() + updates.size());
    for (size_t i = 0; i < outputs.size(); ++i) {
        if (!outputs[i].defined())
            throw ValueError("output " + std::to_string(i) + " is undefined");
        graph_outputs.push_back(outputs[i]);
    }

    std::vector<SharedVariable> targets;
    std::unordered_set<const graph::SharedState *> updated;
    for (const auto &[target, value] : updates) {
        if (!updated.insert(target.state().get()).second)
            throw ValueError("shared variable '" + target.str() +
                             "' is updated more than once");
        graph_outputs.push_back(coerce_update(target, value));
        targets.push_back(target);
    }

    graph::Graph graph(inputs, std::move(graph_outputs));
    check_test_values(graph, config.test_value_policy);

    graph::Graph optimized;
    {
        // Rewrites build nodes without evaluating test values
        TestValueScope scope(TestValuePolicy::Off);
        optimized = opt::optimize(graph, config);
    }
    logging::logger()->debug("function: {} inputs, {} outputs, {} updates, "
                             "{} -> {} apply nodes ({})",
                             inputs.size(), outputs.size(), targets.size(),
                             graph.apply_nodes().size(),
                             optimized.apply_nodes().size(), config.str());

    std::unique_ptr<exec::Linker> linker = exec::make_linker(optimized, config);
    return CompiledFunction(std::move(optimized), outputs.size(),
                            std::move(targets), std::move(linker), config);
}

} // namespace arbor
