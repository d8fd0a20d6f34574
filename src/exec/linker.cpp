#include "arbor/exec/linker.hpp"
#include "arbor/error.hpp"
#include "arbor/log.hpp"

#include <cmath>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace arbor {
namespace exec {

// ============================================================================
// Interpreted / compiled
// ============================================================================

InterpretedLinker::InterpretedLinker(const graph::Graph &graph)
    : interpreter_(graph) {
    logging::logger()->debug("interpreted linker over {} nodes",
                             graph.nodes().size());
}

std::vector<Tensor>
InterpretedLinker::run(const std::vector<Tensor> &inputs,
                       const profile::NodeCallback *callback) const {
    RunOptions options;
    options.callback = callback;
    return interpreter_.run(inputs, options);
}

CompiledLinker::CompiledLinker(const graph::Graph &graph)
    : plan_(compile_plan(graph)) {}

std::vector<Tensor>
CompiledLinker::run(const std::vector<Tensor> &inputs,
                    const profile::NodeCallback *callback) const {
    RunOptions options;
    options.callback = callback;
    return execute_plan(*plan_, inputs, options);
}

// ============================================================================
// Verify
// ============================================================================

std::string first_difference(const Tensor &a, const Tensor &b, double rtol,
                             double atol) {
    std::ostringstream oss;
    if (a.dtype() != b.dtype()) {
        oss << "dtype " << dtype_name(a.dtype()) << " vs "
            << dtype_name(b.dtype());
        return oss.str();
    }
    if (a.shape() != b.shape()) {
        oss << "shape " << ShapeUtils::to_string(a.shape()) << " vs "
            << ShapeUtils::to_string(b.shape());
        return oss.str();
    }

    if (is_float_dtype(a.dtype())) {
        std::vector<double> x = a.to_vector<double>();
        std::vector<double> y = b.to_vector<double>();
        for (size_t i = 0; i < x.size(); ++i) {
            if (std::isnan(x[i]) && std::isnan(y[i]))
                continue;
            bool close = x[i] == y[i] ||
                         std::abs(x[i] - y[i]) <= atol + rtol * std::abs(y[i]);
            if (!close) {
                oss << "element " << i << ": " << x[i] << " vs " << y[i];
                return oss.str();
            }
        }
        return "";
    }

    std::vector<int64_t> x = a.to_vector<int64_t>();
    std::vector<int64_t> y = b.to_vector<int64_t>();
    for (size_t i = 0; i < x.size(); ++i) {
        if (x[i] != y[i]) {
            oss << "element " << i << ": " << x[i] << " vs " << y[i];
            return oss.str();
        }
    }
    return "";
}

VerifyLinker::VerifyLinker(const graph::Graph &graph, double rtol, double atol)
    : reference_(graph), plan_(compile_plan(graph)), rtol_(rtol), atol_(atol) {}

VerifyLinker::VerifyLinker(const graph::Graph &graph,
                           std::shared_ptr<const CompiledPlan> plan,
                           double rtol, double atol)
    : reference_(graph), plan_(std::move(plan)), rtol_(rtol), atol_(atol) {
    if (!plan_)
        throw ValueError("verify: no compiled plan");
    if (plan_->input_slots.size() != graph.inputs().size())
        throw ValueError("verify: plan takes " +
                         std::to_string(plan_->input_slots.size()) +
                         " inputs but the graph has " +
                         std::to_string(graph.inputs().size()));
}

std::vector<Tensor>
VerifyLinker::run(const std::vector<Tensor> &inputs,
                  const profile::NodeCallback *callback) const {
    Trace reference_trace;
    RunOptions reference_options;
    reference_options.trace = &reference_trace;
    reference_options.allow_inplace = false;
    reference_.run(inputs, reference_options);

    Trace compiled_trace;
    RunOptions compiled_options;
    compiled_options.callback = callback;
    compiled_options.trace = &compiled_trace;
    std::vector<Tensor> results = execute_plan(*plan_, inputs, compiled_options);

    std::unordered_map<graph::Variable, const Tensor *, graph::VariableHash>
        compiled;
    for (const auto &[var, value] : compiled_trace)
        compiled[var] = &value;

    size_t compared = 0;
    for (const auto &[var, expected] : reference_trace) {
        auto it = compiled.find(var);
        if (it == compiled.end())
            continue;
        std::string diff = first_difference(expected, *it->second, rtol_, atol_);
        if (!diff.empty())
            throw DivergentExecutionError::at(var.node()->id(),
                                              var.node()->op_name(), var.str(),
                                              "interpreted vs compiled " + diff);
        ++compared;
    }
    logging::logger()->debug("verify: {} intermediates agree", compared);
    return results;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Linker> make_linker(const graph::Graph &graph,
                                    const CompileConfig &config) {
    switch (config.execution_mode) {
    case ExecutionMode::Interpreted:
        return std::make_unique<InterpretedLinker>(graph);
    case ExecutionMode::Compiled:
        return std::make_unique<CompiledLinker>(graph);
    case ExecutionMode::Verify:
        return std::make_unique<VerifyLinker>(graph, config.verify_rtol,
                                              config.verify_atol);
    }
    throw RuntimeError::internal("unknown execution mode");
}

} // namespace exec
} // namespace arbor
