#include "arbor/exec/interpreter.hpp"
#include "arbor/error.hpp"
#include "arbor/exec/kernels.hpp"
#include "arbor/exec/scan_runner.hpp"

namespace arbor {
namespace exec {

profile::NodeEvent make_event(const graph::Node &node) {
    profile::NodeEvent event;
    event.node_id = node.id();
    event.op_name = node.op_name();
    if (node.num_outputs() > 0)
        event.node_name = node.output(0).str();
    return event;
}

Interpreter::Interpreter(graph::Graph graph) : graph_(std::move(graph)) {
    const auto &nodes = graph_.nodes();
    for (size_t pos = 0; pos < nodes.size(); ++pos) {
        const auto &node = nodes[pos];
        for (const auto &in : node->inputs())
            last_use_[in] = pos;
        if (node->op() == graph::OpKind::Scan) {
            const auto &info =
                graph::get_params<graph::ScanParams>(node->params()).info;
            inner_[node->id()] = std::make_shared<Interpreter>(info->inner);
        }
    }
    for (const auto &out : graph_.outputs())
        last_use_.erase(out);
}

std::vector<Tensor> Interpreter::run(const std::vector<Tensor> &inputs,
                                     const RunOptions &options) const {
    const auto &graph_inputs = graph_.inputs();
    if (inputs.size() != graph_inputs.size())
        throw RuntimeError::internal("interpreter expects " +
                                     std::to_string(graph_inputs.size()) +
                                     " inputs, got " +
                                     std::to_string(inputs.size()));

    std::unordered_map<graph::Variable, Tensor, graph::VariableHash> values;
    for (size_t i = 0; i < inputs.size(); ++i)
        values[graph_inputs[i]] = inputs[i];

    KernelOptions kernel_options;
    kernel_options.allow_inplace = options.allow_inplace;

    const auto &nodes = graph_.nodes();
    for (size_t pos = 0; pos < nodes.size(); ++pos) {
        const graph::Node &node = *nodes[pos];
        if (node.op() == graph::OpKind::Input)
            continue;

        std::vector<Tensor> args;
        args.reserve(node.inputs().size());
        for (const auto &in : node.inputs())
            args.push_back(values.at(in));

        profile::NodeTimer timer(make_event(node), options.callback);
        std::vector<Tensor> outs;
        if (node.op() == graph::OpKind::Scan) {
            const auto &info =
                graph::get_params<graph::ScanParams>(node.params()).info;
            std::shared_ptr<const Interpreter> inner = inner_.at(node.id());
            ScanRunner runner(info, [inner](const std::vector<Tensor> &in) {
                RunOptions inner_options;
                inner_options.allow_inplace = false;
                return inner->run(in, inner_options);
            });
            outs = runner.run(args);
        } else {
            KernelResult result = run_kernel(node, args, kernel_options);
            timer.event().inplace = result.inplace;
            outs = std::move(result.outputs);
        }
        for (const auto &t : outs)
            timer.event().output_bytes += t.nbytes();
        timer.stop();

        for (size_t i = 0; i < outs.size(); ++i) {
            graph::Variable v = node.output(i);
            if (options.trace && !node.is_leaf())
                options.trace->emplace_back(v, outs[i].copy());
            values[v] = std::move(outs[i]);
        }

        // Drop intermediates read for the last time
        for (const auto &in : node.inputs()) {
            auto it = last_use_.find(in);
            if (it != last_use_.end() && it->second == pos)
                values.erase(in);
        }
    }

    std::vector<Tensor> results;
    results.reserve(graph_.outputs().size());
    for (const auto &out : graph_.outputs())
        results.push_back(values.at(out));
    return results;
}

} // namespace exec
} // namespace arbor
