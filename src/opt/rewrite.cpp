#include "arbor/opt/rewrite.hpp"
#include "arbor/error.hpp"

#include <unordered_map>

namespace arbor {
namespace opt {

graph::Graph rewrite_graph(const graph::Graph &graph,
                           const LocalRewrite &rewrite) {
    graph::VariableMap memo;
    std::unordered_map<const graph::Node *, graph::NodePtr> rebuilt_nodes;
    bool changed = false;

    auto lookup = [&](const graph::Variable &v) -> graph::Variable {
        auto it = memo.find(v);
        return it == memo.end() ? v : it->second;
    };

    for (const auto &node : graph.nodes()) {
        graph::NodePtr current = node;
        if (!node->is_leaf()) {
            std::vector<graph::Variable> inputs;
            inputs.reserve(node->inputs().size());
            bool inputs_changed = false;
            for (const auto &in : node->inputs()) {
                inputs.push_back(lookup(in));
                inputs_changed |= inputs.back() != in;
            }
            if (inputs_changed)
                current = node->with_inputs(std::move(inputs));
        }

        // Graph inputs keep their identity
        std::optional<std::vector<graph::Variable>> replacement;
        if (node->op() != graph::OpKind::Input)
            replacement = rewrite(current, *node);

        if (replacement) {
            if (replacement->size() != node->num_outputs())
                throw RuntimeError::internal(
                    "rewrite of " + node->str() + " returned " +
                    std::to_string(replacement->size()) + " outputs");
            for (size_t i = 0; i < node->num_outputs(); ++i) {
                const graph::Variable &to = (*replacement)[i];
                if (to.type() != node->outputs()[i])
                    throw RuntimeError::internal(
                        "rewrite of " + node->str() + " changes type of output " +
                        std::to_string(i) + " to " + to.type().str());
                memo[node->output(i)] = to;
                changed |= to != node->output(i);
            }
            continue;
        }

        if (current != node) {
            changed = true;
            for (size_t i = 0; i < node->num_outputs(); ++i)
                memo[node->output(i)] = current->output(i);
        }
        rebuilt_nodes[node.get()] = current;
    }

    if (!changed)
        return graph;

    std::vector<graph::Variable> outputs;
    outputs.reserve(graph.outputs().size());
    for (const auto &out : graph.outputs())
        outputs.push_back(lookup(out));

    std::vector<graph::OrderingEdge> orderings;
    for (const auto &e : graph.orderings()) {
        auto before = rebuilt_nodes.find(e.before.get());
        auto after = rebuilt_nodes.find(e.after.get());
        if (before != rebuilt_nodes.end() && after != rebuilt_nodes.end())
            orderings.push_back({before->second, after->second});
    }

    return graph::Graph(graph.inputs(), std::move(outputs), std::move(orderings),
                        graph.applied_passes());
}

} // namespace opt
} // namespace arbor
