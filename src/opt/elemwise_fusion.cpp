#include "arbor/log.hpp"
#include "arbor/opt/optimizer.hpp"
#include "arbor/opt/rewrite.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace arbor {
namespace opt {

namespace {

using graph::NodePtr;
using graph::Variable;

// Fusable single-output node whose inputs and output all have `dtype`.
bool fusable_with(const graph::Node &node, DType dtype) {
    if (node.is_leaf() || !graph::is_fusable_op(node.op()) ||
        node.num_outputs() != 1 || !node.destroy_map().empty() ||
        node.outputs()[0].dtype != dtype)
        return false;
    for (const auto &in : node.inputs()) {
        if (in.dtype() != dtype)
            return false;
    }
    return true;
}

// Nodes of one fused group, root last once sorted.
struct FusionGroup {
    std::vector<const graph::Node *> members;
};

// Grows groups from the outputs backwards. A producer joins its consumer's
// group when the consumer is its only client.
std::unordered_map<const graph::Node *, FusionGroup>
find_groups(const graph::Graph &graph) {
    std::unordered_map<const graph::Node *, FusionGroup> groups;
    std::unordered_set<const graph::Node *> assigned;

    const auto &nodes = graph.nodes();
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        const graph::Node *root = it->get();
        if (assigned.count(root))
            continue;
        const DType dtype = root->outputs().empty() ? DType::Float64
                                                    : root->outputs()[0].dtype;
        if (!fusable_with(*root, dtype))
            continue;

        FusionGroup group;
        std::vector<const graph::Node *> stack{root};
        assigned.insert(root);
        while (!stack.empty()) {
            const graph::Node *member = stack.back();
            stack.pop_back();
            group.members.push_back(member);
            for (const auto &in : member->inputs()) {
                const graph::Node *producer = in.node().get();
                if (assigned.count(producer) ||
                    !fusable_with(*producer, dtype))
                    continue;
                const auto &clients = graph.clients(in);
                if (clients.size() != 1 || clients[0].is_output())
                    continue;
                assigned.insert(producer);
                stack.push_back(producer);
            }
        }

        if (group.members.size() < 2) {
            assigned.erase(root);
            continue;
        }
        std::sort(group.members.begin(), group.members.end(),
                  [&](const graph::Node *a, const graph::Node *b) {
                      return graph.position(a) < graph.position(b);
                  });
        groups.emplace(root, std::move(group));
    }
    return groups;
}

} // namespace

// Collapses chains of elementwise nodes whose intermediates have a single
// client into one composite node per chain.
graph::Graph elemwise_fusion(const graph::Graph &graph) {
    auto groups = find_groups(graph);
    if (groups.empty())
        return graph;

    // Original variable -> variable in the graph being rebuilt
    graph::VariableMap resolved;
    auto resolve = [&](const Variable &v) -> Variable {
        auto it = resolved.find(v);
        return it == resolved.end() ? v : it->second;
    };

    size_t fused = 0;
    graph::Graph result = rewrite_graph(
        graph,
        [&](const NodePtr &current, const graph::Node &original)
            -> std::optional<std::vector<Variable>> {
            auto g = groups.find(&original);
            if (g == groups.end()) {
                for (size_t i = 0; i < current->num_outputs(); ++i)
                    resolved[original.output(i)] = current->output(i);
                return std::nullopt;
            }
            const auto &members = g->second.members;

            auto program = std::make_shared<graph::CompositeProgram>();
            program->dtype = original.outputs()[0].dtype;
            std::unordered_map<const graph::Node *, int> registers;
            std::vector<Variable> inputs;
            auto input_slot = [&](const Variable &v) {
                auto pos = std::find(inputs.begin(), inputs.end(), v);
                if (pos != inputs.end())
                    return static_cast<int>(pos - inputs.begin());
                inputs.push_back(v);
                return static_cast<int>(inputs.size() - 1);
            };

            for (const graph::Node *member : members) {
                graph::CompositeInstr instr;
                instr.op = member->op();
                for (const auto &in : member->inputs()) {
                    auto r = registers.find(in.node().get());
                    if (r != registers.end())
                        instr.args.push_back(graph::CompositeArg::reg(r->second));
                    else
                        instr.args.push_back(
                            graph::CompositeArg::input(input_slot(resolve(in))));
                }
                registers[member] = static_cast<int>(program->instrs.size());
                program->instrs.push_back(std::move(instr));
            }
            program->n_inputs = inputs.size();
            program->validate();

            graph::NodeDesc desc;
            desc.op = graph::OpKind::Composite;
            desc.params = graph::CompositeParams{program};
            desc.inputs = std::move(inputs);
            desc.outputs = {original.outputs()[0]};
            desc.output_names = {original.output_name(0)};
            NodePtr node = graph::Node::make(std::move(desc));

            logging::logger()->debug("elemwise_fusion: {} nodes -> {}",
                                     members.size(), node->str());
            ++fused;
            resolved[original.output(0)] = node->output(0);
            return std::vector<Variable>{node->output(0)};
        });

    if (fused)
        logging::logger()->debug("elemwise_fusion: created {} composites",
                                 fused);
    return result;
}

} // namespace opt
} // namespace arbor
