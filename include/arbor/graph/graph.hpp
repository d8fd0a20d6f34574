#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "graph_signature.hpp"
#include "node.hpp"

namespace arbor {
namespace graph {

// Reader of a variable: input `input_index` of `node`, or graph output
// number `input_index` when `node` is null.
struct Client {
    NodePtr node;
    size_t input_index = 0;

    bool is_output() const { return node == nullptr; }
};

// `after` must run after `before` (in-place write after every other read).
struct OrderingEdge {
    NodePtr before;
    NodePtr after;
};

using VariableMap = std::unordered_map<Variable, Variable, VariableHash>;

// ============================================================================
// Graph: the DAG between declared inputs and outputs
// ============================================================================

class Graph {
  public:
    Graph() = default;

    // Throws ValueError for duplicate or non-input declarations and
    // MissingInputError when an undeclared input is reachable.
    Graph(std::vector<Variable> inputs, std::vector<Variable> outputs,
          std::vector<OrderingEdge> orderings = {},
          std::vector<std::string> applied_passes = {});

    const std::vector<Variable> &inputs() const { return inputs_; }
    const std::vector<Variable> &outputs() const { return outputs_; }

    // Every reachable node (leaves included) in a topological order that
    // also honors the ordering edges.
    const std::vector<NodePtr> &nodes() const { return nodes_; }
    std::vector<NodePtr> apply_nodes() const;

    const std::vector<OrderingEdge> &orderings() const { return orderings_; }
    const std::vector<std::string> &applied_passes() const {
        return applied_passes_;
    }
    bool has_applied(const std::string &pass) const;

    const std::vector<Client> &clients(const Variable &v) const;
    bool is_output(const Variable &v) const;
    bool contains(const Node *node) const;
    size_t position(const Node *node) const;

    // Shared leaves read by the graph, in topological order.
    std::vector<Variable> shared_variables() const;

    // Copies with one aspect changed. Ordering edges whose nodes are no
    // longer reachable are dropped.
    Graph with_outputs(std::vector<Variable> outputs) const;
    Graph with_orderings(std::vector<OrderingEdge> orderings) const;
    Graph with_pass(const std::string &pass) const;

    // Substitutes variables and rebuilds the affected nodes.
    Graph replace(const VariableMap &replacements) const;

    // Type and alias consistency; throws RuntimeError on a broken graph.
    void validate() const;

    GraphSignature signature() const;

    std::string str() const;

  private:
    std::vector<Variable> inputs_;
    std::vector<Variable> outputs_;
    std::vector<OrderingEdge> orderings_;
    std::vector<std::string> applied_passes_;

    std::vector<NodePtr> nodes_;
    std::unordered_map<const Node *, size_t> position_;
    std::unordered_map<Variable, std::vector<Client>, VariableHash> clients_;

    void build();
};

// Rebuilds everything between `outputs` and the replaced variables.
// Replacement values are used as-is; their types must match. Returns the
// rebuilt outputs in order.
std::vector<Variable> clone_replace(const std::vector<Variable> &outputs,
                                    const VariableMap &replacements);

// Nodes reachable from `outputs`, inputs first (non-recursive DFS).
std::vector<NodePtr> topological_sort(const std::vector<Variable> &outputs);

} // namespace graph
} // namespace arbor
