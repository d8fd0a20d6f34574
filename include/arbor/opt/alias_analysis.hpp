#pragma once

#include <unordered_map>
#include <vector>

#include "arbor/graph/graph.hpp"

namespace arbor {
namespace opt {

// ============================================================================
// Alias classes of a graph
// ============================================================================
//
// Two variables are in one alias class when one is a view (view_map) of
// the other, transitively. The root is the variable that owns the buffer.

class AliasAnalysis {
  public:
    explicit AliasAnalysis(const graph::Graph &graph);

    const graph::Variable &root(const graph::Variable &v) const;

    // Every variable of the class rooted at `root`, root first.
    const std::vector<graph::Variable> &members(const graph::Variable &root) const;

    // Root is an input, a constant or a shared value.
    bool is_leaf_class(const graph::Variable &root) const;

    // Some member is a graph output.
    bool reaches_output(const graph::Variable &root) const;

    // Node destroying some member of the class, or nullptr.
    const graph::Node *destroyer(const graph::Variable &root) const;

    // Nodes reading some member of the class, without duplicates.
    std::vector<graph::NodePtr> readers(const graph::Variable &root) const;

  private:
    const graph::Graph &graph_;
    std::unordered_map<graph::Variable, graph::Variable, graph::VariableHash> root_;
    std::unordered_map<graph::Variable, std::vector<graph::Variable>,
                       graph::VariableHash>
        members_;
    std::unordered_map<graph::Variable, const graph::Node *, graph::VariableHash>
        destroyer_;
};

} // namespace opt
} // namespace arbor
