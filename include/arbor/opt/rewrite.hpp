#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "arbor/graph/graph.hpp"

namespace arbor {
namespace opt {

// Local rewrite: sees a node whose inputs are already rewritten, along
// with the node it was rebuilt from, and returns replacement variables for
// its outputs, or nullopt to keep it. Replacements must have the replaced
// outputs' types.
using LocalRewrite = std::function<std::optional<std::vector<graph::Variable>>(
    const graph::NodePtr &current, const graph::Node &original)>;

// Rebuilds `graph` bottom-up, applying `rewrite` once per node (leaves
// included). Ordering edges follow kept nodes; edges touching a replaced
// node are dropped. Returns the input graph when nothing changed.
graph::Graph rewrite_graph(const graph::Graph &graph, const LocalRewrite &rewrite);

} // namespace opt
} // namespace arbor
