#pragma once

#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "arbor/graph/graph.hpp"
#include "arbor/profile.hpp"
#include "arbor/tensor.hpp"

namespace arbor {
namespace exec {

// Node outputs of one run, in execution order. Values are copies taken
// right after the node ran.
using Trace = std::vector<std::pair<graph::Variable, Tensor>>;

struct RunOptions {
    const profile::NodeCallback *callback = nullptr;
    Trace *trace = nullptr;
    bool allow_inplace = true;
};

// Event describing one executed node, before timing fills in the rest.
profile::NodeEvent make_event(const graph::Node &node);

// ============================================================================
// Reference executor: one kernel per node, in schedule order
// ============================================================================

class Interpreter {
  public:
    explicit Interpreter(graph::Graph graph);

    std::vector<Tensor> run(const std::vector<Tensor> &inputs,
                            const RunOptions &options = {}) const;

    const graph::Graph &graph() const { return graph_; }

  private:
    graph::Graph graph_;
    // Position of the last node reading each variable; outputs are absent
    std::unordered_map<graph::Variable, size_t, graph::VariableHash> last_use_;
    // Inner interpreters of scan nodes, by node id
    std::unordered_map<uint64_t, std::shared_ptr<const Interpreter>> inner_;
};

} // namespace exec
} // namespace arbor
