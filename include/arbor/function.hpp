#pragma once

#include <memory>
#include <vector>

#include "arbor/config.hpp"
#include "arbor/exec/linker.hpp"
#include "arbor/graph/graph.hpp"
#include "arbor/ops.hpp"
#include "arbor/profile.hpp"

namespace arbor {

// ============================================================================
// CompiledFunction: an optimized graph bound to an executor
// ============================================================================
//
// Not safe for concurrent invocation. Shared values are written only after
// every output and update of an invocation has been computed.

class CompiledFunction {
  public:
    CompiledFunction(graph::Graph graph, size_t n_outputs,
                     std::vector<SharedVariable> update_targets,
                     std::unique_ptr<exec::Linker> linker,
                     CompileConfig config);

    // Arguments bind positionally to the declared inputs. A dtype that
    // converts safely is cast; anything else throws TypeShapeError.
    std::vector<Tensor> operator()(const std::vector<Tensor> &args) const;

    const graph::Graph &graph() const { return graph_; }
    const CompileConfig &config() const { return config_; }
    ExecutionMode mode() const { return linker_->mode(); }
    const exec::Linker &linker() const { return *linker_; }

    size_t n_inputs() const { return graph_.inputs().size(); }
    size_t n_outputs() const { return n_outputs_; }
    const std::vector<SharedVariable> &update_targets() const {
        return update_targets_;
    }

    // Shared values read by the graph, whether or not they are updated.
    std::vector<SharedVariable> shared_variables() const;

    // Called once per executed node; pass nullptr to clear.
    void set_node_callback(profile::NodeCallback callback);

  private:
    graph::Graph graph_;
    size_t n_outputs_;
    std::vector<SharedVariable> update_targets_;
    std::unique_ptr<exec::Linker> linker_;
    CompileConfig config_;
    profile::NodeCallback callback_;

    std::vector<Tensor> bind(const std::vector<Tensor> &args) const;
};

// Clones the expression between `inputs` and `outputs` (plus the update
// values) into a graph, optimizes it and links it for `config`'s mode.
// Throws MissingInputError when an output depends on an undeclared input
// and ValueError for invalid updates.
CompiledFunction function(const std::vector<Variable> &inputs,
                          const std::vector<Variable> &outputs,
                          const Updates &updates = {},
                          const CompileConfig &config = CompileConfig());

} // namespace arbor
