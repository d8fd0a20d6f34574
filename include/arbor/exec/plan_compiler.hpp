#pragma once

#include <memory>
#include <vector>

#include "arbor/exec/compiled_plan.hpp"
#include "arbor/exec/interpreter.hpp"

namespace arbor {
namespace exec {

// Lowers a graph to a CompiledPlan: one step per apply node, typed
// kernels resolved up front, buffer liveness computed, scan inner graphs
// compiled recursively.
std::shared_ptr<const CompiledPlan> compile_plan(const graph::Graph &graph);

// Runs a plan on bound inputs. Intermediate buffers are recycled through
// the plan's arena pool.
std::vector<Tensor> execute_plan(const CompiledPlan &plan,
                                 const std::vector<Tensor> &inputs,
                                 const RunOptions &options = {});

} // namespace exec
} // namespace arbor
