#pragma once

#include <functional>
#include <string>
#include <vector>

#include "arbor/config.hpp"
#include "arbor/graph/graph.hpp"

namespace arbor {
namespace opt {

// ============================================================================
// Graph rewrite passes
// ============================================================================

graph::Graph constant_folding(const graph::Graph &graph);
graph::Graph algebraic_simplify(const graph::Graph &graph);
graph::Graph merge(const graph::Graph &graph);
graph::Graph scan_save_mem(const graph::Graph &graph);
graph::Graph scan_inner(const graph::Graph &graph, const CompileConfig &config);
graph::Graph elemwise_fusion(const graph::Graph &graph);
graph::Graph inplace(const graph::Graph &graph);
graph::Graph output_guard(const graph::Graph &graph);

// Constants with more elements than this are not produced by folding.
constexpr size_t CONSTANT_FOLDING_MAX_ELEMENTS = 1 << 16;

// ============================================================================
// Pass registry
// ============================================================================

using PassFn =
    std::function<graph::Graph(const graph::Graph &, const CompileConfig &)>;

struct PassInfo {
    std::string name;
    PassFn run;
    // The pass refuses graphs on which any of these already ran.
    std::vector<std::string> forbidden_after;
};

class PassRegistry {
  public:
    // Throws ValueError for unknown names.
    static const PassInfo &get(const std::string &name);

    // Every pass in canonical (level 2) order.
    static const std::vector<PassInfo> &all();

    static bool contains(const std::string &name);
};

// Pass names run for `config`: the explicit list when set, otherwise the
// level's default pipeline; `inplace` removed when disabled.
std::vector<std::string> pipeline(const CompileConfig &config);

// Runs one pass after checking its preconditions and records it on the
// result. Throws OptimizationPreconditionError.
graph::Graph apply_pass(const graph::Graph &graph, const std::string &name,
                        const CompileConfig &config);

graph::Graph optimize(const graph::Graph &graph, const CompileConfig &config);

} // namespace opt
} // namespace arbor
