#include "arbor/log.hpp"
#include "arbor/ops.hpp"
#include "arbor/opt/alias_analysis.hpp"
#include "arbor/opt/optimizer.hpp"
#include "arbor/scan/scan_info.hpp"

#include <unordered_set>

namespace arbor {
namespace opt {

namespace {

// Final shared values of a scan are the loop state itself, which may be
// the shared value or an outer input passed through unchanged.
bool is_scan_state(const graph::Variable &root) {
    if (root.op() != graph::OpKind::Scan)
        return false;
    const auto &info =
        graph::get_params<graph::ScanParams>(root.node()->params()).info;
    return root.index() >= info->n_outputs() &&
           root.index() < info->n_outputs() + info->n_shared;
}

} // namespace

// Every returned buffer must be owned by the caller: outputs that would
// alias a leaf, loop state or an earlier output are deep-copied.
graph::Graph output_guard(const graph::Graph &graph) {
    AliasAnalysis alias(graph);
    std::unordered_set<graph::Variable, graph::VariableHash> returned;
    std::vector<graph::Variable> outputs;
    outputs.reserve(graph.outputs().size());
    size_t guarded = 0;

    for (const auto &out : graph.outputs()) {
        const graph::Variable &root = alias.root(out);
        bool copy = alias.is_leaf_class(root) || is_scan_state(root) ||
                    returned.count(root) > 0;
        returned.insert(root);
        if (!copy) {
            outputs.push_back(out);
            continue;
        }
        graph::Variable guarded_out = deep_copy(out);
        returned.insert(guarded_out);
        outputs.push_back(guarded_out);
        ++guarded;
        logging::logger()->debug("output_guard: copying output {}", out.str());
    }

    if (!guarded)
        return graph;
    return graph.with_outputs(std::move(outputs));
}

} // namespace opt
} // namespace arbor
