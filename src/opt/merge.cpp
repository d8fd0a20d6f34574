#include "arbor/graph/graph_signature.hpp"
#include "arbor/log.hpp"
#include "arbor/opt/optimizer.hpp"
#include "arbor/opt/rewrite.hpp"

#include <functional>
#include <unordered_map>

namespace arbor {
namespace opt {

namespace {

bool same_computation(const graph::Node &a, const graph::Node &b) {
    return a.op() == b.op() && a.inputs() == b.inputs() &&
           a.outputs() == b.outputs() && a.destroy_map() == b.destroy_map() &&
           a.view_map() == b.view_map() && graph::params_equal(a.params(), b.params());
}

} // namespace

// Common-subexpression elimination: nodes with the same op, params and
// (already merged) inputs collapse onto the first one seen. Equal
// constants merge too; graph inputs never do.
graph::Graph merge(const graph::Graph &graph) {
    std::unordered_multimap<uint64_t, graph::NodePtr> seen;
    size_t merged = 0;

    graph::Graph result = rewrite_graph(
        graph,
        [&](const graph::NodePtr &node, const graph::Node &)
            -> std::optional<std::vector<graph::Variable>> {
            uint64_t key = graph::node_local_hash(*node);
            for (const auto &in : node->inputs()) {
                key ^= std::hash<const void *>()(in.node().get()) + in.index() +
                       0x9e3779b97f4a7c15ULL + (key << 6) + (key >> 2);
            }

            auto range = seen.equal_range(key);
            for (auto it = range.first; it != range.second; ++it) {
                if (!same_computation(*it->second, *node))
                    continue;
                std::vector<graph::Variable> outs;
                for (size_t i = 0; i < node->num_outputs(); ++i)
                    outs.push_back(it->second->output(i));
                logging::logger()->debug("merge: {} into {}", node->str(),
                                         it->second->str());
                ++merged;
                return outs;
            }
            seen.emplace(key, node);
            return std::nullopt;
        });
    if (merged)
        logging::logger()->debug("merge: removed {} duplicate nodes", merged);
    return result;
}

} // namespace opt
} // namespace arbor
