#include "arbor/opt/alias_analysis.hpp"
#include "arbor/error.hpp"

#include <unordered_set>

namespace arbor {
namespace opt {

AliasAnalysis::AliasAnalysis(const graph::Graph &graph) : graph_(graph) {
    // Topological order guarantees a view's source already has a root
    for (const auto &node : graph.nodes()) {
        for (size_t i = 0; i < node->num_outputs(); ++i) {
            graph::Variable out = node->output(i);
            graph::Variable r = out;
            if (auto in = node->viewed_input(i))
                r = root(node->inputs()[*in]);
            root_[out] = r;
            members_[r].push_back(out);
        }
        for (const auto &[out, in] : node->destroy_map())
            destroyer_[root(node->inputs()[in])] = node.get();
    }
}

const graph::Variable &AliasAnalysis::root(const graph::Variable &v) const {
    auto it = root_.find(v);
    if (it == root_.end())
        throw RuntimeError::internal("alias analysis: " + v.str() +
                                     " is not part of the graph");
    return it->second;
}

const std::vector<graph::Variable> &
AliasAnalysis::members(const graph::Variable &root) const {
    return members_.at(root);
}

bool AliasAnalysis::is_leaf_class(const graph::Variable &root) const {
    return root.is_leaf();
}

bool AliasAnalysis::reaches_output(const graph::Variable &root) const {
    for (const auto &m : members(root)) {
        if (graph_.is_output(m))
            return true;
    }
    return false;
}

const graph::Node *AliasAnalysis::destroyer(const graph::Variable &root) const {
    auto it = destroyer_.find(root);
    return it == destroyer_.end() ? nullptr : it->second;
}

std::vector<graph::NodePtr>
AliasAnalysis::readers(const graph::Variable &root) const {
    std::vector<graph::NodePtr> result;
    std::unordered_set<const graph::Node *> seen;
    for (const auto &m : members(root)) {
        for (const auto &c : graph_.clients(m)) {
            if (!c.is_output() && seen.insert(c.node.get()).second)
                result.push_back(c.node);
        }
    }
    return result;
}

} // namespace opt
} // namespace arbor
