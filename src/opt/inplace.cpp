#include "arbor/log.hpp"
#include "arbor/opt/alias_analysis.hpp"
#include "arbor/opt/optimizer.hpp"
#include "arbor/opt/rewrite.hpp"

#include <unordered_map>
#include <unordered_set>

namespace arbor {
namespace opt {

namespace {

using graph::NodePtr;
using graph::OpKind;
using graph::Variable;

// Inputs a node could overwrite with its single output.
std::vector<size_t> destroyable_inputs(const graph::Node &node) {
    std::vector<size_t> result;
    if (node.is_leaf() || !graph::can_destroy_op(node.op()) ||
        node.num_outputs() != 1 || !node.destroy_map().empty())
        return result;

    auto add_if_same_type = [&](size_t i) {
        if (node.inputs()[i].type() == node.outputs()[0])
            result.push_back(i);
    };
    switch (node.op()) {
    case OpKind::SetSubtensor:
    case OpKind::IncSubtensor:
        add_if_same_type(0);
        break;
    case OpKind::Switch:
        add_if_same_type(1);
        add_if_same_type(2);
        break;
    default:
        for (size_t i = 0; i < node.inputs().size(); ++i)
            add_if_same_type(i);
        break;
    }
    return result;
}

class InplacePlanner {
  public:
    explicit InplacePlanner(const graph::Graph &graph)
        : graph_(graph), alias_(graph) {
        for (const auto &e : graph.orderings())
            edges_[e.before.get()].push_back(e.after.get());
    }

    // Destroyed input chosen for `node`, or -1.
    int choose(const graph::Node &node) {
        for (size_t i : destroyable_inputs(node)) {
            const Variable &victim = node.inputs()[i];
            const Variable &root = alias_.root(victim);
            if (!admissible(node, victim, root))
                continue;

            std::vector<NodePtr> readers;
            for (const auto &r : alias_.readers(root)) {
                if (r.get() != &node)
                    readers.push_back(r);
            }
            if (creates_cycle(node, readers))
                continue;

            destroyed_.insert(root);
            for (const auto &r : readers) {
                edges_[r.get()].push_back(&node);
                added_.push_back({r.get(), &node});
            }
            return static_cast<int>(i);
        }
        return -1;
    }

    const std::vector<std::pair<const graph::Node *, const graph::Node *>> &
    added_edges() const {
        return added_;
    }

  private:
    const graph::Graph &graph_;
    AliasAnalysis alias_;
    std::unordered_set<Variable, graph::VariableHash> destroyed_;
    std::unordered_map<const graph::Node *, std::vector<const graph::Node *>>
        edges_;
    std::vector<std::pair<const graph::Node *, const graph::Node *>> added_;

    bool admissible(const graph::Node &node, const Variable &victim,
                    const Variable &root) const {
        // Leaves belong to the caller; scan outputs may alias loop state
        if (alias_.is_leaf_class(root) || root.op() == OpKind::Scan)
            return false;
        if (destroyed_.count(root) || alias_.destroyer(root))
            return false;
        if (alias_.reaches_output(root))
            return false;
        for (const auto &other : node.inputs()) {
            if (other != victim && alias_.root(other) == root)
                return false;
        }
        return true;
    }

    // True when `node` already precedes one of `readers`, so forcing the
    // readers first would close a loop.
    bool creates_cycle(const graph::Node &node,
                       const std::vector<NodePtr> &readers) const {
        std::unordered_set<const graph::Node *> targets;
        for (const auto &r : readers)
            targets.insert(r.get());
        if (targets.empty())
            return false;

        std::unordered_set<const graph::Node *> visited{&node};
        std::vector<const graph::Node *> stack{&node};
        while (!stack.empty()) {
            const graph::Node *n = stack.back();
            stack.pop_back();
            auto visit = [&](const graph::Node *next) {
                if (targets.count(next))
                    return true;
                if (visited.insert(next).second)
                    stack.push_back(next);
                return false;
            };
            for (size_t o = 0; o < n->num_outputs(); ++o) {
                for (const auto &c : graph_.clients(n->output(o))) {
                    if (!c.is_output() && visit(c.node.get()))
                        return true;
                }
            }
            auto e = edges_.find(n);
            if (e != edges_.end()) {
                for (const graph::Node *next : e->second) {
                    if (visit(next))
                        return true;
                }
            }
        }
        return false;
    }
};

} // namespace

// Lets elementwise, composite and subtensor-update nodes overwrite an
// intermediate input, and orders every other reader of that buffer first.
graph::Graph inplace(const graph::Graph &graph) {
    InplacePlanner planner(graph);
    std::unordered_map<const graph::Node *, size_t> destroys;
    for (const auto &node : graph.nodes()) {
        int i = planner.choose(*node);
        if (i >= 0)
            destroys[node.get()] = static_cast<size_t>(i);
    }
    if (destroys.empty())
        return graph;

    std::unordered_map<const graph::Node *, NodePtr> rebuilt;
    graph::Graph result = rewrite_graph(
        graph,
        [&](const NodePtr &current, const graph::Node &original)
            -> std::optional<std::vector<Variable>> {
            auto d = destroys.find(&original);
            if (d == destroys.end()) {
                rebuilt[&original] = current;
                return std::nullopt;
            }
            NodePtr node = current->with_destroy_map({{0, d->second}});
            rebuilt[&original] = node;
            logging::logger()->debug("inplace: {} destroys input {}",
                                     node->str(), d->second);
            return std::vector<Variable>{node->output(0)};
        });

    auto mapped = [&](const graph::Node *n) -> NodePtr {
        auto it = rebuilt.find(n);
        return it == rebuilt.end() ? nullptr : it->second;
    };
    std::vector<graph::OrderingEdge> orderings;
    for (const auto &e : graph.orderings()) {
        NodePtr before = mapped(e.before.get());
        NodePtr after = mapped(e.after.get());
        if (before && after)
            orderings.push_back({before, after});
    }
    for (const auto &[before, after] : planner.added_edges()) {
        NodePtr b = mapped(before);
        NodePtr a = mapped(after);
        if (b && a)
            orderings.push_back({b, a});
    }
    logging::logger()->debug("inplace: {} destroyers, {} ordering edges",
                             destroys.size(), orderings.size());
    return result.with_orderings(std::move(orderings));
}

} // namespace opt
} // namespace arbor
