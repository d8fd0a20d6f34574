#include "arbor/graph/graph.hpp"
#include "arbor/error.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace arbor {
namespace graph {

namespace {

using ExtraDeps = std::unordered_map<const Node *, std::vector<NodePtr>>;

// ============================================================================
// Topological Sort (iterative)
// ============================================================================

std::vector<NodePtr> sort_nodes(const std::vector<Variable> &outputs,
                                const ExtraDeps &extra) {
    enum class Mark { Visiting, Done };
    std::unordered_map<const Node *, Mark> mark;
    std::vector<NodePtr> result;

    struct Frame {
        NodePtr node;
        size_t next;
    };
    std::vector<Frame> stack;

    for (const auto &out : outputs) {
        if (!out.defined())
            throw ValueError("graph output is an undefined variable");
        if (mark.count(out.node().get()))
            continue;
        mark[out.node().get()] = Mark::Visiting;
        stack.push_back({out.node(), 0});

        while (!stack.empty()) {
            const Node *node = stack.back().node.get();
            auto extra_it = extra.find(node);
            size_t n_inputs = node->inputs().size();
            size_t n_extra = extra_it == extra.end() ? 0 : extra_it->second.size();

            size_t idx = stack.back().next;
            if (idx < n_inputs + n_extra) {
                stack.back().next++;
                NodePtr child = idx < n_inputs
                                    ? node->inputs()[idx].node()
                                    : extra_it->second[idx - n_inputs];
                auto m = mark.find(child.get());
                if (m == mark.end()) {
                    mark[child.get()] = Mark::Visiting;
                    stack.push_back({std::move(child), 0});
                } else if (m->second == Mark::Visiting) {
                    throw RuntimeError::internal(
                        "ordering edges create a cycle through node " +
                        child->str());
                }
            } else {
                mark[node] = Mark::Done;
                result.push_back(std::move(stack.back().node));
                stack.pop_back();
            }
        }
    }
    return result;
}

} // namespace

std::vector<NodePtr> topological_sort(const std::vector<Variable> &outputs) {
    return sort_nodes(outputs, {});
}

// ============================================================================
// Graph construction
// ============================================================================

Graph::Graph(std::vector<Variable> inputs, std::vector<Variable> outputs,
             std::vector<OrderingEdge> orderings,
             std::vector<std::string> applied_passes)
    : inputs_(std::move(inputs)), outputs_(std::move(outputs)),
      orderings_(std::move(orderings)),
      applied_passes_(std::move(applied_passes)) {
    build();
}

void Graph::build() {
    std::unordered_set<const Node *> declared;
    for (const auto &in : inputs_) {
        if (!in.defined())
            throw ValueError("graph input is an undefined variable");
        if (!in.is_input())
            throw ValueError("graph input '" + in.str() +
                             "' is not an input variable (it is a " +
                             in.node()->op_name() + ")");
        if (!declared.insert(in.node().get()).second)
            throw ValueError("input '" + in.str() +
                             "' is declared more than once");
    }

    nodes_ = sort_nodes(outputs_, {});

    if (!orderings_.empty()) {
        std::unordered_set<const Node *> reachable;
        for (const auto &n : nodes_)
            reachable.insert(n.get());
        orderings_.erase(
            std::remove_if(orderings_.begin(), orderings_.end(),
                           [&](const OrderingEdge &e) {
                               return !reachable.count(e.before.get()) ||
                                      !reachable.count(e.after.get());
                           }),
            orderings_.end());

        ExtraDeps extra;
        for (const auto &e : orderings_)
            extra[e.after.get()].push_back(e.before);
        nodes_ = sort_nodes(outputs_, extra);
    }

    position_.clear();
    clients_.clear();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const auto &node = nodes_[i];
        position_[node.get()] = i;
        if (node->op() == OpKind::Input && !declared.count(node.get()))
            throw MissingInputError::undeclared(node->output(0).str());
        for (size_t k = 0; k < node->inputs().size(); ++k)
            clients_[node->inputs()[k]].push_back({node, k});
    }
    for (size_t k = 0; k < outputs_.size(); ++k)
        clients_[outputs_[k]].push_back({nullptr, k});
}

// ============================================================================
// Queries
// ============================================================================

std::vector<NodePtr> Graph::apply_nodes() const {
    std::vector<NodePtr> result;
    for (const auto &n : nodes_) {
        if (!n->is_leaf())
            result.push_back(n);
    }
    return result;
}

bool Graph::has_applied(const std::string &pass) const {
    return std::find(applied_passes_.begin(), applied_passes_.end(), pass) !=
           applied_passes_.end();
}

const std::vector<Client> &Graph::clients(const Variable &v) const {
    static const std::vector<Client> none;
    auto it = clients_.find(v);
    return it == clients_.end() ? none : it->second;
}

bool Graph::is_output(const Variable &v) const {
    return std::find(outputs_.begin(), outputs_.end(), v) != outputs_.end();
}

bool Graph::contains(const Node *node) const { return position_.count(node); }

size_t Graph::position(const Node *node) const {
    auto it = position_.find(node);
    if (it == position_.end())
        throw RuntimeError::internal("node " + node->str() +
                                     " is not part of the graph");
    return it->second;
}

std::vector<Variable> Graph::shared_variables() const {
    std::vector<Variable> result;
    for (const auto &n : nodes_) {
        if (n->op() == OpKind::Shared)
            result.push_back(n->output(0));
    }
    return result;
}

// ============================================================================
// Derived graphs
// ============================================================================

Graph Graph::with_outputs(std::vector<Variable> outputs) const {
    return Graph(inputs_, std::move(outputs), orderings_, applied_passes_);
}

Graph Graph::with_orderings(std::vector<OrderingEdge> orderings) const {
    return Graph(inputs_, outputs_, std::move(orderings), applied_passes_);
}

Graph Graph::with_pass(const std::string &pass) const {
    Graph g = *this;
    if (!g.has_applied(pass))
        g.applied_passes_.push_back(pass);
    return g;
}

Graph Graph::replace(const VariableMap &replacements) const {
    if (replacements.empty())
        return *this;
    return with_outputs(clone_replace(outputs_, replacements));
}

std::vector<Variable> clone_replace(const std::vector<Variable> &outputs,
                                    const VariableMap &replacements) {
    for (const auto &[from, to] : replacements) {
        if (!to.defined())
            throw ValueError("replacement for '" + from.str() +
                             "' is undefined");
        if (from.type() != to.type())
            throw TypeShapeError("replacement for '" + from.str() +
                                 "' has type " + to.type().str() +
                                 " but " + from.type().str() +
                                 " is required");
    }

    VariableMap memo;
    auto lookup = [&](const Variable &v) -> const Variable & {
        auto r = replacements.find(v);
        if (r != replacements.end())
            return r->second;
        auto m = memo.find(v);
        if (m != memo.end())
            return m->second;
        return v;
    };

    for (const auto &node : topological_sort(outputs)) {
        if (node->is_leaf())
            continue;
        std::vector<Variable> new_inputs;
        new_inputs.reserve(node->inputs().size());
        bool changed = false;
        for (const auto &in : node->inputs()) {
            const Variable &mapped = lookup(in);
            changed |= mapped != in;
            new_inputs.push_back(mapped);
        }
        if (!changed)
            continue;
        NodePtr rebuilt = node->with_inputs(std::move(new_inputs));
        for (size_t i = 0; i < node->num_outputs(); ++i)
            memo[node->output(i)] = rebuilt->output(i);
    }

    std::vector<Variable> result;
    result.reserve(outputs.size());
    for (const auto &out : outputs)
        result.push_back(lookup(out));
    return result;
}

// ============================================================================
// Validation
// ============================================================================

void Graph::validate() const {
    std::unordered_map<Variable, const Node *, VariableHash> destroyer;
    for (const auto &node : nodes_) {
        for (const auto &[out, in] : node->destroy_map()) {
            const Variable &victim = node->inputs()[in];
            if (victim.is_leaf())
                throw RuntimeError::internal(
                    node->str() + " destroys leaf variable " + victim.str());
            if (is_output(victim))
                throw RuntimeError::internal(
                    node->str() + " destroys graph output " + victim.str());
            if (node->outputs()[out] != victim.type())
                throw RuntimeError::internal(
                    node->str() + " destroys an input of a different type");
            auto [it, inserted] = destroyer.emplace(victim, node.get());
            if (!inserted && it->second != node.get())
                throw RuntimeError::internal(victim.str() +
                                             " is destroyed by two nodes");

            size_t pos = position(node.get());
            for (const auto &c : clients(victim)) {
                if (c.is_output() || c.node.get() == node.get())
                    continue;
                if (position(c.node.get()) > pos)
                    throw RuntimeError::internal(
                        c.node->str() + " reads " + victim.str() +
                        " after it is destroyed by " + node->str());
            }
        }
    }
}

GraphSignature Graph::signature() const { return compute_signature(*this); }

std::string Graph::str() const {
    std::ostringstream oss;
    oss << "Graph(inputs=[";
    for (size_t i = 0; i < inputs_.size(); ++i)
        oss << (i ? ", " : "") << inputs_[i].str();
    oss << "], outputs=[";
    for (size_t i = 0; i < outputs_.size(); ++i)
        oss << (i ? ", " : "") << outputs_[i].str();
    oss << "])\n";
    for (const auto &node : nodes_) {
        if (!node->is_leaf())
            oss << "  " << node->str() << "\n";
    }
    for (const auto &e : orderings_)
        oss << "  order: " << e.before->op_name() << "#" << e.before->id()
            << " before " << e.after->op_name() << "#" << e.after->id()
            << "\n";
    return oss.str();
}

} // namespace graph
} // namespace arbor
