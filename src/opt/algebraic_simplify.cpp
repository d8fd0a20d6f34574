#include "arbor/log.hpp"
#include "arbor/ops.hpp"
#include "arbor/opt/optimizer.hpp"
#include "arbor/opt/rewrite.hpp"

namespace arbor {
namespace opt {

namespace {

using graph::OpKind;
using graph::Variable;

// Constant holding a single element equal to `value`. Size one keeps the
// other operand's shape unchanged under broadcasting.
bool is_scalar_constant(const Variable &v, double value) {
    if (!v.is_constant())
        return false;
    const Tensor &t =
        graph::get_params<graph::ConstantParams>(v.node()->params()).value;
    return t.size() == 1 && t.item<double>() == value;
}

// Simplified form of `node`, or an undefined variable.
Variable simplify(const graph::Node &node) {
    const auto &in = node.inputs();
    switch (node.op()) {
    case OpKind::Add:
        if (is_scalar_constant(in[1], 0))
            return in[0];
        if (is_scalar_constant(in[0], 0))
            return in[1];
        break;
    case OpKind::Sub:
        if (is_scalar_constant(in[1], 0))
            return in[0];
        break;
    case OpKind::Mul:
        if (is_scalar_constant(in[1], 1))
            return in[0];
        if (is_scalar_constant(in[0], 1))
            return in[1];
        break;
    case OpKind::TrueDiv:
        if (is_scalar_constant(in[1], 1))
            return in[0];
        break;
    case OpKind::Pow:
        if (is_scalar_constant(in[1], 1))
            return in[0];
        if (is_scalar_constant(in[1], 2) &&
            infer_unary_type(OpKind::Sqr, in[0].type()) == node.outputs()[0])
            return sqr(in[0]);
        break;
    case OpKind::Neg:
        if (in[0].op() == OpKind::Neg)
            return in[0].node()->inputs()[0];
        break;
    case OpKind::Log:
        if (in[0].op() == OpKind::Exp)
            return in[0].node()->inputs()[0];
        break;
    default:
        break;
    }
    return Variable();
}

} // namespace

graph::Graph algebraic_simplify(const graph::Graph &graph) {
    return rewrite_graph(
        graph,
        [](const graph::NodePtr &node, const graph::Node &)
            -> std::optional<std::vector<graph::Variable>> {
            if (node->is_leaf() || node->num_outputs() != 1)
                return std::nullopt;
            Variable replacement = simplify(*node);
            if (!replacement.defined() ||
                replacement.type() != node->outputs()[0])
                return std::nullopt;
            logging::logger()->debug("algebraic_simplify: {} -> {}",
                                     node->str(), replacement.str());
            return std::vector<graph::Variable>{replacement};
        });
}

} // namespace opt
} // namespace arbor
