#include "arbor/graph/node.hpp"
#include "arbor/error.hpp"

#include <sstream>

namespace arbor {
namespace graph {

// ============================================================================
// Op names
// ============================================================================

namespace {

// clang-format off
constexpr const char *OP_NAMES[] = {
    "input", "constant", "shared",
    "add", "sub", "mul", "true_div", "int_div", "mod", "pow", "maximum",
    "minimum",
    "eq", "neq", "lt", "le", "gt", "ge",
    "and", "or", "not",
    "neg", "abs", "exp", "log", "sqrt", "sin", "cos", "tanh", "sigmoid", "sqr",
    "cast", "fill_like",
    "switch",
    "sum", "prod", "max", "min", "mean",
    "dot",
    "subtensor", "set_subtensor", "inc_subtensor", "reshape", "dimshuffle",
    "alloc", "shape_i", "deep_copy",
    "composite", "scan",
};
// clang-format on

static_assert(sizeof(OP_NAMES) / sizeof(OP_NAMES[0]) ==
                  static_cast<size_t>(OpKind::_Count),
              "OP_NAMES table must have one entry per OpKind");

const std::string &empty_string() {
    static const std::string empty;
    return empty;
}

} // namespace

const char *op_name(OpKind op) { return OP_NAMES[static_cast<size_t>(op)]; }

std::string TensorType::str() const {
    return dtype_name(dtype) + "[" + std::to_string(ndim) + "d]";
}

// ============================================================================
// Variable
// ============================================================================

const TensorType &Variable::type() const {
    if (!node_)
        throw RuntimeError::internal("type() of an undefined variable");
    return node_->outputs()[index_];
}

const std::string &Variable::name() const {
    if (!node_)
        return empty_string();
    return node_->output_name(index_);
}

OpKind Variable::op() const {
    if (!node_)
        throw RuntimeError::internal("op() of an undefined variable");
    return node_->op();
}

const std::optional<Tensor> &Variable::test_value() const {
    static const std::optional<Tensor> none;
    if (!node_)
        return none;
    return node_->test_value(index_);
}

Variable Variable::named(const std::string &name) const {
    if (is_leaf())
        throw ValueError("cannot rename leaf variable '" + str() +
                         "'; name it at creation");
    NodeDesc desc = node_->desc();
    desc.output_names[index_] = name;
    return Variable(Node::make(std::move(desc)), index_);
}

std::string Variable::str() const {
    if (!node_)
        return "<undefined>";
    if (!name().empty())
        return name();
    std::string s = std::string(node_->op_name()) + "#" +
                    std::to_string(node_->id());
    if (node_->num_outputs() > 1)
        s += "." + std::to_string(index_);
    return s;
}

// ============================================================================
// Params equality
// ============================================================================

bool params_equal(const OpParams &a, const OpParams &b) {
    if (a.index() != b.index())
        return false;
    return std::visit(
        [&](const auto &pa) -> bool {
            using T = std::decay_t<decltype(pa)>;
            const auto &pb = std::get<T>(b);
            if constexpr (std::is_same_v<T, NoParams>) {
                return true;
            } else if constexpr (std::is_same_v<T, ConstantParams>) {
                return pa.value.dtype() == pb.value.dtype() &&
                       pa.value.array_equal(pb.value);
            } else if constexpr (std::is_same_v<T, SharedParams>) {
                return pa.state == pb.state;
            } else if constexpr (std::is_same_v<T, CastParams>) {
                return pa.dtype == pb.dtype;
            } else if constexpr (std::is_same_v<T, FillParams>) {
                return pa.value == pb.value && pa.dtype == pb.dtype;
            } else if constexpr (std::is_same_v<T, ReduceParams>) {
                return pa.axes == pb.axes && pa.keepdims == pb.keepdims;
            } else if constexpr (std::is_same_v<T, SubtensorParams>) {
                return pa.axis == pb.axis && pa.is_index == pb.is_index &&
                       pa.index == pb.index && pa.start == pb.start &&
                       pa.stop == pb.stop && pa.step == pb.step;
            } else if constexpr (std::is_same_v<T, ReshapeParams>) {
                return pa.shape == pb.shape;
            } else if constexpr (std::is_same_v<T, DimshuffleParams>) {
                return pa.pattern == pb.pattern;
            } else if constexpr (std::is_same_v<T, ShapeIParams>) {
                return pa.axis == pb.axis;
            } else if constexpr (std::is_same_v<T, CompositeParams>) {
                return *pa.program == *pb.program;
            } else {
                static_assert(std::is_same_v<T, ScanParams>);
                return pa.info == pb.info;
            }
        },
        a);
}

// ============================================================================
// Node
// ============================================================================

Node::Node(NodeDesc desc) : id_(next_id()), desc_(std::move(desc)) {
    const size_t n = desc_.outputs.size();
    if (desc_.output_names.size() > n || desc_.test_values.size() > n) {
        throw RuntimeError::internal(std::string(op_name()) +
                                     ": more output names or test values "
                                     "than outputs");
    }
    desc_.output_names.resize(n);
    desc_.test_values.resize(n);
    for (const auto &in : desc_.inputs) {
        if (!in.defined())
            throw RuntimeError::internal(std::string(op_name()) +
                                         ": undefined input variable");
    }
    auto check_alias = [&](const AliasMap &map, const char *what) {
        for (const auto &[out, in] : map) {
            if (out >= n || in >= desc_.inputs.size())
                throw RuntimeError::internal(std::string(op_name()) + ": " +
                                             what + " entry out of range");
        }
    };
    check_alias(desc_.destroy_map, "destroy_map");
    check_alias(desc_.view_map, "view_map");
}

NodePtr Node::make(NodeDesc desc) {
    return std::make_shared<Node>(std::move(desc));
}

Variable Node::output(size_t i) const {
    if (i >= num_outputs())
        throw IndexError::out_of_bounds(static_cast<int64_t>(i), num_outputs(),
                                        0);
    return Variable(shared_from_this(), i);
}

std::optional<size_t> Node::destroyed_input(size_t out) const {
    for (const auto &[o, i] : desc_.destroy_map) {
        if (o == out)
            return i;
    }
    return std::nullopt;
}

std::optional<size_t> Node::viewed_input(size_t out) const {
    for (const auto &[o, i] : desc_.view_map) {
        if (o == out)
            return i;
    }
    return std::nullopt;
}

NodePtr Node::with_inputs(std::vector<Variable> inputs) const {
    NodeDesc desc = desc_;
    desc.inputs = std::move(inputs);
    desc.test_values.assign(desc.outputs.size(), std::nullopt);
    return make(std::move(desc));
}

NodePtr Node::with_destroy_map(AliasMap destroy_map) const {
    NodeDesc desc = desc_;
    desc.destroy_map = std::move(destroy_map);
    return make(std::move(desc));
}

std::string Node::str() const {
    std::ostringstream oss;
    oss << op_name() << "#" << id_;
    if (desc_.op == OpKind::Composite)
        oss << " " << get_params<CompositeParams>(desc_.params).program->str();
    oss << "(";
    for (size_t i = 0; i < desc_.inputs.size(); ++i)
        oss << (i ? ", " : "") << desc_.inputs[i].str();
    oss << ") -> ";
    for (size_t i = 0; i < desc_.outputs.size(); ++i)
        oss << (i ? ", " : "") << desc_.outputs[i].str();
    if (!desc_.destroy_map.empty()) {
        oss << " destroy{";
        for (const auto &[o, i] : desc_.destroy_map)
            oss << o << ":" << i << " ";
        oss << "}";
    }
    return oss.str();
}

// ============================================================================
// SharedVariable
// ============================================================================

SharedVariable::SharedVariable(const Variable &v) : Variable(v) {
    if (!v.defined() || !v.is_shared())
        throw ValueError("variable '" + v.str() + "' is not a shared variable");
}

const std::shared_ptr<SharedState> &SharedVariable::state() const {
    return get_params<SharedParams>(node()->params()).state;
}

} // namespace graph
} // namespace arbor
