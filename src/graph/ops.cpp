#include "arbor/ops.hpp"
#include "arbor/config.hpp"
#include "arbor/exec/kernels.hpp"
#include "arbor/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <set>

namespace arbor {

using graph::NodeDesc;
using graph::OpKind;

namespace {

// ============================================================================
// Construction helpers
// ============================================================================

void require_defined(OpKind op, const std::vector<Variable> &inputs) {
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (!inputs[i].defined())
            throw ValueError(std::string(graph::op_name(op)) + ": input " +
                             std::to_string(i) + " is undefined");
    }
}

void require_dtype(OpKind op, size_t index, const Variable &v, DType dtype) {
    if (v.dtype() != dtype)
        throw TypeShapeError::dtype_mismatch(graph::op_name(op), index,
                                             dtype_name(dtype),
                                             dtype_name(v.dtype()));
}

int checked_axis(OpKind op, int axis, size_t ndim) {
    int ax = normalize_axis(axis, ndim);
    if (ax < 0)
        throw TypeShapeError::invalid_axis(graph::op_name(op), axis, ndim);
    return ax;
}

void report_test_value_failure(TestValuePolicy policy, const NodeDesc &desc,
                               const std::string &reason) {
    switch (policy) {
    case TestValuePolicy::Off:
    case TestValuePolicy::Ignore:
        return;
    case TestValuePolicy::Warn:
        logging::logger()->warn("{}: test value not computed: {}",
                                graph::op_name(desc.op), reason);
        return;
    case TestValuePolicy::Raise:
        throw TypeShapeError(std::string(graph::op_name(desc.op)) +
                             ": test value evaluation failed: " + reason);
    }
}

// Eagerly evaluates the node on its inputs' test values when the thread's
// policy asks for it.
void attach_test_values(NodeDesc &desc) {
    TestValuePolicy policy = current_test_value_policy();
    if (policy == TestValuePolicy::Off || desc.op == OpKind::Scan)
        return;

    std::vector<Tensor> values;
    values.reserve(desc.inputs.size());
    for (const auto &in : desc.inputs) {
        auto v = static_value(in);
        if (!v) {
            report_test_value_failure(policy, desc,
                                      "input '" + in.str() +
                                          "' has no test value");
            return;
        }
        values.push_back(*v);
    }

    exec::KernelOptions options;
    options.allow_inplace = false;
    try {
        auto eager = graph::Node::make(desc);
        auto result = exec::run_kernel(*eager, values, options);
        desc.test_values.clear();
        for (auto &t : result.outputs)
            desc.test_values.emplace_back(std::move(t));
    } catch (const ArborError &e) {
        report_test_value_failure(policy, desc, e.what());
    }
}

Variable make_node(OpKind op, graph::OpParams params,
                   std::vector<Variable> inputs, TensorType out,
                   graph::AliasMap view_map = {}) {
    NodeDesc desc;
    desc.op = op;
    desc.params = std::move(params);
    desc.inputs = std::move(inputs);
    desc.outputs = {out};
    desc.view_map = std::move(view_map);
    attach_test_values(desc);
    return graph::Node::make(std::move(desc))->output(0);
}

} // namespace

// ============================================================================
// Type inference
// ============================================================================

TensorType infer_binary_type(OpKind op, const TensorType &a,
                             const TensorType &b) {
    if (!graph::is_binary_op(op))
        throw RuntimeError::internal(std::string(graph::op_name(op)) +
                                     " is not a binary op");
    const std::string name = graph::op_name(op);
    TensorType out;
    out.ndim = std::max(a.ndim, b.ndim);

    if (graph::is_logical_op(op)) {
        if (a.dtype != DType::Bool)
            throw TypeShapeError::dtype_mismatch(name, 0, "bool",
                                                 dtype_name(a.dtype));
        if (b.dtype != DType::Bool)
            throw TypeShapeError::dtype_mismatch(name, 1, "bool",
                                                 dtype_name(b.dtype));
        out.dtype = DType::Bool;
        return out;
    }
    if (graph::is_comparison_op(op)) {
        out.dtype = DType::Bool;
        return out;
    }

    DType d = promote_types(a.dtype, b.dtype);
    if (op == OpKind::TrueDiv)
        d = float_result_type(d);
    else if (d == DType::Bool && op != OpKind::Maximum &&
             op != OpKind::Minimum)
        d = DType::Int64;
    out.dtype = d;
    return out;
}

TensorType infer_unary_type(OpKind op, const TensorType &x) {
    TensorType out = x;
    switch (op) {
    case OpKind::Not:
        if (x.dtype != DType::Bool)
            throw TypeShapeError::dtype_mismatch("not", 0, "bool",
                                                 dtype_name(x.dtype));
        break;
    case OpKind::Neg:
    case OpKind::Abs:
    case OpKind::Sqr:
        if (x.dtype == DType::Bool)
            out.dtype = DType::Int64;
        break;
    case OpKind::Exp:
    case OpKind::Log:
    case OpKind::Sqrt:
    case OpKind::Sin:
    case OpKind::Cos:
    case OpKind::Tanh:
    case OpKind::Sigmoid:
        out.dtype = float_result_type(x.dtype);
        break;
    default:
        throw RuntimeError::internal(std::string(graph::op_name(op)) +
                                     " is not a unary math op");
    }
    return out;
}

std::optional<Tensor> static_value(const Variable &v) {
    if (!v.defined())
        return std::nullopt;
    if (v.is_constant())
        return graph::get_params<graph::ConstantParams>(v.node()->params())
            .value;
    if (v.is_shared())
        return graph::get_params<graph::SharedParams>(v.node()->params())
            .state->get_value();
    return v.test_value();
}

// ============================================================================
// Leaves
// ============================================================================

Variable input(const std::string &name, DType dtype, size_t ndim,
               std::optional<Tensor> test_value) {
    NodeDesc desc;
    desc.op = OpKind::Input;
    desc.outputs = {TensorType{dtype, ndim}};
    desc.output_names = {name};
    if (test_value) {
        if (test_value->ndim() != ndim)
            throw TypeShapeError("input '" + name + "': test value has rank " +
                                 std::to_string(test_value->ndim()) +
                                 " but the input is declared with rank " +
                                 std::to_string(ndim));
        if (test_value->dtype() != dtype) {
            if (!can_cast_safely(test_value->dtype(), dtype))
                throw TypeShapeError("input '" + name +
                                     "': test value has dtype " +
                                     dtype_name(test_value->dtype()) +
                                     " but the input is declared as " +
                                     dtype_name(dtype));
            test_value = test_value->astype(dtype);
        }
        desc.test_values = {std::move(test_value)};
    }
    return graph::Node::make(std::move(desc))->output(0);
}

Variable constant(const Tensor &value, const std::string &name) {
    if (!value.defined())
        throw ValueError("constant '" + name + "' needs a defined value");
    NodeDesc desc;
    desc.op = OpKind::Constant;
    desc.params = graph::ConstantParams{value.copy()};
    desc.outputs = {TensorType{value.dtype(), value.ndim()}};
    desc.output_names = {name};
    return graph::Node::make(std::move(desc))->output(0);
}

SharedVariable shared(const Tensor &value, const std::string &name) {
    auto state = std::make_shared<graph::SharedState>(value, name);
    NodeDesc desc;
    desc.op = OpKind::Shared;
    desc.outputs = {TensorType{state->dtype(), state->ndim()}};
    desc.output_names = {name};
    desc.params = graph::SharedParams{std::move(state)};
    return SharedVariable(graph::Node::make(std::move(desc))->output(0));
}

// ============================================================================
// Elementwise
// ============================================================================

Variable binary(OpKind op, const Variable &a, const Variable &b) {
    require_defined(op, {a, b});
    TensorType out = infer_binary_type(op, a.type(), b.type());
    return make_node(op, graph::NoParams{}, {a, b}, out);
}

Variable add(const Variable &a, const Variable &b) {
    return binary(OpKind::Add, a, b);
}
Variable sub(const Variable &a, const Variable &b) {
    return binary(OpKind::Sub, a, b);
}
Variable mul(const Variable &a, const Variable &b) {
    return binary(OpKind::Mul, a, b);
}
Variable true_div(const Variable &a, const Variable &b) {
    return binary(OpKind::TrueDiv, a, b);
}
Variable int_div(const Variable &a, const Variable &b) {
    return binary(OpKind::IntDiv, a, b);
}
Variable mod(const Variable &a, const Variable &b) {
    return binary(OpKind::Mod, a, b);
}
Variable pow(const Variable &a, const Variable &b) {
    return binary(OpKind::Pow, a, b);
}
Variable maximum(const Variable &a, const Variable &b) {
    return binary(OpKind::Maximum, a, b);
}
Variable minimum(const Variable &a, const Variable &b) {
    return binary(OpKind::Minimum, a, b);
}
Variable eq(const Variable &a, const Variable &b) {
    return binary(OpKind::Eq, a, b);
}
Variable neq(const Variable &a, const Variable &b) {
    return binary(OpKind::Neq, a, b);
}
Variable lt(const Variable &a, const Variable &b) {
    return binary(OpKind::Lt, a, b);
}
Variable le(const Variable &a, const Variable &b) {
    return binary(OpKind::Le, a, b);
}
Variable gt(const Variable &a, const Variable &b) {
    return binary(OpKind::Gt, a, b);
}
Variable ge(const Variable &a, const Variable &b) {
    return binary(OpKind::Ge, a, b);
}
Variable logical_and(const Variable &a, const Variable &b) {
    return binary(OpKind::And, a, b);
}
Variable logical_or(const Variable &a, const Variable &b) {
    return binary(OpKind::Or, a, b);
}

Variable unary(OpKind op, const Variable &x) {
    require_defined(op, {x});
    TensorType out = infer_unary_type(op, x.type());
    return make_node(op, graph::NoParams{}, {x}, out);
}

Variable neg(const Variable &x) { return unary(OpKind::Neg, x); }
Variable abs(const Variable &x) { return unary(OpKind::Abs, x); }
Variable exp(const Variable &x) { return unary(OpKind::Exp, x); }
Variable log(const Variable &x) { return unary(OpKind::Log, x); }
Variable sqrt(const Variable &x) { return unary(OpKind::Sqrt, x); }
Variable sin(const Variable &x) { return unary(OpKind::Sin, x); }
Variable cos(const Variable &x) { return unary(OpKind::Cos, x); }
Variable tanh(const Variable &x) { return unary(OpKind::Tanh, x); }
Variable sigmoid(const Variable &x) { return unary(OpKind::Sigmoid, x); }
Variable sqr(const Variable &x) { return unary(OpKind::Sqr, x); }
Variable logical_not(const Variable &x) { return unary(OpKind::Not, x); }

Variable cast(const Variable &x, DType dtype) {
    require_defined(OpKind::Cast, {x});
    if (x.dtype() == dtype)
        return x;
    return make_node(OpKind::Cast, graph::CastParams{dtype}, {x},
                     TensorType{dtype, x.ndim()});
}

Variable fill_like(const Variable &x, double value, DType dtype) {
    require_defined(OpKind::FillLike, {x});
    return make_node(OpKind::FillLike, graph::FillParams{value, dtype}, {x},
                     TensorType{dtype, x.ndim()});
}

Variable zeros_like(const Variable &x) { return fill_like(x, 0.0, x.dtype()); }
Variable ones_like(const Variable &x) { return fill_like(x, 1.0, x.dtype()); }

Variable switch_(const Variable &cond, const Variable &a, const Variable &b) {
    require_defined(OpKind::Switch, {cond, a, b});
    require_dtype(OpKind::Switch, 0, cond, DType::Bool);
    TensorType out;
    out.dtype = promote_types(a.dtype(), b.dtype());
    out.ndim = std::max({cond.ndim(), a.ndim(), b.ndim()});
    return make_node(OpKind::Switch, graph::NoParams{}, {cond, a, b}, out);
}

// ============================================================================
// Reductions and dot
// ============================================================================

namespace {

Variable reduction(OpKind op, const Variable &x, const std::vector<int> &axes,
                   bool keepdims) {
    require_defined(op, {x});
    std::set<int> normalized;
    for (int ax : axes)
        normalized.insert(checked_axis(op, ax, x.ndim()));

    graph::ReduceParams params;
    params.axes.assign(normalized.begin(), normalized.end());
    params.keepdims = keepdims;

    TensorType out;
    if (keepdims)
        out.ndim = x.ndim();
    else
        out.ndim = axes.empty() ? 0 : x.ndim() - params.axes.size();

    switch (op) {
    case OpKind::Sum:
    case OpKind::Prod:
        out.dtype = is_float_dtype(x.dtype()) ? x.dtype() : DType::Int64;
        break;
    case OpKind::Mean:
        out.dtype = float_result_type(x.dtype());
        break;
    default:
        out.dtype = x.dtype();
        break;
    }
    return make_node(op, std::move(params), {x}, out);
}

} // namespace

Variable sum(const Variable &x, const std::vector<int> &axes, bool keepdims) {
    return reduction(OpKind::Sum, x, axes, keepdims);
}
Variable prod(const Variable &x, const std::vector<int> &axes, bool keepdims) {
    return reduction(OpKind::Prod, x, axes, keepdims);
}
Variable max(const Variable &x, const std::vector<int> &axes, bool keepdims) {
    return reduction(OpKind::Max, x, axes, keepdims);
}
Variable min(const Variable &x, const std::vector<int> &axes, bool keepdims) {
    return reduction(OpKind::Min, x, axes, keepdims);
}
Variable mean(const Variable &x, const std::vector<int> &axes, bool keepdims) {
    return reduction(OpKind::Mean, x, axes, keepdims);
}

Variable dot(const Variable &a, const Variable &b) {
    require_defined(OpKind::Dot, {a, b});
    if (a.ndim() < 1 || a.ndim() > 2)
        throw TypeShapeError::rank_mismatch("dot", 0, "1 or 2", a.ndim());
    if (b.ndim() < 1 || b.ndim() > 2)
        throw TypeShapeError::rank_mismatch("dot", 1, "1 or 2", b.ndim());
    TensorType out;
    out.dtype = promote_types(a.dtype(), b.dtype());
    if (out.dtype == DType::Bool)
        out.dtype = DType::Int64;
    out.ndim = (a.ndim() == 2 ? 1 : 0) + (b.ndim() == 2 ? 1 : 0);
    return make_node(OpKind::Dot, graph::NoParams{}, {a, b}, out);
}

// ============================================================================
// Structural
// ============================================================================

Variable subtensor(const Variable &x, int axis, int64_t index) {
    require_defined(OpKind::Subtensor, {x});
    graph::SubtensorParams p;
    p.axis = checked_axis(OpKind::Subtensor, axis, x.ndim());
    p.is_index = true;
    p.index = index;
    return make_node(OpKind::Subtensor, p, {x},
                     TensorType{x.dtype(), x.ndim() - 1}, {{0, 0}});
}

Variable slice(const Variable &x, int axis, std::optional<int64_t> start,
               std::optional<int64_t> stop, int64_t step) {
    require_defined(OpKind::Subtensor, {x});
    if (step == 0)
        throw ValueError("subtensor: slice step cannot be zero");
    graph::SubtensorParams p;
    p.axis = checked_axis(OpKind::Subtensor, axis, x.ndim());
    p.is_index = false;
    p.start = start;
    p.stop = stop;
    p.step = step;
    return make_node(OpKind::Subtensor, p, {x}, x.type(), {{0, 0}});
}

namespace {

Variable update_subtensor(OpKind op, const Variable &region,
                          const Variable &y) {
    require_defined(op, {region, y});
    if (region.op() != OpKind::Subtensor)
        throw TypeShapeError(std::string(graph::op_name(op)) +
                             ": first argument must be a subtensor, got " +
                             region.node()->op_name());
    const Variable &x = region.node()->inputs()[0];
    if (y.ndim() > region.ndim())
        throw TypeShapeError::rank_mismatch(graph::op_name(op), 1,
                                            "<= " +
                                                std::to_string(region.ndim()),
                                            y.ndim());
    if (!can_cast_safely(y.dtype(), x.dtype()))
        throw TypeShapeError::dtype_mismatch(graph::op_name(op), 1,
                                             dtype_name(x.dtype()),
                                             dtype_name(y.dtype()));
    return make_node(op, region.node()->params(), {x, y}, x.type());
}

} // namespace

Variable set_subtensor(const Variable &region, const Variable &y) {
    return update_subtensor(OpKind::SetSubtensor, region, y);
}

Variable inc_subtensor(const Variable &region, const Variable &y) {
    return update_subtensor(OpKind::IncSubtensor, region, y);
}

Variable reshape(const Variable &x, const std::vector<int64_t> &shape) {
    require_defined(OpKind::Reshape, {x});
    int inferred = 0;
    for (int64_t d : shape) {
        if (d < -1)
            throw ValueError("reshape: invalid dimension " + std::to_string(d));
        if (d == -1 && ++inferred > 1)
            throw ValueError("reshape: only one dimension can be -1");
    }
    return make_node(OpKind::Reshape, graph::ReshapeParams{shape}, {x},
                     TensorType{x.dtype(), shape.size()}, {{0, 0}});
}

Variable dimshuffle(const Variable &x, const std::vector<int> &pattern) {
    require_defined(OpKind::Dimshuffle, {x});
    std::vector<bool> seen(x.ndim(), false);
    std::vector<int> normalized;
    normalized.reserve(pattern.size());
    for (int ax : pattern) {
        if (ax == -1) {
            normalized.push_back(-1);
            continue;
        }
        int n = checked_axis(OpKind::Dimshuffle, ax, x.ndim());
        if (seen[n])
            throw ValueError("dimshuffle: axis " + std::to_string(ax) +
                             " appears twice in the pattern");
        seen[n] = true;
        normalized.push_back(n);
    }
    return make_node(OpKind::Dimshuffle, graph::DimshuffleParams{normalized},
                     {x}, TensorType{x.dtype(), pattern.size()}, {{0, 0}});
}

Variable transpose(const Variable &x, const std::vector<int> &perm) {
    require_defined(OpKind::Dimshuffle, {x});
    std::vector<int> pattern = perm;
    if (pattern.empty()) {
        for (size_t d = x.ndim(); d-- > 0;)
            pattern.push_back(static_cast<int>(d));
    }
    if (pattern.size() != x.ndim())
        throw TypeShapeError("transpose: permutation of length " +
                             std::to_string(pattern.size()) +
                             " for rank " + std::to_string(x.ndim()));
    for (int ax : pattern) {
        if (ax == -1)
            throw TypeShapeError::invalid_axis("transpose", ax, x.ndim());
    }
    return dimshuffle(x, pattern);
}

Variable alloc(const Variable &value, const std::vector<Variable> &dims) {
    std::vector<Variable> inputs{value};
    inputs.insert(inputs.end(), dims.begin(), dims.end());
    require_defined(OpKind::Alloc, inputs);
    for (size_t i = 0; i < dims.size(); ++i) {
        if (dims[i].ndim() != 0)
            throw TypeShapeError::rank_mismatch("alloc", i + 1, "0",
                                                dims[i].ndim());
        if (!is_integer_dtype(dims[i].dtype()))
            throw TypeShapeError::dtype_mismatch("alloc", i + 1, "integer",
                                                 dtype_name(dims[i].dtype()));
    }
    if (value.ndim() > dims.size())
        throw TypeShapeError::rank_mismatch(
            "alloc", 0, "<= " + std::to_string(dims.size()), value.ndim());
    return make_node(OpKind::Alloc, graph::NoParams{}, std::move(inputs),
                     TensorType{value.dtype(), dims.size()});
}

Variable alloc(const Variable &value, const std::vector<int64_t> &dims) {
    std::vector<Variable> vars;
    vars.reserve(dims.size());
    for (int64_t d : dims)
        vars.push_back(constant(d));
    return alloc(value, vars);
}

Variable shape_i(const Variable &x, int axis) {
    require_defined(OpKind::ShapeI, {x});
    graph::ShapeIParams p;
    p.axis = checked_axis(OpKind::ShapeI, axis, x.ndim());
    return make_node(OpKind::ShapeI, p, {x}, TensorType{DType::Int64, 0});
}

Variable deep_copy(const Variable &x) {
    require_defined(OpKind::DeepCopy, {x});
    return make_node(OpKind::DeepCopy, graph::NoParams{}, {x}, x.type());
}

Variable scalar_like(double value, const Variable &like) {
    DType dtype = like.defined() ? like.dtype() : DType::Float64;
    bool exact = false;
    switch (dtype) {
    case DType::Float32:
        exact = static_cast<double>(static_cast<float>(value)) == value ||
                std::isnan(value);
        break;
    case DType::Float64:
        exact = true;
        break;
    case DType::Int32:
        exact = std::trunc(value) == value && value >= INT32_MIN &&
                value <= INT32_MAX;
        break;
    case DType::Int64:
        exact = std::trunc(value) == value && std::fabs(value) < 9.2e18;
        break;
    case DType::Bool:
        exact = false;
        break;
    }
    Tensor t = Tensor::scalar<double>(value);
    return constant(exact ? t.astype(dtype) : t);
}

// ============================================================================
// Operators
// ============================================================================

namespace graph {

Variable operator+(const Variable &a, const Variable &b) { return add(a, b); }
Variable operator-(const Variable &a, const Variable &b) { return sub(a, b); }
Variable operator*(const Variable &a, const Variable &b) { return mul(a, b); }
Variable operator/(const Variable &a, const Variable &b) {
    return true_div(a, b);
}
Variable operator<(const Variable &a, const Variable &b) { return lt(a, b); }
Variable operator>(const Variable &a, const Variable &b) { return gt(a, b); }
Variable operator<=(const Variable &a, const Variable &b) { return le(a, b); }
Variable operator>=(const Variable &a, const Variable &b) { return ge(a, b); }
Variable operator-(const Variable &x) { return neg(x); }

Variable operator+(const Variable &a, double b) {
    return add(a, scalar_like(b, a));
}
Variable operator+(double a, const Variable &b) {
    return add(scalar_like(a, b), b);
}
Variable operator-(const Variable &a, double b) {
    return sub(a, scalar_like(b, a));
}
Variable operator-(double a, const Variable &b) {
    return sub(scalar_like(a, b), b);
}
Variable operator*(const Variable &a, double b) {
    return mul(a, scalar_like(b, a));
}
Variable operator*(double a, const Variable &b) {
    return mul(scalar_like(a, b), b);
}
Variable operator/(const Variable &a, double b) {
    return true_div(a, scalar_like(b, a));
}
Variable operator/(double a, const Variable &b) {
    return true_div(scalar_like(a, b), b);
}
Variable operator<(const Variable &a, double b) {
    return lt(a, scalar_like(b, a));
}
Variable operator>(const Variable &a, double b) {
    return gt(a, scalar_like(b, a));
}
Variable operator<=(const Variable &a, double b) {
    return le(a, scalar_like(b, a));
}
Variable operator>=(const Variable &a, double b) {
    return ge(a, scalar_like(b, a));
}

} // namespace graph
} // namespace arbor
