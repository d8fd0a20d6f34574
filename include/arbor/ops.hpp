#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "arbor/graph/node.hpp"
#include "arbor/tensor.hpp"

namespace arbor {

using graph::SharedVariable;
using graph::TensorType;
using graph::Variable;

// New values for shared variables, applied after an invocation (or
// threaded through the steps of a scan).
using Updates = std::vector<std::pair<SharedVariable, Variable>>;

// ============================================================================
// Leaves
// ============================================================================

// Graph input placeholder. A test value, when given, must have the
// declared dtype and rank.
Variable input(const std::string &name, DType dtype, size_t ndim,
               std::optional<Tensor> test_value = std::nullopt);

// The value is copied; later changes to `value` do not affect the graph.
Variable constant(const Tensor &value, const std::string &name = "");

// Python-style scalar constants: bool, int64 or float64.
template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
Variable constant(T value, const std::string &name = "") {
    if constexpr (std::is_same_v<T, bool>)
        return constant(Tensor::scalar<bool>(value), name);
    else if constexpr (std::is_integral_v<T>)
        return constant(Tensor::scalar<int64_t>(static_cast<int64_t>(value)),
                        name);
    else
        return constant(Tensor::scalar<double>(static_cast<double>(value)),
                        name);
}

SharedVariable shared(const Tensor &value, const std::string &name = "");

// ============================================================================
// Elementwise binary (NumPy broadcasting and promotion)
// ============================================================================

Variable add(const Variable &a, const Variable &b);
Variable sub(const Variable &a, const Variable &b);
Variable mul(const Variable &a, const Variable &b);
Variable true_div(const Variable &a, const Variable &b);
Variable int_div(const Variable &a, const Variable &b);
Variable mod(const Variable &a, const Variable &b);
Variable pow(const Variable &a, const Variable &b);
Variable maximum(const Variable &a, const Variable &b);
Variable minimum(const Variable &a, const Variable &b);

Variable eq(const Variable &a, const Variable &b);
Variable neq(const Variable &a, const Variable &b);
Variable lt(const Variable &a, const Variable &b);
Variable le(const Variable &a, const Variable &b);
Variable gt(const Variable &a, const Variable &b);
Variable ge(const Variable &a, const Variable &b);

// Bool operands only
Variable logical_and(const Variable &a, const Variable &b);
Variable logical_or(const Variable &a, const Variable &b);

// Generic entry point used by rewrites; `op` must be binary.
Variable binary(graph::OpKind op, const Variable &a, const Variable &b);

// ============================================================================
// Elementwise unary
// ============================================================================

Variable neg(const Variable &x);
Variable abs(const Variable &x);
Variable exp(const Variable &x);
Variable log(const Variable &x);
Variable sqrt(const Variable &x);
Variable sin(const Variable &x);
Variable cos(const Variable &x);
Variable tanh(const Variable &x);
Variable sigmoid(const Variable &x);
Variable sqr(const Variable &x);
Variable logical_not(const Variable &x);

Variable unary(graph::OpKind op, const Variable &x);

// Returns `x` itself when it already has `dtype`.
Variable cast(const Variable &x, DType dtype);

Variable fill_like(const Variable &x, double value, DType dtype);
Variable zeros_like(const Variable &x);
Variable ones_like(const Variable &x);

// Elementwise select; `cond` must be bool.
Variable switch_(const Variable &cond, const Variable &a, const Variable &b);

// ============================================================================
// Reductions (empty axes = all axes)
// ============================================================================

Variable sum(const Variable &x, const std::vector<int> &axes = {},
             bool keepdims = false);
Variable prod(const Variable &x, const std::vector<int> &axes = {},
              bool keepdims = false);
Variable max(const Variable &x, const std::vector<int> &axes = {},
             bool keepdims = false);
Variable min(const Variable &x, const std::vector<int> &axes = {},
             bool keepdims = false);
Variable mean(const Variable &x, const std::vector<int> &axes = {},
              bool keepdims = false);

// vector.vector, matrix.vector, vector.matrix, matrix.matrix
Variable dot(const Variable &a, const Variable &b);

// ============================================================================
// Structural
// ============================================================================

// x[..., index, ...] on `axis`; negative indices count from the end.
Variable subtensor(const Variable &x, int axis, int64_t index);

// x[..., start:stop:step, ...] on `axis` with Python slice semantics.
Variable slice(const Variable &x, int axis, std::optional<int64_t> start,
               std::optional<int64_t> stop, int64_t step = 1);

// `region` must be a subtensor or slice of some x. The result is x with
// that region replaced by (or incremented by) y.
Variable set_subtensor(const Variable &region, const Variable &y);
Variable inc_subtensor(const Variable &region, const Variable &y);

// At most one entry may be -1.
Variable reshape(const Variable &x, const std::vector<int64_t> &shape);

// Output axis i takes input axis pattern[i]; -1 inserts a length-1 axis.
Variable dimshuffle(const Variable &x, const std::vector<int> &pattern);

// Permutation of all axes; empty reverses them.
Variable transpose(const Variable &x, const std::vector<int> &perm = {});

// `value` broadcast to a fresh array of shape `dims` (integer scalars).
Variable alloc(const Variable &value, const std::vector<Variable> &dims);
Variable alloc(const Variable &value, const std::vector<int64_t> &dims);

// Length of `axis` as an int64 scalar.
Variable shape_i(const Variable &x, int axis);

Variable deep_copy(const Variable &x);

// Value of a variable available at construction time: constant and
// shared values, or the attached test value.
std::optional<Tensor> static_value(const Variable &v);

// Binary op result type; throws TypeShapeError.
TensorType infer_binary_type(graph::OpKind op, const TensorType &a,
                             const TensorType &b);
TensorType infer_unary_type(graph::OpKind op, const TensorType &x);

// A scalar operand takes the variable's dtype when it can hold the value
// exactly, and float64 otherwise.
Variable scalar_like(double value, const Variable &like);

// ============================================================================
// Operators (in the namespace of Variable so lookup finds them)
// ============================================================================

namespace graph {

Variable operator+(const Variable &a, const Variable &b);
Variable operator-(const Variable &a, const Variable &b);
Variable operator*(const Variable &a, const Variable &b);
Variable operator/(const Variable &a, const Variable &b);
Variable operator<(const Variable &a, const Variable &b);
Variable operator>(const Variable &a, const Variable &b);
Variable operator<=(const Variable &a, const Variable &b);
Variable operator>=(const Variable &a, const Variable &b);
Variable operator-(const Variable &x);

Variable operator+(const Variable &a, double b);
Variable operator+(double a, const Variable &b);
Variable operator-(const Variable &a, double b);
Variable operator-(double a, const Variable &b);
Variable operator*(const Variable &a, double b);
Variable operator*(double a, const Variable &b);
Variable operator/(const Variable &a, double b);
Variable operator/(double a, const Variable &b);
Variable operator<(const Variable &a, double b);
Variable operator>(const Variable &a, double b);
Variable operator<=(const Variable &a, double b);
Variable operator>=(const Variable &a, double b);

} // namespace graph
} // namespace arbor
