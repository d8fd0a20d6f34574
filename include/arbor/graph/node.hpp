#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "arbor/dtype.hpp"
#include "arbor/tensor.hpp"
#include "composite.hpp"
#include "op_traits.hpp"
#include "shared.hpp"

namespace arbor {
namespace graph {

class Node;
struct ScanInfo;

using NodePtr = std::shared_ptr<const Node>;

// ============================================================================
// Types and variables
// ============================================================================

// Symbolic type: element type and rank, no concrete shape.
struct TensorType {
    DType dtype = DType::Float64;
    size_t ndim = 0;

    bool operator==(const TensorType &o) const {
        return dtype == o.dtype && ndim == o.ndim;
    }
    bool operator!=(const TensorType &o) const { return !(*this == o); }

    std::string str() const;
};

// Handle to output `index` of a node.
class Variable {
  public:
    Variable() = default;
    Variable(NodePtr node, size_t index) : node_(std::move(node)), index_(index) {}

    bool defined() const { return node_ != nullptr; }
    const NodePtr &node() const { return node_; }
    size_t index() const { return index_; }

    const TensorType &type() const;
    DType dtype() const { return type().dtype; }
    size_t ndim() const { return type().ndim; }
    const std::string &name() const;
    OpKind op() const;

    bool is_input() const { return op() == OpKind::Input; }
    bool is_constant() const { return op() == OpKind::Constant; }
    bool is_shared() const { return op() == OpKind::Shared; }
    bool is_leaf() const { return is_leaf_op(op()); }

    // Eagerly computed value, present when test values were enabled at
    // construction.
    const std::optional<Tensor> &test_value() const;

    // The same computation with a display name. Leaves keep their
    // identity, so naming is only possible on non-leaf outputs.
    Variable named(const std::string &name) const;

    // "name" when named, else "op#id" (with ".index" for multi-output
    // nodes).
    std::string str() const;

    bool operator==(const Variable &o) const {
        return node_ == o.node_ && index_ == o.index_;
    }
    bool operator!=(const Variable &o) const { return !(*this == o); }

  private:
    NodePtr node_;
    size_t index_ = 0;
};

struct VariableHash {
    size_t operator()(const Variable &v) const {
        return std::hash<const void *>()(v.node().get()) ^ (v.index() * 31);
    }
};

// ============================================================================
// Operation-specific parameter types
// ============================================================================

struct NoParams {};

struct ConstantParams {
    Tensor value;
};

struct SharedParams {
    std::shared_ptr<SharedState> state;
};

struct CastParams {
    DType dtype = DType::Float64;
};

struct FillParams {
    double value = 0.0;
    DType dtype = DType::Float64;
};

struct ReduceParams {
    std::vector<int> axes; // Normalized and sorted; empty = all axes
    bool keepdims = false;
};

// One axis is indexed (dropping it) or sliced with Python semantics.
struct SubtensorParams {
    int axis = 0;
    bool is_index = true;
    int64_t index = 0;
    std::optional<int64_t> start;
    std::optional<int64_t> stop;
    int64_t step = 1;
};

struct ReshapeParams {
    std::vector<int64_t> shape; // At most one -1
};

// Output axis i takes input axis pattern[i], or is a new broadcastable
// axis when pattern[i] == -1. Omitted input axes must have length 1.
struct DimshuffleParams {
    std::vector<int> pattern;
};

struct ShapeIParams {
    int axis = 0;
};

struct CompositeParams {
    std::shared_ptr<const CompositeProgram> program;
};

struct ScanParams {
    std::shared_ptr<const ScanInfo> info;
};

using OpParams =
    std::variant<NoParams, ConstantParams, SharedParams, CastParams,
                 FillParams, ReduceParams, SubtensorParams, ReshapeParams,
                 DimshuffleParams, ShapeIParams, CompositeParams, ScanParams>;

// Convenience accessor: returns T& if the variant holds T, throws otherwise
template <typename T> const T &get_params(const OpParams &p) {
    return std::get<T>(p);
}

// Structural equality used by merge and signatures. Constants compare by
// value; shared params by state identity; scan params by info identity.
bool params_equal(const OpParams &a, const OpParams &b);

// (output index, input index) pairs
using AliasMap = std::vector<std::pair<size_t, size_t>>;

// ============================================================================
// Node
// ============================================================================

struct NodeDesc {
    OpKind op{};
    OpParams params;
    std::vector<Variable> inputs;
    std::vector<TensorType> outputs;
    std::vector<std::string> output_names;
    std::vector<std::optional<Tensor>> test_values;
    AliasMap destroy_map; // Output overwrites the input's buffer
    AliasMap view_map;    // Output aliases the input read-only
};

// Immutable operator application. Rewrites build new nodes.
class Node : public std::enable_shared_from_this<Node> {
  public:
    explicit Node(NodeDesc desc);

    static NodePtr make(NodeDesc desc);

    uint64_t id() const { return id_; }
    OpKind op() const { return desc_.op; }
    const char *op_name() const { return graph::op_name(desc_.op); }
    const OpParams &params() const { return desc_.params; }
    const std::vector<Variable> &inputs() const { return desc_.inputs; }
    const std::vector<TensorType> &outputs() const { return desc_.outputs; }
    size_t num_outputs() const { return desc_.outputs.size(); }
    const std::string &output_name(size_t i) const {
        return desc_.output_names[i];
    }
    const std::optional<Tensor> &test_value(size_t i) const {
        return desc_.test_values[i];
    }
    const AliasMap &destroy_map() const { return desc_.destroy_map; }
    const AliasMap &view_map() const { return desc_.view_map; }
    const NodeDesc &desc() const { return desc_; }

    bool is_leaf() const { return is_leaf_op(desc_.op); }

    Variable output(size_t i) const;

    // Input index destroyed by output `out`, if any.
    std::optional<size_t> destroyed_input(size_t out) const;
    std::optional<size_t> viewed_input(size_t out) const;

    // Copies with one aspect changed. Test values are dropped when the
    // inputs change.
    NodePtr with_inputs(std::vector<Variable> inputs) const;
    NodePtr with_destroy_map(AliasMap destroy_map) const;

    std::string str() const;

  private:
    uint64_t id_;
    NodeDesc desc_;

    static uint64_t next_id() {
        static std::atomic<uint64_t> counter{0};
        return counter.fetch_add(1);
    }
};

// ============================================================================
// Shared variables
// ============================================================================

// Variable backed by a SharedState leaf.
class SharedVariable : public Variable {
  public:
    SharedVariable() = default;
    explicit SharedVariable(const Variable &v);

    const std::shared_ptr<SharedState> &state() const;

    Tensor get_value() const { return state()->get_value(); }
    void set_value(const Tensor &value) const { state()->set_value(value); }
};

} // namespace graph
} // namespace arbor
