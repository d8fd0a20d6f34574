#pragma once

#include <cstddef>
#include <cstdint>

namespace arbor {
namespace graph {

enum class OpKind : uint8_t {
    // Leaves
    Input,
    Constant,
    Shared,
    // Binary arithmetic
    Add,
    Sub,
    Mul,
    TrueDiv,
    IntDiv,
    Mod,
    Pow,
    Maximum,
    Minimum,
    // Comparison
    Eq,
    Neq,
    Lt,
    Le,
    Gt,
    Ge,
    // Logical
    And,
    Or,
    Not,
    // Unary math
    Neg,
    Abs,
    Exp,
    Log,
    Sqrt,
    Sin,
    Cos,
    Tanh,
    Sigmoid,
    Sqr,
    // Type conversion and fills
    Cast,
    FillLike,
    // Ternary
    Switch,
    // Reductions
    Sum,
    Prod,
    Max,
    Min,
    Mean,
    // Linear algebra
    Dot,
    // Structural
    Subtensor,
    SetSubtensor,
    IncSubtensor,
    Reshape,
    Dimshuffle,
    Alloc,
    ShapeI,
    DeepCopy,
    // Fused elementwise program and loops
    Composite,
    Scan,
    _Count
};

struct OpTraits {
    bool is_leaf : 1;
    bool is_unary : 1;
    bool is_binary : 1;
    bool is_elementwise : 1;
    bool is_reduction : 1;
    bool is_comparison : 1;
    bool is_logical : 1;
    bool is_view : 1;     // Output 0 may alias input 0 read-only
    bool can_destroy : 1; // Candidate for an in-place rewrite
    bool is_fusable : 1;  // Can join an elementwise composite
};

// clang-format off
inline constexpr OpTraits OP_TRAITS[] = {
    //                  leaf un bin ew red cmp lgc view dst fus
    /*Input*/           {1, 0, 0, 0, 0, 0, 0, 0, 0, 0},
    /*Constant*/        {1, 0, 0, 0, 0, 0, 0, 0, 0, 0},
    /*Shared*/          {1, 0, 0, 0, 0, 0, 0, 0, 0, 0},
    // Binary arithmetic
    /*Add*/             {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    /*Sub*/             {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    /*Mul*/             {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    /*TrueDiv*/         {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    /*IntDiv*/          {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    /*Mod*/             {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    /*Pow*/             {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    /*Maximum*/         {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    /*Minimum*/         {0, 0, 1, 1, 0, 0, 0, 0, 1, 1},
    // Comparison
    /*Eq*/              {0, 0, 1, 1, 0, 1, 0, 0, 1, 0},
    /*Neq*/             {0, 0, 1, 1, 0, 1, 0, 0, 1, 0},
    /*Lt*/              {0, 0, 1, 1, 0, 1, 0, 0, 1, 0},
    /*Le*/              {0, 0, 1, 1, 0, 1, 0, 0, 1, 0},
    /*Gt*/              {0, 0, 1, 1, 0, 1, 0, 0, 1, 0},
    /*Ge*/              {0, 0, 1, 1, 0, 1, 0, 0, 1, 0},
    // Logical
    /*And*/             {0, 0, 1, 1, 0, 0, 1, 0, 1, 0},
    /*Or*/              {0, 0, 1, 1, 0, 0, 1, 0, 1, 0},
    /*Not*/             {0, 1, 0, 1, 0, 0, 1, 0, 1, 0},
    // Unary math
    /*Neg*/             {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Abs*/             {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Exp*/             {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Log*/             {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Sqrt*/            {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Sin*/             {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Cos*/             {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Tanh*/            {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Sigmoid*/         {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    /*Sqr*/             {0, 1, 0, 1, 0, 0, 0, 0, 1, 1},
    // Type conversion and fills
    /*Cast*/            {0, 1, 0, 1, 0, 0, 0, 0, 0, 0},
    /*FillLike*/        {0, 1, 0, 1, 0, 0, 0, 0, 0, 0},
    // Ternary
    /*Switch*/          {0, 0, 0, 1, 0, 0, 0, 0, 1, 0},
    // Reductions
    /*Sum*/             {0, 0, 0, 0, 1, 0, 0, 0, 0, 0},
    /*Prod*/            {0, 0, 0, 0, 1, 0, 0, 0, 0, 0},
    /*Max*/             {0, 0, 0, 0, 1, 0, 0, 0, 0, 0},
    /*Min*/             {0, 0, 0, 0, 1, 0, 0, 0, 0, 0},
    /*Mean*/            {0, 0, 0, 0, 1, 0, 0, 0, 0, 0},
    // Linear algebra
    /*Dot*/             {0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
    // Structural
    /*Subtensor*/       {0, 0, 0, 0, 0, 0, 0, 1, 0, 0},
    /*SetSubtensor*/    {0, 0, 0, 0, 0, 0, 0, 0, 1, 0},
    /*IncSubtensor*/    {0, 0, 0, 0, 0, 0, 0, 0, 1, 0},
    /*Reshape*/         {0, 0, 0, 0, 0, 0, 0, 1, 0, 0},
    /*Dimshuffle*/      {0, 0, 0, 0, 0, 0, 0, 1, 0, 0},
    /*Alloc*/           {0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
    /*ShapeI*/          {0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
    /*DeepCopy*/        {0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
    // Fused elementwise program and loops
    /*Composite*/       {0, 0, 0, 1, 0, 0, 0, 0, 1, 0},
    /*Scan*/            {0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
};
// clang-format on

static_assert(sizeof(OP_TRAITS) / sizeof(OP_TRAITS[0]) ==
                  static_cast<size_t>(OpKind::_Count),
              "OP_TRAITS table must have one entry per OpKind");

inline constexpr const OpTraits &op_traits(OpKind op) {
    return OP_TRAITS[static_cast<size_t>(op)];
}

inline constexpr bool is_leaf_op(OpKind op) { return op_traits(op).is_leaf; }

inline constexpr bool is_unary_op(OpKind op) { return op_traits(op).is_unary; }

inline constexpr bool is_binary_op(OpKind op) {
    return op_traits(op).is_binary;
}

inline constexpr bool is_elementwise_op(OpKind op) {
    return op_traits(op).is_elementwise;
}

inline constexpr bool is_reduction_op(OpKind op) {
    return op_traits(op).is_reduction;
}

inline constexpr bool is_comparison_op(OpKind op) {
    return op_traits(op).is_comparison;
}

inline constexpr bool is_logical_op(OpKind op) {
    return op_traits(op).is_logical;
}

inline constexpr bool is_view_op(OpKind op) { return op_traits(op).is_view; }

inline constexpr bool can_destroy_op(OpKind op) {
    return op_traits(op).can_destroy;
}

inline constexpr bool is_fusable_op(OpKind op) {
    return op_traits(op).is_fusable;
}

const char *op_name(OpKind op);

} // namespace graph
} // namespace arbor
