#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

#include "arbor/error.hpp"
#include "arbor/graph/op_traits.hpp"

namespace arbor {
namespace exec {

// ============================================================================
// Scalar semantics of the elementwise ops
// ============================================================================
//
// Each functor computes one element in the operand type T. Integer
// division and modulo by zero yield 0; an integer raised to a negative
// integer power yields 0 unless the base is 1 or -1.

namespace scalar {

template <typename T> constexpr bool is_int_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool>;

struct Add {
    template <typename T> static T apply(T a, T b) {
        return static_cast<T>(a + b);
    }
};

struct Sub {
    template <typename T> static T apply(T a, T b) {
        return static_cast<T>(a - b);
    }
};

struct Mul {
    template <typename T> static T apply(T a, T b) {
        return static_cast<T>(a * b);
    }
};

struct TrueDiv {
    template <typename T> static T apply(T a, T b) {
        if constexpr (std::is_floating_point_v<T>)
            return a / b;
        else
            return b == T(0) ? T(0) : static_cast<T>(a / b);
    }
};

struct IntDiv {
    template <typename T> static T apply(T a, T b) {
        if constexpr (std::is_floating_point_v<T>) {
            return std::floor(a / b);
        } else if constexpr (is_int_v<T>) {
            if (b == 0)
                return 0;
            T q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0)))
                --q;
            return q;
        } else {
            return b ? a : false;
        }
    }
};

struct Mod {
    template <typename T> static T apply(T a, T b) {
        if constexpr (std::is_floating_point_v<T>) {
            T r = std::fmod(a, b);
            if (r != T(0) && ((r < 0) != (b < 0)))
                r += b;
            return r;
        } else if constexpr (is_int_v<T>) {
            if (b == 0)
                return 0;
            T r = a % b;
            if (r != 0 && ((r < 0) != (b < 0)))
                r += b;
            return r;
        } else {
            return false;
        }
    }
};

struct Pow {
    template <typename T> static T apply(T a, T b) {
        if constexpr (std::is_floating_point_v<T>) {
            return std::pow(a, b);
        } else if constexpr (is_int_v<T>) {
            if (b < 0) {
                if (a == 1)
                    return 1;
                if (a == -1)
                    return (b % 2 == 0) ? 1 : -1;
                return 0;
            }
            T result = 1;
            T base = a;
            while (b > 0) {
                if (b & 1)
                    result = static_cast<T>(result * base);
                base = static_cast<T>(base * base);
                b >>= 1;
            }
            return result;
        } else {
            return a || !b;
        }
    }
};

// NaN propagates, as in NumPy.
struct Maximum {
    template <typename T> static T apply(T a, T b) {
        if constexpr (std::is_floating_point_v<T>) {
            if (std::isnan(a) || std::isnan(b))
                return std::numeric_limits<T>::quiet_NaN();
        }
        return a > b ? a : b;
    }
};

struct Minimum {
    template <typename T> static T apply(T a, T b) {
        if constexpr (std::is_floating_point_v<T>) {
            if (std::isnan(a) || std::isnan(b))
                return std::numeric_limits<T>::quiet_NaN();
        }
        return a < b ? a : b;
    }
};

struct Eq {
    template <typename T> static bool apply(T a, T b) { return a == b; }
};
struct Neq {
    template <typename T> static bool apply(T a, T b) { return a != b; }
};
struct Lt {
    template <typename T> static bool apply(T a, T b) { return a < b; }
};
struct Le {
    template <typename T> static bool apply(T a, T b) { return a <= b; }
};
struct Gt {
    template <typename T> static bool apply(T a, T b) { return a > b; }
};
struct Ge {
    template <typename T> static bool apply(T a, T b) { return a >= b; }
};

struct And {
    template <typename T> static T apply(T a, T b) {
        return static_cast<T>(a && b);
    }
};

struct Or {
    template <typename T> static T apply(T a, T b) {
        return static_cast<T>(a || b);
    }
};

struct Not {
    template <typename T> static T apply(T a) { return static_cast<T>(!a); }
};

struct Neg {
    template <typename T> static T apply(T a) {
        if constexpr (std::is_same_v<T, bool>)
            return !a;
        else
            return static_cast<T>(-a);
    }
};

struct Abs {
    template <typename T> static T apply(T a) {
        if constexpr (std::is_same_v<T, bool>)
            return a;
        else
            return a < T(0) ? static_cast<T>(-a) : a;
    }
};

struct Sqr {
    template <typename T> static T apply(T a) { return static_cast<T>(a * a); }
};

// Transcendentals; integer operands are cast to float64 before they get here
#define ARBOR_FLOAT_UNARY(NAME, EXPR)                                          \
    struct NAME {                                                              \
        template <typename T> static T apply(T a) {                            \
            if constexpr (std::is_floating_point_v<T>)                         \
                return EXPR;                                                   \
            else                                                               \
                return static_cast<T>(EXPR);                                   \
        }                                                                      \
    }

ARBOR_FLOAT_UNARY(Exp, std::exp(a));
ARBOR_FLOAT_UNARY(Log, std::log(a));
ARBOR_FLOAT_UNARY(Sqrt, std::sqrt(a));
ARBOR_FLOAT_UNARY(Sin, std::sin(a));
ARBOR_FLOAT_UNARY(Cos, std::cos(a));
ARBOR_FLOAT_UNARY(Tanh, std::tanh(a));
ARBOR_FLOAT_UNARY(Sigmoid, T(1) / (T(1) + std::exp(-a)));

#undef ARBOR_FLOAT_UNARY

} // namespace scalar

// ============================================================================
// OpKind -> functor dispatch
// ============================================================================

// Calls fn(Functor{}) for a binary elementwise op (arithmetic, comparison
// or logical).
template <typename Fn> decltype(auto) dispatch_binary_op(graph::OpKind op, Fn &&fn) {
    using graph::OpKind;
    switch (op) {
    case OpKind::Add:
        return fn(scalar::Add{});
    case OpKind::Sub:
        return fn(scalar::Sub{});
    case OpKind::Mul:
        return fn(scalar::Mul{});
    case OpKind::TrueDiv:
        return fn(scalar::TrueDiv{});
    case OpKind::IntDiv:
        return fn(scalar::IntDiv{});
    case OpKind::Mod:
        return fn(scalar::Mod{});
    case OpKind::Pow:
        return fn(scalar::Pow{});
    case OpKind::Maximum:
        return fn(scalar::Maximum{});
    case OpKind::Minimum:
        return fn(scalar::Minimum{});
    case OpKind::Eq:
        return fn(scalar::Eq{});
    case OpKind::Neq:
        return fn(scalar::Neq{});
    case OpKind::Lt:
        return fn(scalar::Lt{});
    case OpKind::Le:
        return fn(scalar::Le{});
    case OpKind::Gt:
        return fn(scalar::Gt{});
    case OpKind::Ge:
        return fn(scalar::Ge{});
    case OpKind::And:
        return fn(scalar::And{});
    case OpKind::Or:
        return fn(scalar::Or{});
    default:
        break;
    }
    throw RuntimeError::internal(std::string("not a binary op: ") +
                                 graph::op_name(op));
}

// Calls fn(Functor{}) for a unary elementwise op other than cast and
// fill_like.
template <typename Fn> decltype(auto) dispatch_unary_op(graph::OpKind op, Fn &&fn) {
    using graph::OpKind;
    switch (op) {
    case OpKind::Not:
        return fn(scalar::Not{});
    case OpKind::Neg:
        return fn(scalar::Neg{});
    case OpKind::Abs:
        return fn(scalar::Abs{});
    case OpKind::Exp:
        return fn(scalar::Exp{});
    case OpKind::Log:
        return fn(scalar::Log{});
    case OpKind::Sqrt:
        return fn(scalar::Sqrt{});
    case OpKind::Sin:
        return fn(scalar::Sin{});
    case OpKind::Cos:
        return fn(scalar::Cos{});
    case OpKind::Tanh:
        return fn(scalar::Tanh{});
    case OpKind::Sigmoid:
        return fn(scalar::Sigmoid{});
    case OpKind::Sqr:
        return fn(scalar::Sqr{});
    default:
        break;
    }
    throw RuntimeError::internal(std::string("not a unary op: ") +
                                 graph::op_name(op));
}

} // namespace exec
} // namespace arbor
