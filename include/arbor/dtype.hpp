#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include "arbor/error.hpp"

namespace arbor {

// Element types. Ordered by promotion rank.
enum class DType : uint8_t {
    Bool,
    Int32,
    Int64,
    Float32,
    Float64,
};

constexpr size_t dtype_size(DType dtype) {
    switch (dtype) {
    case DType::Bool:
        return 1;
    case DType::Int32:
        return 4;
    case DType::Int64:
        return 8;
    case DType::Float32:
        return 4;
    case DType::Float64:
        return 8;
    }
    return 0;
}

constexpr bool is_float_dtype(DType dtype) {
    return dtype == DType::Float32 || dtype == DType::Float64;
}

constexpr bool is_integer_dtype(DType dtype) {
    return dtype == DType::Int32 || dtype == DType::Int64;
}

std::string dtype_name(DType dtype);

// Parse "float32", "int64", ... Throws ValueError for unknown names.
DType dtype_from_name(const std::string &name);

// NumPy promotion restricted to the supported types.
DType promote_types(DType a, DType b);

// True if every value of `from` is representable in `to`.
bool can_cast_safely(DType from, DType to);

// Result type of transcendental ops: integers and bool go to float64.
inline DType float_result_type(DType dtype) {
    return is_float_dtype(dtype) ? dtype : DType::Float64;
}

// ============================================================================
// C++ type <-> DType
// ============================================================================

template <typename T> struct dtype_of;

template <> struct dtype_of<bool> {
    static constexpr DType value = DType::Bool;
};
template <> struct dtype_of<int32_t> {
    static constexpr DType value = DType::Int32;
};
template <> struct dtype_of<int64_t> {
    static constexpr DType value = DType::Int64;
};
template <> struct dtype_of<float> {
    static constexpr DType value = DType::Float32;
};
template <> struct dtype_of<double> {
    static constexpr DType value = DType::Float64;
};

template <typename T> constexpr DType dtype_of_v = dtype_of<T>::value;

template <typename T> struct TypeTag {
    using type = T;
};

// Calls fn(TypeTag<T>{}) with T matching `dtype`.
template <typename Fn> decltype(auto) dispatch_dtype(DType dtype, Fn &&fn) {
    switch (dtype) {
    case DType::Bool:
        return fn(TypeTag<bool>{});
    case DType::Int32:
        return fn(TypeTag<int32_t>{});
    case DType::Int64:
        return fn(TypeTag<int64_t>{});
    case DType::Float32:
        return fn(TypeTag<float>{});
    case DType::Float64:
        return fn(TypeTag<double>{});
    }
    throw RuntimeError::internal("unknown dtype in dispatch_dtype");
}

} // namespace arbor
