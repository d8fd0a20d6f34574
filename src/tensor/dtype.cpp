#include "arbor/dtype.hpp"

namespace arbor {

std::string dtype_name(DType dtype) {
    switch (dtype) {
    case DType::Bool:
        return "bool";
    case DType::Int32:
        return "int32";
    case DType::Int64:
        return "int64";
    case DType::Float32:
        return "float32";
    case DType::Float64:
        return "float64";
    }
    return "unknown";
}

DType dtype_from_name(const std::string &name) {
    if (name == "bool")
        return DType::Bool;
    if (name == "int32")
        return DType::Int32;
    if (name == "int64")
        return DType::Int64;
    if (name == "float32")
        return DType::Float32;
    if (name == "float64")
        return DType::Float64;
    throw ValueError("unknown dtype '" + name + "'");
}

DType promote_types(DType a, DType b) {
    if (a == b)
        return a;
    // 32/64-bit integers are not held exactly by float32
    if ((is_integer_dtype(a) && b == DType::Float32) ||
        (a == DType::Float32 && is_integer_dtype(b)))
        return DType::Float64;
    return static_cast<uint8_t>(a) > static_cast<uint8_t>(b) ? a : b;
}

bool can_cast_safely(DType from, DType to) {
    if (from == to)
        return true;
    switch (from) {
    case DType::Bool:
        return true;
    case DType::Int32:
        return to == DType::Int64 || to == DType::Float64;
    case DType::Int64:
        return to == DType::Float64;
    case DType::Float32:
        return to == DType::Float64;
    case DType::Float64:
        return false;
    }
    return false;
}

} // namespace arbor
