#include "arbor/shape.hpp"
#include "arbor/error.hpp"

#include <algorithm>
#include <sstream>

namespace arbor {

size_t ShapeUtils::size(const Shape &shape) {
    size_t n = 1;
    for (size_t d : shape)
        n *= d;
    return n;
}

Strides ShapeUtils::contiguous_strides(const Shape &shape) {
    Strides strides(shape.size());
    int64_t stride = 1;
    for (size_t i = shape.size(); i-- > 0;) {
        strides[i] = stride;
        stride *= static_cast<int64_t>(std::max<size_t>(shape[i], 1));
    }
    return strides;
}

bool ShapeUtils::broadcastable(const Shape &a, const Shape &b) {
    size_t n = std::max(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        size_t da = i < n - a.size() ? 1 : a[i - (n - a.size())];
        size_t db = i < n - b.size() ? 1 : b[i - (n - b.size())];
        if (da != db && da != 1 && db != 1)
            return false;
    }
    return true;
}

Shape ShapeUtils::broadcast_shape(const Shape &a, const Shape &b) {
    size_t n = std::max(a.size(), b.size());
    Shape result(n);
    for (size_t i = 0; i < n; ++i) {
        size_t da = i < n - a.size() ? 1 : a[i - (n - a.size())];
        size_t db = i < n - b.size() ? 1 : b[i - (n - b.size())];
        if (da == db || db == 1) {
            result[i] = da;
        } else if (da == 1) {
            result[i] = db;
        } else {
            throw ShapeError::broadcast_incompatible(a, b);
        }
    }
    return result;
}

Strides ShapeUtils::broadcast_strides(const Shape &shape, const Strides &strides,
                                      const Shape &target) {
    Strides result(target.size(), 0);
    size_t offset = target.size() - shape.size();
    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] == target[i + offset]) {
            result[i + offset] = strides[i];
        } else if (shape[i] != 1) {
            throw ShapeError::broadcast_incompatible(shape, target);
        }
    }
    return result;
}

bool ShapeUtils::is_contiguous(const Shape &shape, const Strides &strides) {
    int64_t expected = 1;
    for (size_t i = shape.size(); i-- > 0;) {
        if (shape[i] == 1)
            continue;
        if (strides[i] != expected)
            return false;
        expected *= static_cast<int64_t>(shape[i]);
    }
    return true;
}

std::string ShapeUtils::to_string(const Shape &shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << shape[i];
    }
    if (shape.size() == 1)
        oss << ",";
    oss << ")";
    return oss.str();
}

int normalize_axis(int axis, size_t ndim) {
    int n = static_cast<int>(ndim);
    if (axis < 0)
        axis += n;
    if (axis < 0 || axis >= n)
        return -1;
    return axis;
}

} // namespace arbor
