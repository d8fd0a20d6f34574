#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace arbor {

using Shape = std::vector<size_t>;
// Strides are counted in elements, not bytes.
using Strides = std::vector<int64_t>;

class ShapeUtils {
  public:
    static size_t size(const Shape &shape);

    static Strides contiguous_strides(const Shape &shape);

    static bool broadcastable(const Shape &a, const Shape &b);

    // NumPy broadcasting; throws ShapeError when incompatible.
    static Shape broadcast_shape(const Shape &a, const Shape &b);

    // Strides that read `shape`/`strides` as if it had `target` shape.
    // Broadcast dimensions get stride 0.
    static Strides broadcast_strides(const Shape &shape, const Strides &strides,
                                     const Shape &target);

    static bool is_contiguous(const Shape &shape, const Strides &strides);

    static std::string to_string(const Shape &shape);
};

// Normalizes a possibly negative axis against `ndim`. Returns -1 if invalid.
int normalize_axis(int axis, size_t ndim);

} // namespace arbor
