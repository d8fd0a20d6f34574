#include "arbor/tensor.hpp"
#include "arbor/strided.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace arbor {

// ============================================================================
// Construction
// ============================================================================

Tensor::Tensor(const Shape &shape, DType dtype)
    : storage_(make_storage(ShapeUtils::size(shape) * dtype_size(dtype))),
      shape_(shape), strides_(ShapeUtils::contiguous_strides(shape)),
      dtype_(dtype), offset_(0) {}

Tensor::Tensor(std::shared_ptr<Storage> storage, const Shape &shape,
               const Strides &strides, DType dtype, size_t offset)
    : storage_(std::move(storage)), shape_(shape), strides_(strides),
      dtype_(dtype), offset_(offset) {
    if (strides_.size() != shape_.size()) {
        throw RuntimeError::internal("tensor strides rank " +
                                     std::to_string(strides_.size()) +
                                     " does not match shape rank " +
                                     std::to_string(shape_.size()));
    }
}

void *Tensor::data() {
    if (!storage_)
        throw RuntimeError::internal("access to undefined tensor");
    return static_cast<uint8_t *>(storage_->data()) + offset_ * itemsize();
}

const void *Tensor::data() const {
    if (!storage_)
        throw RuntimeError::internal("access to undefined tensor");
    return static_cast<const uint8_t *>(storage_->data()) +
           offset_ * itemsize();
}

void Tensor::check_typed_access(DType requested) const {
    if (requested != dtype_) {
        throw TypeShapeError("typed access as " + dtype_name(requested) +
                             " to a tensor of dtype " + dtype_name(dtype_));
    }
}

int64_t Tensor::element_offset(const std::vector<size_t> &indices) const {
    if (indices.size() != shape_.size()) {
        throw IndexError("expected " + std::to_string(shape_.size()) +
                         " indices but got " + std::to_string(indices.size()));
    }
    int64_t off = 0;
    for (size_t d = 0; d < indices.size(); ++d) {
        if (indices[d] >= shape_[d]) {
            throw IndexError::out_of_bounds(static_cast<int64_t>(indices[d]),
                                            shape_[d], static_cast<int>(d));
        }
        off += static_cast<int64_t>(indices[d]) * strides_[d];
    }
    return off;
}

int64_t Tensor::flat_offset(size_t flat_index) const {
    if (flat_index >= size()) {
        throw IndexError::out_of_bounds(static_cast<int64_t>(flat_index),
                                        size(), -1);
    }
    int64_t off = 0;
    for (size_t d = shape_.size(); d-- > 0;) {
        size_t i = flat_index % shape_[d];
        flat_index /= shape_[d];
        off += static_cast<int64_t>(i) * strides_[d];
    }
    return off;
}

// ============================================================================
// Memory operations
// ============================================================================

void Tensor::copy_from(const Tensor &src) {
    if (!src.defined())
        throw RuntimeError::internal("copy from undefined tensor");
    if (shares_memory(src) && this != &src) {
        copy_from(src.copy());
        return;
    }

    Strides src_strides =
        ShapeUtils::broadcast_strides(src.shape_, src.strides_, shape_);
    std::array<const Strides *, 2> strides{&strides_, &src_strides};

    dispatch_dtype(dtype_, [&](auto dst_tag) {
        using D = typename decltype(dst_tag)::type;
        D *dst = static_cast<D *>(data());
        dispatch_dtype(src.dtype_, [&](auto src_tag) {
            using S = typename decltype(src_tag)::type;
            const S *s = static_cast<const S *>(src.data());
            strided_for_each<2>(shape_, strides, {0, 0},
                                [&](const std::array<int64_t, 2> &o) {
                                    dst[o[0]] = static_cast<D>(s[o[1]]);
                                });
        });
    });
}

Tensor Tensor::copy() const {
    Tensor out(shape_, dtype_);
    out.copy_from(*this);
    return out;
}

Tensor Tensor::contiguous() const {
    if (is_contiguous())
        return *this;
    return copy();
}

Tensor Tensor::astype(DType dtype) const {
    Tensor out(shape_, dtype);
    out.copy_from(*this);
    return out;
}

// ============================================================================
// Views
// ============================================================================

Tensor Tensor::reshape(const Shape &new_shape) const {
    if (ShapeUtils::size(new_shape) != size())
        throw ShapeError::invalid_reshape(size(), ShapeUtils::size(new_shape));
    if (!is_contiguous())
        return copy().reshape(new_shape);
    return Tensor(storage_, new_shape, ShapeUtils::contiguous_strides(new_shape),
                  dtype_, offset_);
}

Tensor Tensor::index(int axis, int64_t i) const {
    int ax = normalize_axis(axis, ndim());
    if (ax < 0)
        throw IndexError("axis " + std::to_string(axis) +
                         " out of bounds for rank " + std::to_string(ndim()));
    int64_t n = static_cast<int64_t>(shape_[ax]);
    int64_t idx = i < 0 ? i + n : i;
    if (idx < 0 || idx >= n)
        throw IndexError::out_of_bounds(i, shape_[ax], ax);

    Shape shape = shape_;
    Strides strides = strides_;
    size_t offset = static_cast<size_t>(static_cast<int64_t>(offset_) +
                                        idx * strides_[ax]);
    shape.erase(shape.begin() + ax);
    strides.erase(strides.begin() + ax);
    return Tensor(storage_, shape, strides, dtype_, offset);
}

Tensor Tensor::slice(int axis, std::optional<int64_t> start,
                     std::optional<int64_t> stop, int64_t step) const {
    int ax = normalize_axis(axis, ndim());
    if (ax < 0)
        throw IndexError("axis " + std::to_string(axis) +
                         " out of bounds for rank " + std::to_string(ndim()));
    if (step == 0)
        throw ValueError("slice step cannot be zero");

    int64_t n = static_cast<int64_t>(shape_[ax]);
    int64_t lo, hi, len;
    if (step > 0) {
        lo = start.value_or(0);
        hi = stop.value_or(n);
        if (lo < 0)
            lo += n;
        if (hi < 0)
            hi += n;
        lo = std::clamp<int64_t>(lo, 0, n);
        hi = std::clamp<int64_t>(hi, 0, n);
        len = hi > lo ? (hi - lo + step - 1) / step : 0;
    } else {
        lo = start.has_value() ? *start : n - 1;
        hi = stop.has_value() ? *stop : -n - 1;
        if (lo < 0)
            lo += n;
        if (hi < 0)
            hi += n;
        lo = std::clamp<int64_t>(lo, -1, n - 1);
        hi = std::clamp<int64_t>(hi, -1, n - 1);
        len = lo > hi ? (lo - hi + (-step) - 1) / (-step) : 0;
    }

    Shape shape = shape_;
    Strides strides = strides_;
    size_t offset = offset_;
    shape[ax] = static_cast<size_t>(len);
    if (len > 0)
        offset = static_cast<size_t>(static_cast<int64_t>(offset_) +
                                     lo * strides_[ax]);
    strides[ax] = strides_[ax] * step;
    return Tensor(storage_, shape, strides, dtype_, offset);
}

Tensor Tensor::transpose(const std::vector<int> &perm) const {
    std::vector<int> p = perm;
    if (p.empty()) {
        p.resize(ndim());
        std::iota(p.rbegin(), p.rend(), 0);
    }
    if (p.size() != ndim())
        throw ValueError("transpose: permutation " + detail::join_ints(p) +
                         " does not match rank " + std::to_string(ndim()));

    std::vector<bool> seen(ndim(), false);
    Shape shape(ndim());
    Strides strides(ndim());
    for (size_t i = 0; i < p.size(); ++i) {
        int ax = normalize_axis(p[i], ndim());
        if (ax < 0 || seen[ax])
            throw ValueError("transpose: invalid permutation " +
                             detail::join_ints(p));
        seen[ax] = true;
        shape[i] = shape_[ax];
        strides[i] = strides_[ax];
    }
    return Tensor(storage_, shape, strides, dtype_, offset_);
}

Tensor Tensor::expand_dims(int axis) const {
    int ax = normalize_axis(axis, ndim() + 1);
    if (ax < 0)
        throw IndexError("expand_dims: axis " + std::to_string(axis) +
                         " out of bounds for rank " + std::to_string(ndim()));
    Shape shape = shape_;
    Strides strides = strides_;
    shape.insert(shape.begin() + ax, 1);
    strides.insert(strides.begin() + ax, 1);
    return Tensor(storage_, shape, strides, dtype_, offset_);
}

Tensor Tensor::broadcast_to(const Shape &target) const {
    if (target.size() < ndim())
        throw ShapeError::broadcast_incompatible(shape_, target);
    return Tensor(storage_, target,
                  ShapeUtils::broadcast_strides(shape_, strides_, target),
                  dtype_, offset_);
}

// ============================================================================
// Comparison utilities
// ============================================================================

bool Tensor::shares_memory(const Tensor &other) const {
    return storage_ && storage_ == other.storage_;
}

bool Tensor::same_layout(const Tensor &other) const {
    return dtype_ == other.dtype_ && shape_ == other.shape_ &&
           strides_ == other.strides_;
}

bool Tensor::array_equal(const Tensor &other) const {
    if (shape_ != other.shape_)
        return false;
    bool exact = !is_float_dtype(dtype_) && !is_float_dtype(other.dtype_);
    for (size_t i = 0; i < size(); ++i) {
        if (exact) {
            if (at<int64_t>(i) != other.at<int64_t>(i))
                return false;
        } else if (at<double>(i) != other.at<double>(i)) {
            return false;
        }
    }
    return true;
}

bool Tensor::allclose(const Tensor &other, double rtol, double atol,
                      bool equal_nan) const {
    if (shape_ != other.shape_)
        return false;
    for (size_t i = 0; i < size(); ++i) {
        double a = at<double>(i);
        double b = other.at<double>(i);
        if (a == b)
            continue;
        if (std::isnan(a) || std::isnan(b)) {
            if (equal_nan && std::isnan(a) && std::isnan(b))
                continue;
            return false;
        }
        if (std::abs(a - b) > atol + rtol * std::abs(b))
            return false;
    }
    return true;
}

// ============================================================================
// Printing
// ============================================================================

std::string Tensor::repr() const {
    std::ostringstream oss;
    oss << "Tensor(shape=" << ShapeUtils::to_string(shape_)
        << ", dtype=" << dtype_name(dtype_) << ")";
    return oss.str();
}

namespace {

void print_element(std::ostringstream &oss, const Tensor &t, size_t flat) {
    switch (t.dtype()) {
    case DType::Bool:
        oss << (t.at<bool>(flat) ? "True" : "False");
        break;
    case DType::Int32:
    case DType::Int64:
        oss << t.at<int64_t>(flat);
        break;
    case DType::Float32:
    case DType::Float64:
        oss << t.at<double>(flat);
        break;
    }
}

void print_recursive(std::ostringstream &oss, const Tensor &t, size_t dim,
                     size_t &flat) {
    if (dim == t.ndim()) {
        print_element(oss, t, flat++);
        return;
    }
    oss << "[";
    for (size_t i = 0; i < t.shape()[dim]; ++i) {
        if (i > 0)
            oss << (dim + 1 == t.ndim() ? ", " : ",\n ");
        print_recursive(oss, t, dim + 1, flat);
    }
    oss << "]";
}

} // namespace

std::string Tensor::str() const {
    if (!defined())
        return "Tensor(undefined)";
    std::ostringstream oss;
    size_t flat = 0;
    print_recursive(oss, *this, 0, flat);
    return oss.str();
}

// ============================================================================
// Factories
// ============================================================================

Tensor Tensor::zeros(const Shape &shape, DType dtype) {
    return Tensor(shape, dtype);
}

Tensor Tensor::ones(const Shape &shape, DType dtype) {
    Tensor t(shape, dtype);
    t.fill<int64_t>(1);
    return t;
}

Tensor Tensor::empty(const Shape &shape, DType dtype) {
    return Tensor(shape, dtype);
}

Tensor Tensor::arange(int64_t stop, DType dtype) {
    return arange(0, stop, 1, dtype);
}

Tensor Tensor::arange(int64_t start, int64_t stop, int64_t step, DType dtype) {
    if (step == 0)
        throw ValueError("arange step cannot be zero");
    int64_t count = 0;
    if (step > 0 && stop > start)
        count = (stop - start + step - 1) / step;
    else if (step < 0 && stop < start)
        count = (start - stop + (-step) - 1) / (-step);

    Tensor t(Shape{static_cast<size_t>(count)}, dtype);
    for (int64_t i = 0; i < count; ++i)
        t.write_from<int64_t>(i, start + i * step);
    return t;
}

} // namespace arbor
