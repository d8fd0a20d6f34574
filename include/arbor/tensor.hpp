#pragma once

#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "arbor/dtype.hpp"
#include "arbor/error.hpp"
#include "arbor/shape.hpp"
#include "arbor/storage.hpp"

namespace arbor {

// Concrete n-dimensional array. Copies of a Tensor share storage; use
// copy() for an independent buffer. Offsets and strides are in elements.
class Tensor {
  private:
    std::shared_ptr<Storage> storage_;
    Shape shape_;
    Strides strides_;
    DType dtype_ = DType::Float64;
    size_t offset_ = 0;

  public:
    // Constructors
    Tensor() = default;
    Tensor(const Shape &shape, DType dtype);
    Tensor(std::shared_ptr<Storage> storage, const Shape &shape,
           const Strides &strides, DType dtype, size_t offset = 0);

    // Core attributes
    bool defined() const { return storage_ != nullptr; }
    const Shape &shape() const { return shape_; }
    size_t ndim() const { return shape_.size(); }
    size_t size() const { return ShapeUtils::size(shape_); }
    const Strides &strides() const { return strides_; }
    DType dtype() const { return dtype_; }
    size_t offset() const { return offset_; }
    size_t itemsize() const { return dtype_size(dtype_); }
    size_t nbytes() const { return size() * itemsize(); }
    bool is_contiguous() const {
        return ShapeUtils::is_contiguous(shape_, strides_);
    }
    const std::shared_ptr<Storage> &storage() const { return storage_; }

    // Data access (points at the first element, i.e. storage + offset)
    void *data();
    const void *data() const;

    template <typename T> T *typed_data() {
        check_typed_access(dtype_of_v<T>);
        return reinterpret_cast<T *>(data());
    }

    template <typename T> const T *typed_data() const {
        check_typed_access(dtype_of_v<T>);
        return reinterpret_cast<const T *>(data());
    }

    // Element read converted to T, by multi-index or flat row-major index.
    template <typename T> T item(const std::vector<size_t> &indices) const {
        return read_as<T>(element_offset(indices));
    }

    template <typename T> T item() const {
        if (size() != 1) {
            throw ValueError("item() requires a tensor with exactly one "
                             "element, got shape " +
                             ShapeUtils::to_string(shape_));
        }
        return read_as<T>(flat_offset(0));
    }

    template <typename T> T at(size_t flat_index) const {
        return read_as<T>(flat_offset(flat_index));
    }

    template <typename T>
    void set_item(const std::vector<size_t> &indices, const T &value) {
        write_from<T>(element_offset(indices), value);
    }

    template <typename T> void fill(const T &value) {
        for (size_t i = 0; i < size(); ++i)
            write_from<T>(flat_offset(i), value);
    }

    template <typename T> std::vector<T> to_vector() const {
        std::vector<T> out(size());
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = at<T>(i);
        return out;
    }

    // Memory operations
    Tensor copy() const;
    Tensor contiguous() const;
    Tensor astype(DType dtype) const;

    // Copies `src` (broadcast to this shape) into this tensor's memory.
    void copy_from(const Tensor &src);

    // Views
    Tensor reshape(const Shape &new_shape) const;
    Tensor index(int axis, int64_t i) const;
    // Python slice semantics; nullopt bounds mean "from the start/to the end"
    // in the direction of `step`.
    Tensor slice(int axis, std::optional<int64_t> start,
                 std::optional<int64_t> stop, int64_t step = 1) const;
    Tensor transpose(const std::vector<int> &perm) const;
    Tensor expand_dims(int axis) const;
    Tensor broadcast_to(const Shape &target) const;

    // Comparison utilities
    bool shares_memory(const Tensor &other) const;
    bool same_layout(const Tensor &other) const;
    bool array_equal(const Tensor &other) const;
    bool allclose(const Tensor &other, double rtol = 1e-5,
                  double atol = 1e-8, bool equal_nan = false) const;

    std::string repr() const;
    std::string str() const;

    // Static factory methods
    static Tensor zeros(const Shape &shape, DType dtype = DType::Float64);
    static Tensor ones(const Shape &shape, DType dtype = DType::Float64);
    static Tensor empty(const Shape &shape, DType dtype = DType::Float64);
    static Tensor arange(int64_t stop, DType dtype = DType::Int64);
    static Tensor arange(int64_t start, int64_t stop, int64_t step,
                         DType dtype = DType::Int64);

    template <typename T>
    static Tensor full(const Shape &shape, const T &value) {
        Tensor t(shape, dtype_of_v<T>);
        t.fill(value);
        return t;
    }

    template <typename T> static Tensor scalar(const T &value) {
        return full<T>(Shape{}, value);
    }

    template <typename T>
    static Tensor from_vector(const std::vector<T> &values,
                              const Shape &shape) {
        if (ShapeUtils::size(shape) != values.size()) {
            throw ShapeError("from_vector: " + std::to_string(values.size()) +
                             " values do not fill shape " +
                             ShapeUtils::to_string(shape));
        }
        Tensor t(shape, dtype_of_v<T>);
        for (size_t i = 0; i < values.size(); ++i)
            t.write_from<T>(static_cast<int64_t>(i), values[i]);
        return t;
    }

    template <typename T>
    static Tensor from_vector(const std::vector<T> &values) {
        return from_vector(values, Shape{values.size()});
    }

  private:
    void check_typed_access(DType requested) const;
    int64_t element_offset(const std::vector<size_t> &indices) const;
    int64_t flat_offset(size_t flat_index) const;

    // `offset` is relative to data(), in elements
    template <typename T> T read_as(int64_t offset) const {
        const uint8_t *base = static_cast<const uint8_t *>(data());
        switch (dtype_) {
        case DType::Bool:
            return static_cast<T>(
                reinterpret_cast<const bool *>(base)[offset]);
        case DType::Int32:
            return static_cast<T>(
                reinterpret_cast<const int32_t *>(base)[offset]);
        case DType::Int64:
            return static_cast<T>(
                reinterpret_cast<const int64_t *>(base)[offset]);
        case DType::Float32:
            return static_cast<T>(
                reinterpret_cast<const float *>(base)[offset]);
        case DType::Float64:
            return static_cast<T>(
                reinterpret_cast<const double *>(base)[offset]);
        }
        return T{};
    }

    template <typename T> void write_from(int64_t offset, const T &value) {
        uint8_t *base = static_cast<uint8_t *>(data());
        switch (dtype_) {
        case DType::Bool:
            reinterpret_cast<bool *>(base)[offset] = value != T{};
            break;
        case DType::Int32:
            reinterpret_cast<int32_t *>(base)[offset] =
                static_cast<int32_t>(value);
            break;
        case DType::Int64:
            reinterpret_cast<int64_t *>(base)[offset] =
                static_cast<int64_t>(value);
            break;
        case DType::Float32:
            reinterpret_cast<float *>(base)[offset] = static_cast<float>(value);
            break;
        case DType::Float64:
            reinterpret_cast<double *>(base)[offset] =
                static_cast<double>(value);
            break;
        }
    }
};

} // namespace arbor
