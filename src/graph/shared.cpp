#include "arbor/graph/shared.hpp"
#include "arbor/error.hpp"

#include <atomic>

namespace arbor {
namespace graph {

namespace {

uint64_t next_shared_id() {
    static std::atomic<uint64_t> counter{0};
    return counter.fetch_add(1);
}

} // namespace

SharedState::SharedState(const Tensor &value, std::string name)
    : id_(next_shared_id()), name_(std::move(name)), dtype_(value.dtype()),
      ndim_(value.ndim()) {
    if (!value.defined())
        throw ValueError("shared variable '" + name_ +
                         "' needs a defined initial value");
    value_ = value.copy();
}

Tensor SharedState::get_value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

void SharedState::set_value(const Tensor &value) {
    if (value.ndim() != ndim_) {
        throw TypeShapeError("shared variable '" + name_ + "' has rank " +
                             std::to_string(ndim_) +
                             " but the new value has rank " +
                             std::to_string(value.ndim()));
    }
    Tensor stored;
    if (value.dtype() == dtype_) {
        stored = value.copy();
    } else if (can_cast_safely(value.dtype(), dtype_)) {
        stored = value.astype(dtype_);
    } else {
        throw TypeShapeError("shared variable '" + name_ + "' has dtype " +
                             dtype_name(dtype_) +
                             " but the new value has dtype " +
                             dtype_name(value.dtype()));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::move(stored);
}

} // namespace graph
} // namespace arbor
