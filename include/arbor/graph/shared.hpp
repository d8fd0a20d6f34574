#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "arbor/tensor.hpp"

namespace arbor {
namespace graph {

// Persistent value behind a shared variable. Outlives every compiled
// function that reads or updates it; updates replace the held tensor at
// the end of an invocation.
class SharedState {
  public:
    SharedState(const Tensor &value, std::string name);

    uint64_t id() const { return id_; }
    const std::string &name() const { return name_; }
    DType dtype() const { return dtype_; }
    size_t ndim() const { return ndim_; }

    // Returns the held tensor; callers must not write through it.
    Tensor get_value() const;

    // Stores a copy of `value`; dtype and rank must match (values of a
    // safely castable dtype are converted).
    void set_value(const Tensor &value);

  private:
    uint64_t id_;
    std::string name_;
    DType dtype_;
    size_t ndim_;
    mutable std::mutex mutex_;
    Tensor value_;
};

} // namespace graph
} // namespace arbor
