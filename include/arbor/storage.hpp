#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace arbor {

// Host memory block backing one or more tensors. Tensors that share a
// Storage alias each other; views carry their own offset and strides.
class Storage {
  public:
    explicit Storage(size_t size_bytes);

    Storage(const Storage &) = delete;
    Storage &operator=(const Storage &) = delete;

    void *data() { return data_.get(); }
    const void *data() const { return data_.get(); }

    size_t size_bytes() const { return size_bytes_; }

    std::unique_ptr<Storage> clone() const;

  private:
    std::unique_ptr<uint8_t[]> data_;
    size_t size_bytes_;
};

std::shared_ptr<Storage> make_storage(size_t size_bytes);

} // namespace arbor
