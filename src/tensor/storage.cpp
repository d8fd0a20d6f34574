#include "arbor/storage.hpp"

#include <algorithm>
#include <cstring>

namespace arbor {

// ============================================================================
// Storage Implementation
// ============================================================================

Storage::Storage(size_t size_bytes)
    : data_(new uint8_t[std::max<size_t>(size_bytes, 1)]()),
      size_bytes_(size_bytes) {}

std::unique_ptr<Storage> Storage::clone() const {
    auto copy = std::make_unique<Storage>(size_bytes_);
    std::memcpy(copy->data(), data(), size_bytes_);
    return copy;
}

// ============================================================================
// Factory functions
// ============================================================================

std::shared_ptr<Storage> make_storage(size_t size_bytes) {
    return std::make_shared<Storage>(size_bytes);
}

} // namespace arbor
