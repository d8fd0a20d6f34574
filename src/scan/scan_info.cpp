#include "arbor/scan/scan_info.hpp"

#include <algorithm>

namespace arbor {
namespace graph {

size_t ScanInfo::max_lookback(size_t out) const {
    size_t k = 0;
    for (int tap : out_taps[out])
        k = std::max(k, static_cast<size_t>(-tap));
    return k;
}

size_t ScanInfo::n_initials() const {
    size_t n = 0;
    for (size_t k = 0; k < n_outputs(); ++k)
        n += has_initial(k) ? 1 : 0;
    return n;
}

std::optional<size_t> ScanInfo::outer_init_index(size_t out) const {
    if (!has_initial(out))
        return std::nullopt;
    size_t pos = outer_init_begin();
    for (size_t k = 0; k < out; ++k)
        pos += has_initial(k) ? 1 : 0;
    return pos;
}

size_t ScanInfo::n_seq_slices() const {
    size_t n = 0;
    for (const auto &taps : seq_taps)
        n += taps.size();
    return n;
}

size_t ScanInfo::n_out_tap_slots() const {
    size_t n = 0;
    for (const auto &taps : out_taps)
        n += taps.size();
    return n;
}

} // namespace graph
} // namespace arbor
