#pragma once

#include <optional>
#include <string>
#include <vector>

#include "arbor/graph/graph.hpp"

namespace arbor {
namespace graph {

// ============================================================================
// Wiring of a scan loop node
// ============================================================================
//
// Outer inputs, in order:
//   [n_steps]               int64 scalar, when has_n_steps
//   sequences               one per seq_taps entry, leading axis = time
//   initial states          one per output with taps
//   shared values           n_shared Shared leaves
//   non-sequences           n_nonseqs (explicit, then captured)
//
// Outer outputs: one history per output (leading axis = step), then the
// final value of each shared variable.
//
// Inner graph inputs: one placeholder per sequence tap, per output tap,
// per shared value and per non-sequence, in that order. Inner outputs:
// the step value of each output, the new value of each shared variable,
// then the bool scalar termination predicate when has_until.
struct ScanInfo {
    std::string name;
    Graph inner;

    std::vector<std::vector<int>> seq_taps; // Per sequence, each tap <= 0
    std::vector<std::vector<int>> out_taps; // Per output, each tap < 0
    std::vector<TensorType> out_types;      // Per-step value types

    // Rows kept per output history: 0 keeps every step, otherwise a
    // rolling window of that many trailing rows. The window output holds
    // at most that many executed steps, never initial entries.
    std::vector<size_t> retention;

    size_t n_shared = 0;
    size_t n_nonseqs = 0;
    bool has_n_steps = false;
    bool has_until = false;
    bool go_backwards = false;

    size_t n_seqs() const { return seq_taps.size(); }
    size_t n_outputs() const { return out_taps.size(); }

    // Outputs without taps are not fed back (no initial state).
    bool has_initial(size_t out) const { return !out_taps[out].empty(); }

    // A lone -1 tap takes its initial state without a leading time axis.
    bool initial_is_single_step(size_t out) const {
        return out_taps[out].size() == 1 && out_taps[out][0] == -1;
    }

    // Largest tap magnitude of an output (0 without taps).
    size_t max_lookback(size_t out) const;

    // Positions of each group in the outer input list.
    size_t outer_seq_begin() const { return has_n_steps ? 1 : 0; }
    size_t outer_init_begin() const { return outer_seq_begin() + n_seqs(); }
    size_t n_initials() const;
    std::optional<size_t> outer_init_index(size_t out) const;
    size_t outer_shared_begin() const {
        return outer_init_begin() + n_initials();
    }
    size_t outer_nonseq_begin() const { return outer_shared_begin() + n_shared; }
    size_t n_outer_inputs() const { return outer_nonseq_begin() + n_nonseqs; }

    // Positions of each group in the inner input list.
    size_t n_seq_slices() const;
    size_t inner_out_tap_begin() const { return n_seq_slices(); }
    size_t n_out_tap_slots() const;
    size_t inner_shared_begin() const {
        return inner_out_tap_begin() + n_out_tap_slots();
    }
    size_t inner_nonseq_begin() const { return inner_shared_begin() + n_shared; }

    size_t n_outer_outputs() const { return n_outputs() + n_shared; }

    uint64_t hash() const;
};

} // namespace graph
} // namespace arbor
