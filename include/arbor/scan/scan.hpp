#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "arbor/ops.hpp"

namespace arbor {

// ============================================================================
// Scan: loops as graph nodes
// ============================================================================

// Sequence iterated along its leading axis. At step t, tap k binds row
// t + k - min(taps); every tap must be <= 0.
struct Sequence {
    Variable input;
    std::vector<int> taps = {0};
};

// Recurrent output. Without an initial state the output is not fed back
// and gets no taps. With taps {-1} the initial state is one step; with
// other taps it carries a leading axis whose trailing max|tap| rows are
// used (row len-k+j holds tap -k+j).
struct OutputInfo {
    Variable initial;
    std::vector<int> taps;

    OutputInfo() = default;
    OutputInfo(Variable init, std::vector<int> output_taps = {-1})
        : initial(std::move(init)), taps(std::move(output_taps)) {}
};

// Early termination: the loop stops after the step in which `condition`
// (a bool scalar) is true.
struct Until {
    Variable condition;
};

// One item returned by a step function
using ScanReturn = std::variant<Variable, Updates, Until>;

// Parameters are bound as: sequence taps, output taps, non-sequences.
using StepFn =
    std::function<std::vector<ScanReturn>(const std::vector<Variable> &)>;

struct ScanSpec {
    StepFn fn;
    std::vector<Sequence> sequences;
    std::vector<OutputInfo> outputs_info; // Empty: every output is plain
    std::vector<Variable> non_sequences;
    Variable n_steps; // Integer scalar; undefined = derive from sequences
    bool go_backwards = false;
    std::string name = "scan";
    std::optional<size_t> fn_arity; // Checked against bound parameters
};

struct ScanResult {
    std::vector<Variable> outputs; // Per output: one row per executed step
    Updates updates;               // Final shared values
};

ScanResult scan(const ScanSpec &spec);

// fn(seq rows..., non_sequences...) over every row of the sequences.
ScanResult scan_map(const StepFn &fn, const std::vector<Variable> &sequences,
                    const std::vector<Variable> &non_sequences = {},
                    const std::string &name = "map");

// fn(seq rows..., acc, non_sequences...) -> acc; outputs hold the last
// accumulator value only.
ScanResult scan_reduce(const StepFn &fn, const std::vector<Variable> &sequences,
                       const Variable &initial,
                       const std::vector<Variable> &non_sequences = {},
                       bool go_backwards = false,
                       const std::string &name = "reduce");

ScanResult foldl(const StepFn &fn, const std::vector<Variable> &sequences,
                 const Variable &initial,
                 const std::vector<Variable> &non_sequences = {});
ScanResult foldr(const StepFn &fn, const std::vector<Variable> &sequences,
                 const Variable &initial,
                 const std::vector<Variable> &non_sequences = {});

} // namespace arbor
