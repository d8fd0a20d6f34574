#include "arbor/scan/scan.hpp"
#include "arbor/config.hpp"
#include "arbor/graph/graph.hpp"
#include "arbor/log.hpp"
#include "arbor/scan/scan_info.hpp"

#include <algorithm>
#include <cstddef>
#include <unordered_map>
#include <unordered_set>

namespace arbor {

using graph::OpKind;
using graph::ScanInfo;

namespace {

// ============================================================================
// Argument checks
// ============================================================================

void check_sequence(const std::string &name, size_t k, const Sequence &seq) {
    const std::string what = "sequence " + std::to_string(k);
    if (!seq.input.defined())
        throw ValueError("scan '" + name + "': " + what + " is undefined");
    if (seq.input.ndim() < 1)
        throw TypeShapeError("scan '" + name + "': " + what +
                             " must have a leading time axis (rank >= 1)");
    if (seq.taps.empty())
        throw ScanSignatureError("scan '" + name + "': " + what +
                                 " declares no taps");
    for (int tap : seq.taps) {
        if (tap > 0)
            throw ScanSignatureError::invalid_tap(name, what, tap);
    }
}

// Per-step type of a recurrent output
TensorType check_output_info(const std::string &name, size_t k,
                             const OutputInfo &info) {
    const std::string what = "output " + std::to_string(k);
    if (!info.initial.defined()) {
        if (!info.taps.empty())
            throw ScanSignatureError("scan '" + name + "': " + what +
                                     " declares taps without an initial state");
        return TensorType{};
    }
    if (info.taps.empty())
        throw ScanSignatureError("scan '" + name + "': " + what +
                                 " has an initial state but no taps");
    for (int tap : info.taps) {
        if (tap >= 0)
            throw ScanSignatureError::invalid_tap(name, what, tap);
    }
    TensorType t = info.initial.type();
    bool single = info.taps.size() == 1 && info.taps[0] == -1;
    if (!single) {
        if (t.ndim < 1)
            throw TypeShapeError("scan '" + name + "': " + what +
                                 " has taps beyond -1, so its initial state "
                                 "needs a leading axis");
        t.ndim -= 1;
    }
    return t;
}

std::string tap_suffix(int tap) {
    if (tap == 0)
        return "[t]";
    return "[t" + std::to_string(tap) + "]";
}

struct StepReturns {
    std::vector<Variable> values;
    Updates updates;
    Variable until;
};

StepReturns split_returns(const std::string &name,
                          const std::vector<ScanReturn> &items) {
    StepReturns r;
    for (size_t pos = 0; pos < items.size(); ++pos) {
        const auto &item = items[pos];
        if (r.until.defined())
            throw ScanSignatureError::until_not_last(name, pos - 1);
        if (auto v = std::get_if<Variable>(&item)) {
            if (!v->defined())
                throw ScanSignatureError("scan '" + name +
                                         "': returned item " +
                                         std::to_string(pos) +
                                         " is an undefined variable");
            r.values.push_back(*v);
        } else if (auto u = std::get_if<Updates>(&item)) {
            r.updates.insert(r.updates.end(), u->begin(), u->end());
        } else {
            const auto &until = std::get<Until>(item);
            if (!until.condition.defined())
                throw ScanSignatureError("scan '" + name +
                                         "': until condition is undefined");
            if (until.condition.dtype() != DType::Bool ||
                until.condition.ndim() != 0)
                throw TypeShapeError("scan '" + name +
                                     "': until condition must be a bool "
                                     "scalar, got " +
                                     until.condition.type().str());
            r.until = until.condition;
        }
    }
    return r;
}

// Outer variables read by the step graph: everything reachable from
// `roots` that does not depend on an inner placeholder, constants aside.
std::vector<Variable>
find_captures(const std::vector<Variable> &roots,
              const std::unordered_set<const graph::Node *> &placeholders) {
    std::unordered_map<const graph::Node *, bool> inner;
    std::vector<Variable> captured;
    std::unordered_set<Variable, graph::VariableHash> seen;
    auto capture = [&](const Variable &v) {
        if (v.is_constant() || inner[v.node().get()])
            return;
        if (seen.insert(v).second)
            captured.push_back(v);
    };

    for (const auto &node : graph::topological_sort(roots)) {
        if (node->is_leaf()) {
            inner[node.get()] = placeholders.count(node.get()) > 0;
            continue;
        }
        bool depends = false;
        for (const auto &in : node->inputs())
            depends |= inner[in.node().get()];
        inner[node.get()] = depends;
        if (depends) {
            for (const auto &in : node->inputs())
                capture(in);
        }
    }
    for (const auto &root : roots)
        capture(root);
    return captured;
}

} // namespace

// ============================================================================
// scan
// ============================================================================

ScanResult scan(const ScanSpec &spec) {
    const std::string &name = spec.name;
    if (!spec.fn)
        throw ScanSignatureError("scan '" + name + "' has no step function");

    auto info = std::make_shared<ScanInfo>();
    info->name = name;
    info->go_backwards = spec.go_backwards;

    for (size_t k = 0; k < spec.sequences.size(); ++k) {
        check_sequence(name, k, spec.sequences[k]);
        info->seq_taps.push_back(spec.sequences[k].taps);
    }

    if (spec.n_steps.defined()) {
        if (spec.n_steps.ndim() != 0 || !is_integer_dtype(spec.n_steps.dtype()))
            throw TypeShapeError("scan '" + name +
                                 "': n_steps must be an integer scalar, got " +
                                 spec.n_steps.type().str());
        if (auto v = static_value(spec.n_steps); v && spec.n_steps.is_constant()) {
            if (v->item<int64_t>() < 0)
                throw ValueError("scan '" + name + "': n_steps must be >= 0, got " +
                                 std::to_string(v->item<int64_t>()));
        }
        info->has_n_steps = true;
    } else if (spec.sequences.empty()) {
        throw ScanSignatureError("scan '" + name +
                                 "': without sequences n_steps is required");
    }

    // Bound parameters: sequence taps, output taps, non-sequences
    std::vector<Variable> params;
    std::unordered_set<const graph::Node *> placeholders;
    auto placeholder = [&](const std::string &label, TensorType type) {
        Variable v = input(name + "." + label, type.dtype, type.ndim);
        placeholders.insert(v.node().get());
        return v;
    };

    for (size_t k = 0; k < spec.sequences.size(); ++k) {
        const auto &seq = spec.sequences[k];
        TensorType row{seq.input.dtype(), seq.input.ndim() - 1};
        for (int tap : seq.taps)
            params.push_back(
                placeholder("seq" + std::to_string(k) + tap_suffix(tap), row));
    }

    std::vector<TensorType> declared(spec.outputs_info.size());
    for (size_t k = 0; k < spec.outputs_info.size(); ++k) {
        const auto &out = spec.outputs_info[k];
        declared[k] = check_output_info(name, k, out);
        for (int tap : out.taps)
            params.push_back(placeholder(
                "out" + std::to_string(k) + tap_suffix(tap), declared[k]));
    }

    std::vector<Variable> nonseq_params;
    for (size_t k = 0; k < spec.non_sequences.size(); ++k) {
        const auto &ns = spec.non_sequences[k];
        if (!ns.defined())
            throw ValueError("scan '" + name + "': non-sequence " +
                             std::to_string(k) + " is undefined");
        nonseq_params.push_back(
            placeholder("nonseq" + std::to_string(k), ns.type()));
    }
    params.insert(params.end(), nonseq_params.begin(), nonseq_params.end());

    if (spec.fn_arity && *spec.fn_arity != params.size())
        throw ScanSignatureError("scan '" + name + "': step function declares " +
                                 std::to_string(*spec.fn_arity) +
                                 " parameters but " +
                                 std::to_string(params.size()) + " are bound");

    // Placeholders carry no test values; the step graph is built without
    StepReturns returns;
    {
        TestValueScope no_test_values(TestValuePolicy::Off);
        returns = split_returns(name, spec.fn(params));
    }

    // Outputs
    const size_t n_out = returns.values.size();
    if (!spec.outputs_info.empty() && spec.outputs_info.size() != n_out)
        throw ScanSignatureError::return_count(name, spec.outputs_info.size(),
                                               n_out);
    for (size_t k = 0; k < n_out; ++k) {
        const Variable &v = returns.values[k];
        bool fed_back = !spec.outputs_info.empty() &&
                        spec.outputs_info[k].initial.defined();
        if (fed_back) {
            if (v.type() != declared[k])
                throw TypeShapeError("scan '" + name + "': output " +
                                     std::to_string(k) + " step value has type " +
                                     v.type().str() +
                                     " but its initial state requires " +
                                     declared[k].str());
            info->out_taps.push_back(spec.outputs_info[k].taps);
        } else {
            info->out_taps.emplace_back();
        }
        info->out_types.push_back(v.type());
    }
    info->retention.assign(n_out, 0);

    // Shared variables updated by the step are threaded through the loop
    std::vector<SharedVariable> updated;
    std::vector<Variable> update_values;
    for (const auto &[sv, value] : returns.updates) {
        if (!sv.defined() || !value.defined())
            throw ValueError("scan '" + name + "': undefined update entry");
        for (const auto &prev : updated) {
            if (prev == sv)
                throw ValueError("scan '" + name + "': shared variable '" +
                                 sv.str() + "' is updated twice");
        }
        if (value.type() != sv.type())
            throw TypeShapeError("scan '" + name + "': update of '" + sv.str() +
                                 "' has type " + value.type().str() +
                                 " but the shared variable is " +
                                 sv.type().str());
        updated.push_back(sv);
        update_values.push_back(value);
    }
    info->n_shared = updated.size();

    std::vector<Variable> roots = returns.values;
    roots.insert(roots.end(), update_values.begin(), update_values.end());
    if (returns.until.defined()) {
        roots.push_back(returns.until);
        info->has_until = true;
    }

    // Replace shared reads and closure captures with placeholders
    graph::VariableMap replacements;
    std::vector<Variable> shared_params;
    for (const auto &sv : updated) {
        Variable p = placeholder("shared." + sv.str(), sv.type());
        shared_params.push_back(p);
        replacements[sv] = p;
    }

    // Reads of updated shared variables are loop-carried, so anything
    // computed from them stays inside the step
    std::unordered_set<const graph::Node *> carried = placeholders;
    for (const auto &sv : updated)
        carried.insert(sv.node().get());

    std::vector<Variable> implicit_outer;
    std::vector<Variable> implicit_params;
    for (const auto &v : find_captures(roots, carried)) {
        if (replacements.count(v))
            continue;
        implicit_outer.push_back(v);
        Variable p = placeholder("implicit" +
                                     std::to_string(implicit_params.size()),
                                 v.type());
        implicit_params.push_back(p);
        replacements[v] = p;
    }
    info->n_nonseqs = spec.non_sequences.size() + implicit_outer.size();

    std::vector<Variable> inner_inputs(
        params.begin(),
        params.end() - static_cast<std::ptrdiff_t>(nonseq_params.size()));
    inner_inputs.insert(inner_inputs.end(), shared_params.begin(),
                        shared_params.end());
    inner_inputs.insert(inner_inputs.end(), nonseq_params.begin(),
                        nonseq_params.end());
    inner_inputs.insert(inner_inputs.end(), implicit_params.begin(),
                        implicit_params.end());
    info->inner = graph::Graph(inner_inputs,
                               graph::clone_replace(roots, replacements));

    // Outer node
    graph::NodeDesc desc;
    desc.op = OpKind::Scan;
    if (info->has_n_steps)
        desc.inputs.push_back(spec.n_steps);
    for (const auto &seq : spec.sequences)
        desc.inputs.push_back(seq.input);
    for (size_t k = 0; k < n_out; ++k) {
        if (info->has_initial(k))
            desc.inputs.push_back(spec.outputs_info[k].initial);
    }
    desc.inputs.insert(desc.inputs.end(), updated.begin(), updated.end());
    desc.inputs.insert(desc.inputs.end(), spec.non_sequences.begin(),
                       spec.non_sequences.end());
    desc.inputs.insert(desc.inputs.end(), implicit_outer.begin(),
                       implicit_outer.end());

    for (const auto &t : info->out_types)
        desc.outputs.push_back(TensorType{t.dtype, t.ndim + 1});
    for (const auto &sv : updated)
        desc.outputs.push_back(sv.type());

    logging::logger()->debug(
        "scan '{}': {} sequences, {} outputs, {} shared, {} non-sequences "
        "({} captured), inner graph of {} nodes",
        name, info->n_seqs(), n_out, info->n_shared, info->n_nonseqs,
        implicit_outer.size(), info->inner.nodes().size());

    desc.params = graph::ScanParams{info};
    graph::NodePtr node = graph::Node::make(std::move(desc));

    ScanResult result;
    for (size_t k = 0; k < n_out; ++k)
        result.outputs.push_back(node->output(k));
    for (size_t j = 0; j < updated.size(); ++j)
        result.updates.emplace_back(updated[j], node->output(n_out + j));
    return result;
}

// ============================================================================
// Helpers
// ============================================================================

ScanResult scan_map(const StepFn &fn, const std::vector<Variable> &sequences,
                    const std::vector<Variable> &non_sequences,
                    const std::string &name) {
    ScanSpec spec;
    spec.fn = fn;
    for (const auto &s : sequences)
        spec.sequences.push_back(Sequence{s});
    spec.non_sequences = non_sequences;
    spec.name = name;
    return scan(spec);
}

ScanResult scan_reduce(const StepFn &fn, const std::vector<Variable> &sequences,
                       const Variable &initial,
                       const std::vector<Variable> &non_sequences,
                       bool go_backwards, const std::string &name) {
    ScanSpec spec;
    spec.fn = fn;
    for (const auto &s : sequences)
        spec.sequences.push_back(Sequence{s});
    spec.outputs_info.emplace_back(initial);
    spec.non_sequences = non_sequences;
    spec.go_backwards = go_backwards;
    spec.name = name;
    ScanResult r = scan(spec);
    for (auto &out : r.outputs)
        out = subtensor(out, 0, -1);
    return r;
}

ScanResult foldl(const StepFn &fn, const std::vector<Variable> &sequences,
                 const Variable &initial,
                 const std::vector<Variable> &non_sequences) {
    return scan_reduce(fn, sequences, initial, non_sequences, false, "foldl");
}

ScanResult foldr(const StepFn &fn, const std::vector<Variable> &sequences,
                 const Variable &initial,
                 const std::vector<Variable> &non_sequences) {
    return scan_reduce(fn, sequences, initial, non_sequences, true, "foldr");
}

} // namespace arbor
