#include "arbor/exec/scan_runner.hpp"
#include "arbor/error.hpp"
#include "arbor/log.hpp"

#include <algorithm>

namespace arbor {
namespace exec {

namespace {

// Output history of one scan output. Rows are addressed by absolute
// index: the k initial entries first, then one per step. A rolling
// buffer keeps only the last `rows` of them.
struct History {
    Tensor buffer;
    size_t k = 0;
    size_t rows = 0;
    bool rolling = false;
    Shape step_shape;
    DType dtype = DType::Float64;

    size_t row(size_t absolute) const {
        return rolling ? absolute % rows : absolute;
    }

    void allocate(const Shape &shape) {
        step_shape = shape;
        Shape full{rows};
        full.insert(full.end(), shape.begin(), shape.end());
        buffer = Tensor(full, dtype);
    }
};

int min_tap(const std::vector<int> &taps) {
    return *std::min_element(taps.begin(), taps.end());
}

int max_tap(const std::vector<int> &taps) {
    return *std::max_element(taps.begin(), taps.end());
}

} // namespace

ScanRunner::ScanRunner(std::shared_ptr<const graph::ScanInfo> info,
                       InnerFn inner)
    : info_(std::move(info)), inner_(std::move(inner)) {}

size_t ScanRunner::resolve_steps(const std::vector<Tensor> &seqs,
                                 const std::vector<Tensor> &outer) const {
    const auto &info = *info_;
    std::vector<size_t> available;
    for (size_t k = 0; k < seqs.size(); ++k) {
        size_t span = static_cast<size_t>(max_tap(info.seq_taps[k]) -
                                          min_tap(info.seq_taps[k]));
        size_t len = seqs[k].shape()[0];
        available.push_back(len >= span ? len - span : 0);
    }

    if (!info.has_n_steps)
        return *std::min_element(available.begin(), available.end());

    int64_t requested = outer[0].item<int64_t>();
    if (requested < 0)
        throw ValueError("scan '" + info.name +
                         "': n_steps must be >= 0, got " +
                         std::to_string(requested));
    size_t n = static_cast<size_t>(requested);
    for (size_t k = 0; k < available.size(); ++k) {
        if (n > available[k])
            throw ValueError("scan '" + info.name + "': n_steps=" +
                             std::to_string(n) + " but sequence " +
                             std::to_string(k) + " provides only " +
                             std::to_string(available[k]) + " steps");
    }
    return n;
}

std::vector<Tensor> ScanRunner::run(const std::vector<Tensor> &outer) const {
    const auto &info = *info_;
    const std::string &name = info.name;
    if (outer.size() != info.n_outer_inputs())
        throw RuntimeError::internal("scan '" + name + "' expects " +
                                     std::to_string(info.n_outer_inputs()) +
                                     " inputs, got " +
                                     std::to_string(outer.size()));

    std::vector<Tensor> seqs;
    for (size_t k = 0; k < info.n_seqs(); ++k) {
        Tensor s = outer[info.outer_seq_begin() + k];
        if (info.go_backwards)
            s = s.slice(0, std::nullopt, std::nullopt, -1);
        seqs.push_back(s);
    }
    const size_t n = resolve_steps(seqs, outer);

    // Output histories, seeded with the trailing k rows of each initial
    // buffer
    std::vector<History> hist(info.n_outputs());
    for (size_t o = 0; o < info.n_outputs(); ++o) {
        History &h = hist[o];
        h.k = info.max_lookback(o);
        h.rolling = info.retention[o] > 0;
        h.rows = h.rolling
                     ? std::max<size_t>({info.retention[o], h.k, size_t(1)})
                     : h.k + n;
        h.dtype = info.out_types[o].dtype;
        if (!info.has_initial(o))
            continue;

        Tensor init = outer[*info.outer_init_index(o)];
        if (info.initial_is_single_step(o))
            init = init.expand_dims(0);
        size_t len = init.shape()[0];
        if (len < h.k)
            throw TapWindowError::too_short(name, o, info.out_taps[o], h.k, len);
        h.allocate(Shape(init.shape().begin() + 1, init.shape().end()));
        for (size_t j = 0; j < h.k; ++j)
            h.buffer.index(0, static_cast<int64_t>(h.row(j)))
                .copy_from(init.index(0, static_cast<int64_t>(len - h.k + j)));
    }

    std::vector<Tensor> shared(outer.begin() + info.outer_shared_begin(),
                               outer.begin() + info.outer_nonseq_begin());
    const std::vector<Tensor> nonseqs(outer.begin() + info.outer_nonseq_begin(),
                                      outer.end());

    const size_t n_results =
        info.n_outputs() + info.n_shared + (info.has_until ? 1 : 0);
    std::vector<Tensor> inner_in(info.inner.inputs().size());
    size_t executed = 0;

    for (size_t t = 0; t < n; ++t) {
        size_t pos = 0;
        for (size_t k = 0; k < seqs.size(); ++k) {
            int mn = min_tap(info.seq_taps[k]);
            for (int tap : info.seq_taps[k])
                inner_in[pos++] = seqs[k].index(
                    0, static_cast<int64_t>(t) + tap - mn);
        }
        for (size_t o = 0; o < hist.size(); ++o) {
            for (int tap : info.out_taps[o]) {
                size_t absolute = static_cast<size_t>(
                    static_cast<int64_t>(hist[o].k + t) + tap);
                inner_in[pos++] = hist[o].buffer.index(
                    0, static_cast<int64_t>(hist[o].row(absolute)));
            }
        }
        for (const auto &s : shared)
            inner_in[pos++] = s;
        for (const auto &ns : nonseqs)
            inner_in[pos++] = ns;

        std::vector<Tensor> res = inner_(inner_in);
        if (res.size() != n_results)
            throw RuntimeError::internal("scan '" + name + "' inner graph returned " +
                                         std::to_string(res.size()) +
                                         " values, expected " +
                                         std::to_string(n_results));

        // Results that alias a history must be detached before any row
        // is overwritten
        for (auto &r : res) {
            for (const auto &h : hist) {
                if (h.buffer.defined() && r.shares_memory(h.buffer)) {
                    r = r.copy();
                    break;
                }
            }
        }

        for (size_t o = 0; o < hist.size(); ++o) {
            History &h = hist[o];
            const Tensor &value = res[o];
            if (!h.buffer.defined())
                h.allocate(value.shape());
            else if (value.shape() != h.step_shape)
                throw ValueError("scan '" + name + "': output " +
                                 std::to_string(o) + " has shape " +
                                 ShapeUtils::to_string(value.shape()) +
                                 " at step " + std::to_string(t) + " but " +
                                 ShapeUtils::to_string(h.step_shape) +
                                 " was expected");
            h.buffer.index(0, static_cast<int64_t>(h.row(h.k + t)))
                .copy_from(value);
        }
        for (size_t j = 0; j < shared.size(); ++j)
            shared[j] = res[info.n_outputs() + j];

        executed = t + 1;
        if (info.has_until && res.back().item<bool>())
            break;
    }

    logging::logger()->debug("scan '{}': ran {} of {} steps", name, executed, n);

    std::vector<Tensor> out;
    out.reserve(info.n_outer_outputs());
    for (size_t o = 0; o < hist.size(); ++o) {
        History &h = hist[o];
        if (!h.buffer.defined()) {
            // No step ran and nothing fixes the per-step shape
            out.push_back(Tensor(Shape(info.out_types[o].ndim + 1, 0), h.dtype));
            continue;
        }
        if (!h.rolling) {
            out.push_back(h.buffer.slice(0, static_cast<int64_t>(h.k),
                                         static_cast<int64_t>(h.k + executed)));
            continue;
        }
        // Only executed steps, as in the full history; initial rows that
        // are still in the window are not part of the output
        size_t total = h.k + executed;
        size_t m = std::min(h.rows, executed);
        Shape shape{m};
        shape.insert(shape.end(), h.step_shape.begin(), h.step_shape.end());
        Tensor window(shape, h.dtype);
        for (size_t i = 0; i < m; ++i)
            window.index(0, static_cast<int64_t>(i))
                .copy_from(h.buffer.index(
                    0, static_cast<int64_t>(h.row(total - m + i))));
        out.push_back(window);
    }
    for (auto &s : shared)
        out.push_back(s);
    return out;
}

} // namespace exec
} // namespace arbor
