#include "arbor/graph/graph_signature.hpp"
#include "arbor/graph/graph.hpp"
#include "arbor/scan/scan_info.hpp"

#include <cstring>
#include <unordered_map>
#include <vector>

namespace arbor {
namespace graph {

// FNV-1a streaming hash
static constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
static constexpr uint64_t FNV_PRIME = 1099511628211ULL;

// Constants up to this many elements hash their values
static constexpr size_t MAX_HASHED_CONSTANT = 64;

static inline uint64_t fnv_hash_byte(uint64_t h, uint8_t b) {
    h ^= b;
    h *= FNV_PRIME;
    return h;
}

static inline uint64_t fnv_hash_u64(uint64_t h, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        h = fnv_hash_byte(h, static_cast<uint8_t>(val & 0xFF));
        val >>= 8;
    }
    return h;
}

static inline uint64_t fnv_hash_i64(uint64_t h, int64_t val) {
    uint64_t u;
    std::memcpy(&u, &val, 8);
    return fnv_hash_u64(h, u);
}

static inline uint64_t fnv_hash_double(uint64_t h, double val) {
    uint64_t u;
    std::memcpy(&u, &val, 8);
    return fnv_hash_u64(h, u);
}

static inline uint64_t fnv_hash_bool(uint64_t h, bool val) {
    return fnv_hash_byte(h, val ? 1 : 0);
}

static uint64_t hash_params(uint64_t h, const OpParams &params) {
    h = fnv_hash_u64(h, params.index()); // variant index
    std::visit(
        [&](const auto &p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, ConstantParams>) {
                h = fnv_hash_u64(h, static_cast<uint64_t>(p.value.dtype()));
                h = fnv_hash_u64(h, p.value.ndim());
                for (auto dim : p.value.shape())
                    h = fnv_hash_u64(h, dim);
                if (p.value.size() <= MAX_HASHED_CONSTANT) {
                    for (size_t i = 0; i < p.value.size(); ++i)
                        h = fnv_hash_double(h, p.value.template at<double>(i));
                }
            } else if constexpr (std::is_same_v<T, SharedParams>) {
                h = fnv_hash_u64(h, p.state->id());
            } else if constexpr (std::is_same_v<T, CastParams>) {
                h = fnv_hash_u64(h, static_cast<uint64_t>(p.dtype));
            } else if constexpr (std::is_same_v<T, FillParams>) {
                h = fnv_hash_double(h, p.value);
                h = fnv_hash_u64(h, static_cast<uint64_t>(p.dtype));
            } else if constexpr (std::is_same_v<T, ReduceParams>) {
                h = fnv_hash_u64(h, p.axes.size());
                for (int ax : p.axes)
                    h = fnv_hash_i64(h, ax);
                h = fnv_hash_bool(h, p.keepdims);
            } else if constexpr (std::is_same_v<T, SubtensorParams>) {
                h = fnv_hash_i64(h, p.axis);
                h = fnv_hash_bool(h, p.is_index);
                h = fnv_hash_i64(h, p.index);
                h = fnv_hash_bool(h, p.start.has_value());
                h = fnv_hash_i64(h, p.start.value_or(0));
                h = fnv_hash_bool(h, p.stop.has_value());
                h = fnv_hash_i64(h, p.stop.value_or(0));
                h = fnv_hash_i64(h, p.step);
            } else if constexpr (std::is_same_v<T, ReshapeParams>) {
                h = fnv_hash_u64(h, p.shape.size());
                for (auto dim : p.shape)
                    h = fnv_hash_i64(h, dim);
            } else if constexpr (std::is_same_v<T, DimshuffleParams>) {
                h = fnv_hash_u64(h, p.pattern.size());
                for (int ax : p.pattern)
                    h = fnv_hash_i64(h, ax);
            } else if constexpr (std::is_same_v<T, ShapeIParams>) {
                h = fnv_hash_i64(h, p.axis);
            } else if constexpr (std::is_same_v<T, CompositeParams>) {
                h = fnv_hash_u64(h, p.program->hash());
            } else if constexpr (std::is_same_v<T, ScanParams>) {
                h = fnv_hash_u64(h, p.info->hash());
            }
            // NoParams: nothing to hash
        },
        params);
    return h;
}

uint64_t node_local_hash(const Node &node) {
    uint64_t h = FNV_OFFSET;
    h = fnv_hash_u64(h, static_cast<uint64_t>(node.op()));
    h = hash_params(h, node.params());
    h = fnv_hash_u64(h, node.num_outputs());
    for (const auto &t : node.outputs()) {
        h = fnv_hash_u64(h, static_cast<uint64_t>(t.dtype));
        h = fnv_hash_u64(h, t.ndim);
    }
    return h;
}

GraphSignature compute_signature(const Graph &graph) {
    const auto &sorted = graph.nodes();

    // Declared inputs hash by position so independent builds compare equal
    std::unordered_map<const Node *, uint64_t> input_position;
    for (size_t i = 0; i < graph.inputs().size(); ++i)
        input_position[graph.inputs()[i].node().get()] = i;

    uint64_t h = FNV_OFFSET;

    // Hash number of nodes as a prefix
    h = fnv_hash_u64(h, sorted.size());

    for (const auto &node : sorted) {
        h = fnv_hash_u64(h, node_local_hash(*node));

        if (node->op() == OpKind::Input) {
            auto it = input_position.find(node.get());
            h = fnv_hash_u64(h, it != input_position.end() ? it->second
                                                            : UINT64_MAX);
        }

        // Hash input connectivity (structural edges)
        h = fnv_hash_u64(h, node->inputs().size());
        for (const auto &inp : node->inputs()) {
            h = fnv_hash_u64(h, graph.position(inp.node().get()));
            h = fnv_hash_u64(h, inp.index());
        }

        // Hash alias metadata
        h = fnv_hash_u64(h, node->destroy_map().size());
        for (const auto &[o, i] : node->destroy_map()) {
            h = fnv_hash_u64(h, o);
            h = fnv_hash_u64(h, i);
        }
        h = fnv_hash_u64(h, node->view_map().size());
        for (const auto &[o, i] : node->view_map()) {
            h = fnv_hash_u64(h, o);
            h = fnv_hash_u64(h, i);
        }
    }

    h = fnv_hash_u64(h, graph.outputs().size());
    for (const auto &out : graph.outputs()) {
        h = fnv_hash_u64(h, graph.position(out.node().get()));
        h = fnv_hash_u64(h, out.index());
    }

    h = fnv_hash_u64(h, graph.orderings().size());
    for (const auto &e : graph.orderings()) {
        h = fnv_hash_u64(h, graph.position(e.before.get()));
        h = fnv_hash_u64(h, graph.position(e.after.get()));
    }

    return GraphSignature{h};
}

// ============================================================================
// ScanInfo hash (lives here to share the FNV helpers)
// ============================================================================

uint64_t ScanInfo::hash() const {
    uint64_t h = FNV_OFFSET;
    h = fnv_hash_u64(h, compute_signature(inner).hash);
    auto hash_taps = [&h](const std::vector<std::vector<int>> &taps) {
        h = fnv_hash_u64(h, taps.size());
        for (const auto &t : taps) {
            h = fnv_hash_u64(h, t.size());
            for (int v : t)
                h = fnv_hash_i64(h, v);
        }
    };
    hash_taps(seq_taps);
    hash_taps(out_taps);
    for (size_t r : retention)
        h = fnv_hash_u64(h, r);
    h = fnv_hash_u64(h, n_shared);
    h = fnv_hash_u64(h, n_nonseqs);
    h = fnv_hash_bool(h, has_n_steps);
    h = fnv_hash_bool(h, has_until);
    h = fnv_hash_bool(h, go_backwards);
    return h;
}

} // namespace graph
} // namespace arbor
