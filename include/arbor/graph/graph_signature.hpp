#pragma once

#include <cstddef>
#include <cstdint>

namespace arbor {
namespace graph {

class Graph;
class Node;

struct GraphSignature {
    uint64_t hash;
    bool operator==(const GraphSignature &o) const { return hash == o.hash; }
    bool operator!=(const GraphSignature &o) const { return hash != o.hash; }
};

struct GraphSignatureHash {
    size_t operator()(const GraphSignature &s) const {
        return static_cast<size_t>(s.hash);
    }
};

// Structural signature of a graph: ops, params, types, edges, alias maps
// and ordering edges. Node ids and names do not contribute, so two
// independently built but identical graphs hash equal.
GraphSignature compute_signature(const Graph &graph);

// Hash of a node's op, params and output types (not its inputs). Small
// constants contribute their values.
uint64_t node_local_hash(const Node &node);

} // namespace graph
} // namespace arbor
