#ifndef QUIVERKIT_EDGE_SET_HPP
#define QUIVERKIT_EDGE_SET_HPP

#include "vertex.hpp"
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace quiverkit {

// Narrow a weight computed in 64 bits; throws WeightOverflowError unless
// both it and its negation fit in int
int checked_weight(int64_t value);

// A directed arc with positive multiplicity
struct Edge {
    VertexId source = 0;
    VertexId target = 0;
    int weight = 1;

    bool operator==(const Edge& other) const {
        return source == other.source && target == other.target && weight == other.weight;
    }
};

// Signed arc multiset between vertices.
// Arcs between the same pair accumulate into one net weight; the sign
// encodes direction. A net weight of zero is never stored.
class EdgeSet {
public:
    using PairKey = std::pair<VertexId, VertexId>;  // (lo, hi), lo < hi

    EdgeSet() = default;

    // Accumulate weight on the arc source -> target
    void add_edge(VertexId source, VertexId target, int weight = 1);

    // Overwrite the net weight from u to v (zero removes the pair)
    void set_net_weight(VertexId u, VertexId v, int weight);

    // Weight from u to v minus weight from v to u
    int net_weight(VertexId u, VertexId v) const;

    // Non-zero arcs oriented so that weight > 0, ordered by (lo, hi)
    std::vector<Edge> edges() const;

    // Vertices sharing a non-zero arc with v, in id order
    std::vector<VertexId> neighbors(VertexId v) const;

    size_t size() const { return weights_.size(); }
    bool empty() const { return weights_.empty(); }

    // Raw storage: net weight from key.first to key.second
    const std::map<PairKey, int>& weights() const { return weights_; }

    bool operator==(const EdgeSet& other) const { return weights_ == other.weights_; }
    bool operator!=(const EdgeSet& other) const { return !(*this == other); }

private:
    std::map<PairKey, int> weights_;
};

}  // namespace quiverkit

#endif // QUIVERKIT_EDGE_SET_HPP
