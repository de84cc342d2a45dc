#include "edge_set.hpp"
#include "errors.hpp"
#include <limits>
#include <string>

namespace quiverkit {

int checked_weight(int64_t value) {
    // Symmetric range so that reversing an arc can never overflow
    constexpr int64_t limit = std::numeric_limits<int>::max();
    if (value > limit || value < -limit) {
        throw WeightOverflowError("Arc weight " + std::to_string(value) + " is out of range");
    }
    return static_cast<int>(value);
}

void EdgeSet::add_edge(VertexId source, VertexId target, int weight) {
    if (source == target) {
        throw SelfLoopError("#" + std::to_string(source));
    }
    set_net_weight(source, target,
                   checked_weight(int64_t{net_weight(source, target)} + weight));
}

void EdgeSet::set_net_weight(VertexId u, VertexId v, int weight) {
    if (u == v) {
        throw SelfLoopError("#" + std::to_string(u));
    }

    if (weight == std::numeric_limits<int>::min()) {
        throw WeightOverflowError("Arc weight " + std::to_string(weight) + " cannot be reversed");
    }

    PairKey key = u < v ? PairKey{u, v} : PairKey{v, u};
    int stored = u < v ? weight : -weight;

    if (stored == 0) {
        weights_.erase(key);
    } else {
        weights_[key] = stored;
    }
}

int EdgeSet::net_weight(VertexId u, VertexId v) const {
    if (u == v) {
        return 0;
    }
    PairKey key = u < v ? PairKey{u, v} : PairKey{v, u};
    auto it = weights_.find(key);
    if (it == weights_.end()) {
        return 0;
    }
    return u < v ? it->second : -it->second;
}

std::vector<Edge> EdgeSet::edges() const {
    std::vector<Edge> result;
    result.reserve(weights_.size());
    for (const auto& [key, weight] : weights_) {
        if (weight > 0) {
            result.push_back({key.first, key.second, weight});
        } else {
            result.push_back({key.second, key.first, -weight});
        }
    }
    return result;
}

std::vector<VertexId> EdgeSet::neighbors(VertexId v) const {
    std::vector<VertexId> lower;
    std::vector<VertexId> upper;
    for (const auto& [key, weight] : weights_) {
        if (key.first == v) {
            upper.push_back(key.second);
        } else if (key.second == v) {
            lower.push_back(key.first);
        }
    }
    // Keys are ordered by (lo, hi): lower ids come out sorted, as do upper ids
    lower.insert(lower.end(), upper.begin(), upper.end());
    return lower;
}

}  // namespace quiverkit
