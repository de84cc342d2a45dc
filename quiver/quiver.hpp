#ifndef QUIVERKIT_QUIVER_HPP
#define QUIVERKIT_QUIVER_HPP

#include "vertex_registry.hpp"
#include "edge_set.hpp"
#include <exchange/exchange_matrix.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quiverkit {

// A cluster algebra quiver: frozen and cluster vertices joined by signed,
// weighted arcs. Owns its registry and edge set; copies are independent.
//
// Not synchronized. A quiver must not be mutated from two threads at once;
// callers serialize access themselves.
class Quiver {
public:
    struct VertexSpec {
        std::string name;
        VertexKind kind = VertexKind::Cluster;
    };

    struct EdgeSpec {
        std::string source;
        std::string target;
        int weight = 1;
    };

    Quiver() = default;
    Quiver(const std::vector<VertexSpec>& vertices, const std::vector<EdgeSpec>& edges);

    // Construction
    VertexId add_vertex(const std::string& name, VertexKind kind);
    void add_edge(const std::string& source, const std::string& target, int weight = 1);
    void add_edge(VertexId source, VertexId target, int weight = 1);

    // Lookup
    VertexId index_of(const std::string& name) const { return registry_.index_of(name); }
    bool has_vertex(const std::string& name) const { return registry_.contains(name); }
    const Vertex& vertex(VertexId id) const { return registry_.vertex(id); }
    const Vertex& vertex(const std::string& name) const { return registry_.vertex(name); }

    int net_weight(const std::string& u, const std::string& v) const;
    int net_weight(VertexId u, VertexId v) const { return edges_.net_weight(u, v); }

    // Read-only snapshots for rendering and export
    const std::vector<Vertex>& vertices() const { return registry_.vertices(); }
    std::vector<Edge> edges() const { return edges_.edges(); }
    const VertexRegistry& registry() const { return registry_; }
    const EdgeSet& edge_set() const { return edges_; }

    size_t vertex_count() const { return registry_.size(); }
    size_t cluster_count() const { return registry_.cluster_count(); }
    size_t edge_count() const { return edges_.size(); }

    // Exchange matrix over cluster vertices, rebuilt after any edge change
    const ExchangeMatrix& exchange_matrix() const;

    // Mutation at a cluster vertex, in place.
    // Throws UnknownVertexError, FrozenMutationError or WeightOverflowError
    // without touching state.
    Quiver& mutate(const std::string& name);
    Quiver& mutate(VertexId id);

    // Same vertices (names, kinds, order) and same net arcs
    bool operator==(const Quiver& other) const;
    bool operator!=(const Quiver& other) const { return !(*this == other); }

private:
    VertexRegistry registry_;
    EdgeSet edges_;
    mutable std::optional<ExchangeMatrix> matrix_cache_;
};

}  // namespace quiverkit

#endif // QUIVERKIT_QUIVER_HPP
