#ifndef QUIVERKIT_VERTEX_REGISTRY_HPP
#define QUIVERKIT_VERTEX_REGISTRY_HPP

#include "vertex.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace quiverkit {

// Named vertices partitioned into frozen and cluster kinds.
// Ids follow insertion order; the cluster order (matrix rows/columns)
// is the insertion order restricted to cluster vertices.
class VertexRegistry {
public:
    VertexRegistry() = default;

    VertexId add_vertex(const std::string& name, VertexKind kind);

    VertexId index_of(const std::string& name) const;
    bool contains(const std::string& name) const;

    const Vertex& vertex(VertexId id) const;
    const Vertex& vertex(const std::string& name) const { return vertex(index_of(name)); }

    size_t size() const { return vertices_.size(); }
    const std::vector<Vertex>& vertices() const { return vertices_; }

    // Cluster vertex ids in cluster order
    const std::vector<VertexId>& cluster_vertices() const { return cluster_ids_; }
    size_t cluster_count() const { return cluster_ids_.size(); }
    size_t frozen_count() const { return vertices_.size() - cluster_ids_.size(); }

    // Row/column of a cluster vertex in the exchange matrix
    size_t cluster_position(VertexId id) const;

private:
    std::vector<Vertex> vertices_;
    std::vector<VertexId> cluster_ids_;
    std::unordered_map<std::string, VertexId> name_to_id_;
    std::unordered_map<VertexId, size_t> cluster_position_;
};

}  // namespace quiverkit

#endif // QUIVERKIT_VERTEX_REGISTRY_HPP
