#ifndef QUIVERKIT_VERTEX_HPP
#define QUIVERKIT_VERTEX_HPP

#include <cstdint>
#include <string>

namespace quiverkit {

using VertexId = uint32_t;

// Kind of a quiver vertex
enum class VertexKind {
    Frozen,   // Never pivots; contributes arrows only
    Cluster   // Mutable; mutation may be performed here
};

// A named vertex of a quiver.
// The id is the global insertion index and never changes.
struct Vertex {
    std::string name;
    VertexKind kind = VertexKind::Cluster;
    VertexId id = 0;

    bool is_frozen() const { return kind == VertexKind::Frozen; }
    bool is_cluster() const { return kind == VertexKind::Cluster; }
};

}  // namespace quiverkit

#endif // QUIVERKIT_VERTEX_HPP
