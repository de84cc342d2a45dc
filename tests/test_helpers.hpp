#ifndef QUIVERKIT_TEST_HELPERS_HPP
#define QUIVERKIT_TEST_HELPERS_HPP

#include <lamination/triangulation.hpp>
#include <quiver/quiver.hpp>
#include <string>
#include <vector>

namespace quiverkit {
namespace test {

// Octagon with diagonals x1 = (0,3), x2 = (4,6), x3 = (0,4), x4 = (0,6),
// x5 = (0,2). Vertex order: e0..e7 then x1..x5.
inline PolygonTriangulation make_octagon() {
    PolygonTriangulation t(8);
    for (uint32_t i = 0; i < 8; ++i) {
        t.add_arc("e" + std::to_string(i), i, (i + 1) % 8);
    }
    t.add_arc("x1", 0, 3);
    t.add_arc("x2", 4, 6);
    t.add_arc("x3", 0, 4);
    t.add_arc("x4", 0, 6);
    t.add_arc("x5", 0, 2);
    return t;
}

inline Quiver make_octagon_quiver() {
    return make_octagon().to_quiver();
}

// Exchange matrix of the octagon quiver, rows and columns x1..x5
inline std::vector<std::vector<int>> octagon_matrix() {
    return {
        { 0,  0,  1,  0, -1},
        { 0,  0,  1, -1,  0},
        {-1, -1,  0,  1,  0},
        { 0,  1, -1,  0,  0},
        { 1,  0,  0,  0,  0},
    };
}

// Three cluster vertices in a line: a -> b -> c, with frozen f -> a
inline Quiver make_a3_quiver() {
    return Quiver(
        {{"f", VertexKind::Frozen}, {"a", VertexKind::Cluster},
         {"b", VertexKind::Cluster}, {"c", VertexKind::Cluster}},
        {{"f", "a"}, {"a", "b"}, {"b", "c"}});
}

// Net weights agree on every pair with at least one cluster vertex
inline bool same_up_to_frozen_pairs(const Quiver& a, const Quiver& b) {
    if (a.vertex_count() != b.vertex_count()) return false;
    for (VertexId u = 0; u < a.vertex_count(); ++u) {
        for (VertexId v = u + 1; v < a.vertex_count(); ++v) {
            if (a.vertex(u).is_frozen() && a.vertex(v).is_frozen()) continue;
            if (a.net_weight(u, v) != b.net_weight(u, v)) return false;
        }
    }
    return true;
}

}  // namespace test
}  // namespace quiverkit

#endif // QUIVERKIT_TEST_HELPERS_HPP
