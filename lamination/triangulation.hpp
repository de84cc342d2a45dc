#ifndef QUIVERKIT_TRIANGULATION_HPP
#define QUIVERKIT_TRIANGULATION_HPP

#include "lamination.hpp"
#include <quiver/quiver.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace quiverkit {

// Marked points are numbered 0..n-1 counterclockwise along the boundary
using MarkedPoint = uint32_t;

// A named arc between two marked points.
// Boundary segments join neighbouring points; all other arcs are diagonals.
struct Arc {
    std::string name;
    MarkedPoint p = 0;
    MarkedPoint q = 0;
    uint32_t flips = 0;  // Number of times this arc has been flipped

    bool has_endpoint(MarkedPoint x) const { return p == x || q == x; }
};

// Corners in increasing order, hence counterclockwise
using Triangle = std::array<MarkedPoint, 3>;

// A triangulated polygon: the combinatorial embedding of a quiver.
// Frozen vertices are boundary segments and cluster vertices are diagonals,
// matched by name. The cyclic boundary order is explicit in the point
// numbering; nothing is inferred from coordinates.
class PolygonTriangulation {
public:
    explicit PolygonTriangulation(uint32_t marked_points);

    // Boundary segments e0..e{n-1} with e_i = (i, i+1) and the fan of
    // diagonals x1..x{n-3} from point 0, x_i = (0, i+1)
    static PolygonTriangulation standard(uint32_t marked_points);

    // Throws EmbeddingError on bad endpoints, duplicate names or arcs,
    // or an arc crossing an existing one. `flips` restores a saved counter.
    const Arc& add_arc(const std::string& name, MarkedPoint p, MarkedPoint q, uint32_t flips = 0);

    uint32_t marked_point_count() const { return n_; }
    const std::vector<Arc>& arcs() const { return arcs_; }

    bool has_arc(const std::string& name) const;
    const Arc& arc(const std::string& name) const;

    // Name of the arc joining p and q, if any
    std::optional<std::string> arc_between(MarkedPoint p, MarkedPoint q) const;

    bool is_boundary(const Arc& arc) const;
    size_t boundary_count() const;
    size_t diagonal_count() const;

    // n boundary segments and n - 3 diagonals
    bool is_complete() const;

    std::vector<Triangle> triangles() const;
    // Triangles having the named arc as a side (one for a segment, two for a diagonal)
    std::vector<Triangle> triangles_of(const std::string& name) const;

    // Replace a diagonal by the other diagonal of its quadrilateral.
    // Throws EmbeddingError for boundary segments or an incomplete triangulation
    const Arc& flip(const std::string& name);

    // Display label with one prime per flip, e.g. x_{3''}
    std::string label(const std::string& name) const;

    // True if p -> q -> r runs counterclockwise
    bool is_counterclockwise(MarkedPoint p, MarkedPoint q, MarkedPoint r) const;

    // Quiver with one vertex per arc, arrows from each triangle
    Quiver to_quiver() const;

    // Elementary lamination u_<name> for each diagonal, from segment
    // (p-1, p) to segment (q-1, q)
    std::vector<Lamination> principal_laminations() const;

    // Throws EmbeddingError unless the triangulation is complete, every quiver
    // vertex has an arc of the same name and kind (frozen = segment,
    // cluster = diagonal), and the quiver's net weights equal those of
    // to_quiver() on every pair with a cluster vertex
    void validate_against(const Quiver& quiver) const;

private:
    using PointPair = std::pair<MarkedPoint, MarkedPoint>;

    static PointPair key(MarkedPoint p, MarkedPoint q) {
        return p < q ? PointPair{p, q} : PointPair{q, p};
    }

    bool crosses(const Arc& a, MarkedPoint c, MarkedPoint d) const;

    uint32_t n_;
    std::vector<Arc> arcs_;
    std::unordered_map<std::string, size_t> by_name_;
    std::map<PointPair, size_t> by_endpoints_;
};

}  // namespace quiverkit

#endif // QUIVERKIT_TRIANGULATION_HPP
