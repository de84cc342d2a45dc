#ifndef QUIVERKIT_SHEAR_HPP
#define QUIVERKIT_SHEAR_HPP

#include "lamination.hpp"
#include "triangulation.hpp"
#include <quiver/quiver.hpp>
#include <exchange/exchange_matrix.hpp>
#include <string>
#include <vector>

namespace quiverkit {

// Shear coordinates of a lamination with respect to a triangulated polygon.
//
// The lamination runs between the midpoints of two boundary segments. For a
// crossed diagonal gamma = (p, q), let alpha and beta be the arcs crossed just
// before and after it. When alpha and beta meet gamma at the same endpoint
// the lamination only cuts a corner of gamma's quadrilateral and the
// coordinate is 0. Otherwise alpha = (p, r), beta = (q, s) and the coordinate
// is +1 if (p, q, r) is counterclockwise, -1 if not.
class ShearCalculator {
public:
    // One coordinate per cluster vertex, in cluster order.
    // Throws UnknownVertexError, InvalidLaminationError, EmbeddingError,
    // or DisconnectedLaminationError.
    static ShearVector shear_vector(const Quiver& quiver,
                                    const PolygonTriangulation& triangulation,
                                    const Lamination& lamination);

    // Arcs crossed walking from one boundary segment to the other,
    // including both segments
    static std::vector<std::string> crossing_sequence(const PolygonTriangulation& triangulation,
                                                      const std::string& from_segment,
                                                      const std::string& to_segment);

    // Undirected edge path between two vertices through non-zero arcs
    static bool connected(const Quiver& quiver, VertexId from, VertexId to);
};

// Matrix export with one shear row per lamination, below the principal part
ExtendedExchangeMatrix export_exchange_matrix(const Quiver& quiver,
                                              const PolygonTriangulation& triangulation,
                                              const std::vector<Lamination>& laminations);

}  // namespace quiverkit

#endif // QUIVERKIT_SHEAR_HPP
