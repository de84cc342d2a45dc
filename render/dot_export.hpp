#ifndef QUIVERKIT_DOT_EXPORT_HPP
#define QUIVERKIT_DOT_EXPORT_HPP

#include "render_options.hpp"
#include <quiver/quiver.hpp>
#include <lamination/triangulation.hpp>
#include <lamination/lamination.hpp>
#include <string>
#include <vector>

namespace quiverkit {

// Graphviz rendering of quiver snapshots. This is the diagram consumer:
// it reads vertices() and edges() and applies the RenderOptions itself.

// Frozen vertices are boxes, cluster vertices ellipses
std::string quiver_to_dot(const Quiver& quiver, const RenderOptions& options = RenderOptions{});

// Same, with primed labels from the triangulation and one node per
// lamination joined to the diagonals where its shear coordinate is non-zero
std::string quiver_to_dot(const Quiver& quiver,
                          const PolygonTriangulation& triangulation,
                          const std::vector<Lamination>& laminations,
                          const RenderOptions& options = RenderOptions{});

}  // namespace quiverkit

#endif // QUIVERKIT_DOT_EXPORT_HPP
