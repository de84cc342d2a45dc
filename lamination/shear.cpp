#include "shear.hpp"
#include <quiver/errors.hpp>
#include <common/logging.hpp>
#include <queue>

namespace quiverkit {

namespace {

// Endpoint shared by two sides of one triangle
MarkedPoint shared_endpoint(const Arc& a, const Arc& b) {
    if (b.has_endpoint(a.p)) return a.p;
    if (b.has_endpoint(a.q)) return a.q;
    throw EmbeddingError("Arcs " + a.name + " and " + b.name + " do not meet");
}

MarkedPoint other_endpoint(const Arc& a, MarkedPoint x) {
    return a.p == x ? a.q : a.p;
}

// Leading point of a boundary segment in counterclockwise order
MarkedPoint segment_start(const PolygonTriangulation& triangulation, const Arc& segment) {
    uint32_t n = triangulation.marked_point_count();
    return (segment.p + 1) % n == segment.q ? segment.p : segment.q;
}

}  // namespace

std::vector<std::string> ShearCalculator::crossing_sequence(const PolygonTriangulation& triangulation,
                                                            const std::string& from_segment,
                                                            const std::string& to_segment) {
    const Arc& start = triangulation.arc(from_segment);
    const Arc& end = triangulation.arc(to_segment);
    if (!triangulation.is_boundary(start) || !triangulation.is_boundary(end)) {
        throw InvalidLaminationError("Lamination endpoints must be boundary segments: " +
                                     from_segment + ", " + to_segment);
    }

    std::vector<std::string> sequence{start.name};
    if (start.name == end.name) {
        return sequence;
    }

    // Points a+1 .. b lie on one side of the lamination, the rest on the other
    uint32_t n = triangulation.marked_point_count();
    MarkedPoint a = segment_start(triangulation, start);
    MarkedPoint b = segment_start(triangulation, end);
    uint32_t span = (b + n - a) % n;
    auto side = [a, n, span](MarkedPoint x) {
        uint32_t d = (x + n - a) % n;
        return d >= 1 && d <= span;
    };

    const Arc* current = &start;
    std::optional<Triangle> previous;
    for (size_t step = 0; step <= triangulation.arcs().size(); ++step) {
        const Triangle* next_triangle = nullptr;
        auto candidates = triangulation.triangles_of(current->name);
        for (const auto& t : candidates) {
            if (!previous || t != *previous) {
                next_triangle = &t;
                break;
            }
        }
        if (!next_triangle) {
            throw EmbeddingError("Lamination leaves the triangulation at " + current->name);
        }

        MarkedPoint apex = 0;
        for (MarkedPoint x : *next_triangle) {
            if (!current->has_endpoint(x)) apex = x;
        }

        const Arc* exit = nullptr;
        for (MarkedPoint corner : {current->p, current->q}) {
            const Arc& side_arc = triangulation.arc(*triangulation.arc_between(corner, apex));
            if (side_arc.name == end.name) {
                exit = &side_arc;
                break;
            }
            if (!triangulation.is_boundary(side_arc) && side(side_arc.p) != side(side_arc.q)) {
                exit = &side_arc;
            }
        }
        if (!exit) {
            throw EmbeddingError("No exit from triangle at " + current->name);
        }

        sequence.push_back(exit->name);
        if (exit->name == end.name) {
            return sequence;
        }
        previous = *next_triangle;
        current = exit;
    }

    throw EmbeddingError("Lamination from " + from_segment + " to " + to_segment + " does not terminate");
}

bool ShearCalculator::connected(const Quiver& quiver, VertexId from, VertexId to) {
    if (from == to) {
        return true;
    }

    std::vector<bool> visited(quiver.vertex_count(), false);
    std::queue<VertexId> to_visit;
    to_visit.push(from);
    visited[from] = true;

    while (!to_visit.empty()) {
        VertexId v = to_visit.front();
        to_visit.pop();
        for (VertexId w : quiver.edge_set().neighbors(v)) {
            if (w == to) {
                return true;
            }
            if (!visited[w]) {
                visited[w] = true;
                to_visit.push(w);
            }
        }
    }
    return false;
}

ShearVector ShearCalculator::shear_vector(const Quiver& quiver,
                                          const PolygonTriangulation& triangulation,
                                          const Lamination& lamination) {
    const Vertex& from = quiver.vertex(lamination.from_frozen);
    const Vertex& to = quiver.vertex(lamination.to_frozen);
    if (!from.is_frozen() || !to.is_frozen()) {
        throw InvalidLaminationError("Lamination " + lamination.name +
                                     " must join two frozen vertices");
    }

    triangulation.validate_against(quiver);

    if (!connected(quiver, from.id, to.id)) {
        throw DisconnectedLaminationError(from.name, to.name);
    }

    auto sequence = crossing_sequence(triangulation, from.name, to.name);

    auto log = logging::get_logger();
    if (log->should_log(spdlog::level::debug)) {
        std::string path;
        for (const auto& name : sequence) {
            if (!path.empty()) path += " -> ";
            path += name;
        }
        log->debug("Lamination {} crosses {}", lamination.name, path);
    }

    const auto& registry = quiver.registry();
    ShearVector result(registry.cluster_count(), 0);

    for (size_t i = 1; i + 1 < sequence.size(); ++i) {
        const Arc& alpha = triangulation.arc(sequence[i - 1]);
        const Arc& gamma = triangulation.arc(sequence[i]);
        const Arc& beta = triangulation.arc(sequence[i + 1]);

        MarkedPoint p = shared_endpoint(gamma, alpha);
        MarkedPoint q = shared_endpoint(gamma, beta);
        if (p == q) {
            continue;
        }
        MarkedPoint r = other_endpoint(alpha, p);

        size_t column = registry.cluster_position(quiver.index_of(gamma.name));
        result[column] = triangulation.is_counterclockwise(p, q, r) ? 1 : -1;
    }

    return result;
}

ExtendedExchangeMatrix export_exchange_matrix(const Quiver& quiver,
                                              const PolygonTriangulation& triangulation,
                                              const std::vector<Lamination>& laminations) {
    ExtendedExchangeMatrix result(quiver.exchange_matrix());
    for (const auto& lamination : laminations) {
        result.add_shear_row(lamination.name,
                             ShearCalculator::shear_vector(quiver, triangulation, lamination));
    }
    return result;
}

}  // namespace quiverkit
