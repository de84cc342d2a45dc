#include "triangulation.hpp"
#include <quiver/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <set>

namespace quiverkit {

PolygonTriangulation::PolygonTriangulation(uint32_t marked_points) : n_(marked_points) {
    if (n_ < 3) {
        throw EmbeddingError("A polygon needs at least 3 marked points, got " + std::to_string(n_));
    }
}

PolygonTriangulation PolygonTriangulation::standard(uint32_t marked_points) {
    PolygonTriangulation result(marked_points);
    for (uint32_t i = 0; i < marked_points; ++i) {
        result.add_arc("e" + std::to_string(i), i, (i + 1) % marked_points);
    }
    for (uint32_t i = 2; i + 1 < marked_points; ++i) {
        result.add_arc("x" + std::to_string(i - 1), 0, i);
    }
    return result;
}

bool PolygonTriangulation::crosses(const Arc& a, MarkedPoint c, MarkedPoint d) const {
    if (a.has_endpoint(c) || a.has_endpoint(d)) {
        return false;
    }
    MarkedPoint lo = std::min(a.p, a.q);
    MarkedPoint hi = std::max(a.p, a.q);
    bool c_inside = lo < c && c < hi;
    bool d_inside = lo < d && d < hi;
    return c_inside != d_inside;
}

const Arc& PolygonTriangulation::add_arc(const std::string& name, MarkedPoint p, MarkedPoint q,
                                         uint32_t flips) {
    if (p >= n_ || q >= n_) {
        throw EmbeddingError("Arc " + name + " has an endpoint outside 0.." + std::to_string(n_ - 1));
    }
    if (p == q) {
        throw EmbeddingError("Arc " + name + " joins a point to itself");
    }
    if (by_name_.count(name) > 0) {
        throw EmbeddingError("Duplicate arc name: " + name);
    }
    if (by_endpoints_.count(key(p, q)) > 0) {
        throw EmbeddingError("Arc " + name + " duplicates arc " + arcs_[by_endpoints_.at(key(p, q))].name);
    }
    for (const auto& existing : arcs_) {
        if (crosses(existing, p, q)) {
            throw EmbeddingError("Arc " + name + " crosses arc " + existing.name);
        }
    }

    arcs_.push_back({name, p, q, flips});
    by_name_[name] = arcs_.size() - 1;
    by_endpoints_[key(p, q)] = arcs_.size() - 1;
    return arcs_.back();
}

bool PolygonTriangulation::has_arc(const std::string& name) const {
    return by_name_.find(name) != by_name_.end();
}

const Arc& PolygonTriangulation::arc(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        throw EmbeddingError("Unknown arc: " + name);
    }
    return arcs_[it->second];
}

std::optional<std::string> PolygonTriangulation::arc_between(MarkedPoint p, MarkedPoint q) const {
    auto it = by_endpoints_.find(key(p, q));
    if (it == by_endpoints_.end()) {
        return std::nullopt;
    }
    return arcs_[it->second].name;
}

bool PolygonTriangulation::is_boundary(const Arc& arc) const {
    return (arc.p + 1) % n_ == arc.q || (arc.q + 1) % n_ == arc.p;
}

size_t PolygonTriangulation::boundary_count() const {
    return static_cast<size_t>(std::count_if(arcs_.begin(), arcs_.end(),
        [this](const Arc& a) { return is_boundary(a); }));
}

size_t PolygonTriangulation::diagonal_count() const {
    return arcs_.size() - boundary_count();
}

bool PolygonTriangulation::is_complete() const {
    return boundary_count() == n_ && diagonal_count() == n_ - 3;
}

std::vector<Triangle> PolygonTriangulation::triangles() const {
    std::set<Triangle> found;
    for (const auto& a : arcs_) {
        for (MarkedPoint r = 0; r < n_; ++r) {
            if (a.has_endpoint(r)) continue;
            if (by_endpoints_.count(key(a.p, r)) && by_endpoints_.count(key(a.q, r))) {
                Triangle t{a.p, a.q, r};
                std::sort(t.begin(), t.end());
                found.insert(t);
            }
        }
    }
    return std::vector<Triangle>(found.begin(), found.end());
}

std::vector<Triangle> PolygonTriangulation::triangles_of(const std::string& name) const {
    const Arc& a = arc(name);
    std::vector<Triangle> result;
    for (MarkedPoint r = 0; r < n_; ++r) {
        if (a.has_endpoint(r)) continue;
        if (by_endpoints_.count(key(a.p, r)) && by_endpoints_.count(key(a.q, r))) {
            Triangle t{a.p, a.q, r};
            std::sort(t.begin(), t.end());
            result.push_back(t);
        }
    }
    return result;
}

const Arc& PolygonTriangulation::flip(const std::string& name) {
    const Arc& current = arc(name);
    if (is_boundary(current)) {
        throw EmbeddingError("Cannot flip boundary segment " + name);
    }
    if (!is_complete()) {
        throw EmbeddingError("Cannot flip " + name + " in an incomplete triangulation");
    }

    auto quad = triangles_of(name);
    if (quad.size() != 2) {
        throw EmbeddingError("Arc " + name + " does not bound two triangles");
    }

    auto apex = [&current](const Triangle& t) {
        for (MarkedPoint x : t) {
            if (!current.has_endpoint(x)) return x;
        }
        return t[0];
    };
    MarkedPoint r = apex(quad[0]);
    MarkedPoint s = apex(quad[1]);

    size_t index = by_name_.at(name);
    by_endpoints_.erase(key(current.p, current.q));
    arcs_[index].p = std::min(r, s);
    arcs_[index].q = std::max(r, s);
    arcs_[index].flips += 1;
    by_endpoints_[key(r, s)] = index;

    auto log = logging::get_logger();
    log->debug("Flipped {} to ({}, {})", name, arcs_[index].p, arcs_[index].q);
    return arcs_[index];
}

std::string PolygonTriangulation::label(const std::string& name) const {
    const Arc& a = arc(name);
    std::string primes(a.flips, '\'');

    // Letters before the first digit become the base: x12 -> x_{12}
    size_t digit = name.find_first_of("0123456789");
    if (digit == std::string::npos || digit == 0) {
        return name + primes;
    }
    return name.substr(0, digit) + "_{" + name.substr(digit) + primes + "}";
}

bool PolygonTriangulation::is_counterclockwise(MarkedPoint p, MarkedPoint q, MarkedPoint r) const {
    return (q + n_ - p) % n_ < (r + n_ - p) % n_;
}

Quiver PolygonTriangulation::to_quiver() const {
    Quiver quiver;
    for (const auto& a : arcs_) {
        quiver.add_vertex(a.name, is_boundary(a) ? VertexKind::Frozen : VertexKind::Cluster);
    }

    for (const auto& t : triangles()) {
        const std::string sides[3] = {
            *arc_between(t[0], t[1]),
            *arc_between(t[1], t[2]),
            *arc_between(t[2], t[0]),
        };
        // Arrows run clockwise inside each counterclockwise triangle
        for (int i = 0; i < 3; ++i) {
            const std::string& to = sides[i];
            const std::string& from = sides[(i + 1) % 3];
            if (quiver.vertex(to).is_frozen() && quiver.vertex(from).is_frozen()) {
                continue;
            }
            quiver.add_edge(from, to);
        }
    }
    return quiver;
}

std::vector<Lamination> PolygonTriangulation::principal_laminations() const {
    std::vector<Lamination> result;
    for (const auto& a : arcs_) {
        if (is_boundary(a)) continue;

        auto from = arc_between((a.p + n_ - 1) % n_, a.p);
        auto to = arc_between((a.q + n_ - 1) % n_, a.q);
        if (!from || !to) {
            throw EmbeddingError("Missing boundary segment next to diagonal " + a.name);
        }
        result.push_back({"u_" + a.name, *from, *to});
    }
    return result;
}

void PolygonTriangulation::validate_against(const Quiver& quiver) const {
    if (!is_complete()) {
        throw EmbeddingError("Triangulation of " + std::to_string(n_) + "-gon is incomplete: " +
                             std::to_string(boundary_count()) + " segments, " +
                             std::to_string(diagonal_count()) + " diagonals");
    }
    if (arcs_.size() != quiver.vertex_count()) {
        throw EmbeddingError("Triangulation has " + std::to_string(arcs_.size()) +
                             " arcs but the quiver has " + std::to_string(quiver.vertex_count()) +
                             " vertices");
    }
    for (const auto& v : quiver.vertices()) {
        if (!has_arc(v.name)) {
            throw EmbeddingError("No arc for vertex " + v.name);
        }
        bool boundary = is_boundary(arc(v.name));
        if (v.is_frozen() != boundary) {
            throw EmbeddingError("Vertex " + v.name + " is " +
                                 (v.is_frozen() ? "frozen" : "a cluster vertex") +
                                 " but its arc is " + (boundary ? "a boundary segment" : "a diagonal"));
        }
    }

    // Arrows must be those of the triangulation; frozen pairs are exempt
    Quiver induced = to_quiver();
    const auto& vertices = quiver.vertices();
    for (size_t a = 0; a < vertices.size(); ++a) {
        for (size_t b = a + 1; b < vertices.size(); ++b) {
            const Vertex& u = vertices[a];
            const Vertex& v = vertices[b];
            if (u.is_frozen() && v.is_frozen()) continue;

            int actual = quiver.net_weight(u.id, v.id);
            int expected = induced.net_weight(u.name, v.name);
            if (actual != expected) {
                throw EmbeddingError("Weight " + u.name + " -> " + v.name + " is " +
                                     std::to_string(actual) + " but the triangulation gives " +
                                     std::to_string(expected));
            }
        }
    }
}

}  // namespace quiverkit
