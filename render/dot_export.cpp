#include "dot_export.hpp"
#include <lamination/shear.hpp>
#include <sstream>

namespace quiverkit {

namespace {

std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

void write_body(std::ostringstream& ss,
                const Quiver& quiver,
                const PolygonTriangulation* triangulation,
                const RenderOptions& options) {
    ss << "  rankdir=" << options.rankdir << ";\n";
    ss << "  \n";

    ss << "  // Vertices\n";
    for (const auto& v : quiver.vertices()) {
        if (v.is_frozen() && options.hide_frozen) continue;

        std::string label = triangulation ? triangulation->label(v.name) : v.name;
        ss << "  " << quoted(v.name) << " [label=" << quoted(label);
        if (v.is_frozen()) {
            ss << ", shape=box, style=filled, fillcolor=lightgray";
        } else {
            ss << ", shape=ellipse";
        }
        ss << "];\n";
    }
    ss << "  \n";

    ss << "  // Arrows\n";
    for (const auto& e : quiver.edges()) {
        const Vertex& source = quiver.vertex(e.source);
        const Vertex& target = quiver.vertex(e.target);
        if (options.hide_frozen && (source.is_frozen() || target.is_frozen())) continue;

        ss << "  " << quoted(source.name) << " -> " << quoted(target.name);
        if (options.show_weights && e.weight > 1) {
            ss << " [label=\"" << e.weight << "\"]";
        }
        ss << ";\n";
    }
}

}  // namespace

std::string quiver_to_dot(const Quiver& quiver, const RenderOptions& options) {
    std::ostringstream ss;
    ss << "digraph Quiver {\n";
    write_body(ss, quiver, nullptr, options);
    ss << "}\n";
    return ss.str();
}

std::string quiver_to_dot(const Quiver& quiver,
                          const PolygonTriangulation& triangulation,
                          const std::vector<Lamination>& laminations,
                          const RenderOptions& options) {
    std::ostringstream ss;
    ss << "digraph Quiver {\n";
    write_body(ss, quiver, &triangulation, options);

    if (options.show_laminations && !laminations.empty()) {
        const auto& cluster = quiver.registry().cluster_vertices();

        ss << "  \n";
        ss << "  // Laminations\n";
        for (const auto& lamination : laminations) {
            ShearVector shear = ShearCalculator::shear_vector(quiver, triangulation, lamination);

            ss << "  " << quoted(lamination.name) << " [shape=diamond, style=dashed];\n";
            for (size_t i = 0; i < shear.size(); ++i) {
                if (shear[i] == 0) continue;
                ss << "  " << quoted(lamination.name) << " -> "
                   << quoted(quiver.vertex(cluster[i]).name)
                   << " [style=dashed, arrowhead=none, label=\""
                   << (shear[i] > 0 ? "+" : "") << shear[i] << "\"];\n";
            }
        }
    }

    ss << "}\n";
    return ss.str();
}

}  // namespace quiverkit
