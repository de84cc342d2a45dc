#ifndef QUIVERKIT_SERIALIZATION_DOCUMENT_JSON_HPP
#define QUIVERKIT_SERIALIZATION_DOCUMENT_JSON_HPP

#include <nlohmann/json.hpp>
#include "quiver_json.hpp"
#include "triangulation_json.hpp"
#include <optional>
#include <stdexcept>
#include <vector>

namespace quiverkit {

// Contents of a data section: a quiver, its embedding, or both,
// plus any laminations to evaluate
struct QuiverDocument {
    std::optional<Quiver> quiver;
    std::optional<PolygonTriangulation> triangulation;
    std::vector<Lamination> laminations;

    // The explicit quiver, or the one derived from the triangulation
    Quiver resolve_quiver() const {
        if (quiver.has_value()) {
            return *quiver;
        }
        if (triangulation.has_value()) {
            return triangulation->to_quiver();
        }
        throw std::runtime_error("Document has neither a quiver nor a triangulation");
    }
};

inline nlohmann::json document_to_json(const QuiverDocument& doc) {
    nlohmann::json j = nlohmann::json::object();
    if (doc.quiver.has_value()) {
        j["quiver"] = quiver_to_json(*doc.quiver);
    }
    if (doc.triangulation.has_value()) {
        j["triangulation"] = triangulation_to_json(*doc.triangulation);
    }
    if (!doc.laminations.empty()) {
        j["laminations"] = doc.laminations;
    }
    return j;
}

inline QuiverDocument document_from_json(const nlohmann::json& j) {
    QuiverDocument doc;
    if (j.contains("quiver")) {
        doc.quiver = quiver_from_json(j["quiver"]);
    }
    if (j.contains("triangulation")) {
        doc.triangulation = triangulation_from_json(j["triangulation"]);
    }
    if (j.contains("laminations")) {
        doc.laminations = j["laminations"].get<std::vector<Lamination>>();
    }
    // Unnamed laminations are numbered u_1, u_2, ...
    for (size_t i = 0; i < doc.laminations.size(); ++i) {
        if (doc.laminations[i].name.empty()) {
            doc.laminations[i].name = "u_" + std::to_string(i + 1);
        }
    }
    return doc;
}

}  // namespace quiverkit

#endif // QUIVERKIT_SERIALIZATION_DOCUMENT_JSON_HPP
