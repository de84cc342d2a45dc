#ifndef QUIVERKIT_SERIALIZATION_TRIANGULATION_JSON_HPP
#define QUIVERKIT_SERIALIZATION_TRIANGULATION_JSON_HPP

#include <nlohmann/json.hpp>
#include <lamination/triangulation.hpp>
#include <quiver/errors.hpp>

namespace quiverkit {

// Arc serialization
inline void to_json(nlohmann::json& j, const Arc& arc) {
    j["name"] = arc.name;
    j["endpoints"] = {arc.p, arc.q};
    j["flips"] = arc.flips;
}

// PolygonTriangulation serialization
inline nlohmann::json triangulation_to_json(const PolygonTriangulation& triangulation) {
    nlohmann::json j;
    j["marked_points"] = triangulation.marked_point_count();
    j["arcs"] = triangulation.arcs();
    return j;
}

// PolygonTriangulation deserialization.
// Flip counters are restored so primed labels survive a round trip.
inline PolygonTriangulation triangulation_from_json(const nlohmann::json& j) {
    PolygonTriangulation triangulation(j.at("marked_points").get<uint32_t>());

    for (const auto& arc_json : j.at("arcs")) {
        auto endpoints = arc_json.at("endpoints").get<std::vector<MarkedPoint>>();
        if (endpoints.size() != 2) {
            throw EmbeddingError("Arc endpoints must be a pair");
        }
        triangulation.add_arc(arc_json.at("name").get<std::string>(),
                              endpoints[0], endpoints[1],
                              arc_json.value("flips", 0u));
    }
    return triangulation;
}

}  // namespace quiverkit

#endif // QUIVERKIT_SERIALIZATION_TRIANGULATION_JSON_HPP
