#ifndef QUIVERKIT_SERIALIZATION_QUIVER_JSON_HPP
#define QUIVERKIT_SERIALIZATION_QUIVER_JSON_HPP

#include <nlohmann/json.hpp>
#include <quiver/quiver.hpp>
#include <lamination/lamination.hpp>

namespace quiverkit {

// VertexKind enum serialization
NLOHMANN_JSON_SERIALIZE_ENUM(VertexKind, {
    {VertexKind::Frozen, "Frozen"},
    {VertexKind::Cluster, "Cluster"},
})

// Quiver::VertexSpec serialization
inline void to_json(nlohmann::json& j, const Quiver::VertexSpec& spec) {
    j["name"] = spec.name;
    j["kind"] = spec.kind;
}

inline void from_json(const nlohmann::json& j, Quiver::VertexSpec& spec) {
    spec.name = j.at("name").get<std::string>();
    spec.kind = j.value("kind", VertexKind::Cluster);
}

// Quiver::EdgeSpec serialization
inline void to_json(nlohmann::json& j, const Quiver::EdgeSpec& spec) {
    j["source"] = spec.source;
    j["target"] = spec.target;
    j["weight"] = spec.weight;
}

inline void from_json(const nlohmann::json& j, Quiver::EdgeSpec& spec) {
    spec.source = j.at("source").get<std::string>();
    spec.target = j.at("target").get<std::string>();
    spec.weight = j.value("weight", 1);
}

// Lamination serialization
inline void to_json(nlohmann::json& j, const Lamination& lamination) {
    j["name"] = lamination.name;
    j["from"] = lamination.from_frozen;
    j["to"] = lamination.to_frozen;
}

inline void from_json(const nlohmann::json& j, Lamination& lamination) {
    lamination.name = j.value("name", "");
    lamination.from_frozen = j.at("from").get<std::string>();
    lamination.to_frozen = j.at("to").get<std::string>();
}

// Quiver serialization: vertices in id order, arcs with names and positive weights
inline nlohmann::json quiver_to_json(const Quiver& quiver) {
    nlohmann::json j;

    std::vector<Quiver::VertexSpec> vertices;
    for (const auto& v : quiver.vertices()) {
        vertices.push_back({v.name, v.kind});
    }
    j["vertices"] = vertices;

    std::vector<Quiver::EdgeSpec> edges;
    for (const auto& e : quiver.edges()) {
        edges.push_back({quiver.vertex(e.source).name, quiver.vertex(e.target).name, e.weight});
    }
    j["edges"] = edges;
    return j;
}

// Quiver deserialization; construction errors propagate as QuiverError
inline Quiver quiver_from_json(const nlohmann::json& j) {
    auto vertices = j.at("vertices").get<std::vector<Quiver::VertexSpec>>();
    std::vector<Quiver::EdgeSpec> edges;
    if (j.contains("edges")) {
        edges = j["edges"].get<std::vector<Quiver::EdgeSpec>>();
    }
    return Quiver(vertices, edges);
}

}  // namespace quiverkit

#endif // QUIVERKIT_SERIALIZATION_QUIVER_JSON_HPP
