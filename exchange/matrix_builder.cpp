#include "matrix_builder.hpp"

namespace quiverkit {

ExchangeMatrix ExchangeMatrixBuilder::build(const Quiver& quiver) {
    const auto& registry = quiver.registry();
    const auto& cluster = registry.cluster_vertices();

    std::vector<std::string> labels;
    labels.reserve(cluster.size());
    for (VertexId id : cluster) {
        labels.push_back(registry.vertex(id).name);
    }

    ExchangeMatrix matrix(std::move(labels));

    // Walk stored arcs rather than all pairs; frozen endpoints are skipped
    for (const auto& [key, weight] : quiver.edge_set().weights()) {
        const Vertex& u = registry.vertex(key.first);
        const Vertex& v = registry.vertex(key.second);
        if (!u.is_cluster() || !v.is_cluster()) {
            continue;
        }
        size_t i = registry.cluster_position(u.id);
        size_t j = registry.cluster_position(v.id);
        matrix.at(i, j) = weight;
        matrix.at(j, i) = -weight;
    }

    return matrix;
}

ExtendedExchangeMatrix export_exchange_matrix(const Quiver& quiver) {
    return ExtendedExchangeMatrix(quiver.exchange_matrix());
}

}  // namespace quiverkit
