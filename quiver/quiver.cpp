#include "quiver.hpp"
#include "errors.hpp"
#include <exchange/matrix_builder.hpp>
#include <mutation/mutation.hpp>
#include <common/logging.hpp>
#include <algorithm>

namespace quiverkit {

Quiver::Quiver(const std::vector<VertexSpec>& vertices, const std::vector<EdgeSpec>& edges) {
    for (const auto& spec : vertices) {
        add_vertex(spec.name, spec.kind);
    }
    for (const auto& spec : edges) {
        add_edge(spec.source, spec.target, spec.weight);
    }
}

VertexId Quiver::add_vertex(const std::string& name, VertexKind kind) {
    VertexId id = registry_.add_vertex(name, kind);
    matrix_cache_.reset();
    return id;
}

void Quiver::add_edge(const std::string& source, const std::string& target, int weight) {
    VertexId u = registry_.index_of(source);
    VertexId v = registry_.index_of(target);
    if (u == v) {
        throw SelfLoopError(source);
    }
    edges_.add_edge(u, v, weight);
    matrix_cache_.reset();
}

void Quiver::add_edge(VertexId source, VertexId target, int weight) {
    if (source >= registry_.size() || target >= registry_.size()) {
        throw UnknownVertexError("#" + std::to_string(std::max(source, target)));
    }
    if (source == target) {
        throw SelfLoopError(registry_.vertex(source).name);
    }
    edges_.add_edge(source, target, weight);
    matrix_cache_.reset();
}

int Quiver::net_weight(const std::string& u, const std::string& v) const {
    return edges_.net_weight(registry_.index_of(u), registry_.index_of(v));
}

const ExchangeMatrix& Quiver::exchange_matrix() const {
    if (!matrix_cache_.has_value()) {
        matrix_cache_ = ExchangeMatrixBuilder::build(*this);
    }
    return *matrix_cache_;
}

Quiver& Quiver::mutate(const std::string& name) {
    return mutate(registry_.index_of(name));
}

Quiver& Quiver::mutate(VertexId id) {
    // Validation and the full update happen before the commit below
    EdgeSet mutated = MutationEngine::mutate_edges(registry_, edges_, id);

    auto log = logging::get_logger();
    log->debug("Mutated at {}: {} arcs -> {} arcs",
               registry_.vertex(id).name, edges_.size(), mutated.size());

    edges_ = std::move(mutated);
    matrix_cache_.reset();
    return *this;
}

bool Quiver::operator==(const Quiver& other) const {
    const auto& a = registry_.vertices();
    const auto& b = other.registry_.vertices();
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].name != b[i].name || a[i].kind != b[i].kind) {
            return false;
        }
    }
    return edges_ == other.edges_;
}

}  // namespace quiverkit
