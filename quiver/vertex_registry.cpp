#include "vertex_registry.hpp"
#include "errors.hpp"

namespace quiverkit {

VertexId VertexRegistry::add_vertex(const std::string& name, VertexKind kind) {
    if (name_to_id_.count(name) > 0) {
        throw DuplicateNameError(name);
    }

    VertexId id = static_cast<VertexId>(vertices_.size());
    vertices_.push_back({name, kind, id});
    name_to_id_[name] = id;

    if (kind == VertexKind::Cluster) {
        cluster_position_[id] = cluster_ids_.size();
        cluster_ids_.push_back(id);
    }
    return id;
}

VertexId VertexRegistry::index_of(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it == name_to_id_.end()) {
        throw UnknownVertexError(name);
    }
    return it->second;
}

bool VertexRegistry::contains(const std::string& name) const {
    return name_to_id_.find(name) != name_to_id_.end();
}

const Vertex& VertexRegistry::vertex(VertexId id) const {
    if (id >= vertices_.size()) {
        throw UnknownVertexError("#" + std::to_string(id));
    }
    return vertices_[id];
}

size_t VertexRegistry::cluster_position(VertexId id) const {
    auto it = cluster_position_.find(id);
    if (it == cluster_position_.end()) {
        throw std::out_of_range("VertexRegistry::cluster_position: not a cluster vertex");
    }
    return it->second;
}

}  // namespace quiverkit
