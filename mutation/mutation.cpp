#include "mutation.hpp"
#include <quiver/errors.hpp>
#include <common/logging.hpp>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace quiverkit {

namespace {

// Entry-wise mutation of a row-major block whose first `cols` rows are the
// principal part. Reads only from `rows`, writes a fresh block.
std::vector<std::vector<int>> mutate_rows(const std::vector<std::vector<int>>& rows,
                                          size_t cols, size_t k) {
    if (k >= cols) {
        throw std::out_of_range("MutationEngine: mutation index out of range");
    }

    std::vector<std::vector<int>> result = rows;
    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t j = 0; j < cols; ++j) {
            if (i == k || j == k) {
                result[i][j] = checked_weight(-int64_t{rows[i][j]});
                continue;
            }
            int64_t b_ik = rows[i][k];
            int64_t b_kj = rows[k][j];
            int64_t product = b_ik * b_kj;
            if (product > 0) {
                result[i][j] = checked_weight(rows[i][j] + (b_ik > 0 ? product : -product));
            }
        }
    }
    return result;
}

}  // namespace

Quiver MutationEngine::mutate(const Quiver& quiver, const std::string& name) {
    Quiver result = quiver;
    result.mutate(name);
    return result;
}

Quiver MutationEngine::mutate(const Quiver& quiver, VertexId k) {
    Quiver result = quiver;
    result.mutate(k);
    return result;
}

EdgeSet MutationEngine::mutate_edges(const VertexRegistry& registry, const EdgeSet& edges, VertexId k) {
    const Vertex& pivot = registry.vertex(k);
    if (pivot.is_frozen()) {
        throw FrozenMutationError(pivot.name);
    }

    auto log = logging::get_logger();

    // Split neighbors of k into arcs i -> k and arcs k -> j
    std::vector<std::pair<VertexId, int>> incoming;
    std::vector<std::pair<VertexId, int>> outgoing;
    for (VertexId v : edges.neighbors(k)) {
        int w = edges.net_weight(v, k);
        if (w > 0) {
            incoming.emplace_back(v, w);
        } else {
            outgoing.emplace_back(v, -w);
        }
    }

    log->trace("Mutation at {}: {} incoming, {} outgoing", pivot.name, incoming.size(), outgoing.size());

    EdgeSet result = edges;

    // Every path i -> k -> j adds b_ik * b_kj to i -> j. The opposite sign
    // case (i <- k <- j) is the same update seen from j, so storing net
    // weights per unordered pair covers both.
    for (const auto& [i, b_ik] : incoming) {
        for (const auto& [j, b_kj] : outgoing) {
            int64_t weight = int64_t{edges.net_weight(i, j)} + int64_t{b_ik} * b_kj;
            result.set_net_weight(i, j, checked_weight(weight));
        }
    }

    // Reverse all arcs at k
    for (const auto& [i, b_ik] : incoming) {
        result.set_net_weight(i, k, -b_ik);
    }
    for (const auto& [j, b_kj] : outgoing) {
        result.set_net_weight(k, j, -b_kj);
    }

    return result;
}

ExchangeMatrix MutationEngine::mutate(const ExchangeMatrix& matrix, size_t k) {
    return ExchangeMatrix(matrix.labels(), mutate_rows(matrix.to_rows(), matrix.size(), k));
}

ExtendedExchangeMatrix MutationEngine::mutate(const ExtendedExchangeMatrix& matrix, size_t k) {
    const ExchangeMatrix& principal = matrix.principal();
    size_t cols = principal.size();

    std::vector<std::vector<int>> rows = principal.to_rows();
    for (const auto& shear : matrix.shear_rows()) {
        rows.push_back(shear.values);
    }

    std::vector<std::vector<int>> mutated = mutate_rows(rows, cols, k);

    std::vector<std::vector<int>> principal_rows(mutated.begin(), mutated.begin() + cols);
    ExtendedExchangeMatrix result(ExchangeMatrix(principal.labels(), principal_rows));
    for (size_t r = 0; r < matrix.shear_rows().size(); ++r) {
        result.add_shear_row(matrix.shear_rows()[r].name, mutated[cols + r]);
    }
    return result;
}

}  // namespace quiverkit
