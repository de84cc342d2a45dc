#ifndef QUIVERKIT_MUTATION_HPP
#define QUIVERKIT_MUTATION_HPP

#include <quiver/quiver.hpp>
#include <exchange/exchange_matrix.hpp>
#include <string>

namespace quiverkit {

// Quiver mutation at a cluster vertex k:
//
//   b'_ij = -b_ij                                    if i = k or j = k
//   b'_ij = b_ij + sign(b_ik) * max(b_ik * b_kj, 0)  otherwise
//
// over every pair of vertices, frozen ones included. New weights are
// computed from the pre-mutation snapshot only; zero weights are dropped.
class MutationEngine {
public:
    // Snapshot mutation: returns the mutated copy, the input is untouched
    static Quiver mutate(const Quiver& quiver, const std::string& name);
    static Quiver mutate(const Quiver& quiver, VertexId k);

    // Edge set after mutating at k.
    // Throws UnknownVertexError if k is not a vertex, FrozenMutationError if frozen,
    // WeightOverflowError if a new weight does not fit in int.
    static EdgeSet mutate_edges(const VertexRegistry& registry, const EdgeSet& edges, VertexId k);

    // The same rule on a bare matrix; k is a row/column position.
    // Shear rows are updated like frozen rows and never pivot.
    // Throws std::out_of_range if k is not a column, WeightOverflowError on overflow.
    static ExchangeMatrix mutate(const ExchangeMatrix& matrix, size_t k);
    static ExtendedExchangeMatrix mutate(const ExtendedExchangeMatrix& matrix, size_t k);
};

}  // namespace quiverkit

#endif // QUIVERKIT_MUTATION_HPP
