#ifndef QUIVERKIT_MATRIX_BUILDER_HPP
#define QUIVERKIT_MATRIX_BUILDER_HPP

#include "exchange_matrix.hpp"
#include <quiver/quiver.hpp>

namespace quiverkit {

// Projection of a quiver's edge set onto its cluster vertices
class ExchangeMatrixBuilder {
public:
    // B[i][j] = net weight from the i-th to the j-th cluster vertex
    static ExchangeMatrix build(const Quiver& quiver);
};

// Matrix export without laminations (no shear rows)
ExtendedExchangeMatrix export_exchange_matrix(const Quiver& quiver);

}  // namespace quiverkit

#endif // QUIVERKIT_MATRIX_BUILDER_HPP
