#ifndef QUIVERKIT_EXCHANGE_MATRIX_HPP
#define QUIVERKIT_EXCHANGE_MATRIX_HPP

#include <lamination/lamination.hpp>
#include <string>
#include <vector>

namespace quiverkit {

// Square integer matrix indexed by cluster vertices.
// Row/column i is labelled with the name of the i-th cluster vertex.
class ExchangeMatrix {
public:
    ExchangeMatrix() = default;

    // Zero matrix over the given labels
    explicit ExchangeMatrix(std::vector<std::string> labels);

    // Matrix from explicit rows; throws std::invalid_argument unless square
    // and matching the label count
    ExchangeMatrix(std::vector<std::string> labels, const std::vector<std::vector<int>>& rows);

    size_t size() const { return labels_.size(); }
    const std::vector<std::string>& labels() const { return labels_; }

    int at(size_t row, size_t col) const;
    int& at(size_t row, size_t col);

    std::vector<int> row(size_t i) const;
    std::vector<std::vector<int>> to_rows() const;

    // True when B[i][j] == -B[j][i] for all i, j
    bool is_skew_symmetric() const;

    // Aligned table with labelled rows and columns
    std::string to_string() const;

    bool operator==(const ExchangeMatrix& other) const {
        return labels_ == other.labels_ && values_ == other.values_;
    }
    bool operator!=(const ExchangeMatrix& other) const { return !(*this == other); }

private:
    std::vector<std::string> labels_;
    std::vector<int> values_;  // Row-major, size() * size()
};

// A lamination row appended below the principal part
struct ShearRow {
    std::string name;
    ShearVector values;
};

// Principal part B plus one shear row per lamination.
// Rows: cluster vertices then laminations; columns: cluster vertices.
class ExtendedExchangeMatrix {
public:
    ExtendedExchangeMatrix() = default;
    explicit ExtendedExchangeMatrix(ExchangeMatrix principal);

    const ExchangeMatrix& principal() const { return principal_; }

    const std::vector<ShearRow>& shear_rows() const { return shear_rows_; }

    // Throws std::invalid_argument if the row length differs from the column count
    void add_shear_row(const std::string& name, const ShearVector& values);

    size_t row_count() const { return principal_.size() + shear_rows_.size(); }
    size_t column_count() const { return principal_.size(); }

    // Entry over the full (rows x columns) layout
    int at(size_t row, size_t col) const;

    // Row labels: cluster names then lamination names
    std::vector<std::string> row_labels() const;

    std::string to_string() const;

    bool operator==(const ExtendedExchangeMatrix& other) const;
    bool operator!=(const ExtendedExchangeMatrix& other) const { return !(*this == other); }

private:
    ExchangeMatrix principal_;
    std::vector<ShearRow> shear_rows_;
};

}  // namespace quiverkit

#endif // QUIVERKIT_EXCHANGE_MATRIX_HPP
