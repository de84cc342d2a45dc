#include "exchange_matrix.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace quiverkit {

namespace {

std::string format_table(const std::vector<std::string>& row_labels,
                         const std::vector<std::string>& col_labels,
                         const std::vector<std::vector<int>>& rows) {
    size_t label_width = 0;
    for (const auto& label : row_labels) {
        label_width = std::max(label_width, label.size());
    }

    size_t cell_width = 2;
    for (const auto& label : col_labels) {
        cell_width = std::max(cell_width, label.size());
    }
    for (const auto& row : rows) {
        for (int value : row) {
            cell_width = std::max(cell_width, std::to_string(value).size());
        }
    }

    std::ostringstream ss;
    ss << std::string(label_width, ' ');
    for (const auto& label : col_labels) {
        ss << "  " << std::setw(static_cast<int>(cell_width)) << label;
    }
    ss << "\n";

    for (size_t i = 0; i < rows.size(); ++i) {
        ss << std::left << std::setw(static_cast<int>(label_width)) << row_labels[i] << std::right;
        for (int value : rows[i]) {
            ss << "  " << std::setw(static_cast<int>(cell_width)) << value;
        }
        ss << "\n";
    }
    return ss.str();
}

}  // namespace

ExchangeMatrix::ExchangeMatrix(std::vector<std::string> labels)
    : labels_(std::move(labels)), values_(labels_.size() * labels_.size(), 0) {}

ExchangeMatrix::ExchangeMatrix(std::vector<std::string> labels,
                               const std::vector<std::vector<int>>& rows)
    : ExchangeMatrix(std::move(labels)) {
    if (rows.size() != size()) {
        throw std::invalid_argument("ExchangeMatrix: row count does not match labels");
    }
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != size()) {
            throw std::invalid_argument("ExchangeMatrix: matrix is not square");
        }
        std::copy(rows[i].begin(), rows[i].end(), values_.begin() + i * size());
    }
}

int ExchangeMatrix::at(size_t row, size_t col) const {
    if (row >= size() || col >= size()) {
        throw std::out_of_range("ExchangeMatrix::at: index out of range");
    }
    return values_[row * size() + col];
}

int& ExchangeMatrix::at(size_t row, size_t col) {
    if (row >= size() || col >= size()) {
        throw std::out_of_range("ExchangeMatrix::at: index out of range");
    }
    return values_[row * size() + col];
}

std::vector<int> ExchangeMatrix::row(size_t i) const {
    if (i >= size()) {
        throw std::out_of_range("ExchangeMatrix::row: index out of range");
    }
    return std::vector<int>(values_.begin() + i * size(), values_.begin() + (i + 1) * size());
}

std::vector<std::vector<int>> ExchangeMatrix::to_rows() const {
    std::vector<std::vector<int>> rows;
    rows.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        rows.push_back(row(i));
    }
    return rows;
}

bool ExchangeMatrix::is_skew_symmetric() const {
    for (size_t i = 0; i < size(); ++i) {
        for (size_t j = i; j < size(); ++j) {
            if (at(i, j) != -at(j, i)) {
                return false;
            }
        }
    }
    return true;
}

std::string ExchangeMatrix::to_string() const {
    return format_table(labels_, labels_, to_rows());
}

ExtendedExchangeMatrix::ExtendedExchangeMatrix(ExchangeMatrix principal)
    : principal_(std::move(principal)) {}

void ExtendedExchangeMatrix::add_shear_row(const std::string& name, const ShearVector& values) {
    if (values.size() != column_count()) {
        throw std::invalid_argument("ExtendedExchangeMatrix: shear row '" + name +
                                    "' has " + std::to_string(values.size()) +
                                    " entries, expected " + std::to_string(column_count()));
    }
    shear_rows_.push_back({name, values});
}

int ExtendedExchangeMatrix::at(size_t row, size_t col) const {
    if (row < principal_.size()) {
        return principal_.at(row, col);
    }
    size_t shear_index = row - principal_.size();
    if (shear_index >= shear_rows_.size() || col >= column_count()) {
        throw std::out_of_range("ExtendedExchangeMatrix::at: index out of range");
    }
    return shear_rows_[shear_index].values[col];
}

std::vector<std::string> ExtendedExchangeMatrix::row_labels() const {
    std::vector<std::string> labels = principal_.labels();
    for (const auto& shear : shear_rows_) {
        labels.push_back(shear.name);
    }
    return labels;
}

std::string ExtendedExchangeMatrix::to_string() const {
    std::vector<std::vector<int>> rows = principal_.to_rows();
    for (const auto& shear : shear_rows_) {
        rows.push_back(shear.values);
    }
    return format_table(row_labels(), principal_.labels(), rows);
}

bool ExtendedExchangeMatrix::operator==(const ExtendedExchangeMatrix& other) const {
    if (principal_ != other.principal_ || shear_rows_.size() != other.shear_rows_.size()) {
        return false;
    }
    for (size_t i = 0; i < shear_rows_.size(); ++i) {
        if (shear_rows_[i].name != other.shear_rows_[i].name ||
            shear_rows_[i].values != other.shear_rows_[i].values) {
            return false;
        }
    }
    return true;
}

}  // namespace quiverkit
