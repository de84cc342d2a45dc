#ifndef QUIVERKIT_SERIALIZATION_MATRIX_JSON_HPP
#define QUIVERKIT_SERIALIZATION_MATRIX_JSON_HPP

#include <nlohmann/json.hpp>
#include <exchange/exchange_matrix.hpp>

namespace quiverkit {

// ExchangeMatrix serialization
inline void to_json(nlohmann::json& j, const ExchangeMatrix& matrix) {
    j["labels"] = matrix.labels();
    j["rows"] = matrix.to_rows();
}

inline void from_json(const nlohmann::json& j, ExchangeMatrix& matrix) {
    matrix = ExchangeMatrix(j.at("labels").get<std::vector<std::string>>(),
                            j.at("rows").get<std::vector<std::vector<int>>>());
}

// ShearRow serialization
inline void to_json(nlohmann::json& j, const ShearRow& row) {
    j["name"] = row.name;
    j["values"] = row.values;
}

inline void from_json(const nlohmann::json& j, ShearRow& row) {
    row.name = j.at("name").get<std::string>();
    row.values = j.at("values").get<ShearVector>();
}

// ExtendedExchangeMatrix serialization
inline void to_json(nlohmann::json& j, const ExtendedExchangeMatrix& matrix) {
    j["principal"] = matrix.principal();
    j["shear_rows"] = matrix.shear_rows();
}

inline void from_json(const nlohmann::json& j, ExtendedExchangeMatrix& matrix) {
    matrix = ExtendedExchangeMatrix(j.at("principal").get<ExchangeMatrix>());
    if (j.contains("shear_rows")) {
        for (const auto& row : j["shear_rows"].get<std::vector<ShearRow>>()) {
            matrix.add_shear_row(row.name, row.values);
        }
    }
}

}  // namespace quiverkit

#endif // QUIVERKIT_SERIALIZATION_MATRIX_JSON_HPP
