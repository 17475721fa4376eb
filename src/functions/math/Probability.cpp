// src/functions/math/Probability.cpp
#include "functions/math/Probability.hpp"
#include "core/Errors.hpp"
#include <algorithm>

namespace id3 {

double probability(const CategoricalTable& table,
                   const std::string& feature,
                   const std::string& value) {
    const auto& col = table.column(feature);
    if (table.rowCount() == 0) {
        throw DegenerateProbabilityError("probability() on empty table, feature: " + feature);
    }

    const auto hits = std::count(col.begin(), col.end(), value);
    if (hits == 0) {
        throw InvalidInputError("Value '" + value + "' not present in column " + feature);
    }
    return static_cast<double>(hits) / static_cast<double>(table.rowCount());
}

} // namespace id3
