// src/tree/criterion/EntropyCriterion.cpp
#include "criterion/EntropyCriterion.hpp"
#include "core/Errors.hpp"
#include <cmath>
#include <numeric>

namespace id3 {

double EntropyCriterion::nodeMetric(const std::vector<size_t>& labelCounts) const {
    return entropyOfCounts(labelCounts);
}

double EntropyCriterion::entropyOfCounts(const std::vector<size_t>& counts) {
    const size_t total = std::accumulate(counts.begin(), counts.end(), size_t{0});
    if (total == 0) {
        throw InvalidInputError("entropyOfCounts: total count is zero");
    }

    double h = 0.0;
    for (size_t c : counts) {
        if (c == 0) continue;   // 0·log2(0) 记为 0
        const double p = static_cast<double>(c) / static_cast<double>(total);
        h -= p * std::log2(p);
    }
    // 纯节点 log2(1) = 0，结果即为 0；这里只防 -0.0
    return h > 0.0 ? h : 0.0;
}

double EntropyCriterion::subsetEntropy(const CategoricalTable& subtable,
                                       const std::string& label) {
    return EntropyCriterion().subsetMetric(subtable, label);
}

double EntropyCriterion::subsetEntropy(const CategoricalTable& table,
                                       const std::string& label,
                                       const std::vector<int>& rows) {
    return EntropyCriterion().subsetMetric(table, label, &rows);
}

double EntropyCriterion::featureEntropy(const CategoricalTable& table,
                                        const std::string& feature,
                                        const std::string& label) {
    return EntropyCriterion().splitMetric(table, feature, label);
}

double EntropyCriterion::informationGain(const CategoricalTable& table,
                                         const std::string& feature,
                                         const std::string& label) {
    return subsetEntropy(table, label) - featureEntropy(table, feature, label);
}

} // namespace id3
