// src/tree/ISplitCriterion.cpp
#include "tree/ISplitCriterion.hpp"
#include "functions/math/Probability.hpp"
#include "core/Errors.hpp"

namespace id3 {

double ISplitCriterion::subsetMetric(const CategoricalTable& table,
                                     const std::string& label,
                                     const std::vector<int>* rows) const {
    const auto valueCounts = table.valueCounts(label, rows);

    std::vector<size_t> counts;
    counts.reserve(valueCounts.size());
    for (const auto& kv : valueCounts) counts.push_back(kv.second);
    return nodeMetric(counts);
}

double ISplitCriterion::splitMetric(const CategoricalTable& table,
                                    const std::string& feature,
                                    const std::string& label) const {
    if (table.rowCount() == 0) {
        throw InvalidInputError("splitMetric: table has no rows");
    }
    if (!table.hasColumn(label)) {
        throw InvalidInputError("splitMetric: unknown label column " + label);
    }

    double metric = 0.0;
    for (const auto& group : table.partition(feature)) {
        metric += probability(table, feature, group.value) *
                  subsetMetric(table, label, &group.rows);
    }
    return metric;
}

} // namespace id3
