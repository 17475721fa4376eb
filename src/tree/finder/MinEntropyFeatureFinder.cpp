// src/tree/finder/MinEntropyFeatureFinder.cpp - OpenMP并行版本
#include "finder/MinEntropyFeatureFinder.hpp"
#include "criterion/EntropyCriterion.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <numeric>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace id3 {

CategoricalTable MinEntropyFeatureFinder::mergeLabel(const CategoricalTable& table,
                                                     const LabelVector&      label) {
    if (label.name.empty()) {
        throw InvalidInputError("Label vector has no name");
    }
    if (table.hasColumn(label.name)) {
        throw AmbiguousLabelError("Label '" + label.name + "' collides with an existing column");
    }
    if (label.name == kIndexColumn) {
        throw InvalidInputError("Label must not be named '" + std::string(kIndexColumn) + "'");
    }
    if (table.columnCount() == 0) {
        throw InvalidInputError("No candidate feature columns");
    }
    if (table.rowCount() == 0) {
        throw InvalidInputError("Table has no rows");
    }
    if (label.values.size() != table.rowCount()) {
        throw InvalidInputError("Label has " + std::to_string(label.values.size()) +
                                " rows, table has " + std::to_string(table.rowCount()));
    }

    // 不改动调用方的表
    CategoricalTable work = table;
    work.insertColumn(0, label.name, label.values);
    work.dropColumn(kIndexColumn);
    return work;
}

std::vector<FeatureScore>
MinEntropyFeatureFinder::rankFeatures(const CategoricalTable& table,
                                      const LabelVector&      label,
                                      const ISplitCriterion&  criterion) const {
    const CategoricalTable work = mergeLabel(table, label);

    // 标签列自身不是候选特征
    std::vector<std::string> features;
    for (const auto& name : work.columnNames()) {
        if (name != label.name) features.push_back(name);
    }
    if (features.empty()) {
        throw InvalidInputError("No candidate feature columns");
    }

    const int    F     = static_cast<int>(features.size());
    const size_t cells = work.rowCount() * features.size();
    std::vector<double> entropy(features.size(), 0.0);

    /* ---------- 各特征加权不纯度互相独立，可并行 ---------- */
    // 每个特征内部串行累加，结果与单线程完全一致
    #pragma omp parallel for schedule(dynamic) if(cells > parallelThreshold_)
    for (int f = 0; f < F; ++f) {
        entropy[f] = criterion.splitMetric(work, features[f], label.name);
    }

    const double parent = criterion.subsetMetric(work, label.name);

    /* ---------- 稳定升序：熵相同取表中靠前的列 ---------- */
    std::vector<int> order(features.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](int a, int b) { return entropy[a] < entropy[b]; });

    std::vector<FeatureScore> ranking;
    ranking.reserve(order.size());
    for (int f : order) {
        ranking.push_back({features[f], entropy[f], parent - entropy[f]});
    }
    return ranking;
}

std::string bestFeature(const CategoricalTable& table, const LabelVector& label) {
    const EntropyCriterion criterion{};
    return MinEntropyFeatureFinder().findBestFeature(table, label, criterion);
}

} // namespace id3
