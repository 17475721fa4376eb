#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "table/CategoricalTable.hpp"

namespace id3 {

class ISplitCriterion {
public:
    virtual ~ISplitCriterion() = default;

    /** 节点不纯度：输入为该节点内各标签取值的行数 */
    virtual double nodeMetric(const std::vector<size_t>& labelCounts) const = 0;

    // 只看 rows 指定的行；为空指针时统计全表
    double subsetMetric(const CategoricalTable& table,
                        const std::string& label,
                        const std::vector<int>* rows = nullptr) const;

    /**
     * 按 feature 分裂后的加权不纯度：Σ_v p(feature = v) · nodeMetric(label | v)
     * 按取值首次出现顺序累加
     * @throws InvalidInputError 表为零行或列不存在
     */
    double splitMetric(const CategoricalTable& table,
                       const std::string& feature,
                       const std::string& label) const;
};

} // namespace id3
