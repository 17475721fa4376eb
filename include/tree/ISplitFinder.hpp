#pragma once

#include <string>
#include <vector>
#include "table/CategoricalTable.hpp"
#include "ISplitCriterion.hpp"

namespace id3 {

/** 候选特征及其得分 */
struct FeatureScore {
    std::string name;
    double      entropy = 0.0;   // 分裂后的加权不纯度（条件熵）
    double      gain    = 0.0;   // 父节点不纯度 - 加权不纯度（信息增益）
};

class ISplitFinder {
public:
    virtual ~ISplitFinder() = default;

    /** 所有候选特征按 criterion 得分排好序，首个即最佳分裂特征 */
    virtual std::vector<FeatureScore>
    rankFeatures(const CategoricalTable& table,
                 const LabelVector&      label,
                 const ISplitCriterion&  criterion) const = 0;

    std::string findBestFeature(const CategoricalTable& table,
                                const LabelVector&      label,
                                const ISplitCriterion&  criterion) const {
        return rankFeatures(table, label, criterion).front().name;
    }
};

} // namespace id3
