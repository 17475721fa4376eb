#pragma once

#include "../tree/ISplitFinder.hpp"
#include <string>
#include <vector>

namespace id3 {

/**
 * ID3 特征选择：条件熵最小（信息增益最大）的特征
 * 不纯度由传入的 ISplitCriterion 计算，bestFeature 使用 EntropyCriterion
 *
 * 工作副本 = table + 标签列（插在第 0 列），并去掉名为 "index" 的行号列。
 * 排序为稳定升序，熵相同时保持表中列的原始顺序。
 */
class MinEntropyFeatureFinder : public ISplitFinder {
public:
    static constexpr const char* kIndexColumn = "index";

    /** @param parallelThreshold 行数×特征数超过该值时启用 OpenMP */
    explicit MinEntropyFeatureFinder(size_t parallelThreshold = 100000)
        : parallelThreshold_(parallelThreshold) {}

    std::vector<FeatureScore>
    rankFeatures(const CategoricalTable& table,
                 const LabelVector&      label,
                 const ISplitCriterion&  criterion) const override;

    /** 构造工作副本并做输入校验 */
    static CategoricalTable mergeLabel(const CategoricalTable& table,
                                       const LabelVector&      label);

private:
    size_t parallelThreshold_;
};

/** 对外唯一入口：按香农熵返回最佳分裂特征名 */
std::string bestFeature(const CategoricalTable& table, const LabelVector& label);

} // namespace id3
