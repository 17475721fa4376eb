// include/criterion/EntropyCriterion.hpp
#ifndef ENTROPY_CRITERION_HPP
#define ENTROPY_CRITERION_HPP

#include "tree/ISplitCriterion.hpp"
#include "table/CategoricalTable.hpp"
#include <string>
#include <vector>

namespace id3 {

/** 香农熵（以 2 为底）准则 */
class EntropyCriterion : public ISplitCriterion {
public:
    double nodeMetric(const std::vector<size_t>& labelCounts) const override;

    /**
     * -Σ (c/t)·log2(c/t)，零计数跳过
     * @throws InvalidInputError 计数总和为 0
     */
    static double entropyOfCounts(const std::vector<size_t>& counts);

    /** 按 label 分组后求熵 */
    static double subsetEntropy(const CategoricalTable& subtable,
                                const std::string& label);

    // 只看 rows 指定的行，避免拷贝子表
    static double subsetEntropy(const CategoricalTable& table,
                                const std::string& label,
                                const std::vector<int>& rows);

    /**
     * 条件熵：Σ_v p(feature = v) · H(label | feature = v)
     * 按取值首次出现顺序累加
     */
    static double featureEntropy(const CategoricalTable& table,
                                 const std::string& feature,
                                 const std::string& label);

    /** 信息增益 = H(label) - 条件熵 */
    static double informationGain(const CategoricalTable& table,
                                  const std::string& feature,
                                  const std::string& label);
};

} // namespace id3

#endif // ENTROPY_CRITERION_HPP
