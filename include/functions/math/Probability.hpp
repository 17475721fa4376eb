#pragma once

#include "table/CategoricalTable.hpp"
#include <string>

namespace id3 {

/**
 * 经验概率：table[feature] == value 的行数 / 总行数
 * @throws InvalidInputError feature 不存在或 value 从未出现
 * @throws DegenerateProbabilityError 表为零行
 */
double probability(const CategoricalTable& table,
                   const std::string& feature,
                   const std::string& value);

} // namespace id3
