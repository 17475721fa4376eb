// =============================================================================
// include/functions/io/DataIO.hpp - 分类数据读取
// =============================================================================
#pragma once

#include "table/CategoricalTable.hpp"
#include <string>

namespace id3 {

class DataIO {
public:
    /**
     * 读取带表头的 CSV，所有单元格按字符串保存
     * @throws std::runtime_error 无法打开文件、缺少表头或某行列数不符
     */
    CategoricalTable readCategoricalCSV(const std::string& filename);

    /**
     * 从表中取出标签列（并删除），返回对齐的 LabelVector
     * @param labelColumn 为空时取最后一列
     */
    static LabelVector splitLabel(CategoricalTable& table,
                                  const std::string& labelColumn);

    // 按 ',' 切分一行，去掉行尾 '\r'
    static std::vector<std::string> splitLine(const std::string& line);
};

} // namespace id3
