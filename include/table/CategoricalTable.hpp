// include/table/CategoricalTable.hpp
#ifndef ID3_TABLE_CATEGORICAL_TABLE_HPP
#define ID3_TABLE_CATEGORICAL_TABLE_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace id3 {

/** 带名字的标签列，按行位置与表对齐 */
struct LabelVector {
    std::string              name;
    std::vector<std::string> values;
};

/** 某一取值及其所在的行索引 */
struct ValueRows {
    std::string      value;
    std::vector<int> rows;
};

/**
 * 列式存储的分类数据表：每列是一串字符串取值，所有列等长
 */
class CategoricalTable {
public:
    CategoricalTable() = default;

    size_t rowCount() const { return rowCount_; }
    size_t columnCount() const { return names_.size(); }
    const std::vector<std::string>& columnNames() const { return names_; }

    bool hasColumn(const std::string& name) const;

    /** 列下标，找不到时抛 InvalidInputError */
    size_t columnIndex(const std::string& name) const;

    const std::vector<std::string>& column(const std::string& name) const;

    // 追加 / 插入列：长度不符抛 InvalidInputError，重名抛 AmbiguousLabelError
    void addColumn(const std::string& name, std::vector<std::string> values);
    void insertColumn(size_t position,
                      const std::string& name,
                      std::vector<std::string> values);

    /** 删除列，返回是否真的删掉了 */
    bool dropColumn(const std::string& name);

    /** 按给定行索引（及顺序）取子表 */
    CategoricalTable select(const std::vector<int>& rows) const;

    /** column == value 的子表 */
    CategoricalTable filterEquals(const std::string& column,
                                  const std::string& value) const;

    std::vector<int> rowsWhere(const std::string& column,
                               const std::string& value) const;

    /**
     * 按列分组（group-by）
     * @return 各个不同取值及其行索引，按首次出现顺序
     */
    std::vector<ValueRows> partition(const std::string& column) const;

    /**
     * 统计各取值的行数，按首次出现顺序
     * @param rows 只统计这些行；为空指针时统计全表
     */
    std::vector<std::pair<std::string, size_t>>
    valueCounts(const std::string& column,
                const std::vector<int>* rows = nullptr) const;

private:
    std::vector<std::string>              names_;
    std::vector<std::vector<std::string>> columns_;
    size_t                                rowCount_ = 0;
};

} // namespace id3

#endif // ID3_TABLE_CATEGORICAL_TABLE_HPP
