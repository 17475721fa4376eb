// src/table/CategoricalTable.cpp
#include "table/CategoricalTable.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <unordered_map>

namespace id3 {

bool CategoricalTable::hasColumn(const std::string& name) const {
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

size_t CategoricalTable::columnIndex(const std::string& name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) {
        throw InvalidInputError("Unknown column: " + name);
    }
    return static_cast<size_t>(it - names_.begin());
}

const std::vector<std::string>& CategoricalTable::column(const std::string& name) const {
    return columns_[columnIndex(name)];
}

void CategoricalTable::addColumn(const std::string& name,
                                 std::vector<std::string> values) {
    insertColumn(names_.size(), name, std::move(values));
}

void CategoricalTable::insertColumn(size_t position,
                                    const std::string& name,
                                    std::vector<std::string> values) {
    if (hasColumn(name)) {
        throw AmbiguousLabelError("Column already exists: " + name);
    }
    if (!names_.empty() && values.size() != rowCount_) {
        throw InvalidInputError("Column '" + name + "' has " +
                                std::to_string(values.size()) + " rows, expected " +
                                std::to_string(rowCount_));
    }
    position = std::min(position, names_.size());

    if (names_.empty()) rowCount_ = values.size();
    names_.insert(names_.begin() + position, name);
    columns_.insert(columns_.begin() + position, std::move(values));
}

bool CategoricalTable::dropColumn(const std::string& name) {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) return false;

    const auto idx = it - names_.begin();
    names_.erase(it);
    columns_.erase(columns_.begin() + idx);
    if (names_.empty()) rowCount_ = 0;
    return true;
}

CategoricalTable CategoricalTable::select(const std::vector<int>& rows) const {
    CategoricalTable out;
    out.names_    = names_;
    out.rowCount_ = names_.empty() ? 0 : rows.size();
    out.columns_.resize(columns_.size());

    for (size_t c = 0; c < columns_.size(); ++c) {
        auto& dst = out.columns_[c];
        dst.reserve(rows.size());
        for (int r : rows) {
            if (r < 0 || static_cast<size_t>(r) >= rowCount_) {
                throw InvalidInputError("Row index out of range: " + std::to_string(r));
            }
            dst.push_back(columns_[c][r]);
        }
    }
    return out;
}

CategoricalTable CategoricalTable::filterEquals(const std::string& column,
                                                const std::string& value) const {
    return select(rowsWhere(column, value));
}

std::vector<int> CategoricalTable::rowsWhere(const std::string& column,
                                             const std::string& value) const {
    const auto& col = this->column(column);
    std::vector<int> rows;
    for (size_t i = 0; i < col.size(); ++i) {
        if (col[i] == value) rows.push_back(static_cast<int>(i));
    }
    return rows;
}

std::vector<ValueRows> CategoricalTable::partition(const std::string& column) const {
    const auto& col = this->column(column);

    // 首次出现顺序，保证后续浮点累加可复现
    std::vector<ValueRows> groups;
    std::unordered_map<std::string, size_t> slot;
    for (size_t i = 0; i < col.size(); ++i) {
        auto it = slot.find(col[i]);
        if (it == slot.end()) {
            it = slot.emplace(col[i], groups.size()).first;
            groups.push_back({col[i], {}});
        }
        groups[it->second].rows.push_back(static_cast<int>(i));
    }
    return groups;
}

std::vector<std::pair<std::string, size_t>>
CategoricalTable::valueCounts(const std::string& column,
                              const std::vector<int>* rows) const {
    const auto& col = this->column(column);

    std::vector<std::pair<std::string, size_t>> counts;
    std::unordered_map<std::string, size_t> slot;
    auto bump = [&](const std::string& v) {
        auto it = slot.find(v);
        if (it == slot.end()) {
            slot.emplace(v, counts.size());
            counts.emplace_back(v, 1);
        } else {
            ++counts[it->second].second;
        }
    };

    if (rows) {
        for (int r : *rows) {
            if (r < 0 || static_cast<size_t>(r) >= col.size()) {
                throw InvalidInputError("Row index out of range: " + std::to_string(r));
            }
            bump(col[r]);
        }
    } else {
        for (const auto& v : col) bump(v);
    }
    return counts;
}

} // namespace id3
