// =============================================================================
// src/functions/io/DataIO.cpp - 分类数据读取
// =============================================================================
#include "functions/io/DataIO.hpp"
#include "core/Errors.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace id3 {

std::vector<std::string> DataIO::splitLine(const std::string& line) {
    std::string trimmed = line;
    if (!trimmed.empty() && trimmed.back() == '\r') trimmed.pop_back();

    std::vector<std::string> cells;
    std::stringstream ss(trimmed);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(cell);
    }
    // "a,b," 末尾空单元格
    if (!trimmed.empty() && trimmed.back() == ',') cells.emplace_back();
    return cells;
}

CategoricalTable DataIO::readCategoricalCSV(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Empty file: " + filename);
    }
    const std::vector<std::string> headers = splitLine(line);
    if (headers.empty()) {
        throw std::runtime_error("Missing header row: " + filename);
    }

    // **按列缓存，最后一次性装入表**
    std::vector<std::vector<std::string>> columns(headers.size());
    size_t lineNo = 1;
    while (std::getline(file, line)) {
        ++lineNo;
        if (line.empty() || line == "\r") continue;

        auto row = splitLine(line);
        if (row.size() != headers.size()) {
            throw std::runtime_error(filename + ":" + std::to_string(lineNo) + ": expected " +
                                     std::to_string(headers.size()) + " cells, got " +
                                     std::to_string(row.size()));
        }
        for (size_t c = 0; c < row.size(); ++c) {
            columns[c].push_back(std::move(row[c]));
        }
    }
    file.close();

    CategoricalTable table;
    for (size_t c = 0; c < headers.size(); ++c) {
        try {
            table.addColumn(headers[c], std::move(columns[c]));
        } catch (const AmbiguousLabelError&) {
            throw std::runtime_error("Duplicate column '" + headers[c] + "' in " + filename);
        }
    }

    std::cout << "Loaded " << table.rowCount() << " samples with "
              << table.columnCount() << " columns each" << std::endl;
    return table;
}

LabelVector DataIO::splitLabel(CategoricalTable& table, const std::string& labelColumn) {
    if (table.columnCount() == 0) {
        throw InvalidInputError("Table has no columns");
    }
    const std::string name = labelColumn.empty() ? table.columnNames().back() : labelColumn;

    LabelVector label{name, table.column(name)};
    table.dropColumn(name);
    return label;
}

} // namespace id3
