#pragma once
/**
 * @file result_set.h
 * @brief Client-side copy of a query result, independent of the driver.
 */
#include <optional>
#include <string>
#include <vector>

namespace usersvc {

enum class ColumnType { Integer, Text, Other };

struct Column {
    std::string name;
    ColumnType type = ColumnType::Other;
};

/// nullopt is SQL NULL.
using Cell = std::optional<std::string>;
using Row = std::vector<Cell>;

struct ResultSet {
    std::vector<Column> columns;
    std::vector<Row> rows;

    /// Index of the column called `name`, or -1.
    int column_index(const std::string& name) const {
        for (size_t i = 0; i < columns.size(); ++i)
            if (columns[i].name == name) return static_cast<int>(i);
        return -1;
    }
};

} // namespace usersvc
