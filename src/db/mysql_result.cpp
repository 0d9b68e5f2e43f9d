/**
 * @file mysql_result.cpp
 * @brief MYSQL_FIELD type mapping and stored-result copy.
 */
#include "usersvc/db/mysql_result.h"

namespace usersvc {

// charset 63 is "binary": BLOB/BINARY columns, not text.
static constexpr unsigned int kBinaryCharset = 63;

ColumnType column_type_of(const MYSQL_FIELD& f){
    switch (f.type) {
    case MYSQL_TYPE_TINY:
    case MYSQL_TYPE_SHORT:
    case MYSQL_TYPE_INT24:
    case MYSQL_TYPE_LONG:
    case MYSQL_TYPE_LONGLONG:
        return ColumnType::Integer;
    case MYSQL_TYPE_VARCHAR:
    case MYSQL_TYPE_VAR_STRING:
    case MYSQL_TYPE_STRING:
    case MYSQL_TYPE_TINY_BLOB:
    case MYSQL_TYPE_MEDIUM_BLOB:
    case MYSQL_TYPE_LONG_BLOB:
    case MYSQL_TYPE_BLOB:
        return f.charsetnr == kBinaryCharset ? ColumnType::Other : ColumnType::Text;
    default:
        return ColumnType::Other;
    }
}

ResultSet materialize(MYSQL_RES* res){
    ResultSet rs;
    if (!res) return rs;

    unsigned int n = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);
    rs.columns.reserve(n);
    for (unsigned int i = 0; i < n; ++i) {
        rs.columns.push_back(Column{std::string(fields[i].name, fields[i].name_length),
                                    column_type_of(fields[i])});
    }

    rs.rows.reserve(static_cast<size_t>(mysql_num_rows(res)));
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        unsigned long* lengths = mysql_fetch_lengths(res);
        Row r;
        r.reserve(n);
        for (unsigned int i = 0; i < n; ++i) {
            if (row[i]) r.emplace_back(std::string(row[i], lengths[i]));
            else r.emplace_back(std::nullopt);
        }
        rs.rows.push_back(std::move(r));
    }
    return rs;
}

} // namespace usersvc
