/**
 * @file user_mapper.cpp
 * @brief Column lookup by name with lenient/strict fallbacks.
 */
#include "usersvc/model/user_mapper.h"
#include "usersvc/app/errors.h"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace usersvc {

namespace {

std::optional<int32_t> to_i32(const std::string& s){
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) return std::nullopt;
    return static_cast<int32_t>(v);
}

class ColumnReader {
public:
    ColumnReader(const ResultSet& rs, ColumnPolicy policy) : rs_(rs), policy_(policy) {}

    int32_t integer(const Row& row, size_t row_no, const char* name) const {
        const Cell* cell = lookup(row, row_no, name, ColumnType::Integer);
        if (!cell) return 0;
        auto v = to_i32(**cell);
        if (!v) return fail<int32_t>(row_no, name, "is not a 32-bit integer", 0);
        return *v;
    }

    std::string text(const Row& row, size_t row_no, const char* name) const {
        const Cell* cell = lookup(row, row_no, name, ColumnType::Text);
        if (!cell) return std::string();
        return **cell;
    }

private:
    // nullptr means "use the default" (lenient only; strict throws).
    const Cell* lookup(const Row& row, size_t row_no, const char* name, ColumnType want) const {
        int idx = rs_.column_index(name);
        if (idx < 0 || static_cast<size_t>(idx) >= row.size())
            return fail<const Cell*>(row_no, name, "is missing", nullptr);
        if (rs_.columns[idx].type != want)
            return fail<const Cell*>(row_no, name, "has an unexpected type", nullptr);
        const Cell& cell = row[idx];
        if (!cell) return fail<const Cell*>(row_no, name, "is NULL", nullptr);
        return &cell;
    }

    template <typename T>
    T fail(size_t row_no, const char* name, const char* what, T fallback) const {
        if (policy_ == ColumnPolicy::Strict) {
            throw MappingError("row " + std::to_string(row_no) + ": column '" + name + "' " + what);
        }
        return fallback;
    }

    const ResultSet& rs_;
    ColumnPolicy policy_;
};

} // namespace

std::vector<User> map_users(const ResultSet& rs, ColumnPolicy policy){
    ColumnReader rd(rs, policy);
    std::vector<User> users;
    users.reserve(rs.rows.size());
    for (size_t i = 0; i < rs.rows.size(); ++i) {
        const Row& row = rs.rows[i];
        User u;
        u.id = rd.integer(row, i, "id");
        u.username = rd.text(row, i, "username");
        u.email = rd.text(row, i, "email");
        u.full_name = rd.text(row, i, "full_name");
        users.push_back(std::move(u));
    }
    return users;
}

} // namespace usersvc
