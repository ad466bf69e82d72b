#include "pointers/schema.hpp"
#include <algorithm>
#include <sstream>

namespace pointers {

std::string column_def::to_sql(bool inline_primary_key) const {
    std::string sql = detail::quote_ident(name) + " " + pointers::to_sql(type);
    if (is_primary_key && inline_primary_key) {
        sql += " PRIMARY KEY";
    }
    if (!nullable || is_primary_key) {
        // Non-integer SQLite primary keys accept NULL unless told otherwise
        sql += " NOT NULL";
    }
    if (is_unique) {
        sql += " UNIQUE";
    }
    if (default_sql) {
        sql += " DEFAULT (" + *default_sql + ")";
    }
    if (references) {
        sql += " " + references->to_sql();
    }
    return sql;
}

table_builder& table_builder::add(const std::string& column, column_type type, column_options options) {
    column_def def;
    def.name = column;
    def.type = type;
    def.nullable = options.nullable;
    def.is_primary_key = options.primary_key;
    def.is_unique = options.unique;
    def.default_sql = std::move(options.default_sql);
    columns_.push_back(std::move(def));
    return *this;
}

table_builder& table_builder::add(const std::string& column, const reference& ref, column_options options) {
    add(column, ref.type, std::move(options));
    columns_.back().references = ref;
    return *this;
}

table_builder& table_builder::add_ulid(const std::string& column, column_options options) {
    return add(column, column_type::blob, std::move(options));
}

table_builder& table_builder::add_pointer_pk() {
    column_options options;
    options.nullable = false;
    options.primary_key = true;
    return add_ulid("id", options);
}

table_builder& table_builder::add_pointer_ref_pk() {
    column_options options;
    options.nullable = false;
    options.primary_key = true;
    return add("id", strong_pointer(pointer_table_), options);
}

bool table_builder::has_column(const std::string& column) const {
    return std::any_of(columns_.begin(), columns_.end(),
                       [&](const column_def& c) { return c.name == column; });
}

std::string table_builder::create_sql(const table_options& options) const {
    std::vector<const column_def*> keys;
    for (const auto& col : columns_) {
        if (col.is_primary_key) keys.push_back(&col);
    }

    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << detail::quote_ident(name_) << " (";

    bool first = true;
    for (const auto& col : columns_) {
        if (!first) sql << ", ";
        sql << col.to_sql(keys.size() == 1);
        first = false;
    }

    // Composite key goes in a table constraint
    if (keys.size() > 1) {
        sql << ", PRIMARY KEY (";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << detail::quote_ident(keys[i]->name);
        }
        sql << ")";
    }
    sql << ")";

    if (options.strict && options.without_rowid) {
        sql << " STRICT, WITHOUT ROWID";
    } else if (options.strict) {
        sql << " STRICT";
    } else if (options.without_rowid) {
        sql << " WITHOUT ROWID";
    }
    return sql.str();
}

} // namespace pointers
