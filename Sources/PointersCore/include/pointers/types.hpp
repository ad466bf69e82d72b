#pragma once

#ifdef __cplusplus

#include "ulid.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <variant>
#include <unordered_map>

namespace pointers {

// Supported column values
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Storage classes used in generated DDL
enum class column_type {
    integer,
    real,
    text,
    blob
};

inline const char* to_sql(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
    }
    return "BLOB";
}

// One result row: column name -> value
using row_t = std::unordered_map<std::string, column_value_t>;

// Ordered column/value pairs for inserts
using values_t = std::vector<std::pair<std::string, column_value_t>>;

// Registry row: a participating table and its stable id
struct table_record {
    ulid id;
    std::string table;
};

// Pointer store row
struct pointer_record {
    ulid id;
    ulid table_id;
};

// ============================================================================
// SQL helpers
// ============================================================================

namespace detail {
    /// Read an identifier column. Throws invalid_identifier for anything but a 16-byte blob.
    inline ulid ulid_from_column(const column_value_t& v) {
        if (!std::holds_alternative<std::vector<uint8_t>>(v)) {
            throw invalid_identifier("Invalid identifier: column is not a blob");
        }
        return ulid::load(std::get<std::vector<uint8_t>>(v));
    }

    /// Double-quote an SQL identifier, doubling embedded quotes.
    inline std::string quote_ident(const std::string& name) {
        std::string out = "\"";
        for (char c : name) {
            if (c == '"') out += '"';
            out += c;
        }
        out += '"';
        return out;
    }

    /// Single-quote an SQL string literal, doubling embedded quotes.
    inline std::string quote_literal(const std::string& text) {
        std::string out = "'";
        for (char c : text) {
            if (c == '\'') out += '\'';
            out += c;
        }
        out += '\'';
        return out;
    }
} // namespace detail

} // namespace pointers

#endif // __cplusplus
