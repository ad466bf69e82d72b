#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "references.hpp"
#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pointers {

/// Migration direction
enum class direction {
    up,
    down
};

/// Fixed registry id of the registry table itself.
inline constexpr std::string_view registry_table_id = "0TAB1ES0000000000000000000";

/// A type naming a table: `static constexpr std::string_view table_name = "...";`
template<typename T>
concept table_schema = requires {
    { T::table_name } -> std::convertible_to<std::string_view>;
};

/// A table schema that also fixes its registry id:
/// `static constexpr std::string_view table_id = "<26-char ULID>";`
template<typename T>
concept pointable_schema = table_schema<T> && requires {
    { T::table_id } -> std::convertible_to<std::string_view>;
};

struct column_options {
    bool nullable = true;
    bool primary_key = false;
    bool unique = false;
    std::optional<std::string> default_sql;  // raw SQL expression
};

// Column definition for a table body
struct column_def {
    std::string name;
    column_type type = column_type::blob;
    bool nullable = true;
    bool is_primary_key = false;
    bool is_unique = false;
    std::optional<std::string> default_sql;
    std::optional<reference> references;

    std::string to_sql(bool inline_primary_key = true) const;
};

struct table_options {
    bool without_rowid = false;
    bool strict = false;
};

/// Collects the columns of a table created through the migration DSL.
class table_builder {
public:
    table_builder(std::string name, std::string pointer_table)
        : name_(std::move(name)), pointer_table_(std::move(pointer_table)) {}

    table_builder& add(const std::string& column, column_type type, column_options options = {});
    table_builder& add(const std::string& column, const reference& ref, column_options options = {});

    /// Identifier-valued column without a foreign key
    table_builder& add_ulid(const std::string& column, column_options options = {});

    /// `id` identifier primary key. create_pointable_table adds it.
    table_builder& add_pointer_pk();

    /// `id` primary key that is also a strong reference to the pointer store.
    /// create_mixin_table adds it.
    table_builder& add_pointer_ref_pk();

    const std::string& name() const { return name_; }
    const std::vector<column_def>& columns() const { return columns_; }
    bool has_column(const std::string& column) const;

    /// CREATE TABLE IF NOT EXISTS statement for the collected columns
    std::string create_sql(const table_options& options) const;

private:
    std::string name_;
    std::string pointer_table_;
    std::vector<column_def> columns_;
};

using table_body_t = std::function<void(table_builder&)>;

} // namespace pointers

#endif // __cplusplus
