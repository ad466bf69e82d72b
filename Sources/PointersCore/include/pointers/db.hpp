#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <unordered_map>

namespace pointers {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg, int code = SQLITE_ERROR)
        : std::runtime_error(msg), code_(code) {}

    /// SQLite extended result code of the failing call
    int code() const { return code_; }

private:
    int code_;
};

// What an insert does when it hits a uniqueness conflict.
enum class conflict_action {
    raise,    // plain INSERT, the conflict is an error
    nothing,  // ON CONFLICT DO NOTHING
    update    // ON CONFLICT DO UPDATE SET col = excluded.col
};

struct conflict_policy {
    conflict_action action = conflict_action::raise;
    std::vector<std::string> target;     // conflict target columns
    std::vector<std::string> preserve;   // never rewritten by an update

    static conflict_policy do_nothing(std::vector<std::string> target = {}) {
        return {conflict_action::nothing, std::move(target), {}};
    }

    static conflict_policy replace_all_except(std::vector<std::string> target,
                                              std::vector<std::string> preserve = {}) {
        return {conflict_action::update, std::move(target), std::move(preserve)};
    }
};

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Schema introspection
    bool table_exists(const std::string& name) const;
    bool trigger_exists(const std::string& name) const;
    bool index_exists(const std::string& name) const;

    /// Names of all triggers starting with prefix
    std::vector<std::string> triggers_with_prefix(const std::string& prefix) const;

    // Get existing column names and types from a table
    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // Row operations. Return the number of rows changed.
    int insert(const std::string& table,
               const values_t& values,
               const conflict_policy& conflict = {});

    /// Insert several rows with one prepared statement. All rows must
    /// name the same columns in the same order.
    int insert_all(const std::string& table,
                   const std::vector<values_t>& rows,
                   const conflict_policy& conflict = {});

    int remove(const std::string& table, const std::string& column, const column_value_t& value);

    // Query - returns rows as vector of column maps
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction(bool exclusive = false);
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows changed by the most recent statement
    int changes() const { return sqlite3_changes(db_); }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    const std::string& path() const { return path_; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    std::string build_insert(const std::string& table,
                             const values_t& values,
                             const conflict_policy& conflict) const;
    [[noreturn]] void fail(const std::string& what, const std::string& sql) const;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db, bool exclusive = false);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace pointers

#endif // __cplusplus
