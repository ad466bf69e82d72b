#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "db.hpp"
#include <memory>
#include <optional>
#include <string>

namespace pointers {

/// An insert reached a table that has no registry row. The statement was
/// aborted before anything was written.
class unregistered_table_insert : public db_error {
public:
    unregistered_table_insert(const std::string& table, int code)
        : db_error("Table " + table + " does not participate in the pointers abstraction", code),
          table_(table) {}

    const std::string& table() const { return table_; }

private:
    std::string table_;
};

// Keeps the pointer store in step with every participating table.
//
// SQLite has no stored procedures, so the shared trigger function is an
// application-defined SQL function (configuration::trigger_function) that
// maps a table name to its registry id and fails the statement when the
// table is not registered. Each participating table gets two triggers:
//
//   <trigger_prefix><table>         BEFORE INSERT: INSERT OR IGNORE the pointer
//   <delete_trigger_prefix><table>  AFTER DELETE:  delete the pointer, which
//                                   lets the reference policies cascade
//
// Functions live on the connection, not in the file, so install_function()
// has to run again on every new connection.
class trigger_protocol {
public:
    trigger_protocol(database& db, const configuration& config);
    ~trigger_protocol();

    trigger_protocol(const trigger_protocol&) = delete;
    trigger_protocol& operator=(const trigger_protocol&) = delete;

    /// Register the trigger function on the connection. Idempotent.
    void install_function();

    /// Drop every trigger carrying either prefix, then unregister the
    /// function. Idempotent.
    void drop_function();

    /// Unregister the function only, leaving triggers in place. Idempotent.
    void unregister_function();

    bool function_installed() const { return installed_; }

    /// (Re)create both triggers on table. Existing ones are dropped first,
    /// SQLite has no CREATE TRIGGER OR REPLACE.
    void create_trigger(const std::string& table);

    void drop_trigger(const std::string& table);

    /// True if the insert trigger exists on table
    bool has_trigger(const std::string& table) const;

    std::string insert_trigger_name(const std::string& table) const {
        return config_.trigger_prefix + table;
    }

    std::string delete_trigger_name(const std::string& table) const {
        return config_.delete_trigger_prefix + table;
    }

    /// Name of the table whose insert the function last refused, cleared
    /// by the call.
    std::optional<std::string> take_rejection();

private:
    struct function_state {
        std::string lookup_sql;
        std::optional<std::string> rejected;
    };

    database& db_;
    const configuration& config_;
    std::unique_ptr<function_state> state_;
    bool installed_ = false;

    static void resolve_table_id(sqlite3_context* ctx, int argc, sqlite3_value** argv);
};

} // namespace pointers

#endif // __cplusplus
