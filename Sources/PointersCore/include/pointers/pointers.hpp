#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "db.hpp"
#include "pointer_store.hpp"
#include "registry.hpp"
#include "schema.hpp"
#include "trigger.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pointers {

class migration;

/// A pointer together with the table and row it points at.
struct followed_pointer {
    pointer_record pointer;
    std::string table;
    std::optional<row_t> row;  // nullopt if the home row is gone
};

// ============================================================================
// Main database interface
// ============================================================================

// Owns the connection and is the write path for participating tables.
// Inserts go through the trigger protocol; an insert into a table that is
// not registered raises unregistered_table_insert.
class pointers_db {
public:
    // Construct in-memory with default names
    pointers_db() : pointers_db(configuration()) {}

    explicit pointers_db(const std::string& path) : pointers_db(configuration(path)) {}

    explicit pointers_db(const configuration& config);

    ~pointers_db();

    // Non-copyable and non-moveable (sqlite keeps pointers into members)
    pointers_db(const pointers_db&) = delete;
    pointers_db& operator=(const pointers_db&) = delete;
    pointers_db(pointers_db&&) = delete;
    pointers_db& operator=(pointers_db&&) = delete;

    const configuration& config() const { return config_; }
    database& db() { return *db_; }
    table_registry& registry() { return registry_; }
    pointer_store& pointers() { return pointers_; }
    trigger_protocol& triggers() { return triggers_; }

    /// True once init_pointers(up) has created the registry and pointer tables
    bool is_initialized() const;

    // ------------------------------------------------------------------------
    // Write path
    // ------------------------------------------------------------------------

    /// Insert one row. Returns rows written (0 only under a conflict policy).
    int insert(const std::string& table, const values_t& values,
               const conflict_policy& conflict = {});

    int insert_all(const std::string& table, const std::vector<values_t>& rows,
                   const conflict_policy& conflict = {});

    /// Delete the row with this id from table. Reference policies decide
    /// what happens to rows pointing at it; an unbreakable reference makes
    /// this throw db_error.
    int remove(const std::string& table, const ulid& id);

    std::optional<row_t> find(const std::string& table, const ulid& id);

    /// Resolve a pointer to its table and home row.
    std::optional<followed_pointer> follow(const ulid& pointer_id);

    /// Run block in a transaction: commit on return, roll back and rethrow
    /// on exception. Inside an open transaction block just runs.
    template<typename F>
    void write(F&& block) {
        if (db_->is_in_transaction()) {
            block();
            return;
        }
        db_->begin_transaction();
        try {
            block();
            db_->commit();
        } catch (...) {
            if (db_->is_in_transaction()) {
                db_->rollback();
            }
            throw;
        }
    }

    /// Run a migration in an exclusive transaction. On failure the
    /// transaction is rolled back and the trigger function is re-registered
    /// or removed to match the restored schema.
    void migrate(direction dir, const std::function<void(migration&)>& block);

private:
    configuration config_;
    std::unique_ptr<database> db_;
    table_registry registry_;
    pointer_store pointers_;
    trigger_protocol triggers_;

    [[noreturn]] void rethrow_insert_error(const std::string& table, const db_error& e);
    void sync_trigger_function();
};

} // namespace pointers

#endif // __cplusplus
