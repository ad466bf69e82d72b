#pragma once

#ifdef __cplusplus

#include "pointers.hpp"
#include "references.hpp"
#include "schema.hpp"
#include <string>
#include <string_view>

namespace pointers {

// ============================================================================
// Migration DSL
// ============================================================================

/// Pointer-aware migration steps, bound to one pointers_db and a direction.
///
/// Typical use:
/// ```cpp
/// db.migrate(pointers::direction::up, [](pointers::migration& m) {
///     m.init_pointers();
///     m.create_pointable_table("posts", "01F8MECHZX3TBDSZ7XRADM79XV", [&](auto& t) {
///         t.add("title", pointers::column_type::text, {.nullable = false});
///         t.add("author_id", m.weak_pointer());
///     });
/// });
/// ```
///
/// Every create is IF NOT EXISTS and every drop IF EXISTS, so a migration
/// that failed halfway can simply be run again.
class migration {
public:
    explicit migration(pointers_db& db, direction dir = direction::up);

    direction dir() const { return dir_; }

    /// init_pointers(dir())
    void init_pointers();

    /// up: create the registry and pointer tables with their indexes,
    /// register the registry table itself, install the trigger function and
    /// the registry's triggers.
    /// down: undo all of it in reverse order.
    void init_pointers(direction dir);

    /// Register the ulid(), ulid_text() and ulid_blob() SQL helpers.
    void init_pointers_ulid_extra();

    // ------------------------------------------------------------------------
    // Tables
    // ------------------------------------------------------------------------

    /// Register name under id, create the table with an identifier primary
    /// key plus the columns body adds, then install its triggers.
    /// id is validated before anything runs (invalid_identifier).
    void create_pointable_table(const std::string& name, std::string_view id,
                                const table_body_t& body);
    void create_pointable_table(const std::string& name, std::string_view id,
                                const table_options& options, const table_body_t& body);
    void create_pointable_table(const std::string& name, const ulid& id,
                                const table_options& options, const table_body_t& body);

    template<pointable_schema T>
    void create_pointable_table(const table_options& options, const table_body_t& body) {
        create_pointable_table(std::string(T::table_name), T::table_id, options, body);
    }

    /// Drop the triggers, delete the registry row (cascading to its
    /// pointers), drop the table.
    void drop_pointable_table(const std::string& name, std::string_view id);
    void drop_pointable_table(const std::string& name, const ulid& id);

    /// Side table keyed by a strong reference to the pointer store. No triggers.
    void create_mixin_table(const std::string& name, const table_body_t& body);
    void create_mixin_table(const std::string& name, const table_options& options,
                            const table_body_t& body);

    void drop_mixin_table(const std::string& name);

    // ------------------------------------------------------------------------
    // Reference columns (default target: the configured pointer store)
    // ------------------------------------------------------------------------

    reference pointer(pointer_type type) const;
    reference pointer(const std::string& table, pointer_type type) const;
    reference strong_pointer() const;
    reference weak_pointer() const;
    reference unbreakable_pointer() const;

    // ------------------------------------------------------------------------
    // Building blocks
    // ------------------------------------------------------------------------

    /// Returns the id the name is registered under afterwards.
    ulid insert_table_record(std::string_view id, const std::string& name);
    ulid insert_table_record(const ulid& id, const std::string& name);

    void delete_table_record(std::string_view id);
    void delete_table_record(const ulid& id);

    void create_pointer_trigger_function();
    void drop_pointer_trigger_function();
    void create_pointer_trigger(const std::string& table);
    void drop_pointer_trigger(const std::string& table);

    void drop_table(const std::string& name);

private:
    pointers_db& db_;
    direction dir_;

    std::string registry_index() const;
    std::string pointer_index() const;
};

} // namespace pointers

#endif // __cplusplus
