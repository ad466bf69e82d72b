#include "pointers/migration.hpp"
#include "pointers/log.hpp"
#include "pointers/ulid_functions.hpp"

namespace pointers {

migration::migration(pointers_db& db, direction dir) : db_(db), dir_(dir) {}

std::string migration::registry_index() const {
    return db_.config().table_source + "_table_index";
}

std::string migration::pointer_index() const {
    return db_.config().pointer_source + "_table_id_index";
}

void migration::init_pointers() {
    init_pointers(dir_);
}

void migration::init_pointers(direction dir) {
    const auto& config = db_.config();
    auto& db = db_.db();

    if (dir == direction::up) {
        LOG_INFO("migration", "Initialising pointers (%s, %s)",
                 config.table_source.c_str(), config.pointer_source.c_str());

        table_builder registry(config.table_source, config.pointer_source);
        registry.add_pointer_pk();
        registry.add("table", column_type::text, {.nullable = false});
        db.execute(registry.create_sql({}));

        table_builder pointer(config.pointer_source, config.pointer_source);
        pointer.add_pointer_pk();
        reference table_ref;
        table_ref.table = config.table_source;
        table_ref.on_delete = fk_action::cascade;
        table_ref.on_update = fk_action::cascade;
        pointer.add("table_id", table_ref, {.nullable = false});
        db.execute(pointer.create_sql({}));

        db.execute("CREATE UNIQUE INDEX IF NOT EXISTS " + detail::quote_ident(registry_index()) +
                   " ON " + detail::quote_ident(config.table_source) + " (\"table\")");
        db.execute("CREATE INDEX IF NOT EXISTS " + detail::quote_ident(pointer_index()) +
                   " ON " + detail::quote_ident(config.pointer_source) + " (table_id)");

        // Registered before its trigger exists, so it has no pointer of its own
        insert_table_record(registry_table_id, config.table_source);
        create_pointer_trigger_function();
        create_pointer_trigger(config.table_source);
        return;
    }

    LOG_INFO("migration", "Removing pointers (%s, %s)",
             config.table_source.c_str(), config.pointer_source.c_str());
    drop_pointer_trigger(config.table_source);
    drop_pointer_trigger_function();
    db.execute("DROP INDEX IF EXISTS " + detail::quote_ident(pointer_index()));
    db.execute("DROP INDEX IF EXISTS " + detail::quote_ident(registry_index()));
    drop_table(config.pointer_source);
    drop_table(config.table_source);
}

void migration::init_pointers_ulid_extra() {
    register_ulid_functions(db_.db());
}

void migration::create_pointable_table(const std::string& name, std::string_view id,
                                       const table_body_t& body) {
    create_pointable_table(name, ulid::cast(id), table_options{}, body);
}

void migration::create_pointable_table(const std::string& name, std::string_view id,
                                       const table_options& options, const table_body_t& body) {
    create_pointable_table(name, ulid::cast(id), options, body);
}

void migration::create_pointable_table(const std::string& name, const ulid& id,
                                       const table_options& options, const table_body_t& body) {
    auto registered = insert_table_record(id, name);
    if (registered != id) {
        LOG_WARN("migration", "Table %s keeps its existing id %s (asked for %s)",
                 name.c_str(), registered.to_string().c_str(), id.to_string().c_str());
    }

    table_builder table(name, db_.config().pointer_source);
    table.add_pointer_pk();
    if (body) {
        body(table);
    }
    db_.db().execute(table.create_sql(options));

    create_pointer_trigger(name);
    LOG_INFO("migration", "Created pointable table %s", name.c_str());
}

void migration::drop_pointable_table(const std::string& name, std::string_view id) {
    drop_pointable_table(name, ulid::cast(id));
}

void migration::drop_pointable_table(const std::string& name, const ulid& id) {
    drop_pointer_trigger(name);
    delete_table_record(id);
    drop_table(name);
    LOG_INFO("migration", "Dropped pointable table %s", name.c_str());
}

void migration::create_mixin_table(const std::string& name, const table_body_t& body) {
    create_mixin_table(name, table_options{}, body);
}

void migration::create_mixin_table(const std::string& name, const table_options& options,
                                   const table_body_t& body) {
    table_builder table(name, db_.config().pointer_source);
    table.add_pointer_ref_pk();
    if (body) {
        body(table);
    }
    db_.db().execute(table.create_sql(options));
    LOG_INFO("migration", "Created mixin table %s", name.c_str());
}

void migration::drop_mixin_table(const std::string& name) {
    drop_table(name);
}

reference migration::pointer(pointer_type type) const {
    return pointers::pointer(db_.config().pointer_source, type);
}

reference migration::pointer(const std::string& table, pointer_type type) const {
    return pointers::pointer(table, type);
}

reference migration::strong_pointer() const {
    return pointer(pointer_type::strong);
}

reference migration::weak_pointer() const {
    return pointer(pointer_type::weak);
}

reference migration::unbreakable_pointer() const {
    return pointer(pointer_type::unbreakable);
}

ulid migration::insert_table_record(std::string_view id, const std::string& name) {
    return insert_table_record(ulid::cast(id), name);
}

ulid migration::insert_table_record(const ulid& id, const std::string& name) {
    return db_.registry().register_table(id, name);
}

void migration::delete_table_record(std::string_view id) {
    delete_table_record(ulid::cast(id));
}

void migration::delete_table_record(const ulid& id) {
    if (!db_.registry().deregister(id)) {
        LOG_WARN("migration", "No table registered as %s", id.to_string().c_str());
    }
}

void migration::create_pointer_trigger_function() {
    db_.triggers().install_function();
}

void migration::drop_pointer_trigger_function() {
    db_.triggers().drop_function();
}

void migration::create_pointer_trigger(const std::string& table) {
    db_.triggers().create_trigger(table);
}

void migration::drop_pointer_trigger(const std::string& table) {
    db_.triggers().drop_trigger(table);
}

void migration::drop_table(const std::string& name) {
    db_.db().execute("DROP TABLE IF EXISTS " + detail::quote_ident(name));
}

} // namespace pointers
