#include "pointers/registry.hpp"
#include "pointers/log.hpp"

namespace pointers {

ulid table_registry::register_table(const ulid& id, const std::string& name) {
    // The NOT EXISTS guard keeps a losing candidate id from ever reaching
    // the registry's own insert trigger. The conflict clause still settles
    // a race on the unique name index.
    std::string table = detail::quote_ident(source_);
    db_.execute(
        "INSERT INTO " + table + " (\"id\", \"table\") "
        "SELECT ?1, ?2 WHERE NOT EXISTS (SELECT 1 FROM " + table + " WHERE \"table\" = ?2) "
        "ON CONFLICT (\"table\") DO NOTHING",
        {id.dump(), name});

    auto effective = find(name);
    if (!effective) {
        throw db_error("Registration of table " + name + " did not persist");
    }
    if (*effective != id) {
        LOG_INFO("registry", "Table %s already registered as %s, keeping it",
                 name.c_str(), effective->to_string().c_str());
    } else {
        LOG_DEBUG("registry", "Registered table %s as %s", name.c_str(), id.to_string().c_str());
    }
    return *effective;
}

bool table_registry::deregister(const ulid& id) {
    int removed = db_.remove(source_, "id", id.dump());
    LOG_DEBUG("registry", "Deregistered %s (%d row)", id.to_string().c_str(), removed);
    return removed > 0;
}

ulid table_registry::resolve(const std::string& name) const {
    auto id = find(name);
    if (!id) {
        throw unknown_table(name);
    }
    return *id;
}

std::optional<ulid> table_registry::find(const std::string& name) const {
    auto rows = db_.query(
        "SELECT id FROM " + detail::quote_ident(source_) + " WHERE \"table\" = ?",
        {name});
    if (rows.empty()) {
        return std::nullopt;
    }
    return detail::ulid_from_column(rows[0].at("id"));
}

std::optional<std::string> table_registry::name_of(const ulid& id) const {
    auto rows = db_.query(
        "SELECT \"table\" FROM " + detail::quote_ident(source_) + " WHERE id = ?",
        {id.dump()});
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::get<std::string>(rows[0].at("table"));
}

std::vector<table_record> table_registry::all() const {
    auto rows = db_.query(
        "SELECT id, \"table\" FROM " + detail::quote_ident(source_) + " ORDER BY \"table\"");
    std::vector<table_record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back({detail::ulid_from_column(row.at("id")),
                           std::get<std::string>(row.at("table"))});
    }
    return records;
}

} // namespace pointers
