#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "schema.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pointers {

class unknown_table : public std::runtime_error {
public:
    explicit unknown_table(const std::string& table)
        : std::runtime_error("Table " + table + " is not registered with the pointers abstraction"),
          table_(table) {}

    const std::string& table() const { return table_; }

private:
    std::string table_;
};

// Persistent mapping from participating table name to its stable id.
//
// An id is assigned once per name. Registering a name again never changes
// it, so ids baked into migrations and application code stay valid.
class table_registry {
public:
    table_registry(database& db, std::string source)
        : db_(db), source_(std::move(source)) {}

    /// Insert (id, name) unless name is already registered.
    /// Returns the id the name maps to afterwards, which is the existing
    /// one if there was one.
    ulid register_table(const ulid& id, const std::string& name);

    /// Delete the row for id. Cascades to every pointer tagged with it.
    /// Returns false if no such row existed.
    bool deregister(const ulid& id);

    /// Throws unknown_table.
    ulid resolve(const std::string& name) const;

    template<table_schema T>
    ulid resolve() const {
        return resolve(std::string(T::table_name));
    }

    std::optional<ulid> find(const std::string& name) const;
    std::optional<std::string> name_of(const ulid& id) const;

    /// All registered tables ordered by name
    std::vector<table_record> all() const;

    const std::string& source() const { return source_; }

private:
    database& db_;
    std::string source_;
};

} // namespace pointers

#endif // __cplusplus
