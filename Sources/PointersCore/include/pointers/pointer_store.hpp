#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include <optional>
#include <string>

namespace pointers {

// The central table: one (id, table_id) row per row of every participating
// table. Rows are written by the insert trigger; create() is what that
// trigger does, exposed for maintenance.
class pointer_store {
public:
    pointer_store(database& db, std::string source)
        : db_(db), source_(std::move(source)) {}

    /// Insert (id, table_id), ignoring a duplicate id.
    /// Returns true if a row was written.
    bool create(const ulid& id, const ulid& table_id);

    /// Move an existing pointer to another table. Returns false if there
    /// is no pointer with that id.
    bool repoint(const ulid& pointer_id, const ulid& new_table_id);

    std::optional<pointer_record> find(const ulid& id) const;

    int64_t count() const;
    int64_t count_for(const ulid& table_id) const;

    const std::string& source() const { return source_; }

private:
    database& db_;
    std::string source_;
};

} // namespace pointers

#endif // __cplusplus
