#include "pointers/pointer_store.hpp"
#include "pointers/log.hpp"

namespace pointers {

bool pointer_store::create(const ulid& id, const ulid& table_id) {
    int written = db_.insert(source_,
                             {{"id", id.dump()}, {"table_id", table_id.dump()}},
                             conflict_policy::do_nothing({"id"}));
    if (written == 0) {
        LOG_DEBUG("pointer_store", "Pointer %s already exists", id.to_string().c_str());
    }
    return written > 0;
}

bool pointer_store::repoint(const ulid& pointer_id, const ulid& new_table_id) {
    db_.execute("UPDATE " + detail::quote_ident(source_) + " SET table_id = ? WHERE id = ?",
                {new_table_id.dump(), pointer_id.dump()});
    bool moved = db_.changes() > 0;
    if (moved) {
        LOG_INFO("pointer_store", "Repointed %s to table %s",
                 pointer_id.to_string().c_str(), new_table_id.to_string().c_str());
    }
    return moved;
}

std::optional<pointer_record> pointer_store::find(const ulid& id) const {
    auto rows = db_.query(
        "SELECT id, table_id FROM " + detail::quote_ident(source_) + " WHERE id = ?",
        {id.dump()});
    if (rows.empty()) {
        return std::nullopt;
    }
    return pointer_record{detail::ulid_from_column(rows[0].at("id")),
                          detail::ulid_from_column(rows[0].at("table_id"))};
}

int64_t pointer_store::count() const {
    auto rows = db_.query("SELECT COUNT(*) AS n FROM " + detail::quote_ident(source_));
    return std::get<int64_t>(rows[0].at("n"));
}

int64_t pointer_store::count_for(const ulid& table_id) const {
    auto rows = db_.query(
        "SELECT COUNT(*) AS n FROM " + detail::quote_ident(source_) + " WHERE table_id = ?",
        {table_id.dump()});
    return std::get<int64_t>(rows[0].at("n"));
}

} // namespace pointers
