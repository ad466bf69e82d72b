#include "pointers/pointers.hpp"
#include "pointers/log.hpp"
#include "pointers/migration.hpp"
#include "pointers/ulid_functions.hpp"

namespace pointers {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

namespace {

configuration validated(const configuration& config) {
    config.validate();
    return config;
}

} // namespace

pointers_db::pointers_db(const configuration& config)
    : config_(validated(config))
    , db_(std::make_unique<database>(config_.path,
          config_.read_only ? database::open_mode::read_only : database::open_mode::read_write))
    , registry_(*db_, config_.table_source)
    , pointers_(*db_, config_.pointer_source)
    , triggers_(*db_, config_) {
    if (config_.level != log_level::off) {
        set_log_level(config_.level);
    }

    register_ulid_functions(*db_);

    // Triggers already in the file need their function on this connection
    if (is_initialized()) {
        triggers_.install_function();
    }
    LOG_DEBUG("pointers_db", "Opened %s (initialized=%d)", config_.path.c_str(), is_initialized() ? 1 : 0);
}

pointers_db::~pointers_db() = default;

bool pointers_db::is_initialized() const {
    return db_->table_exists(config_.table_source) && db_->table_exists(config_.pointer_source);
}

void pointers_db::rethrow_insert_error(const std::string& table, const db_error& e) {
    if (auto rejected = triggers_.take_rejection()) {
        LOG_ERROR("pointers_db", "Insert into %s refused: %s is not registered",
                  table.c_str(), rejected->c_str());
        throw unregistered_table_insert(*rejected, e.code());
    }
    throw;
}

int pointers_db::insert(const std::string& table, const values_t& values,
                        const conflict_policy& conflict) {
    triggers_.take_rejection();
    try {
        return db_->insert(table, values, conflict);
    } catch (const db_error& e) {
        rethrow_insert_error(table, e);
    }
}

int pointers_db::insert_all(const std::string& table, const std::vector<values_t>& rows,
                            const conflict_policy& conflict) {
    triggers_.take_rejection();
    try {
        return db_->insert_all(table, rows, conflict);
    } catch (const db_error& e) {
        rethrow_insert_error(table, e);
    }
}

int pointers_db::remove(const std::string& table, const ulid& id) {
    return db_->remove(table, "id", id.dump());
}

std::optional<row_t> pointers_db::find(const std::string& table, const ulid& id) {
    auto rows = db_->query("SELECT * FROM " + detail::quote_ident(table) + " WHERE id = ?",
                           {id.dump()});
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows[0]);
}

std::optional<followed_pointer> pointers_db::follow(const ulid& pointer_id) {
    auto pointer = pointers_.find(pointer_id);
    if (!pointer) {
        return std::nullopt;
    }

    auto table = registry_.name_of(pointer->table_id);
    if (!table) {
        throw db_error("Pointer " + pointer_id.to_string() + " is tagged with unregistered table id " +
                       pointer->table_id.to_string());
    }

    followed_pointer result{*pointer, *table, std::nullopt};
    if (db_->table_exists(*table)) {
        result.row = find(*table, pointer_id);
    }
    return result;
}

void pointers_db::migrate(direction dir, const std::function<void(migration&)>& block) {
    if (config_.read_only) {
        throw db_error("Cannot migrate a read-only database", SQLITE_READONLY);
    }

    transaction tx(*db_, true);
    try {
        migration m(*this, dir);
        block(m);
        tx.commit();
    } catch (...) {
        if (db_->is_in_transaction()) {
            try {
                tx.rollback();
            } catch (const db_error& e) {
                LOG_ERROR("pointers_db", "Rollback of failed migration failed: %s", e.what());
            }
        }
        sync_trigger_function();
        throw;
    }
    LOG_INFO("pointers_db", "Migration %s committed", dir == direction::up ? "up" : "down");
}

void pointers_db::sync_trigger_function() {
    // ROLLBACK does not undo function (un)registration
    try {
        if (is_initialized()) {
            triggers_.install_function();
        } else {
            triggers_.unregister_function();
        }
    } catch (const db_error& e) {
        LOG_ERROR("pointers_db", "Could not resync %s() after rollback: %s",
                  config_.trigger_function.c_str(), e.what());
    }
}

} // namespace pointers
