#include "pointers/trigger.hpp"
#include "pointers/log.hpp"

namespace pointers {

trigger_protocol::trigger_protocol(database& db, const configuration& config)
    : db_(db), config_(config), state_(std::make_unique<function_state>()) {
    state_->lookup_sql = "SELECT id FROM " + detail::quote_ident(config_.table_source) +
                         " WHERE \"table\" = ?";
}

trigger_protocol::~trigger_protocol() {
    if (installed_ && db_.handle()) {
        // The connection must not keep a pointer to state_ past this point
        sqlite3_create_function_v2(db_.handle(), config_.trigger_function.c_str(), 1,
                                   SQLITE_UTF8, nullptr, nullptr, nullptr, nullptr, nullptr);
    }
}

void trigger_protocol::resolve_table_id(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    auto* state = static_cast<function_state*>(sqlite3_user_data(ctx));
    if (argc != 1) {
        sqlite3_result_error(ctx, "pointer trigger function takes one argument", -1);
        return;
    }

    const unsigned char* raw = sqlite3_value_text(argv[0]);
    std::string table = raw ? reinterpret_cast<const char*>(raw) : "";

    sqlite3* db = sqlite3_context_db_handle(ctx);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, state->lookup_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_result_error(ctx, sqlite3_errmsg(db), -1);
        return;
    }

    sqlite3_bind_text(stmt, 1, table.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        sqlite3_result_blob(ctx, sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0),
                            SQLITE_TRANSIENT);
        sqlite3_finalize(stmt);
        return;
    }
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        sqlite3_result_error(ctx, error.c_str(), -1);
        return;
    }
    sqlite3_finalize(stmt);

    // Fail closed: a table accepts no rows until it is registered
    state->rejected = table;
    std::string message = "Table " + table + " does not participate in the pointers abstraction";
    LOG_ERROR("trigger", "%s", message.c_str());
    sqlite3_result_error(ctx, message.c_str(), -1);
    sqlite3_result_error_code(ctx, SQLITE_CONSTRAINT_TRIGGER);
}

void trigger_protocol::install_function() {
    int rc = sqlite3_create_function_v2(
        db_.handle(),
        config_.trigger_function.c_str(),
        1,  // table name
        SQLITE_UTF8,
        state_.get(),
        &trigger_protocol::resolve_table_id,
        nullptr,
        nullptr,
        nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to register trigger function " + config_.trigger_function +
                       ": " + sqlite3_errmsg(db_.handle()), rc);
    }
    installed_ = true;
    LOG_DEBUG("trigger", "Registered function %s()", config_.trigger_function.c_str());
}

void trigger_protocol::drop_function() {
    // Dependent triggers go with the function
    for (const auto& prefix : {config_.trigger_prefix, config_.delete_trigger_prefix}) {
        for (const auto& name : db_.triggers_with_prefix(prefix)) {
            db_.execute("DROP TRIGGER IF EXISTS " + detail::quote_ident(name));
            LOG_DEBUG("trigger", "Dropped dependent trigger %s", name.c_str());
        }
    }

    unregister_function();
}

void trigger_protocol::unregister_function() {
    int rc = sqlite3_create_function_v2(db_.handle(), config_.trigger_function.c_str(), 1,
                                        SQLITE_UTF8, nullptr, nullptr, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to unregister trigger function " + config_.trigger_function +
                       ": " + sqlite3_errmsg(db_.handle()), rc);
    }
    installed_ = false;
    LOG_DEBUG("trigger", "Unregistered function %s()", config_.trigger_function.c_str());
}

void trigger_protocol::create_trigger(const std::string& table) {
    // because there is no create trigger if not exists that replaces
    drop_trigger(table);

    std::string quoted_table = detail::quote_ident(table);
    std::string pointer_table = detail::quote_ident(config_.pointer_source);

    db_.execute(
        "CREATE TRIGGER " + detail::quote_ident(insert_trigger_name(table)) +
        " BEFORE INSERT ON " + quoted_table +
        " FOR EACH ROW"
        " BEGIN"
        "   INSERT OR IGNORE INTO " + pointer_table + " (id, table_id)"
        "   VALUES (NEW.id, " + detail::quote_ident(config_.trigger_function) +
        "(" + detail::quote_literal(table) + "));"
        " END");

    db_.execute(
        "CREATE TRIGGER " + detail::quote_ident(delete_trigger_name(table)) +
        " AFTER DELETE ON " + quoted_table +
        " FOR EACH ROW"
        " BEGIN"
        "   DELETE FROM " + pointer_table + " WHERE id = OLD.id;"
        " END");

    LOG_INFO("trigger", "Installed pointer triggers on %s", table.c_str());
}

void trigger_protocol::drop_trigger(const std::string& table) {
    db_.execute("DROP TRIGGER IF EXISTS " + detail::quote_ident(insert_trigger_name(table)));
    db_.execute("DROP TRIGGER IF EXISTS " + detail::quote_ident(delete_trigger_name(table)));
}

bool trigger_protocol::has_trigger(const std::string& table) const {
    return db_.trigger_exists(insert_trigger_name(table));
}

std::optional<std::string> trigger_protocol::take_rejection() {
    auto rejected = std::move(state_->rejected);
    state_->rejected.reset();
    return rejected;
}

} // namespace pointers
