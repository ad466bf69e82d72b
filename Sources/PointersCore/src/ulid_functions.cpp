#include "pointers/ulid_functions.hpp"
#include "pointers/log.hpp"

namespace pointers {

namespace {

void sql_ulid(sqlite3_context* ctx, int, sqlite3_value**) {
    auto id = ulid::generate();
    sqlite3_result_blob(ctx, id.bytes.data(), static_cast<int>(id.bytes.size()), SQLITE_TRANSIENT);
}

void sql_ulid_text(sqlite3_context* ctx, int, sqlite3_value** argv) {
    if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }
    const auto* data = static_cast<const uint8_t*>(sqlite3_value_blob(argv[0]));
    int size = sqlite3_value_bytes(argv[0]);
    try {
        auto id = ulid::load(std::vector<uint8_t>(data, data + size));
        auto text = id.to_string();
        sqlite3_result_text(ctx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    } catch (const invalid_identifier& e) {
        sqlite3_result_error(ctx, e.what(), -1);
    }
}

void sql_ulid_blob(sqlite3_context* ctx, int, sqlite3_value** argv) {
    if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }
    const unsigned char* raw = sqlite3_value_text(argv[0]);
    try {
        auto id = ulid::cast(raw ? reinterpret_cast<const char*>(raw) : "");
        sqlite3_result_blob(ctx, id.bytes.data(), static_cast<int>(id.bytes.size()), SQLITE_TRANSIENT);
    } catch (const invalid_identifier& e) {
        sqlite3_result_error(ctx, e.what(), -1);
    }
}

void register_function(database& db, const char* name, int args, int flags,
                       void (*fn)(sqlite3_context*, int, sqlite3_value**)) {
    int rc = sqlite3_create_function_v2(db.handle(), name, args, SQLITE_UTF8 | flags,
                                        nullptr, fn, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error(std::string("Failed to register function ") + name + ": " +
                       sqlite3_errmsg(db.handle()), rc);
    }
}

} // namespace

void register_ulid_functions(database& db) {
    register_function(db, "ulid", 0, 0, &sql_ulid);
    register_function(db, "ulid_text", 1, SQLITE_DETERMINISTIC | SQLITE_INNOCUOUS, &sql_ulid_text);
    register_function(db, "ulid_blob", 1, SQLITE_DETERMINISTIC | SQLITE_INNOCUOUS, &sql_ulid_blob);
    LOG_DEBUG("ulid", "Registered ulid SQL functions");
}

} // namespace pointers
