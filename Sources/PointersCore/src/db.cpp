#include "pointers/db.hpp"
#include "pointers/log.hpp"
#include <sstream>
#include <thread>
#include <chrono>
#include <algorithm>
#include <cctype>

namespace pointers {

database::database(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw db_error("Failed to open database: " + error, rc);
    }
    sqlite3_extended_result_codes(db_, 1);

    // Cascades on the pointer store depend on this
    execute("PRAGMA foreign_keys = ON");

    // A cascade into the same table must still run that table's delete trigger
    execute("PRAGMA recursive_triggers = ON");

    // Triggers call the application-defined pointer function
    execute("PRAGMA trusted_schema = ON");

    if (mode == open_mode::read_write) {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), mode_(other.mode_) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close_v2(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        other.db_ = nullptr;
    }
    return *this;
}

void database::fail(const std::string& what, const std::string& sql) const {
    std::string error = sqlite3_errmsg(db_);
    int code = sqlite3_extended_errcode(db_);
    LOG_ERROR("db", "%s: %s (SQL: %s)", what.c_str(), error.c_str(), sql.c_str());
    throw db_error(what + ": " + error, code);
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            int code = sqlite3_extended_errcode(db_);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error, code);
        }
        return;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        fail("Failed to prepare statement", sql);
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(db_);
        int code = sqlite3_extended_errcode(db_);
        sqlite3_finalize(stmt);
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Execution failed: " + error, code);
    }
    sqlite3_finalize(stmt);
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare table_exists statement", sql);
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

bool database::trigger_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='trigger' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare trigger_exists statement", sql);
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

bool database::index_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='index' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare index_exists statement", sql);
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

std::vector<std::string> database::triggers_with_prefix(const std::string& prefix) const {
    // substr() rather than LIKE: trigger prefixes usually contain '_'
    const char* sql = "SELECT name FROM sqlite_master WHERE type='trigger' "
                      "AND substr(name, 1, length(?1)) = ?1 ORDER BY name";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare trigger listing", sql);
    }

    sqlite3_bind_text(stmt, 1, prefix.c_str(), -1, SQLITE_TRANSIENT);
    std::vector<std::string> names;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (name) names.emplace_back(name);
    }
    sqlite3_finalize(stmt);
    return names;
}

std::unordered_map<std::string, std::string> database::get_table_info(const std::string& table) const {
    std::unordered_map<std::string, std::string> columns;

    std::string sql = "PRAGMA table_info(" + detail::quote_ident(table) + ")";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare table_info statement", sql);
    }

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));

        if (name && type) {
            std::string type_str(type);
            for (char& c : type_str) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            columns[name] = type_str;
        }
    }

    sqlite3_finalize(stmt);
    return columns;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return sqlite3_column_int64(stmt, index);
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::string database::build_insert(const std::string& table,
                                   const values_t& values,
                                   const conflict_policy& conflict) const {
    std::ostringstream sql;
    sql << "INSERT INTO " << detail::quote_ident(table) << " (";

    bool first = true;
    for (const auto& [col, _] : values) {
        if (!first) sql << ", ";
        sql << detail::quote_ident(col);
        first = false;
    }

    sql << ") VALUES (";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "?";
    }
    sql << ")";

    if (conflict.action == conflict_action::raise) {
        return sql.str();
    }

    sql << " ON CONFLICT";
    if (!conflict.target.empty()) {
        sql << " (";
        first = true;
        for (const auto& col : conflict.target) {
            if (!first) sql << ", ";
            sql << detail::quote_ident(col);
            first = false;
        }
        sql << ")";
    }

    std::vector<std::string> updated;
    if (conflict.action == conflict_action::update) {
        auto contains = [](const std::vector<std::string>& list, const std::string& col) {
            return std::find(list.begin(), list.end(), col) != list.end();
        };
        for (const auto& [col, _] : values) {
            if (contains(conflict.target, col) || contains(conflict.preserve, col)) continue;
            updated.push_back(col);
        }
    }

    // An update with nothing left to rewrite is a do-nothing
    if (updated.empty() || conflict.target.empty()) {
        sql << " DO NOTHING";
        return sql.str();
    }

    sql << " DO UPDATE SET ";
    first = true;
    for (const auto& col : updated) {
        if (!first) sql << ", ";
        sql << detail::quote_ident(col) << " = excluded." << detail::quote_ident(col);
        first = false;
    }
    return sql.str();
}

int database::insert(const std::string& table,
                     const values_t& values,
                     const conflict_policy& conflict) {
    std::vector<values_t> rows;
    rows.push_back(values);
    return insert_all(table, rows, conflict);
}

int database::insert_all(const std::string& table,
                         const std::vector<values_t>& rows,
                         const conflict_policy& conflict) {
    if (rows.empty()) return 0;

    std::string sql = build_insert(table, rows.front(), conflict);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare insert", sql);
    }

    int changed = 0;
    for (const auto& row : rows) {
        if (row.size() != rows.front().size()) {
            sqlite3_finalize(stmt);
            throw db_error("Insert failed: rows name different columns (table " + table + ")");
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        int index = 1;
        for (const auto& [_, val] : row) {
            bind_value(stmt, index++, val);
        }

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            std::string error = sqlite3_errmsg(db_);
            int code = sqlite3_extended_errcode(db_);
            sqlite3_finalize(stmt);
            LOG_ERROR("db", "Insert into %s failed: %s", table.c_str(), error.c_str());
            throw db_error("Insert failed: " + error, code);
        }
        changed += sqlite3_changes(db_);
    }

    sqlite3_finalize(stmt);
    return changed;
}

int database::remove(const std::string& table, const std::string& column, const column_value_t& value) {
    std::string sql = "DELETE FROM " + detail::quote_ident(table) +
                      " WHERE " + detail::quote_ident(column) + " = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare delete", sql);
    }

    bind_value(stmt, 1, value);
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        int code = sqlite3_extended_errcode(db_);
        sqlite3_finalize(stmt);
        LOG_ERROR("db", "Delete from %s failed: %s", table.c_str(), error.c_str());
        throw db_error("Delete failed: " + error, code);
    }
    sqlite3_finalize(stmt);
    return sqlite3_changes(db_);
}

std::vector<row_t> database::query(const std::string& sql,
                                   const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare query", sql);
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        int code = sqlite3_extended_errcode(db_);
        sqlite3_finalize(stmt);
        LOG_ERROR("db", "Query failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Query failed: " + error, code);
    }

    sqlite3_finalize(stmt);
    return results;
}

void database::begin_transaction(bool exclusive) {
    // IMMEDIATE: acquires write lock, readers still allowed (WAL mode).
    // EXCLUSIVE: also blocks readers. Migrations use it.
    const char* sql = exclusive ? "BEGIN EXCLUSIVE" : "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Retry with exponential backoff while another connection holds the write lock
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        fail("Failed to begin transaction", sql);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction RAII guard
transaction::transaction(database& db, bool exclusive) : db_(db) {
    db_.begin_transaction(exclusive);
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace pointers
