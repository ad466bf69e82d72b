#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace pointers {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Configuration for pointers_db
// ============================================================================

/// Names used by the pointer abstraction. Read once when a pointers_db is
/// opened; nothing consults process-wide state afterwards.
struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// Registry of participating tables
    std::string table_source = "pointers_table";

    /// Pointer store
    std::string pointer_source = "pointers_pointer";

    /// SQL function the insert triggers call
    std::string trigger_function = "insert_pointer";

    /// Per-table BEFORE INSERT trigger is named trigger_prefix + table
    std::string trigger_prefix = "insert_pointer_";

    /// Per-table AFTER DELETE trigger is named delete_trigger_prefix + table
    std::string delete_trigger_prefix = "delete_pointer_";

    /// Open the database read-only. No migrations can run.
    bool read_only = false;

    log_level level = log_level::off;

    configuration() = default;

    // Path only - everything else defaulted
    explicit configuration(const std::string& p) : path(p) {}

    /// Read keys of the same names from a JSON object. Missing keys keep
    /// their defaults. Throws config_error.
    static configuration from_json(const nlohmann::json& json);

    /// Parse a JSON file. Throws config_error.
    static configuration load(const std::string& file);

    nlohmann::json to_json() const;

    /// Throws config_error unless every name is a plain SQL identifier and
    /// the two trigger prefixes differ.
    void validate() const;
};

} // namespace pointers

#endif // __cplusplus
