#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace pointers {

// Foreign-key referential action
enum class fk_action {
    no_action,
    cascade,
    set_null,
    restrict
};

inline const char* to_sql(fk_action action) {
    switch (action) {
        case fk_action::no_action: return "NO ACTION";
        case fk_action::cascade: return "CASCADE";
        case fk_action::set_null: return "SET NULL";
        case fk_action::restrict: return "RESTRICT";
    }
    return "NO ACTION";
}

// How a reference column behaves when the pointer it targets disappears
enum class pointer_type {
    strong,      // referencing row is deleted with the pointer
    weak,        // reference is set to NULL
    unbreakable  // the pointer cannot be deleted while referenced
};

struct fk_policy {
    fk_action on_delete;
    fk_action on_update;
};

/// Delete/update policy of each pointer type, indexed by pointer_type.
inline constexpr std::array<fk_policy, 3> pointer_policies = {{
    {fk_action::cascade,  fk_action::cascade},   // strong
    {fk_action::set_null, fk_action::cascade},   // weak
    {fk_action::restrict, fk_action::cascade},   // unbreakable
}};

constexpr fk_policy policy_for(pointer_type type) {
    return pointer_policies[static_cast<size_t>(type)];
}

inline const char* to_string(pointer_type type) {
    switch (type) {
        case pointer_type::strong: return "strong";
        case pointer_type::weak: return "weak";
        case pointer_type::unbreakable: return "unbreakable";
    }
    return "strong";
}

inline std::optional<pointer_type> pointer_type_from_string(std::string_view name) {
    if (name == "strong") return pointer_type::strong;
    if (name == "weak") return pointer_type::weak;
    if (name == "unbreakable") return pointer_type::unbreakable;
    return std::nullopt;
}

// A foreign-key column type: what the column references and how it reacts
// to changes in the referenced row.
struct reference {
    std::string table;
    std::string column = "id";
    column_type type = column_type::blob;
    fk_action on_delete = fk_action::no_action;
    fk_action on_update = fk_action::no_action;

    /// `REFERENCES "table"("id") ON DELETE ... ON UPDATE ...`
    std::string to_sql() const {
        return "REFERENCES " + detail::quote_ident(table) + "(" + detail::quote_ident(column) + ")"
               " ON DELETE " + pointers::to_sql(on_delete) +
               " ON UPDATE " + pointers::to_sql(on_update);
    }
};

/// Reference to the pointer store (or any table keyed by identifiers)
/// with the cascade policy of the given pointer type.
inline reference pointer(std::string table, pointer_type type) {
    auto policy = policy_for(type);
    reference ref;
    ref.table = std::move(table);
    ref.on_delete = policy.on_delete;
    ref.on_update = policy.on_update;
    return ref;
}

inline reference strong_pointer(std::string table) {
    return pointer(std::move(table), pointer_type::strong);
}

inline reference weak_pointer(std::string table) {
    return pointer(std::move(table), pointer_type::weak);
}

inline reference unbreakable_pointer(std::string table) {
    return pointer(std::move(table), pointer_type::unbreakable);
}

} // namespace pointers

#endif // __cplusplus
