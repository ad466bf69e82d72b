#pragma once

#ifdef __cplusplus

#include <array>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pointers {

class invalid_identifier : public std::runtime_error {
public:
    explicit invalid_identifier(const std::string& msg) : std::runtime_error(msg) {}
};

// 128-bit time-sortable identifier (ULID).
//
// Layout, big-endian: 48 bits of Unix milliseconds, then 80 random bits.
// Text form is 26 characters of Crockford base32; the database only ever
// sees the 16-byte form returned by dump().
struct ulid {
    static constexpr size_t byte_size = 16;
    static constexpr size_t text_size = 26;

    std::array<uint8_t, byte_size> bytes{};

    ulid() = default;

    explicit ulid(const std::array<uint8_t, byte_size>& b) : bytes(b) {}

    /// Fresh identifier stamped with the current wall-clock time.
    static ulid generate();

    /// Fresh identifier stamped with the given Unix time in milliseconds.
    /// Only the low 48 bits of the timestamp are kept.
    static ulid generate_at(uint64_t timestamp_ms);

    /// Parse the 26-character Crockford form (either case) or the 36-character
    /// hyphenated UUID form. Throws invalid_identifier.
    static ulid cast(std::string_view text);

    /// Load the 16-byte stored form. Throws invalid_identifier.
    static ulid load(const std::vector<uint8_t>& raw);

    /// Non-throwing variant of cast().
    static bool is_valid(std::string_view text);

    /// Stored form (16-byte BLOB).
    std::vector<uint8_t> dump() const {
        return std::vector<uint8_t>(bytes.begin(), bytes.end());
    }

    /// Canonical 26-character Crockford base32 text.
    std::string to_string() const;

    // Lowercase hyphenated rendering of the same 128 bits
    std::string to_uuid_string() const;

    uint64_t timestamp_ms() const;

    bool is_nil() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }

    bool operator==(const ulid& other) const { return bytes == other.bytes; }
    bool operator!=(const ulid& other) const { return bytes != other.bytes; }
    bool operator<(const ulid& other) const { return bytes < other.bytes; }
    bool operator>(const ulid& other) const { return other < *this; }
    bool operator<=(const ulid& other) const { return !(other < *this); }
    bool operator>=(const ulid& other) const { return !(*this < other); }
};

} // namespace pointers

template<>
struct std::hash<pointers::ulid> {
    size_t operator()(const pointers::ulid& id) const noexcept {
        size_t h = 0;
        for (auto b : id.bytes) {
            h = h * 131 + b;
        }
        return h;
    }
};

#endif // __cplusplus
