#include "pointers/ulid.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace pointers {

namespace {

constexpr char crockford_alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// -1 for characters outside the alphabet (I, L, O, U included)
int crockford_value(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    for (int i = 0; i < 32; ++i) {
        if (crockford_alphabet[i] == c) return i;
    }
    return -1;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Bit positions count from the least significant bit of the 128-bit value.
bool get_bit(const std::array<uint8_t, ulid::byte_size>& bytes, int pos) {
    if (pos >= 128) return false;
    return (bytes[15 - pos / 8] >> (pos % 8)) & 1;
}

void set_bit(std::array<uint8_t, ulid::byte_size>& bytes, int pos) {
    bytes[15 - pos / 8] |= static_cast<uint8_t>(1u << (pos % 8));
}

bool decode_crockford(std::string_view text, ulid& out) {
    if (text.size() != ulid::text_size) return false;
    std::array<uint8_t, ulid::byte_size> bytes{};
    for (size_t i = 0; i < text.size(); ++i) {
        int v = crockford_value(text[i]);
        if (v < 0) return false;
        // 26 * 5 = 130 bits: the two leading bits must be zero
        if (i == 0 && v > 7) return false;
        for (int k = 0; k < 5; ++k) {
            int pos = 129 - static_cast<int>(5 * i) - k;
            if ((v >> (4 - k)) & 1) {
                set_bit(bytes, pos);
            }
        }
    }
    out.bytes = bytes;
    return true;
}

bool decode_uuid(std::string_view text, ulid& out) {
    if (text.size() != 36) return false;
    std::array<uint8_t, ulid::byte_size> bytes{};
    size_t b = 0;
    for (size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return false;
            ++i;
            continue;
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return false;
        bytes[b++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    out.bytes = bytes;
    return true;
}

} // namespace

ulid ulid::generate() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return generate_at(static_cast<uint64_t>(millis));
}

ulid ulid::generate_at(uint64_t timestamp_ms) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    ulid result;
    for (int i = 0; i < 6; ++i) {
        result.bytes[i] = static_cast<uint8_t>((timestamp_ms >> (40 - i * 8)) & 0xFF);
    }

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);
    for (int i = 0; i < 8; ++i) {
        result.bytes[6 + i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
    }
    result.bytes[14] = static_cast<uint8_t>((b >> 56) & 0xFF);
    result.bytes[15] = static_cast<uint8_t>((b >> 48) & 0xFF);
    return result;
}

ulid ulid::cast(std::string_view text) {
    ulid result;
    if (decode_crockford(text, result) || decode_uuid(text, result)) {
        return result;
    }
    throw invalid_identifier("Invalid identifier: '" + std::string(text) + "'");
}

ulid ulid::load(const std::vector<uint8_t>& raw) {
    if (raw.size() != byte_size) {
        throw invalid_identifier("Invalid identifier: expected 16 bytes, got " +
                                 std::to_string(raw.size()));
    }
    ulid result;
    std::copy(raw.begin(), raw.end(), result.bytes.begin());
    return result;
}

bool ulid::is_valid(std::string_view text) {
    ulid scratch;
    return decode_crockford(text, scratch) || decode_uuid(text, scratch);
}

std::string ulid::to_string() const {
    std::string out(text_size, '0');
    for (size_t i = 0; i < text_size; ++i) {
        int v = 0;
        for (int k = 0; k < 5; ++k) {
            int pos = 129 - static_cast<int>(5 * i) - k;
            v = (v << 1) | (get_bit(bytes, pos) ? 1 : 0);
        }
        out[i] = crockford_alphabet[v];
    }
    return out;
}

std::string ulid::to_uuid_string() const {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < byte_size; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

uint64_t ulid::timestamp_ms() const {
    uint64_t ts = 0;
    for (int i = 0; i < 6; ++i) {
        ts = (ts << 8) | bytes[i];
    }
    return ts;
}

} // namespace pointers
