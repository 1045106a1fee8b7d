#include "core/utils.hpp"

#include <openssl/rand.h>

#include <array>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace gpcopy::utils {

namespace {

std::array<uint8_t, 16> random_uuid_bytes() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    // Version 4, RFC 4122 variant
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    return bytes;
}

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

} // anonymous namespace

// ============================================================================
// UUID Generation
// ============================================================================

std::string generate_uuid() {
    const std::string hex = generate_uuid_hex();
    return std::format("{}-{}-{}-{}-{}",
        hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
        hex.substr(16, 4), hex.substr(20, 12));
}

std::string generate_uuid_hex() {
    static constexpr char kDigits[] = "0123456789abcdef";
    const auto bytes = random_uuid_bytes();

    std::string hex;
    hex.reserve(32);
    for (const uint8_t b : bytes) {
        hex += kDigits[b >> 4];
        hex += kDigits[b & 0x0F];
    }
    return hex;
}

// ============================================================================
// Duration Parsing
// ============================================================================

std::optional<std::chrono::milliseconds> parse_duration(std::string_view text) {
    const std::string s = to_lower(trim(text));
    if (s.empty()) return std::nullopt;

    int64_t amount = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), amount);
    if (ec != std::errc{} || ptr == s.data() || amount < 0) {
        return std::nullopt;
    }

    const std::string suffix = trim(std::string_view(ptr, s.data() + s.size() - ptr));

    static const std::unordered_map<std::string, int64_t> micros_per_unit = {
        {"us",   1},
        {"usec", 1},
        {"ms",   1000},
        {"msec", 1000},
        {"s",    1000LL * 1000},
        {"sec",  1000LL * 1000},
        {"m",    60LL * 1000 * 1000},
        {"min",  60LL * 1000 * 1000},
        {"h",    60LL * 60 * 1000 * 1000},
        {"d",    24LL * 60 * 60 * 1000 * 1000},
    };

    int64_t factor = 1000;  // bare number: milliseconds
    if (!suffix.empty()) {
        const auto it = micros_per_unit.find(suffix);
        if (it == micros_per_unit.end()) {
            return std::nullopt;
        }
        factor = it->second;
    }

    if (amount > std::numeric_limits<int64_t>::max() / factor) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::microseconds(amount * factor));
}

// ============================================================================
// UTF-8
// ============================================================================

std::string decode_utf8_lossy(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(size);

    size_t i = 0;
    while (i < size) {
        const uint8_t lead = data[i];
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        size_t len = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            if (lead == 0xE0) lo = 0xA0;
            if (lead == 0xED) hi = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            if (lead == 0xF0) lo = 0x90;
            if (lead == 0xF4) hi = 0x8F;
        } else {
            out += kReplacementChar;
            ++i;
            continue;
        }

        // Only the second byte has a lead-dependent range; the rest are 80..BF.
        size_t valid = 1;
        while (valid < len && i + valid < size) {
            const uint8_t b = data[i + valid];
            const uint8_t min = (valid == 1) ? lo : 0x80;
            const uint8_t max = (valid == 1) ? hi : 0xBF;
            if (b < min || b > max) break;
            ++valid;
        }

        if (valid == len) {
            out.append(reinterpret_cast<const char*>(data + i), len);
        } else {
            out += kReplacementChar;
        }
        i += valid;
    }
    return out;
}

} // namespace gpcopy::utils
