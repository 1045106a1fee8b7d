#include "core/row.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <type_traits>

namespace gpcopy {

namespace {

template<typename T>
std::optional<T> parse_fixed(std::string_view sv) {
    T out{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return out;
}

bool all_digits(std::string_view sv) {
    if (sv.empty()) return false;
    for (const char c : sv) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

template<typename F>
std::string floating_to_text(F v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "Infinity" : "-Infinity";

    char buf[64];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{}) {
        return std::format("{}", v);
    }
    return std::string(buf, ptr);
}

} // anonymous namespace

// ============================================================================
// Decimal
// ============================================================================

std::string Decimal::to_string() const {
    const bool negative = unscaled < 0;
    // Magnitude as unsigned so INT64_MIN does not overflow
    const uint64_t magnitude = negative
        ? static_cast<uint64_t>(-(unscaled + 1)) + 1
        : static_cast<uint64_t>(unscaled);

    std::string digits = std::to_string(magnitude);
    if (scale <= 0) {
        if (magnitude != 0) digits.append(static_cast<size_t>(-scale), '0');
        return negative ? "-" + digits : digits;
    }

    const auto s = static_cast<size_t>(scale);
    if (digits.size() <= s) {
        digits.insert(0, s - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - s, 1, '.');
    return negative ? "-" + digits : digits;
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
    if (text.empty()) return std::nullopt;

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    const size_t dot = text.find('.');
    const std::string_view int_part = text.substr(0, dot);
    const std::string_view frac_part =
        dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) return std::nullopt;
    if (!int_part.empty() && !all_digits(int_part)) return std::nullopt;
    if (dot != std::string_view::npos && !frac_part.empty() && !all_digits(frac_part)) {
        return std::nullopt;
    }

    constexpr uint64_t kLimit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t acc = 0;
    for (const std::string_view part : {int_part, frac_part}) {
        for (const char c : part) {
            const auto digit = static_cast<uint64_t>(c - '0');
            if (acc > (kLimit - digit) / 10) return std::nullopt;
            acc = acc * 10 + digit;
        }
    }

    Decimal d;
    d.unscaled = negative ? -static_cast<int64_t>(acc) : static_cast<int64_t>(acc);
    d.scale = static_cast<int32_t>(frac_part.size());
    return d;
}

// ============================================================================
// Date / Timestamp
// ============================================================================

std::string Date::to_string() const {
    return std::format("{:04d}-{:02d}-{:02d}",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()));
}

std::optional<Date> Date::parse(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    const auto y = parse_fixed<int>(text.substr(0, 4));
    const auto m = parse_fixed<unsigned>(text.substr(5, 2));
    const auto d = parse_fixed<unsigned>(text.substr(8, 2));
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{*y}, std::chrono::month{*m}, std::chrono::day{*d}};
    if (!ymd.ok()) return std::nullopt;
    return Date{ymd};
}

std::string Timestamp::to_string() const {
    using namespace std::chrono;
    const auto day_point = floor<days>(time);
    const Date date{year_month_day{day_point}};
    const hh_mm_ss<microseconds> tod{time - day_point};

    std::string out = std::format("{} {:02d}:{:02d}:{:02d}",
        date.to_string(),
        tod.hours().count(), tod.minutes().count(), tod.seconds().count());

    const auto micros = tod.subseconds().count();
    if (micros == 0) {
        out += ".0";
    } else {
        std::string frac = std::format("{:06d}", micros);
        frac.erase(frac.find_last_not_of('0') + 1);
        out += '.';
        out += frac;
    }
    return out;
}

std::optional<Timestamp> Timestamp::parse(std::string_view text) {
    using namespace std::chrono;
    if (text.size() < 19 || (text[10] != ' ' && text[10] != 'T')) return std::nullopt;
    if (text[13] != ':' || text[16] != ':') return std::nullopt;

    const auto date = Date::parse(text.substr(0, 10));
    const auto hh = parse_fixed<int>(text.substr(11, 2));
    const auto mm = parse_fixed<int>(text.substr(14, 2));
    const auto ss = parse_fixed<int>(text.substr(17, 2));
    if (!date || !hh || !mm || !ss) return std::nullopt;
    if (*hh > 23 || *mm > 59 || *ss > 59) return std::nullopt;

    int64_t micros = 0;
    if (text.size() > 19) {
        if (text[19] != '.') return std::nullopt;
        std::string_view frac = text.substr(20);
        if (frac.empty() || frac.size() > 9 || !all_digits(frac)) return std::nullopt;
        // Nanosecond digits beyond the sixth are truncated
        std::string padded(frac.substr(0, 6));
        padded.append(6 - padded.size(), '0');
        micros = *parse_fixed<int64_t>(padded);
    }

    Timestamp ts;
    ts.time = sys_days{date->ymd} + hours{*hh} + minutes{*mm} + seconds{*ss}
            + microseconds{micros};
    return ts;
}

// ============================================================================
// Text conversion
// ============================================================================

std::string float_to_text(float v) {
    return floating_to_text(v);
}

std::string double_to_text(double v) {
    return floating_to_text(v);
}

std::string value_to_text(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, float>) {
            return float_to_text(x);
        } else if constexpr (std::is_same_v<T, double>) {
            return double_to_text(x);
        } else if constexpr (std::is_integral_v<T>) {
            return std::to_string(static_cast<int64_t>(x));
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return utils::decode_utf8_lossy(x.data(), x.size());
        } else {
            return x.to_string();
        }
    }, v);
}

// ============================================================================
// TableSchema
// ============================================================================

std::optional<size_t> TableSchema::find(std::string_view name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (utils::iequals(columns[i].name, name)) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace gpcopy
