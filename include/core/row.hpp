#pragma once

#include "core/column_type.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gpcopy {

/**
 * @brief Fixed-point decimal: unscaled * 10^-scale
 */
struct Decimal {
    int64_t unscaled = 0;
    int32_t scale = 0;

    /// Plain notation, e.g. {-12345, 2} -> "-123.45", {5, 3} -> "0.005"
    [[nodiscard]] std::string to_string() const;

    /// Parses "[-+]digits[.digits]"; std::nullopt on malformed or overflowing input
    [[nodiscard]] static std::optional<Decimal> parse(std::string_view text);

    bool operator==(const Decimal&) const = default;
};

/**
 * @brief Calendar date without time zone
 */
struct Date {
    std::chrono::year_month_day ymd{};

    /// yyyy-mm-dd
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<Date> parse(std::string_view text);

    bool operator==(const Date&) const = default;
};

/**
 * @brief Timestamp without time zone, microsecond precision
 */
struct Timestamp {
    std::chrono::sys_time<std::chrono::microseconds> time{};

    /**
     * @brief yyyy-mm-dd hh:mm:ss.f
     *
     * The fraction keeps at least one digit and drops trailing zeros
     * ("... 10:00:00.0", "... 10:00:00.25").
     */
    [[nodiscard]] std::string to_string() const;

    /// "yyyy-mm-dd hh:mm:ss[.ffffff]" (a 'T' separator is also accepted)
    [[nodiscard]] static std::optional<Timestamp> parse(std::string_view text);

    bool operator==(const Timestamp&) const = default;
};

using Bytes = std::vector<uint8_t>;

/**
 * @brief One column value; std::monostate is SQL NULL
 */
using Value = std::variant<
    std::monostate,
    std::string,
    bool,
    int8_t,
    int16_t,
    int32_t,
    int64_t,
    float,
    double,
    Decimal,
    Date,
    Timestamp,
    Bytes>;

/// Ordered values, one per schema column
using Row = std::vector<Value>;

[[nodiscard]] inline bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Default text form of any value, used for OTHER columns
 *
 * Binary values are decoded as UTF-8. NULL yields "null".
 */
[[nodiscard]] std::string value_to_text(const Value& v);

/// Shortest text that reads back to the same float ("NaN", "Infinity" for specials)
[[nodiscard]] std::string float_to_text(float v);
[[nodiscard]] std::string double_to_text(double v);

// ============================================================================
// Schema
// ============================================================================

struct ColumnSchema {
    std::string name;
    ColumnType type;
    bool nullable = true;
};

struct TableSchema {
    std::vector<ColumnSchema> columns;

    [[nodiscard]] size_t size() const { return columns.size(); }
    [[nodiscard]] bool empty() const { return columns.empty(); }

    /// Case-insensitive lookup; std::nullopt if absent
    [[nodiscard]] std::optional<size_t> find(std::string_view name) const;
};

} // namespace gpcopy
