#include "io/value_parser.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <string>

namespace gpcopy::io {

namespace {

Result<Value> invalid(std::string_view text, std::string_view kind) {
    return Result<Value>::error(ErrorCategory::ENCODING_ERROR,
                                std::format("'{}' is not a valid {} value", text, kind));
}

template<typename Int>
Result<Value> parse_integer(std::string_view text, std::string_view kind) {
    int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return invalid(text, kind);
    }
    if (v < std::numeric_limits<Int>::min() || v > std::numeric_limits<Int>::max()) {
        return Result<Value>::error(ErrorCategory::ENCODING_ERROR,
                                    std::format("{} is out of range for {}", text, kind));
    }
    return Result<Value>::ok(Value{static_cast<Int>(v)});
}

template<typename Float>
Result<Value> parse_floating(std::string_view text, std::string_view kind) {
    if (text == "NaN") return Result<Value>::ok(Value{std::numeric_limits<Float>::quiet_NaN()});
    if (text == "Infinity") return Result<Value>::ok(Value{std::numeric_limits<Float>::infinity()});
    if (text == "-Infinity") return Result<Value>::ok(Value{-std::numeric_limits<Float>::infinity()});

    Float v{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return invalid(text, kind);
    }
    return Result<Value>::ok(Value{v});
}

Result<Value> parse_boolean(std::string_view text) {
    const std::string lower = utils::to_lower(text);
    if (lower == "true" || lower == "t" || lower == "yes" || lower == "on" || lower == "1") {
        return Result<Value>::ok(Value{true});
    }
    if (lower == "false" || lower == "f" || lower == "no" || lower == "off" || lower == "0") {
        return Result<Value>::ok(Value{false});
    }
    return invalid(text, "boolean");
}

template<typename T>
Result<Value> from_optional(std::optional<T> parsed, std::string_view text, std::string_view kind) {
    if (!parsed) return invalid(text, kind);
    return Result<Value>::ok(Value{std::move(*parsed)});
}

} // anonymous namespace

Result<Value> parse_value(std::string_view text, const ColumnType& type) {
    const ColumnType& t = type.resolved();
    switch (t.kind) {
        case ValueKind::TEXT:
        case ValueKind::OTHER:
        case ValueKind::USER_DEFINED:
            return Result<Value>::ok(Value{std::string(text)});
        case ValueKind::BOOLEAN:   return parse_boolean(text);
        case ValueKind::TINYINT:   return parse_integer<int8_t>(text, "tinyint");
        case ValueKind::SMALLINT:  return parse_integer<int16_t>(text, "smallint");
        case ValueKind::INTEGER:   return parse_integer<int32_t>(text, "integer");
        case ValueKind::BIGINT:    return parse_integer<int64_t>(text, "bigint");
        case ValueKind::REAL:      return parse_floating<float>(text, "real");
        case ValueKind::DOUBLE:    return parse_floating<double>(text, "double");
        case ValueKind::DECIMAL:   return from_optional(Decimal::parse(text), text, "decimal");
        case ValueKind::DATE:      return from_optional(Date::parse(text), text, "date");
        case ValueKind::TIMESTAMP: return from_optional(Timestamp::parse(text), text, "timestamp");
        case ValueKind::BINARY:
            return Result<Value>::ok(Value{Bytes(text.begin(), text.end())});
    }
    return invalid(text, value_kind_to_string(t.kind));
}

} // namespace gpcopy::io
