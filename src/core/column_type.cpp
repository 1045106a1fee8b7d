#include "core/column_type.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <unordered_map>

namespace gpcopy {

namespace {

std::optional<uint8_t> parse_small(std::string_view sv) {
    const std::string t = utils::trim(sv);
    unsigned v = 0;
    const auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), v);
    if (ec != std::errc{} || ptr != t.data() + t.size() || v > 38) return std::nullopt;
    return static_cast<uint8_t>(v);
}

} // anonymous namespace

std::optional<ColumnType> parse_column_type(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(name));

    // decimal(p,s) / numeric(p,s)
    if (lower.starts_with("decimal") || lower.starts_with("numeric")) {
        const std::string_view rest = std::string_view(lower).substr(7);
        if (utils::trim(rest).empty()) {
            return ColumnType::decimal(10, 0);
        }
        const size_t open = rest.find('(');
        const size_t close = rest.rfind(')');
        if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
            return std::nullopt;
        }
        const std::string_view args = rest.substr(open + 1, close - open - 1);
        const size_t comma = args.find(',');
        const auto precision = parse_small(args.substr(0, comma));
        const auto scale = comma == std::string_view::npos
            ? std::optional<uint8_t>(0)
            : parse_small(args.substr(comma + 1));
        if (!precision || !scale || *precision == 0 || *scale > *precision) {
            return std::nullopt;
        }
        return ColumnType::decimal(*precision, *scale);
    }

    static const std::unordered_map<std::string, ValueKind> lookup = {
        {"text",             ValueKind::TEXT},
        {"string",           ValueKind::TEXT},
        {"varchar",          ValueKind::TEXT},
        {"boolean",          ValueKind::BOOLEAN},
        {"bool",             ValueKind::BOOLEAN},
        {"tinyint",          ValueKind::TINYINT},
        {"byte",             ValueKind::TINYINT},
        {"smallint",         ValueKind::SMALLINT},
        {"short",            ValueKind::SMALLINT},
        {"int",              ValueKind::INTEGER},
        {"integer",          ValueKind::INTEGER},
        {"bigint",           ValueKind::BIGINT},
        {"long",             ValueKind::BIGINT},
        {"real",             ValueKind::REAL},
        {"float",            ValueKind::REAL},
        {"float4",           ValueKind::REAL},
        {"double",           ValueKind::DOUBLE},
        {"float8",           ValueKind::DOUBLE},
        {"double precision", ValueKind::DOUBLE},
        {"date",             ValueKind::DATE},
        {"timestamp",        ValueKind::TIMESTAMP},
        {"binary",           ValueKind::BINARY},
        {"bytea",            ValueKind::BINARY},
    };

    const auto it = lookup.find(lower);
    if (it != lookup.end()) {
        return ColumnType(it->second);
    }
    return ColumnType::other(utils::trim(name));
}

} // namespace gpcopy
