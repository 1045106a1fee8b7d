#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gpcopy {

/**
 * @brief Closed set of value kinds a column can carry
 *
 * USER_DEFINED wraps another kind (its underlying storage type).
 * OTHER covers everything else (json, uuid, arrays...) and is written
 * using the value's default text form.
 */
enum class ValueKind : uint8_t {
    TEXT = 0,
    BOOLEAN,
    TINYINT,
    SMALLINT,
    INTEGER,
    BIGINT,
    REAL,
    DOUBLE,
    DECIMAL,
    DATE,
    TIMESTAMP,
    BINARY,
    USER_DEFINED,
    OTHER,
};

inline constexpr size_t kValueKindCount = static_cast<size_t>(ValueKind::OTHER) + 1;

/**
 * @brief Column type: a value kind plus the parameters some kinds need
 */
struct ColumnType {
    ValueKind kind = ValueKind::TEXT;

    // DECIMAL only
    uint8_t precision = 0;
    uint8_t scale = 0;

    // USER_DEFINED: type name; OTHER: SQL type used for DDL (empty = TEXT)
    std::string sql_name;

    // USER_DEFINED only
    std::shared_ptr<const ColumnType> underlying;

    ColumnType() = default;
    explicit ColumnType(ValueKind k) : kind(k) {}

    static ColumnType decimal(uint8_t precision, uint8_t scale) {
        ColumnType t(ValueKind::DECIMAL);
        t.precision = precision;
        t.scale = scale;
        return t;
    }

    static ColumnType user_defined(std::string name, ColumnType storage) {
        ColumnType t(ValueKind::USER_DEFINED);
        t.sql_name = std::move(name);
        t.underlying = std::make_shared<const ColumnType>(std::move(storage));
        return t;
    }

    static ColumnType other(std::string sql_name) {
        ColumnType t(ValueKind::OTHER);
        t.sql_name = std::move(sql_name);
        return t;
    }

    /**
     * @brief Follow USER_DEFINED wrappers down to the storage type
     */
    [[nodiscard]] const ColumnType& resolved() const {
        const ColumnType* t = this;
        while (t->kind == ValueKind::USER_DEFINED && t->underlying) {
            t = t->underlying.get();
        }
        return *t;
    }
};

[[nodiscard]] inline const char* value_kind_to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::TEXT: return "TEXT";
        case ValueKind::BOOLEAN: return "BOOLEAN";
        case ValueKind::TINYINT: return "TINYINT";
        case ValueKind::SMALLINT: return "SMALLINT";
        case ValueKind::INTEGER: return "INTEGER";
        case ValueKind::BIGINT: return "BIGINT";
        case ValueKind::REAL: return "REAL";
        case ValueKind::DOUBLE: return "DOUBLE";
        case ValueKind::DECIMAL: return "DECIMAL";
        case ValueKind::DATE: return "DATE";
        case ValueKind::TIMESTAMP: return "TIMESTAMP";
        case ValueKind::BINARY: return "BINARY";
        case ValueKind::USER_DEFINED: return "USER_DEFINED";
        case ValueKind::OTHER: return "OTHER";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a configured type name ("bigint", "decimal(10,2)", "string"...)
 *
 * Unrecognised names become OTHER with the name kept as its SQL type.
 * Returns std::nullopt only for a malformed decimal specification.
 */
[[nodiscard]] std::optional<ColumnType> parse_column_type(std::string_view name);

} // namespace gpcopy
