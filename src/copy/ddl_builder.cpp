#include "copy/ddl_builder.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <optional>
#include <unordered_set>
#include <vector>

namespace gpcopy::ddl {

namespace {

struct TypeOverride {
    std::string column;
    bool quoted = false;
    std::string type;
};

// Split on commas that are not inside parentheses, e.g. "a NUMERIC(10,2), b TEXT"
std::vector<std::string> split_top_level(std::string_view text) {
    std::vector<std::string> parts;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '(') ++depth;
        else if (text[i] == ')') --depth;
        else if (text[i] == ',' && depth == 0) {
            parts.push_back(utils::trim(text.substr(start, i - start)));
            start = i + 1;
        }
    }
    parts.push_back(utils::trim(text.substr(start)));
    return parts;
}

std::vector<TypeOverride> parse_overrides(std::string_view text) {
    std::vector<TypeOverride> result;
    if (utils::trim(text).empty()) return result;

    for (const auto& entry : split_top_level(text)) {
        TypeOverride o;
        size_t type_start = 0;
        if (!entry.empty() && entry.front() == '"') {
            const size_t close = entry.find('"', 1);
            if (close == std::string::npos) {
                throw InvalidOptionsError(std::format(
                    "create_table_column_types: unterminated quoted column in '{}'", entry));
            }
            o.column = entry.substr(1, close - 1);
            o.quoted = true;
            type_start = close + 1;
        } else {
            const size_t space = entry.find_first_of(" \t");
            o.column = entry.substr(0, space);
            type_start = space == std::string::npos ? entry.size() : space;
        }
        o.type = utils::trim(std::string_view(entry).substr(type_start));

        if (o.column.empty() || o.type.empty()) {
            throw InvalidOptionsError(std::format(
                "create_table_column_types: expected 'column TYPE', got '{}'", entry));
        }
        result.push_back(std::move(o));
    }
    return result;
}

} // anonymous namespace

std::string quote_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string sql_type(const ColumnType& type) {
    const ColumnType& t = type.resolved();
    switch (t.kind) {
        case ValueKind::TEXT: return "TEXT";
        case ValueKind::BOOLEAN: return "BOOLEAN";
        case ValueKind::TINYINT: return "SMALLINT";
        case ValueKind::SMALLINT: return "SMALLINT";
        case ValueKind::INTEGER: return "INTEGER";
        case ValueKind::BIGINT: return "BIGINT";
        case ValueKind::REAL: return "FLOAT4";
        case ValueKind::DOUBLE: return "FLOAT8";
        case ValueKind::DECIMAL:
            return std::format("NUMERIC({},{})", t.precision, t.scale);
        case ValueKind::DATE: return "DATE";
        case ValueKind::TIMESTAMP: return "TIMESTAMP";
        case ValueKind::BINARY: return "BYTEA";
        case ValueKind::USER_DEFINED:
        case ValueKind::OTHER:
            return t.sql_name.empty() ? "TEXT" : t.sql_name;
        default: return "TEXT";
    }
}

std::string schema_string(const TableSchema& schema, std::string_view column_type_overrides) {
    std::vector<std::string> types;
    types.reserve(schema.size());
    for (const auto& col : schema.columns) {
        types.push_back(sql_type(col.type));
    }

    std::unordered_set<size_t> overridden;
    for (auto& o : parse_overrides(column_type_overrides)) {
        std::optional<size_t> idx;
        if (o.quoted) {
            for (size_t i = 0; i < schema.size(); ++i) {
                if (schema.columns[i].name == o.column) idx = i;
            }
        } else {
            idx = schema.find(o.column);
        }
        if (!idx) {
            throw InvalidOptionsError(std::format(
                "create_table_column_types option column {} not found in schema", o.column));
        }
        if (!overridden.insert(*idx).second) {
            throw InvalidOptionsError(std::format(
                "create_table_column_types option column {} specified more than once", o.column));
        }
        types[*idx] = std::move(o.type);
    }

    std::string out;
    for (size_t i = 0; i < schema.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote_identifier(schema.columns[i].name);
        out += ' ';
        out += types[i];
        if (!schema.columns[i].nullable) {
            out += " NOT NULL";
        }
    }
    return out;
}

std::string create_table(std::string_view table,
                         std::string_view schema_string,
                         std::string_view table_options) {
    const std::string options = utils::trim(table_options);
    if (options.empty()) {
        return std::format("CREATE TABLE {} ({})", table, schema_string);
    }
    return std::format("CREATE TABLE {} ({}) {}", table, schema_string, options);
}

std::string drop_table(std::string_view table) {
    return std::format("DROP TABLE {}", table);
}

std::string table_exists_probe(std::string_view table) {
    return std::format("SELECT * FROM {} WHERE 1=0", table);
}

std::string rename_table(std::string_view from, std::string_view new_name) {
    return std::format("ALTER TABLE {} RENAME TO {}", from, new_name);
}

std::string copy_from_stdin(std::string_view table, char delimiter) {
    const std::string delim = delimiter == '\'' ? std::string("\\'") : std::string(1, delimiter);
    return std::format("COPY {} FROM STDIN WITH NULL AS 'NULL' DELIMITER AS E'{}'", table, delim);
}

} // namespace gpcopy::ddl
