#include "copy/row_encoder.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace gpcopy {

namespace {

template<typename T>
const T& expect(const Value& v, const char* kind) {
    if (const T* p = std::get_if<T>(&v)) {
        return *p;
    }
    throw RowEncodingError(std::format("expected a {} value, got variant index {}",
                                       kind, v.index()));
}

std::string text_converter(const Value& v) {
    return expect<std::string>(v, "TEXT");
}

std::string boolean_converter(const Value& v) {
    return expect<bool>(v, "BOOLEAN") ? "true" : "false";
}

std::string tinyint_converter(const Value& v) {
    return std::to_string(expect<int8_t>(v, "TINYINT"));
}

std::string smallint_converter(const Value& v) {
    return std::to_string(expect<int16_t>(v, "SMALLINT"));
}

std::string integer_converter(const Value& v) {
    return std::to_string(expect<int32_t>(v, "INTEGER"));
}

std::string bigint_converter(const Value& v) {
    return std::to_string(expect<int64_t>(v, "BIGINT"));
}

std::string real_converter(const Value& v) {
    return float_to_text(expect<float>(v, "REAL"));
}

std::string double_converter(const Value& v) {
    return double_to_text(expect<double>(v, "DOUBLE"));
}

std::string decimal_converter(const Value& v) {
    return expect<Decimal>(v, "DECIMAL").to_string();
}

std::string date_converter(const Value& v) {
    return expect<Date>(v, "DATE").to_string();
}

std::string timestamp_converter(const Value& v) {
    return expect<Timestamp>(v, "TIMESTAMP").to_string();
}

std::string binary_converter(const Value& v) {
    const auto& bytes = expect<Bytes>(v, "BINARY");
    return utils::decode_utf8_lossy(bytes.data(), bytes.size());
}

std::string default_converter(const Value& v) {
    return value_to_text(v);
}

// Indexed by ValueKind
constexpr std::array<ValueConverter, kValueKindCount> kConverters = {
    &text_converter,       // TEXT
    &boolean_converter,    // BOOLEAN
    &tinyint_converter,    // TINYINT
    &smallint_converter,   // SMALLINT
    &integer_converter,    // INTEGER
    &bigint_converter,     // BIGINT
    &real_converter,       // REAL
    &double_converter,     // DOUBLE
    &decimal_converter,    // DECIMAL
    &date_converter,       // DATE
    &timestamp_converter,  // TIMESTAMP
    &binary_converter,     // BINARY
    &default_converter,    // USER_DEFINED without an underlying type
    &default_converter,    // OTHER
};

} // anonymous namespace

ValueConverter make_converter(const ColumnType& type) {
    return kConverters[static_cast<size_t>(type.resolved().kind)];
}

// ============================================================================
// RowEncoder
// ============================================================================

RowEncoder::RowEncoder(const TableSchema& schema, char delimiter)
    : delimiter_(delimiter) {
    converters_.reserve(schema.size());
    column_names_.reserve(schema.size());
    for (const auto& col : schema.columns) {
        converters_.push_back(make_converter(col.type));
        column_names_.push_back(col.name);
    }
}

void RowEncoder::encode_to(const Row& row, std::string& out) const {
    if (row.size() != converters_.size()) {
        throw RowEncodingError(std::format(
            "row has {} values but the schema has {} columns",
            row.size(), converters_.size()));
    }

    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out += delimiter_;

        if (is_null(row[i])) {
            out += kNullToken;
            continue;
        }

        try {
            escape_to(converters_[i](row[i]), delimiter_, out);
        } catch (const RowEncodingError& e) {
            throw RowEncodingError(std::format("column '{}': {}", column_names_[i], e.what()));
        }
    }
    out += '\n';
}

std::string RowEncoder::encode(const Row& row) const {
    std::string line;
    encode_to(row, line);
    return line;
}

void RowEncoder::escape_to(std::string_view value, char delimiter, std::string& out) {
    for (const char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\0': break;
            default:
                if (c == delimiter) {
                    out += '\\';
                }
                out += c;
        }
    }
}

std::string RowEncoder::escape(std::string_view value, char delimiter) {
    std::string out;
    out.reserve(value.size());
    escape_to(value, delimiter, out);
    return out;
}

std::vector<std::optional<std::string>> RowEncoder::decode_line(
    std::string_view line, char delimiter, std::string_view null_token) {
    if (!line.empty() && line.back() == '\n') {
        line.remove_suffix(1);
    }

    std::vector<std::optional<std::string>> fields;
    std::string current;
    size_t field_start = 0;

    // NULL is recognised on the raw field text, before unescaping
    const auto finish_field = [&](size_t raw_end) {
        if (line.substr(field_start, raw_end - field_start) == null_token) {
            fields.emplace_back(std::nullopt);
        } else {
            fields.emplace_back(std::move(current));
        }
        current.clear();
        field_start = raw_end + 1;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            const char next = line[++i];
            switch (next) {
                case 'n': current += '\n'; break;
                case 'r': current += '\r'; break;
                case 't': current += '\t'; break;
                default:  current += next; break;
            }
        } else if (c == delimiter) {
            finish_field(i);
        } else {
            current += c;
        }
    }
    finish_field(line.size());
    return fields;
}

} // namespace gpcopy
