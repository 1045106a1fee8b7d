#pragma once

#include "core/row.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gpcopy {

/// Token written for SQL NULL; also the NULL AS clause of the COPY command
inline constexpr std::string_view kNullToken = "NULL";

/**
 * @brief Converts one non-null column value to its canonical text
 */
using ValueConverter = std::string (*)(const Value& value);

/**
 * @brief Pick the converter for a column type
 *
 * USER_DEFINED types are resolved to their underlying kind. Called once per
 * column when an encoder is built, never per row.
 */
[[nodiscard]] ValueConverter make_converter(const ColumnType& type);

/**
 * @brief Encodes rows as COPY text-format lines
 *
 * Each non-null value is converted with its column's converter and escaped;
 * NULL becomes the bare token NULL. Fields are joined with the delimiter and
 * the line ends with '\n'. The result is UTF-8.
 *
 * A NULL and a text value equal to "NULL" produce the same field. The COPY
 * command declares NULL AS 'NULL', so such strings load as NULL.
 */
class RowEncoder {
public:
    RowEncoder(const TableSchema& schema, char delimiter);

    /**
     * @brief Append one encoded line to @p out
     * @throws RowEncodingError if the row width or a value kind does not match
     */
    void encode_to(const Row& row, std::string& out) const;

    [[nodiscard]] std::string encode(const Row& row) const;

    [[nodiscard]] char delimiter() const { return delimiter_; }
    [[nodiscard]] size_t column_count() const { return converters_.size(); }

    /**
     * @brief Escape one field value
     *
     * backslash -> \\, newline -> \n, carriage return -> \r,
     * delimiter -> backslash + delimiter, NUL dropped, everything else as is.
     */
    static void escape_to(std::string_view value, char delimiter, std::string& out);

    [[nodiscard]] static std::string escape(std::string_view value, char delimiter);

    /**
     * @brief Split one encoded line back into fields
     *
     * Inverse of encode(): a trailing '\n' is ignored, escapes are undone and a
     * field consisting of exactly @p null_token (unescaped) is returned as
     * std::nullopt.
     */
    [[nodiscard]] static std::vector<std::optional<std::string>> decode_line(
        std::string_view line, char delimiter, std::string_view null_token = kNullToken);

private:
    std::vector<ValueConverter> converters_;
    std::vector<std::string> column_names_;
    char delimiter_;
};

} // namespace gpcopy
