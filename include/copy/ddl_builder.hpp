#pragma once

#include "core/row.hpp"

#include <string>
#include <string_view>

namespace gpcopy::ddl {

/// "name" with embedded double quotes doubled
[[nodiscard]] std::string quote_identifier(std::string_view name);

/// Column type used when creating a table for @p type
[[nodiscard]] std::string sql_type(const ColumnType& type);

/**
 * @brief Column list for CREATE TABLE: "a" BIGINT NOT NULL, "b" TEXT, ...
 *
 * @p column_type_overrides is "col TYPE, col2 TYPE(...)"; each named column
 * uses the given type instead of its default one.
 *
 * @throws InvalidOptionsError on an unknown or repeated override column, or a
 *         malformed override entry
 */
[[nodiscard]] std::string schema_string(const TableSchema& schema,
                                        std::string_view column_type_overrides = {});

[[nodiscard]] std::string create_table(std::string_view table,
                                       std::string_view schema_string,
                                       std::string_view table_options = {});

[[nodiscard]] std::string drop_table(std::string_view table);

/// Succeeds iff the table exists; the (empty) result carries its column names
[[nodiscard]] std::string table_exists_probe(std::string_view table);

[[nodiscard]] std::string rename_table(std::string_view from, std::string_view new_name);

/// COPY <table> FROM STDIN WITH NULL AS 'NULL' DELIMITER AS E'<delimiter>'
[[nodiscard]] std::string copy_from_stdin(std::string_view table, char delimiter);

} // namespace gpcopy::ddl
