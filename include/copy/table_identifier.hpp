#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gpcopy {

/**
 * @brief Schema-qualified table name split into its parts
 *
 * Accepted forms: `name`, `"name"`, `schema.name`, `"schema"."name"`
 * (each part: letters, digits, underscore).
 *
 * The schema is kept as written, quotes included, because it is only ever
 * used as a SQL prefix. The raw name has its quotes removed so it can be
 * embedded in a new quoted identifier.
 */
struct TableIdentifier {
    std::optional<std::string> schema;
    std::string raw_name;

    /**
     * @throws MalformedIdentifierError on any other shape
     */
    [[nodiscard]] static TableIdentifier parse(std::string_view text);

    [[nodiscard]] static Result<TableIdentifier> try_parse(std::string_view text);

    /// "schema." or "" when unqualified
    [[nodiscard]] std::string schema_prefix() const {
        return schema ? *schema + "." : std::string{};
    }
};

/**
 * @brief Name of the table as the last dot-separated component of @p table
 *
 * Used as the target of ALTER TABLE ... RENAME TO, which never takes a schema.
 */
[[nodiscard]] std::string unqualified_name(std::string_view table);

} // namespace gpcopy
