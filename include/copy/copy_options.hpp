#pragma once

#include "db/iconnection_factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gpcopy {

/// Largest accepted copy_timeout; waits beyond it overflow steady_clock arithmetic
inline constexpr std::chrono::milliseconds kMaxCopyTimeout = std::chrono::hours(24) * 365 * 100;

/**
 * @brief Everything a copy job needs besides the data
 */
struct CopyOptions {
    // Target table: name or schema.name, either part optionally quoted
    std::string table;

    std::string connection_string;
    std::shared_ptr<IConnectionFactory> connection_factory;

    // Single-character field delimiter on the wire
    char delimiter = '\t';

    // Upper bound for one partition's COPY transfer
    std::chrono::milliseconds copy_timeout{std::chrono::hours(1)};

    // Stage into a shadow table and swap it in only if every partition succeeded
    bool transaction_on = false;

    // Appended verbatim to CREATE TABLE of the staging table
    std::string create_table_options;

    // "col TYPE, col2 TYPE" overrides for the staging table's column types
    std::string create_table_column_types;

    // Where partition spool files are written; empty = <system temp>/gpcopy
    std::filesystem::path local_dir;

    // Non-transactional append: reorder columns to match an existing target
    bool match_table_columns = true;
};

/**
 * @brief Check the options for a copy job
 * @return Human-readable problems; empty when valid
 */
[[nodiscard]] std::vector<std::string> validate_copy_options(const CopyOptions& options);

/**
 * @brief Whether @p delimiter can be used in a text-format COPY with NULL AS 'NULL'
 */
[[nodiscard]] bool is_valid_delimiter(char delimiter);

/// Directory used for spool files when local_dir is not set
[[nodiscard]] std::filesystem::path resolve_local_dir(const CopyOptions& options);

/**
 * @brief Open a new connection through the configured factory
 * @throws ConnectionError if the factory is missing or returns nullptr
 */
[[nodiscard]] std::unique_ptr<IDbConnection> open_connection(const CopyOptions& options);

/**
 * @brief Close a connection, logging (never propagating) any failure
 */
void close_connection_silently(IDbConnection* conn) noexcept;

} // namespace gpcopy
