#pragma once

#include "copy/copy_options.hpp"
#include "copy/load_report.hpp"
#include "copy/table_identifier.hpp"
#include "exec/ipartition_executor.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gpcopy {

/// Suffix of every staging table name
inline constexpr std::string_view kStagingSuffix = "gpcopyTmp";

/// Attempts made to drop a leftover staging table
inline constexpr int kDropMaxAttempts = 3;

/**
 * @brief Drives a whole copy job over a partitioned dataset
 *
 * Transactional mode:
 *   1. CREATE a staging table next to the target (fatal on failure)
 *   2. Upload every partition into it, counting successes
 *   3. All succeeded: drop the old target, rename staging to target.
 *      Otherwise raise PartitionCopyFailureError.
 *   Cleanup: drop the staging table if it is still there (bounded retry).
 *
 * Non-transactional mode appends each partition straight into the target.
 *
 * Partition scheduling belongs to the IPartitionExecutor passed in.
 */
class LoadOrchestrator {
public:
    /**
     * @throws InvalidOptionsError if the options do not validate
     * @throws MalformedIdentifierError if options.table cannot be parsed
     */
    LoadOrchestrator(CopyOptions options, TableSchema schema);

    /// Transactional or not, per options.transaction_on
    LoadReport copy(IPartitionExecutor& dataset);

    /**
     * @throws StagingCreationError, PartitionCopyFailureError, CommitError
     */
    LoadReport transactional_copy(IPartitionExecutor& dataset);

    /**
     * @throws PartitionCopyFailureError if any partition failed (earlier ones stay loaded)
     */
    LoadReport non_transactional_copy(IPartitionExecutor& dataset);

    [[nodiscard]] const CopyOptions& options() const { return options_; }
    [[nodiscard]] const TableIdentifier& identifier() const { return identifier_; }

    /// <schema.>"<raw>_<uuid_hex>_gpcopyTmp"
    [[nodiscard]] static std::string make_staging_table_name(const TableIdentifier& target,
                                                             std::string_view uuid_hex);

    /// True iff the existence probe on @p table succeeds
    [[nodiscard]] static bool table_exists(IDbConnection& conn, const std::string& table);

    /// Column names of @p table, or nullopt when it does not exist
    [[nodiscard]] static std::optional<std::vector<std::string>> table_columns(
        IDbConnection& conn, const std::string& table);

    /**
     * @brief Drop @p table, retrying up to @p max_attempts times
     *
     * Never throws. Returns true at once if the table does not exist; each
     * failed attempt is logged as a warning and a final give-up as an error.
     */
    static bool retrying_drop_table(IDbConnection& conn, const std::string& table,
                                    int max_attempts = kDropMaxAttempts) noexcept;

private:
    void create_staging_table(const std::string& staging_table);
    void commit(IDbConnection& conn, const std::string& staging_table);
    void cleanup_staging(std::unique_ptr<IDbConnection>& conn,
                         const std::string& staging_table) noexcept;
    bool resolve_target_order(std::vector<size_t>& mapping, TableSchema& ordered);

    std::vector<PartitionOutcome> upload_all(IPartitionExecutor& dataset,
                                             const std::string& target,
                                             std::atomic<uint64_t>* counter,
                                             const TableSchema& schema,
                                             const std::vector<size_t>& mapping,
                                             LoadReport& report);

    CopyOptions options_;
    TableSchema schema_;
    TableIdentifier identifier_;
};

/**
 * @brief Load @p dataset atomically into options.table via a staging table
 */
LoadReport transactional_copy(IPartitionExecutor& dataset,
                              const TableSchema& schema,
                              const CopyOptions& options);

/**
 * @brief Append @p dataset partition by partition into options.table
 */
LoadReport non_transactional_copy(IPartitionExecutor& dataset,
                                  const TableSchema& schema,
                                  const CopyOptions& options);

} // namespace gpcopy
