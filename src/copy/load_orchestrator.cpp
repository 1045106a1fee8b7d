#include "copy/load_orchestrator.hpp"
#include "copy/ddl_builder.hpp"
#include "copy/partition_uploader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace gpcopy {

namespace {

std::string join_errors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

// A malformed name is reported as such, ahead of any other option problem
TableIdentifier checked_identifier(const CopyOptions& options) {
    TableIdentifier identifier = TableIdentifier::parse(options.table);

    auto errors = validate_copy_options(options);
    if (!errors.empty()) {
        throw InvalidOptionsError("Invalid copy options: " + join_errors(errors));
    }
    return identifier;
}

} // anonymous namespace

LoadOrchestrator::LoadOrchestrator(CopyOptions options, TableSchema schema)
    : options_(std::move(options)),
      schema_(std::move(schema)),
      identifier_(checked_identifier(options_)) {
    if (schema_.empty()) {
        throw InvalidOptionsError("Table schema has no columns");
    }
}

LoadReport LoadOrchestrator::copy(IPartitionExecutor& dataset) {
    return options_.transaction_on ? transactional_copy(dataset)
                                   : non_transactional_copy(dataset);
}

// ============================================================================
// Transactional copy
// ============================================================================

LoadReport LoadOrchestrator::transactional_copy(IPartitionExecutor& dataset) {
    utils::Timer timer;
    LoadReport report;
    report.target_table = options_.table;
    report.transactional = true;
    report.total_partitions = dataset.partition_count();
    report.staging_table = make_staging_table_name(identifier_, utils::generate_uuid_hex());

    // Stage 1: nothing has been written yet, so failure needs no cleanup
    create_staging_table(report.staging_table);

    std::unique_ptr<IDbConnection> conn;
    try {
        // Stage 2
        std::atomic<uint64_t> successes{0};
        utils::log::info(std::format("Uploading {} partition(s) into {}",
                                     report.total_partitions, report.staging_table));
        upload_all(dataset, report.staging_table, &successes, schema_, {}, report);
        report.successful_partitions = successes.load();

        // Stage 3
        conn = open_connection(options_);
        if (report.successful_partitions != report.total_partitions) {
            throw PartitionCopyFailureError(
                std::format("Job aborted because some partitions failed to copy data: "
                            "total partitions is {} and successful partitions is {}. "
                            "You can retry the whole job.",
                            report.total_partitions, report.successful_partitions),
                report.total_partitions, report.successful_partitions);
        }
        commit(*conn, report.staging_table);
        report.committed = true;
    } catch (...) {
        cleanup_staging(conn, report.staging_table);
        throw;
    }
    cleanup_staging(conn, report.staging_table);

    report.elapsed = timer.elapsed_ms();
    utils::log::info(std::format("Committed {} row(s) into {} in {:.3f}s",
                                 report.rows_copied, report.target_table,
                                 timer.elapsed_seconds()));
    return report;
}

void LoadOrchestrator::create_staging_table(const std::string& staging_table) {
    // DDL errors in the overrides are option errors, raised before any I/O
    const std::string sql = ddl::create_table(
        staging_table,
        ddl::schema_string(schema_, options_.create_table_column_types),
        options_.create_table_options);

    std::unique_ptr<IDbConnection> conn;
    try {
        conn = open_connection(options_);
    } catch (const ConnectionError& e) {
        throw StagingCreationError(std::format(
            "Failed to create staging table {}: {}", staging_table, e.what()));
    }

    utils::log::info(std::format("Creating staging table: {}", sql));
    const auto result = conn->execute(sql);
    close_connection_silently(conn.get());

    if (!result.success) {
        throw StagingCreationError(std::format(
            "Failed to create staging table {}: {}", staging_table, result.error_message));
    }
}

void LoadOrchestrator::commit(IDbConnection& conn, const std::string& staging_table) {
    if (table_exists(conn, options_.table)) {
        utils::log::info(std::format("Dropping existing target table {}", options_.table));
        const auto dropped = conn.execute(ddl::drop_table(options_.table));
        if (!dropped.success) {
            throw CommitError(std::format("Failed to drop target table {}: {}",
                                          options_.table, dropped.error_message));
        }
    }

    const auto renamed = conn.execute(
        ddl::rename_table(staging_table, unqualified_name(options_.table)));
    if (!renamed.success) {
        throw CommitError(std::format("Failed to rename {} to {}: {}",
                                      staging_table, options_.table, renamed.error_message));
    }
    utils::log::info(std::format("Renamed {} to {}", staging_table, options_.table));
}

void LoadOrchestrator::cleanup_staging(std::unique_ptr<IDbConnection>& conn,
                                       const std::string& staging_table) noexcept {
    try {
        if (!conn) {
            conn = open_connection(options_);
        }
        retrying_drop_table(*conn, staging_table);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Could not clean up staging table {}: {}",
                                      staging_table, e.what()));
    }
    close_connection_silently(conn.get());
    conn.reset();
}

// ============================================================================
// Non-transactional copy
// ============================================================================

LoadReport LoadOrchestrator::non_transactional_copy(IPartitionExecutor& dataset) {
    utils::Timer timer;
    LoadReport report;
    report.target_table = options_.table;
    report.total_partitions = dataset.partition_count();

    std::vector<size_t> mapping;
    TableSchema ordered;
    const bool reorder = options_.match_table_columns && resolve_target_order(mapping, ordered);

    utils::log::info(std::format("Appending {} partition(s) into {}",
                                 report.total_partitions, report.target_table));
    const auto outcomes = upload_all(dataset, options_.table, nullptr,
                                     reorder ? ordered : schema_, mapping, report);
    for (const auto& outcome : outcomes) {
        if (outcome.result.is_ok()) ++report.successful_partitions;
    }

    if (report.successful_partitions != report.total_partitions) {
        throw PartitionCopyFailureError(
            std::format("{} of {} partitions failed to append into {}; rows from the "
                        "successful partitions remain in the table",
                        report.total_partitions - report.successful_partitions,
                        report.total_partitions, report.target_table),
            report.total_partitions, report.successful_partitions);
    }

    report.committed = true;
    report.elapsed = timer.elapsed_ms();
    utils::log::info(std::format("Appended {} row(s) into {} in {:.3f}s",
                                 report.rows_copied, report.target_table,
                                 timer.elapsed_seconds()));
    return report;
}

bool LoadOrchestrator::resolve_target_order(std::vector<size_t>& mapping, TableSchema& ordered) {
    auto conn = open_connection(options_);
    std::optional<std::vector<std::string>> columns;
    try {
        columns = table_columns(*conn, options_.table);
    } catch (...) {
        close_connection_silently(conn.get());
        throw;
    }
    close_connection_silently(conn.get());

    if (!columns || columns->empty()) {
        return false;
    }

    mapping.clear();
    ordered.columns.clear();
    bool identity = columns->size() == schema_.size();
    for (const auto& name : *columns) {
        const auto idx = schema_.find(name);
        if (!idx) {
            throw InvalidOptionsError(std::format(
                "Column {} of table {} is not in the input schema", name, options_.table));
        }
        identity = identity && *idx == mapping.size();
        mapping.push_back(*idx);
        ordered.columns.push_back(schema_.columns[*idx]);
    }

    if (identity) {
        mapping.clear();
        return false;
    }
    utils::log::debug(std::format("Reordering input columns to match {}", options_.table));
    return true;
}

// ============================================================================
// Shared helpers
// ============================================================================

std::vector<PartitionOutcome> LoadOrchestrator::upload_all(IPartitionExecutor& dataset,
                                                           const std::string& target,
                                                           std::atomic<uint64_t>* counter,
                                                           const TableSchema& schema,
                                                           const std::vector<size_t>& mapping,
                                                           LoadReport& report) {
    PartitionTask task = [&](size_t, IRowSource& rows) {
        if (mapping.empty()) {
            return upload_partition(rows, options_, schema, target, counter);
        }
        ProjectingRowSource projected(rows, mapping);
        return upload_partition(projected, options_, schema, target, counter);
    };

    auto outcomes = dataset.run(task);
    for (const auto& outcome : outcomes) {
        if (outcome.result.is_ok()) {
            report.rows_copied += outcome.result.value().rows_copied;
        } else {
            utils::log::error(std::format("Partition {} failed [{}]: {}",
                                          outcome.partition_index,
                                          error_category_to_string(outcome.result.error_category()),
                                          outcome.result.error_message()));
        }
    }
    return outcomes;
}

std::string LoadOrchestrator::make_staging_table_name(const TableIdentifier& target,
                                                      std::string_view uuid_hex) {
    return std::format("{}\"{}_{}_{}\"", target.schema_prefix(), target.raw_name,
                       uuid_hex, kStagingSuffix);
}

bool LoadOrchestrator::table_exists(IDbConnection& conn, const std::string& table) {
    return conn.execute(ddl::table_exists_probe(table)).success;
}

std::optional<std::vector<std::string>> LoadOrchestrator::table_columns(
    IDbConnection& conn, const std::string& table) {
    auto result = conn.execute(ddl::table_exists_probe(table));
    if (!result.success) {
        return std::nullopt;
    }
    return std::move(result.column_names);
}

bool LoadOrchestrator::retrying_drop_table(IDbConnection& conn, const std::string& table,
                                           int max_attempts) noexcept {
    try {
        for (int attempt = 1; attempt <= max_attempts; ++attempt) {
            if (!table_exists(conn, table)) {
                return true;
            }
            const auto result = conn.execute(ddl::drop_table(table));
            if (result.success) {
                utils::log::info(std::format("Dropped table {}", table));
                return true;
            }
            utils::log::warn(std::format("Drop table {} failed for {}/{} times, and will retry: {}",
                                         table, attempt, max_attempts, result.error_message));
        }
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Drop table {} raised: {}", table, e.what()));
    }
    utils::log::error(std::format("Drop table {} failed for {} times, and will not retry.",
                                  table, max_attempts));
    return false;
}

// ============================================================================
// Free functions
// ============================================================================

LoadReport transactional_copy(IPartitionExecutor& dataset,
                              const TableSchema& schema,
                              const CopyOptions& options) {
    LoadOrchestrator orchestrator(options, schema);
    return orchestrator.transactional_copy(dataset);
}

LoadReport non_transactional_copy(IPartitionExecutor& dataset,
                                  const TableSchema& schema,
                                  const CopyOptions& options) {
    LoadOrchestrator orchestrator(options, schema);
    return orchestrator.non_transactional_copy(dataset);
}

} // namespace gpcopy
