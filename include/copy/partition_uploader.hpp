#pragma once

#include "copy/copy_options.hpp"
#include "copy/row_encoder.hpp"
#include "exec/ipartition_executor.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace gpcopy {

/**
 * @brief Loads one partition into a table with COPY ... FROM STDIN
 *
 * 1. Encodes every row into a private spool file (removed afterwards).
 * 2. Opens a dedicated connection and streams the file with COPY on a
 *    worker thread, waiting at most options.copy_timeout.
 * 3. On timeout, cancels the transfer, joins the worker and raises
 *    TransferTimeoutError.
 * 4. On success, bumps the shared success counter if one was given.
 *
 * The connection and file handles are released on every path; a failure to
 * close the connection is logged and never replaces the primary outcome.
 */
class PartitionUploader {
public:
    PartitionUploader(const CopyOptions& options,
                      const TableSchema& schema,
                      std::string target_table,
                      std::atomic<uint64_t>* success_counter = nullptr);

    /**
     * @throws PartitionUploadError, TransferTimeoutError, RowEncodingError, ConnectionError
     */
    UploadStats upload(IRowSource& rows);

    [[nodiscard]] const std::string& copy_command() const { return copy_sql_; }

private:
    void write_spool(IRowSource& rows, const std::filesystem::path& path, UploadStats& stats);
    void transfer(const std::filesystem::path& path, UploadStats& stats);

    const CopyOptions& options_;
    RowEncoder encoder_;
    std::string target_table_;
    std::string copy_sql_;
    std::atomic<uint64_t>* success_counter_;
};

/**
 * @brief Upload one partition; see PartitionUploader
 */
UploadStats upload_partition(IRowSource& rows,
                             const CopyOptions& options,
                             const TableSchema& schema,
                             const std::string& target_table,
                             std::atomic<uint64_t>* success_counter = nullptr);

} // namespace gpcopy
