#include "copy/partition_uploader.hpp"
#include "copy/ddl_builder.hpp"
#include "copy/spool_file.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <future>
#include <thread>

namespace gpcopy {

namespace {

constexpr size_t kWriteBufferBytes = 1 << 20;

std::string timeout_message(std::chrono::milliseconds timeout) {
    return std::format(
        "The copy operation for copying this partition's data has been running for "
        "more than the timeout: {}s. You can configure this timeout with option "
        "copy_timeout, such as \"2h\", \"100min\", and default copy_timeout is \"1h\".",
        std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
}

// Closes the connection when the scope ends, after the copy worker has been joined
class ConnectionCloser {
public:
    explicit ConnectionCloser(IDbConnection* conn) : conn_(conn) {}
    ~ConnectionCloser() { close_connection_silently(conn_); }

    ConnectionCloser(const ConnectionCloser&) = delete;
    ConnectionCloser& operator=(const ConnectionCloser&) = delete;

private:
    IDbConnection* conn_;
};

} // anonymous namespace

PartitionUploader::PartitionUploader(const CopyOptions& options,
                                     const TableSchema& schema,
                                     std::string target_table,
                                     std::atomic<uint64_t>* success_counter)
    : options_(options),
      encoder_(schema, options.delimiter),
      target_table_(std::move(target_table)),
      copy_sql_(ddl::copy_from_stdin(target_table_, options.delimiter)),
      success_counter_(success_counter) {}

UploadStats PartitionUploader::upload(IRowSource& rows) {
    UploadStats stats;
    SpoolFile spool(resolve_local_dir(options_));

    write_spool(rows, spool.path(), stats);
    transfer(spool.path(), stats);

    if (success_counter_) {
        success_counter_->fetch_add(1, std::memory_order_relaxed);
    }
    return stats;
}

void PartitionUploader::write_spool(IRowSource& rows,
                                    const std::filesystem::path& path,
                                    UploadStats& stats) {
    utils::log::info(std::format("Start to write data to local tmp file: {}", path.string()));
    utils::Timer timer;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw PartitionUploadError(std::format("Failed to open local tmp file {}", path.string()));
    }

    std::string buffer;
    buffer.reserve(kWriteBufferBytes + 4096);
    Row row;
    while (rows.next(row)) {
        encoder_.encode_to(row, buffer);
        ++stats.rows_written;
        if (buffer.size() >= kWriteBufferBytes) {
            out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            stats.bytes_written += buffer.size();
            buffer.clear();
        }
    }
    out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    stats.bytes_written += buffer.size();
    out.close();

    if (!out) {
        throw PartitionUploadError(std::format("Failed to write local tmp file {}", path.string()));
    }

    stats.write_time = timer.elapsed_ms();
    utils::log::info(std::format(
        "Finished writing data to local tmp file: {}, time taken: {:.3f}s",
        path.string(), timer.elapsed_seconds()));
}

void PartitionUploader::transfer(const std::filesystem::path& path, UploadStats& stats) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PartitionUploadError(std::format("Failed to reopen local tmp file {}", path.string()));
    }

    auto conn = open_connection(options_);
    ConnectionCloser closer(conn.get());

    std::promise<CopyInResult> promise;
    auto future = promise.get_future();

    utils::log::info(std::format("Start copy stream with copy command {}", copy_sql_));
    utils::Timer timer;

    std::jthread worker([&conn, &in, &promise, this] {
        try {
            promise.set_value(conn->copy_in(copy_sql_, in));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    });

    const auto deadline = std::min(options_.copy_timeout, kMaxCopyTimeout);
    if (future.wait_for(deadline) == std::future_status::timeout) {
        if (!conn->cancel()) {
            utils::log::warn("Cancel request for the timed-out COPY could not be delivered");
        }
        worker.join();
        throw TransferTimeoutError(timeout_message(options_.copy_timeout), options_.copy_timeout);
    }
    worker.join();

    const CopyInResult result = future.get();
    if (!result.success) {
        throw PartitionUploadError(std::format("COPY into {} failed: {}",
                                               target_table_, result.error_message));
    }

    stats.rows_copied = result.rows_copied;
    stats.copy_time = timer.elapsed_ms();
    utils::log::info(std::format("Copied {} row(s) to {}, time taken: {:.3f}s",
                                 result.rows_copied, target_table_, timer.elapsed_seconds()));
}

UploadStats upload_partition(IRowSource& rows,
                             const CopyOptions& options,
                             const TableSchema& schema,
                             const std::string& target_table,
                             std::atomic<uint64_t>* success_counter) {
    PartitionUploader uploader(options, schema, target_table, success_counter);
    return uploader.upload(rows);
}

} // namespace gpcopy
