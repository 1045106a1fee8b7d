#pragma once

#include "core/error.hpp"
#include "exec/irow_source.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace gpcopy {

/**
 * @brief What one successful partition upload did
 */
struct UploadStats {
    uint64_t rows_written = 0;   // encoded into the spool file
    uint64_t rows_copied = 0;    // acknowledged by the server
    uint64_t bytes_written = 0;
    std::chrono::milliseconds write_time{0};
    std::chrono::milliseconds copy_time{0};
};

/// Work applied to one partition; failure is signalled by throwing
using PartitionTask = std::function<UploadStats(size_t partition_index, IRowSource& rows)>;

struct PartitionOutcome {
    size_t partition_index = 0;
    Result<UploadStats> result;
};

/**
 * @brief Runs a task over every partition of a dataset
 *
 * Owned by the caller (a cluster scheduler, a thread pool...). The loader only
 * consumes it: each partition is handed to the task exactly once, possibly in
 * parallel with other partitions, and the outcome of every invocation is
 * reported back. An exception thrown by the task becomes an error outcome.
 */
class IPartitionExecutor {
public:
    virtual ~IPartitionExecutor() = default;

    [[nodiscard]] virtual size_t partition_count() const = 0;

    /**
     * @brief Apply @p task to every partition and wait for all of them
     * @return One outcome per partition, in partition order
     */
    [[nodiscard]] virtual std::vector<PartitionOutcome> run(const PartitionTask& task) = 0;
};

} // namespace gpcopy
