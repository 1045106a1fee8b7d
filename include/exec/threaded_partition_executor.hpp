#pragma once

#include "exec/ipartition_executor.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace gpcopy {

/**
 * @brief In-process IPartitionExecutor backed by a fixed set of threads
 *
 * Partitions are opened lazily, one at a time per worker, so only
 * max_parallelism row sources are live at once.
 */
class ThreadedPartitionExecutor : public IPartitionExecutor {
public:
    using SourceFactory = std::function<std::unique_ptr<IRowSource>()>;

    /**
     * @param partitions One factory per partition
     * @param max_parallelism Worker threads; 0 = hardware concurrency
     */
    explicit ThreadedPartitionExecutor(std::vector<SourceFactory> partitions,
                                       size_t max_parallelism = 0);

    /// Convenience: in-memory partitions
    static ThreadedPartitionExecutor from_rows(std::vector<std::vector<Row>> partitions,
                                               size_t max_parallelism = 0);

    size_t partition_count() const override { return partitions_.size(); }

    std::vector<PartitionOutcome> run(const PartitionTask& task) override;

    [[nodiscard]] size_t max_parallelism() const { return max_parallelism_; }

private:
    PartitionOutcome run_one(size_t index, const PartitionTask& task) const;

    std::vector<SourceFactory> partitions_;
    size_t max_parallelism_;
};

} // namespace gpcopy
