#include "exec/threaded_partition_executor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <thread>

namespace gpcopy {

ThreadedPartitionExecutor::ThreadedPartitionExecutor(std::vector<SourceFactory> partitions,
                                                     size_t max_parallelism)
    : partitions_(std::move(partitions)),
      max_parallelism_(max_parallelism > 0
                           ? max_parallelism
                           : std::max<size_t>(1, std::thread::hardware_concurrency())) {}

ThreadedPartitionExecutor ThreadedPartitionExecutor::from_rows(
    std::vector<std::vector<Row>> partitions, size_t max_parallelism) {
    std::vector<SourceFactory> factories;
    factories.reserve(partitions.size());
    for (auto& rows : partitions) {
        auto shared = std::make_shared<std::vector<Row>>(std::move(rows));
        factories.emplace_back([shared]() -> std::unique_ptr<IRowSource> {
            return std::make_unique<VectorRowSource>(std::move(*shared));
        });
    }
    return ThreadedPartitionExecutor(std::move(factories), max_parallelism);
}

std::vector<PartitionOutcome> ThreadedPartitionExecutor::run(const PartitionTask& task) {
    std::vector<PartitionOutcome> outcomes(partitions_.size());
    if (partitions_.empty()) {
        return outcomes;
    }

    std::atomic<size_t> next{0};
    const size_t worker_count = std::min(max_parallelism_, partitions_.size());
    utils::log::debug(std::format("Running {} partitions on {} workers",
                                  partitions_.size(), worker_count));

    {
        std::vector<std::jthread> workers;
        workers.reserve(worker_count);
        for (size_t w = 0; w < worker_count; ++w) {
            workers.emplace_back([this, &next, &outcomes, &task] {
                for (size_t i = next.fetch_add(1, std::memory_order_relaxed);
                     i < partitions_.size();
                     i = next.fetch_add(1, std::memory_order_relaxed)) {
                    outcomes[i] = run_one(i, task);
                }
            });
        }
    } // jthreads join here

    return outcomes;
}

PartitionOutcome ThreadedPartitionExecutor::run_one(size_t index, const PartitionTask& task) const {
    PartitionOutcome outcome;
    outcome.partition_index = index;
    try {
        auto source = partitions_[index]();
        if (!source) {
            outcome.result = Result<UploadStats>::error(
                ErrorCategory::INTERNAL_ERROR,
                std::format("partition {} has no row source", index));
            return outcome;
        }
        outcome.result = Result<UploadStats>::ok(task(index, *source));
    } catch (const CopyError& e) {
        outcome.result = Result<UploadStats>::error(e.category(), e.what());
    } catch (const std::exception& e) {
        outcome.result = Result<UploadStats>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }
    return outcome;
}

} // namespace gpcopy
