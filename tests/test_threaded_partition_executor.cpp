#include <catch2/catch_test_macros.hpp>
#include "exec/threaded_partition_executor.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace gpcopy;

namespace {

std::vector<std::vector<Row>> partitions_of(size_t count, size_t rows_each) {
    std::vector<std::vector<Row>> parts(count);
    for (size_t p = 0; p < count; ++p) {
        for (size_t r = 0; r < rows_each; ++r) {
            parts[p].push_back({static_cast<int64_t>(p * 1000 + r)});
        }
    }
    return parts;
}

UploadStats count_rows(size_t, IRowSource& rows) {
    UploadStats stats;
    Row row;
    while (rows.next(row)) ++stats.rows_copied;
    return stats;
}

} // namespace

TEST_CASE("ThreadedPartitionExecutor: every partition runs exactly once", "[executor]") {
    auto executor = ThreadedPartitionExecutor::from_rows(partitions_of(10, 5), 3);
    REQUIRE(executor.partition_count() == 10);

    std::mutex mutex;
    std::multiset<size_t> seen;
    const auto outcomes = executor.run([&](size_t index, IRowSource& rows) {
        {
            std::lock_guard lock(mutex);
            seen.insert(index);
        }
        return count_rows(index, rows);
    });

    REQUIRE(outcomes.size() == 10);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        CHECK(outcomes[i].partition_index == i);
        REQUIRE(outcomes[i].result.is_ok());
        CHECK(outcomes[i].result.value().rows_copied == 5);
        CHECK(seen.count(i) == 1);
    }
}

TEST_CASE("ThreadedPartitionExecutor: bounded parallelism", "[executor]") {
    auto executor = ThreadedPartitionExecutor::from_rows(partitions_of(12, 1), 3);

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    (void)executor.run([&](size_t index, IRowSource& rows) {
        const int now = running.fetch_add(1) + 1;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        running.fetch_sub(1);
        return count_rows(index, rows);
    });

    CHECK(peak.load() <= 3);
    CHECK(peak.load() >= 1);
}

TEST_CASE("ThreadedPartitionExecutor: exceptions become error outcomes", "[executor][errors]") {
    auto executor = ThreadedPartitionExecutor::from_rows(partitions_of(4, 2), 2);

    const auto outcomes = executor.run([](size_t index, IRowSource& rows) -> UploadStats {
        if (index == 1) throw PartitionUploadError("copy failed");
        if (index == 2) throw std::runtime_error("boom");
        return count_rows(index, rows);
    });

    REQUIRE(outcomes.size() == 4);
    CHECK(outcomes[0].result.is_ok());
    REQUIRE(outcomes[1].result.is_error());
    CHECK(outcomes[1].result.error_category() == ErrorCategory::PARTITION_UPLOAD_ERROR);
    CHECK(outcomes[1].result.error_message() == "copy failed");
    REQUIRE(outcomes[2].result.is_error());
    CHECK(outcomes[2].result.error_category() == ErrorCategory::INTERNAL_ERROR);
    CHECK(outcomes[3].result.is_ok());
}

TEST_CASE("ThreadedPartitionExecutor: source factory failures", "[executor][errors]") {
    std::vector<ThreadedPartitionExecutor::SourceFactory> factories;
    factories.emplace_back([] { return std::unique_ptr<IRowSource>{}; });
    factories.emplace_back([]() -> std::unique_ptr<IRowSource> {
        throw PartitionUploadError("Cannot open input file missing.csv");
    });
    ThreadedPartitionExecutor executor(std::move(factories), 1);

    const auto outcomes = executor.run(count_rows);
    REQUIRE(outcomes.size() == 2);
    CHECK(outcomes[0].result.error_category() == ErrorCategory::INTERNAL_ERROR);
    CHECK(outcomes[1].result.error_category() == ErrorCategory::PARTITION_UPLOAD_ERROR);
}

TEST_CASE("ThreadedPartitionExecutor: empty dataset", "[executor]") {
    ThreadedPartitionExecutor executor({}, 4);
    CHECK(executor.partition_count() == 0);
    CHECK(executor.run(count_rows).empty());
}

TEST_CASE("ThreadedPartitionExecutor: zero parallelism means hardware concurrency", "[executor]") {
    ThreadedPartitionExecutor executor({}, 0);
    CHECK(executor.max_parallelism() >= 1);
}

TEST_CASE("ProjectingRowSource: reorders columns", "[executor][rows]") {
    VectorRowSource inner({{int64_t{1}, std::string("a"), true}});
    ProjectingRowSource projected(inner, {2, 0});

    Row row;
    REQUIRE(projected.next(row));
    REQUIRE(row.size() == 2);
    CHECK(std::get<bool>(row[0]));
    CHECK(std::get<int64_t>(row[1]) == 1);
    CHECK_FALSE(projected.next(row));
}

TEST_CASE("ProjectingRowSource: short input row is an encoding error", "[executor][rows]") {
    VectorRowSource inner({Row{int64_t{1}}});
    ProjectingRowSource projected(inner, {1, 0});

    Row row;
    CHECK_THROWS_AS(projected.next(row), RowEncodingError);
}
