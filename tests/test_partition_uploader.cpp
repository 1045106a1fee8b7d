#include <catch2/catch_test_macros.hpp>
#include "copy/partition_uploader.hpp"
#include "core/utils.hpp"
#include "mocks/fake_warehouse.hpp"

#include <filesystem>

using namespace gpcopy;
using namespace gpcopy::testing;
using namespace std::chrono_literals;

namespace {

// Private spool directory, removed with its contents
struct SpoolDir {
    std::filesystem::path path =
        std::filesystem::temp_directory_path() / ("gpcopy_test_" + utils::generate_uuid_hex());
    ~SpoolDir() { std::filesystem::remove_all(path); }

    [[nodiscard]] bool empty() const {
        return !std::filesystem::exists(path) || std::filesystem::is_empty(path);
    }
};

struct Fixture {
    std::shared_ptr<FakeWarehouse> warehouse = std::make_shared<FakeWarehouse>();
    SpoolDir spool;
    CopyOptions options;
    TableSchema schema;

    Fixture() {
        options.table = "orders";
        options.connection_string = "host=fake";
        options.connection_factory = std::make_shared<FakeConnectionFactory>(warehouse);
        options.delimiter = '|';
        options.local_dir = spool.path;

        schema.columns.push_back({"id", ColumnType(ValueKind::BIGINT), false});
        schema.columns.push_back({"name", ColumnType(ValueKind::TEXT), true});

        warehouse->add_table("orders", {"id", "name"});
    }

    static std::vector<Row> rows() {
        return {
            {int64_t{1}, std::string("alpha")},
            {int64_t{2}, Value{}},
            {int64_t{3}, std::string("with|pipe")},
        };
    }
};

} // namespace

TEST_CASE("PartitionUploader: copies every row into the target", "[uploader]") {
    Fixture f;
    std::atomic<uint64_t> successes{0};
    VectorRowSource source(Fixture::rows());

    const auto stats = upload_partition(source, f.options, f.schema, "orders", &successes);

    CHECK(stats.rows_written == 3);
    CHECK(stats.rows_copied == 3);
    CHECK(stats.bytes_written > 0);
    CHECK(successes.load() == 1);

    const auto lines = f.warehouse->lines("orders");
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "1|alpha");
    CHECK(lines[1] == "2|NULL");
    CHECK(lines[2] == "3|with\\|pipe");

    CHECK(f.warehouse->count_statements(
              "COPY orders FROM STDIN WITH NULL AS 'NULL' DELIMITER AS E'|'") == 1);
    CHECK(f.warehouse->opened() == 1);
    CHECK(f.warehouse->closed() == 1);
    CHECK(f.spool.empty());
}

TEST_CASE("PartitionUploader: copy_command", "[uploader]") {
    Fixture f;
    const PartitionUploader uploader(f.options, f.schema, "s.\"t_tmp\"");
    CHECK(uploader.copy_command() ==
          "COPY s.\"t_tmp\" FROM STDIN WITH NULL AS 'NULL' DELIMITER AS E'|'");
}

TEST_CASE("PartitionUploader: empty partition still runs COPY", "[uploader]") {
    Fixture f;
    std::atomic<uint64_t> successes{0};
    VectorRowSource source({});

    const auto stats = upload_partition(source, f.options, f.schema, "orders", &successes);
    CHECK(stats.rows_written == 0);
    CHECK(stats.rows_copied == 0);
    CHECK(successes.load() == 1);
    CHECK(f.warehouse->lines("orders").empty());
}

TEST_CASE("PartitionUploader: failed COPY raises and does not count", "[uploader][errors]") {
    Fixture f;
    f.warehouse->fail_copy_containing("alpha");
    std::atomic<uint64_t> successes{0};
    VectorRowSource source(Fixture::rows());

    CHECK_THROWS_AS(upload_partition(source, f.options, f.schema, "orders", &successes),
                    PartitionUploadError);
    CHECK(successes.load() == 0);
    CHECK(f.warehouse->lines("orders").empty());
    CHECK(f.warehouse->closed() == f.warehouse->opened());
    CHECK(f.spool.empty());
}

TEST_CASE("PartitionUploader: timeout cancels and releases resources", "[uploader][timeout]") {
    Fixture f;
    f.options.copy_timeout = 100ms;
    f.warehouse->set_hang_copy(true);
    std::atomic<uint64_t> successes{0};
    VectorRowSource source(Fixture::rows());

    const auto start = std::chrono::steady_clock::now();
    try {
        (void)upload_partition(source, f.options, f.schema, "orders", &successes);
        FAIL("expected TransferTimeoutError");
    } catch (const TransferTimeoutError& e) {
        CHECK(e.timeout() == 100ms);
        CHECK(e.category() == ErrorCategory::TRANSFER_TIMEOUT);
        const std::string msg = e.what();
        CHECK(msg.find("copy_timeout") != std::string::npos);
        CHECK(msg.find("\"1h\"") != std::string::npos);
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(elapsed >= 100ms);
    CHECK(elapsed < 5s);
    CHECK(successes.load() == 0);
    CHECK(f.warehouse->cancels() == 1);
    CHECK(f.warehouse->active_copies() == 0);
    CHECK(f.warehouse->closed() == f.warehouse->opened());
    CHECK(f.spool.empty());
}

TEST_CASE("PartitionUploader: a timeout past the ceiling still waits for the copy", "[uploader][timeout]") {
    Fixture f;
    f.options.copy_timeout = std::chrono::hours(24) * 1000000;
    VectorRowSource source(Fixture::rows());

    const auto stats = upload_partition(source, f.options, f.schema, "orders");

    CHECK(stats.rows_copied == 3);
    CHECK(f.warehouse->cancels() == 0);
}

TEST_CASE("PartitionUploader: close errors never mask success", "[uploader][errors]") {
    Fixture f;
    f.warehouse->set_throw_on_close(true);
    std::atomic<uint64_t> successes{0};
    VectorRowSource source(Fixture::rows());

    const auto stats = upload_partition(source, f.options, f.schema, "orders", &successes);
    CHECK(stats.rows_copied == 3);
    CHECK(successes.load() == 1);
    CHECK(f.warehouse->closed() == 1);
}

TEST_CASE("PartitionUploader: connection failure", "[uploader][errors]") {
    Fixture f;
    f.warehouse->fail_connects(-1);
    VectorRowSource source(Fixture::rows());

    CHECK_THROWS_AS(upload_partition(source, f.options, f.schema, "orders"), ConnectionError);
    CHECK(f.spool.empty());
}

TEST_CASE("PartitionUploader: encoding error happens before connecting", "[uploader][errors]") {
    Fixture f;
    VectorRowSource source({{std::string("not an id"), std::string("x")}});

    CHECK_THROWS_AS(upload_partition(source, f.options, f.schema, "orders"), RowEncodingError);
    CHECK(f.warehouse->opened() == 0);
    CHECK(f.spool.empty());
}
