#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace gpcopy;
using namespace std::chrono_literals;

namespace {

const std::string kMinimal = R"(
[database]
connection_string = "host=localhost dbname=warehouse"

[copy]
table = "public.orders"

[[columns]]
name = "id"
type = "bigint"
nullable = false

[[columns]]
name = "amount"
type = "decimal(12,2)"
)";

} // namespace

TEST_CASE("ConfigLoader: minimal config uses defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string(kMinimal);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.database.connection_string == "host=localhost dbname=warehouse");
    CHECK(cfg.copy.table == "public.orders");
    CHECK(cfg.copy.delimiter == '\t');
    CHECK(cfg.copy.copy_timeout == std::chrono::milliseconds(1h));
    CHECK_FALSE(cfg.copy.transaction_on);
    CHECK(cfg.copy.match_table_columns);
    CHECK(cfg.execution.max_parallel_partitions == 0);
    CHECK(cfg.input.field_separator == ',');
    CHECK(cfg.input.null_token == "\\N");
    CHECK(cfg.logging.level == utils::log::Level::INFO);

    REQUIRE(cfg.schema.size() == 2);
    CHECK(cfg.schema.columns[0].name == "id");
    CHECK(cfg.schema.columns[0].type.kind == ValueKind::BIGINT);
    CHECK_FALSE(cfg.schema.columns[0].nullable);
    CHECK(cfg.schema.columns[1].type.kind == ValueKind::DECIMAL);
    CHECK(cfg.schema.columns[1].type.precision == 12);
    CHECK(cfg.schema.columns[1].type.scale == 2);
}

TEST_CASE("ConfigLoader: full config", "[config]") {
    const std::string toml = R"(
[database]
connection_string = "host=db"

[copy]
table = "\"Sales\".\"Orders\""
delimiter = "|"
copy_timeout = "100min"
transaction_on = true
create_table_options = "DISTRIBUTED BY (id)"
create_table_column_types = "note VARCHAR(200)"
local_dir = "/var/tmp/gpcopy"
match_table_columns = false

[execution]
max_parallel_partitions = 4

[input]
field_separator = ";"
null_token = "<null>"

[logging]
level = "debug"

[[columns]]
name = "id"
type = "int"

[[columns]]
name = "note"
type = "email_t"
underlying = "string"

[[columns]]
name = "payload"
type = "jsonb"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.copy.delimiter == '|');
    CHECK(cfg.copy.copy_timeout == std::chrono::milliseconds(100min));
    CHECK(cfg.copy.transaction_on);
    CHECK(cfg.copy.create_table_options == "DISTRIBUTED BY (id)");
    CHECK(cfg.copy.local_dir == std::filesystem::path("/var/tmp/gpcopy"));
    CHECK_FALSE(cfg.copy.match_table_columns);
    CHECK(cfg.execution.max_parallel_partitions == 4);
    CHECK(cfg.input.field_separator == ';');
    CHECK(cfg.input.null_token == "<null>");
    CHECK(cfg.logging.level == utils::log::Level::DEBUG);

    REQUIRE(cfg.schema.size() == 3);
    CHECK(cfg.schema.columns[1].type.kind == ValueKind::USER_DEFINED);
    CHECK(cfg.schema.columns[1].type.resolved().kind == ValueKind::TEXT);
    CHECK(cfg.schema.columns[2].type.kind == ValueKind::OTHER);
    CHECK(cfg.schema.columns[2].type.sql_name == "jsonb");

    const auto options = cfg.to_copy_options(nullptr);
    CHECK(options.table == "\"Sales\".\"Orders\"");
    CHECK(options.connection_string == "host=db");
    CHECK(options.delimiter == '|');
    CHECK(options.transaction_on);
    CHECK(options.create_table_column_types == "note VARCHAR(200)");
}

TEST_CASE("ConfigLoader: env var substitution", "[config][env]") {
    ::setenv("GPCOPY_TEST_DSN", "host=from-env", 1);
    const std::string toml = R"(
[database]
connection_string = "${GPCOPY_TEST_DSN} dbname=x"

[copy]
table = "orders"

[[columns]]
name = "id"
type = "bigint"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=from-env dbname=x");
    ::unsetenv("GPCOPY_TEST_DSN");
}

TEST_CASE("ConfigLoader: env vars inside column entries", "[config][env]") {
    ::setenv("GPCOPY_TEST_COL", "order_id", 1);
    ::unsetenv("GPCOPY_TEST_UNSET");
    const auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=db${GPCOPY_TEST_UNSET}"

[copy]
table = "orders"

[[columns]]
name = "${GPCOPY_TEST_COL}"
type = "bigint"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=db");
    REQUIRE(result.config.schema.size() == 1);
    CHECK(result.config.schema.columns[0].name == "order_id");
    ::unsetenv("GPCOPY_TEST_COL");

    const auto unclosed = ConfigLoader::load_from_string(R"(
[database]
connection_string = "${GPCOPY_TEST_COL"
)");
    CHECK_FALSE(unclosed.success);
    CHECK(unclosed.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("ConfigLoader: validation collects every error", "[config][validation]") {
    const std::string toml = R"(
[copy]
table = "a.b.c"
delimiter = "n"

[[columns]]
name = "x"

[[columns]]
name = "X"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("connection_string") != std::string::npos);
    CHECK(result.error_message.find("copy.table") != std::string::npos);
    CHECK(result.error_message.find("copy.delimiter") != std::string::npos);
    CHECK(result.error_message.find("duplicate column") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed values", "[config][validation]") {
    SECTION("multi-character delimiter") {
        const auto result = ConfigLoader::load_from_string(R"(
[copy]
table = "t"
delimiter = "||"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("exactly one character") != std::string::npos);
    }

    SECTION("unparseable timeout") {
        const auto result = ConfigLoader::load_from_string(R"(
[copy]
table = "t"
copy_timeout = "soon"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("copy_timeout") != std::string::npos);
    }

    SECTION("timeout too large to wait on") {
        const auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=localhost"

[copy]
table = "t"
copy_timeout = "1000000d"

[[columns]]
name = "id"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("copy.copy_timeout must be at most") != std::string::npos);
    }

    SECTION("unknown log level") {
        const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "chatty"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("logging.level") != std::string::npos);
    }

    SECTION("no columns") {
        const auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=x"
[copy]
table = "t"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("[[columns]]") != std::string::npos);
    }

    SECTION("invalid TOML") {
        const auto result = ConfigLoader::load_from_string("[copy\ntable = ");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: load_from_file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "gpcopy_test_config.toml";
    {
        std::ofstream f(path);
        f << kMinimal;
    }
    const auto result = ConfigLoader::load_from_file(path.string());
    CHECK(result.success);
    CHECK(result.config.schema.size() == 2);
    std::filesystem::remove(path);

    const auto missing = ConfigLoader::load_from_file("/nonexistent/gpcopy.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.find("Failed to load config") != std::string::npos);
}
