#include <catch2/catch_test_macros.hpp>
#include "copy/ddl_builder.hpp"
#include "core/error.hpp"

using namespace gpcopy;

namespace {

TableSchema sample_schema() {
    TableSchema s;
    s.columns.push_back({"id", ColumnType(ValueKind::BIGINT), false});
    s.columns.push_back({"name", ColumnType(ValueKind::TEXT), true});
    s.columns.push_back({"price", ColumnType::decimal(10, 2), true});
    s.columns.push_back({"Created", ColumnType(ValueKind::TIMESTAMP), true});
    return s;
}

} // namespace

TEST_CASE("DdlBuilder: column types", "[ddl]") {
    CHECK(ddl::sql_type(ColumnType(ValueKind::TEXT)) == "TEXT");
    CHECK(ddl::sql_type(ColumnType(ValueKind::BOOLEAN)) == "BOOLEAN");
    CHECK(ddl::sql_type(ColumnType(ValueKind::TINYINT)) == "SMALLINT");
    CHECK(ddl::sql_type(ColumnType(ValueKind::SMALLINT)) == "SMALLINT");
    CHECK(ddl::sql_type(ColumnType(ValueKind::INTEGER)) == "INTEGER");
    CHECK(ddl::sql_type(ColumnType(ValueKind::BIGINT)) == "BIGINT");
    CHECK(ddl::sql_type(ColumnType(ValueKind::REAL)) == "FLOAT4");
    CHECK(ddl::sql_type(ColumnType(ValueKind::DOUBLE)) == "FLOAT8");
    CHECK(ddl::sql_type(ColumnType::decimal(38, 18)) == "NUMERIC(38,18)");
    CHECK(ddl::sql_type(ColumnType(ValueKind::DATE)) == "DATE");
    CHECK(ddl::sql_type(ColumnType(ValueKind::TIMESTAMP)) == "TIMESTAMP");
    CHECK(ddl::sql_type(ColumnType(ValueKind::BINARY)) == "BYTEA");
    CHECK(ddl::sql_type(ColumnType::other("jsonb")) == "jsonb");
    CHECK(ddl::sql_type(ColumnType::other("")) == "TEXT");
    CHECK(ddl::sql_type(ColumnType::user_defined("email", ColumnType(ValueKind::TEXT))) == "TEXT");
}

TEST_CASE("DdlBuilder: quote_identifier doubles embedded quotes", "[ddl]") {
    CHECK(ddl::quote_identifier("plain") == "\"plain\"");
    CHECK(ddl::quote_identifier("we\"ird") == "\"we\"\"ird\"");
}

TEST_CASE("DdlBuilder: schema_string", "[ddl]") {
    const auto schema = sample_schema();

    SECTION("defaults") {
        CHECK(ddl::schema_string(schema) ==
              "\"id\" BIGINT NOT NULL, \"name\" TEXT, \"price\" NUMERIC(10,2), "
              "\"Created\" TIMESTAMP");
    }

    SECTION("overrides replace the type of named columns") {
        CHECK(ddl::schema_string(schema, "name VARCHAR(64), price NUMERIC(20,4)") ==
              "\"id\" BIGINT NOT NULL, \"name\" VARCHAR(64), \"price\" NUMERIC(20,4), "
              "\"Created\" TIMESTAMP");
    }

    SECTION("unquoted override names match case-insensitively") {
        CHECK(ddl::schema_string(schema, "created TIMESTAMPTZ").ends_with("\"Created\" TIMESTAMPTZ"));
    }

    SECTION("quoted override names match exactly") {
        CHECK(ddl::schema_string(schema, "\"Created\" DATE").ends_with("\"Created\" DATE"));
        CHECK_THROWS_AS(ddl::schema_string(schema, "\"created\" DATE"), InvalidOptionsError);
    }

    SECTION("unknown, repeated or malformed overrides are option errors") {
        CHECK_THROWS_AS(ddl::schema_string(schema, "missing TEXT"), InvalidOptionsError);
        CHECK_THROWS_AS(ddl::schema_string(schema, "name TEXT, NAME VARCHAR(3)"), InvalidOptionsError);
        CHECK_THROWS_AS(ddl::schema_string(schema, "name"), InvalidOptionsError);
    }
}

TEST_CASE("DdlBuilder: statements", "[ddl]") {
    CHECK(ddl::create_table("s.\"t_x\"", "\"a\" TEXT") == "CREATE TABLE s.\"t_x\" (\"a\" TEXT)");
    CHECK(ddl::create_table("t", "\"a\" TEXT", " DISTRIBUTED BY (a) ") ==
          "CREATE TABLE t (\"a\" TEXT) DISTRIBUTED BY (a)");
    CHECK(ddl::drop_table("public.t") == "DROP TABLE public.t");
    CHECK(ddl::table_exists_probe("t") == "SELECT * FROM t WHERE 1=0");
    CHECK(ddl::rename_table("s.\"t_tmp\"", "t") == "ALTER TABLE s.\"t_tmp\" RENAME TO t");
}

TEST_CASE("DdlBuilder: COPY command", "[ddl][copy]") {
    CHECK(ddl::copy_from_stdin("public.orders", '|') ==
          "COPY public.orders FROM STDIN WITH NULL AS 'NULL' DELIMITER AS E'|'");
    CHECK(ddl::copy_from_stdin("t", '\t') ==
          "COPY t FROM STDIN WITH NULL AS 'NULL' DELIMITER AS E'\t'");
    CHECK(ddl::copy_from_stdin("t", '\'') ==
          "COPY t FROM STDIN WITH NULL AS 'NULL' DELIMITER AS E'\\''");
}
