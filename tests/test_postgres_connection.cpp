// Copyright (c) 2024 liudegui. MIT License.
// Tests for qbpp::PostgresConnection against an in-memory client.

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "fake_postgres_client.hpp"
#include "qbpp/postgres_driver.hpp"

using namespace qbpp;
using qbpp_test::FakeCursorLog;
using qbpp_test::FakeSingleClient;
using qbpp_test::MakeFakeCursorConstructor;
using qbpp_test::MakeIdRows;

namespace {

qbpp_test::QueryHandler Answer(const char* command, uint64_t row_count,
                               std::vector<Row> rows = {}) {
  std::string cmd = command;
  return [cmd, row_count, rows](const std::string&, const std::vector<Value>&,
                                PostgresNativeResult* out) {
    out->command = cmd;
    out->row_count = row_count;
    out->rows = rows;
    return Error::Ok();
  };
}

}  // namespace

TEST_CASE("PostgresConnection: update reports affected rows",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  client->target.handler = Answer("UPDATE", 3);
  PostgresConnection conn(client, nullptr);

  QueryResult result;
  auto query = CompiledQuery::Raw("update \"person\" set \"age\" = $1",
                                  {Value::Int(30)});
  REQUIRE(conn.ExecuteQuery(query, &result).ok());
  REQUIRE(result.has_num_affected_rows);
  REQUIRE(result.num_affected_rows == 3);
  REQUIRE(result.rows.empty());

  REQUIRE(client->target.queries.size() == 1);
  REQUIRE(client->target.queries[0].sql == query.sql);
  REQUIRE(client->target.queries[0].params == query.parameters);
}

TEST_CASE("PostgresConnection: insert and delete report affected rows",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  PostgresConnection conn(client, nullptr);
  QueryResult result;

  client->target.handler = Answer("INSERT", 2);
  REQUIRE(conn.ExecuteQuery(CompiledQuery::Raw("insert ..."), &result).ok());
  REQUIRE(result.num_affected_rows == 2);

  client->target.handler = Answer("DELETE", 0);
  REQUIRE(conn.ExecuteQuery(CompiledQuery::Raw("delete ..."), &result).ok());
  REQUIRE(result.has_num_affected_rows);
  REQUIRE(result.num_affected_rows == 0);
}

TEST_CASE("PostgresConnection: select returns rows without count",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  client->target.handler = Answer("SELECT", 2, MakeIdRows(2));
  PostgresConnection conn(client, nullptr);

  QueryResult result;
  REQUIRE(conn.ExecuteQuery(CompiledQuery::Raw("select 1"), &result).ok());
  REQUIRE(result.rows.size() == 2);
  REQUIRE(result.rows[1].GetInt64("id") == 2);
  REQUIRE_FALSE(result.has_num_affected_rows);
}

TEST_CASE("PostgresConnection: native error keeps code, adds call site",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  client->target.handler = [](const std::string&, const std::vector<Value>&,
                              PostgresNativeResult*) {
    return Error::Make(ErrorCode::kConstraint, "duplicate key value");
  };
  PostgresConnection conn(client, nullptr);

  QueryResult result;
  Error err = conn.ExecuteQuery(CompiledQuery::Raw("insert ..."), &result);
  REQUIRE(err.code == ErrorCode::kConstraint);
  REQUIRE(std::strstr(err.message, "duplicate key value") != nullptr);
  REQUIRE(std::strstr(err.message, "PostgresConnection::ExecuteQuery") !=
          nullptr);
}

TEST_CASE("PostgresConnection: dead client is not open",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  PostgresConnection conn(client, nullptr);
  client.reset();

  QueryResult result;
  REQUIRE(conn.ExecuteQuery(CompiledQuery::Raw("select 1"), &result).code ==
          ErrorCode::kNotOpen);
}

TEST_CASE("PostgresConnection: stream without cursor is a config error",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  PostgresConnection conn(client, nullptr);

  QueryStream stream;
  Error err = conn.StreamQuery(CompiledQuery::Raw("select 1"), 10, &stream);
  REQUIRE(err.code == ErrorCode::kConfig);
  REQUIRE(std::strstr(err.message, "'cursor'") != nullptr);
  REQUIRE(client->target.queries.empty());
  REQUIRE_FALSE(stream.IsOpen());
}

TEST_CASE("PostgresConnection: chunk size must be positive",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  auto log = std::make_shared<FakeCursorLog>();
  int constructed = 0;
  PostgresConnection conn(client,
                          MakeFakeCursorConstructor(5, log, &constructed));

  QueryStream stream;
  REQUIRE(conn.StreamQuery(CompiledQuery::Raw("select 1"), 0, &stream).code ==
          ErrorCode::kInvalidArgument);
  REQUIRE(conn.StreamQuery(CompiledQuery::Raw("select 1"), -1, &stream).code ==
          ErrorCode::kInvalidArgument);
  REQUIRE(constructed == 0);
}

TEST_CASE("PostgresConnection: stream yields batches",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  auto log = std::make_shared<FakeCursorLog>();
  int constructed = 0;
  PostgresConnection conn(client,
                          MakeFakeCursorConstructor(5, log, &constructed));

  QueryStream stream;
  REQUIRE(conn.StreamQuery(CompiledQuery::Raw("select id from t"), 2, &stream)
              .ok());
  REQUIRE(constructed == 1);

  std::vector<size_t> sizes;
  QueryResult batch;
  while (stream.Next(&batch)) { sizes.push_back(batch.rows.size()); }
  REQUIRE(sizes == std::vector<size_t>{2, 2, 1});
  REQUIRE(log->close_count == 1);
}

TEST_CASE("PostgresConnection: release of a dedicated client is a no-op",
          "[postgres_connection]") {
  auto client = std::make_shared<FakeSingleClient>();
  PostgresConnection conn(client, nullptr);
  REQUIRE_FALSE(conn.pooled());
  REQUIRE(conn.Release().ok());
  REQUIRE(client->end_count == 0);
}
