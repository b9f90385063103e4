// Copyright (c) 2024 liudegui. MIT License.
// Tests for the libpq client and pool (requires a running PostgreSQL server).
//
// Environment variables:
//   QBPP_PG_DSN  -- libpq conninfo, e.g. "host=localhost dbname=qbpp_test".
//                   The tests are skipped when unset.

#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "qbpp/database.hpp"
#include "qbpp/nodes.hpp"
#include "qbpp/postgres_cursor.hpp"
#include "qbpp/postgres_dialect.hpp"
#include "qbpp/pq_client.hpp"

using namespace qbpp;

static const char* GetDsn() { return std::getenv("QBPP_PG_DSN"); }

static PostgresDialect MakeDialect(const std::shared_ptr<PqPool>& pool) {
  PostgresDialectPoolConfig config;
  config.pool = pool;
  config.cursor = MakeSqlCursorConstructor();
  return PostgresDialect(PostgresDialectConfig::FromPool(std::move(config)));
}

static void ResetTable(Database* db) {
  QueryResult result;
  REQUIRE(db->ExecuteCompiled(
                CompiledQuery::Raw("drop table if exists qbpp_person"), &result)
              .ok());
  REQUIRE(db->ExecuteCompiled(
                CompiledQuery::Raw("create table qbpp_person (id serial "
                                   "primary key, first_name text, age bigint)"),
                &result)
              .ok());
}

static NodePtr<InsertQueryNode> InsertPerson(const char* name, int64_t age) {
  InsertQueryParts parts;
  parts.into = TableNode::Create("qbpp_person");
  parts.columns = MakeNodeList<ColumnNode>(ColumnNode::Create("first_name"),
                                           ColumnNode::Create("age"));
  parts.values = ValuesNode::Create(MakeNodeList<ValueListNode>(
      ValueListNode::CreateFromValues({Value::Text(name), Value::Int(age)})));
  parts.returning = ReturningNode::Create(MakeNodeList<SelectionNode>(
      SelectionNode::Create(ColumnNode::Create("id"))));
  return InsertQueryNode::Create(std::move(parts));
}

TEST_CASE("PqClient: connect, query, end", "[pq_client]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_PG_DSN not set"); }
  PqClient client(GetDsn());
  REQUIRE(client.Connect().ok());

  PostgresNativeResult result;
  REQUIRE(client.Query("select $1::bigint + 1 as n, $2::text as s",
                       {Value::Int(41), Value::Text("hi")}, &result)
              .ok());
  REQUIRE(result.command == "SELECT");
  REQUIRE(result.rows.size() == 1);
  REQUIRE(result.rows[0].GetInt64("n") == 42);
  REQUIRE(result.rows[0].GetString("s") == "hi");
  REQUIRE(client.End().ok());
}

TEST_CASE("PqClient: bad connection string", "[pq_client]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_PG_DSN not set"); }
  PqClient client("host=/nonexistent/socket/dir dbname=none");
  REQUIRE_FALSE(client.Connect().ok());
}

TEST_CASE("PqPool: handles are reused", "[pq_client]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_PG_DSN not set"); }
  auto pool = std::make_shared<PqPool>(GetDsn(), 2);

  std::shared_ptr<PostgresPoolClient> first;
  REQUIRE(pool->Connect(&first).ok());
  PostgresPoolClient* raw = first.get();
  REQUIRE(first->Release().ok());
  first.reset();

  std::shared_ptr<PostgresPoolClient> second;
  REQUIRE(pool->Connect(&second).ok());
  REQUIRE(second.get() == raw);
  REQUIRE(pool->NumOpen() == 1);
  REQUIRE(second->Release().ok());
  REQUIRE(pool->End().ok());
}

TEST_CASE("PostgresDialect: insert returning, update, stream",
          "[pq_client]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_PG_DSN not set"); }
  auto pool = std::make_shared<PqPool>(GetDsn(), 2);
  Database db{MakeDialect(pool)};
  ResetTable(&db);

  QueryResult result;
  REQUIRE(db.Execute(*InsertPerson("Jennifer", 31), &result).ok());
  REQUIRE(result.rows.size() == 1);
  REQUIRE(result.rows[0].GetInt64("id") == 1);
  REQUIRE(result.num_affected_rows == 1);
  for (int i = 0; i < 4; ++i) {
    REQUIRE(db.Execute(*InsertPerson("p", i), &result).ok());
  }

  UpdateQueryParts update;
  update.table = TableNode::Create("qbpp_person");
  update.updates = MakeNodeList<ColumnUpdateNode>(
      ColumnUpdateNode::Create("age", Value::Int(99)));
  update.where = WhereNode::Create(BinaryOperationNode::Create(
      ColumnNode::Create("first_name"), BinaryOperator::kEq,
      ValueNode::Create(Value::Text("p"))));
  REQUIRE(db.Execute(*UpdateQueryNode::Create(std::move(update)), &result)
              .ok());
  REQUIRE(result.has_num_affected_rows);
  REQUIRE(result.num_affected_rows == 4);

  SelectQueryParts select;
  select.selections = MakeNodeList<SelectionNode>(
      SelectionNode::CreateSelectAll());
  select.from = FromNode::Create("qbpp_person");
  auto query = SelectQueryNode::Create(std::move(select));

  ConnectionLease lease;
  REQUIRE(db.Acquire(&lease).ok());
  QueryStream stream;
  REQUIRE(lease.Stream(*query, 2, &stream).ok());
  std::vector<size_t> sizes;
  QueryResult batch;
  Error err;
  while (stream.Next(&batch, &err)) { sizes.push_back(batch.rows.size()); }
  REQUIRE(err.ok());
  REQUIRE(sizes == std::vector<size_t>{2, 2, 1});
}

TEST_CASE("PostgresDialect: unique violation maps to kConstraint",
          "[pq_client]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_PG_DSN not set"); }
  auto pool = std::make_shared<PqPool>(GetDsn(), 1);
  Database db{MakeDialect(pool)};
  ResetTable(&db);

  QueryResult result;
  auto insert = CompiledQuery::Raw(
      "insert into qbpp_person (id, first_name) values ($1, $2)",
      {Value::Int(1), Value::Text("a")});
  REQUIRE(db.ExecuteCompiled(insert, &result).ok());
  Error err = db.ExecuteCompiled(insert, &result);
  REQUIRE(err.code == ErrorCode::kConstraint);
  REQUIRE(std::strstr(err.message, "PostgresConnection::ExecuteQuery") !=
          nullptr);
}

TEST_CASE("PostgresDialect: transaction rollback", "[pq_client]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_PG_DSN not set"); }
  auto pool = std::make_shared<PqPool>(GetDsn(), 2);
  Database db{MakeDialect(pool)};
  ResetTable(&db);

  {
    Transaction tx;
    TransactionSettings settings;
    settings.isolation_level = IsolationLevel::kSerializable;
    REQUIRE(db.BeginTransaction(&tx, settings).ok());
    QueryResult result;
    REQUIRE(tx.Execute(*InsertPerson("ghost", 1), &result).ok());
  }

  QueryResult result;
  REQUIRE(db.ExecuteCompiled(
                CompiledQuery::Raw("select count(*) as n from qbpp_person"),
                &result)
              .ok());
  REQUIRE(result.rows[0].GetInt64("n") == 0);
}
