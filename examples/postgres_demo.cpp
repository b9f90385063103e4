// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp PostgreSQL demo -- pooled connections, returning, streaming.
//
// Usage:
//   export QBPP_PG_DSN="host=localhost dbname=qbpp_test"
//   ./qbpp_postgres_demo
//
// Before running, create the database:
//   createdb qbpp_test

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <utility>

#include "qbpp/database.hpp"
#include "qbpp/nodes.hpp"
#include "qbpp/postgres_cursor.hpp"
#include "qbpp/postgres_dialect.hpp"
#include "qbpp/pq_client.hpp"

using namespace qbpp;

static int Fail(const char* what, const Error& err) {
  std::fprintf(stderr, "%s failed (%s): %s\n", what, ErrorCodeName(err.code),
               err.message);
  return 1;
}

int main() {
  const char* dsn = std::getenv("QBPP_PG_DSN");
  if (dsn == nullptr) {
    dsn = "host=localhost dbname=qbpp_test";
  }
  Logger().set_level(spdlog::level::debug);

  PostgresDialectPoolConfig config;
  config.pool = std::make_shared<PqPool>(dsn, 4);
  config.cursor = MakeSqlCursorConstructor();
  config.on_create_connection = [](DatabaseConnection* conn) {
    QueryResult result;
    return conn->ExecuteQuery(
        CompiledQuery::Raw("set application_name to 'qbpp_demo'"), &result);
  };
  Database db{PostgresDialect(PostgresDialectConfig::FromPool(std::move(config)))};

  QueryResult result;
  Error err = db.ExecuteCompiled(
      CompiledQuery::Raw("DROP TABLE IF EXISTS emp"), &result);
  if (!err.ok()) { return Fail("Drop", err); }
  err = db.ExecuteCompiled(
      CompiledQuery::Raw("CREATE TABLE emp(empno SERIAL PRIMARY KEY, "
                         "empname TEXT)"),
      &result);
  if (!err.ok()) { return Fail("Create", err); }
  std::printf("Connected, emp table created\n");

  // Insert with returning
  const char* names[] = {"Alice", "Bob", "Charlie"};
  for (const char* name : names) {
    InsertQueryParts parts;
    parts.into = TableNode::Create("emp");
    parts.columns = MakeNodeList<ColumnNode>(ColumnNode::Create("empname"));
    parts.values = ValuesNode::Create(MakeNodeList<ValueListNode>(
        ValueListNode::CreateFromValues({Value::Text(name)})));
    parts.returning = ReturningNode::Create(MakeNodeList<SelectionNode>(
        SelectionNode::Create(ColumnNode::Create("empno"))));
    err = db.Execute(*InsertQueryNode::Create(std::move(parts)), &result);
    if (!err.ok()) { return Fail("Insert", err); }
    std::printf("  inserted %s as empno=%lld\n", name,
                static_cast<long long>(result.rows[0].GetInt64("empno")));
  }

  // Stream through a server-side cursor
  SelectQueryParts select;
  select.selections = MakeNodeList<SelectionNode>(
      SelectionNode::CreateSelectAll());
  select.from = FromNode::Create("emp");
  select.order_by = OrderByNode::Create(MakeNodeList<OrderByItemNode>(
      OrderByItemNode::Create(ColumnNode::Create("empno"),
                              OrderDirection::kDesc)));
  auto query = SelectQueryNode::Create(std::move(select));

  std::printf("\n--- Stream, 2 rows per batch ---\n");
  ConnectionLease lease;
  err = db.Acquire(&lease);
  if (!err.ok()) { return Fail("Acquire", err); }
  {
    QueryStream stream;
    err = lease.Stream(*query, 2, &stream);
    if (!err.ok()) { return Fail("Stream", err); }
    QueryResult batch;
    while (stream.Next(&batch, &err)) {
      for (const auto& row : batch.rows) {
        std::printf("  empno=%lld  empname=%s\n",
                    static_cast<long long>(row.GetInt64("empno")),
                    row.GetString("empname").c_str());
      }
      std::printf("  --\n");
    }
    if (!err.ok()) { return Fail("Stream", err); }
  }
  err = lease.Release();
  if (!err.ok()) { return Fail("Release", err); }

  // Transaction
  {
    Transaction tx;
    TransactionSettings settings;
    settings.isolation_level = IsolationLevel::kSerializable;
    err = db.BeginTransaction(&tx, settings);
    if (!err.ok()) { return Fail("Begin", err); }

    DeleteQueryParts del;
    del.from = FromNode::Create("emp");
    err = tx.Execute(*DeleteQueryNode::Create(std::move(del)), &result);
    if (!err.ok()) { return Fail("Delete", err); }
    std::printf("\nDeleted %llu rows, rolling back\n",
                static_cast<unsigned long long>(result.num_affected_rows));
    err = tx.Rollback();
    if (!err.ok()) { return Fail("Rollback", err); }
  }

  err = db.Destroy();
  if (!err.ok()) { return Fail("Destroy", err); }
  std::printf("\nDone.\n");
  return 0;
}
