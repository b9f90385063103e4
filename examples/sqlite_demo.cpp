// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp sqlite demo -- build queries as trees, run them on an in-memory
// database.
//
// Usage:
//   ./qbpp_sqlite_demo

#include <cstdio>
#include <utility>

#include "qbpp/database.hpp"
#include "qbpp/nodes.hpp"
#include "qbpp/sqlite_dialect.hpp"

using namespace qbpp;

static NodePtr<InsertQueryNode> InsertEmp(int64_t empno, const char* name) {
  InsertQueryParts parts;
  parts.into = TableNode::Create("emp");
  parts.columns = MakeNodeList<ColumnNode>(ColumnNode::Create("empno"),
                                           ColumnNode::Create("empname"));
  parts.values = ValuesNode::Create(MakeNodeList<ValueListNode>(
      ValueListNode::CreateFromValues({Value::Int(empno), Value::Text(name)})));
  return InsertQueryNode::Create(std::move(parts));
}

static NodePtr<SelectQueryNode> SelectEmps() {
  SelectQueryParts parts;
  parts.selections = MakeNodeList<SelectionNode>(
      SelectionNode::CreateSelectAll());
  parts.from = FromNode::Create("emp");
  parts.order_by = OrderByNode::Create(MakeNodeList<OrderByItemNode>(
      OrderByItemNode::Create(ColumnNode::Create("empno"))));
  return SelectQueryNode::Create(std::move(parts));
}

int main() {
  Logger().set_level(spdlog::level::debug);

  SqliteDialectConfig config;
  config.path = ":memory:";
  config.on_create_connection = [](DatabaseConnection* conn) {
    QueryResult result;
    return conn->ExecuteQuery(
        CompiledQuery::Raw("CREATE TABLE emp(empno INTEGER, empname TEXT)"),
        &result);
  };
  Database db{SqliteDialect(std::move(config))};
  QueryResult result;

  // Insert
  const char* names[] = {"Alice", "Bob", "Charlie"};
  for (int64_t i = 0; i < 3; ++i) {
    Error err = db.Execute(*InsertEmp(i + 1, names[i]), &result);
    if (!err.ok()) {
      std::fprintf(stderr, "Insert failed: %s\n", err.message);
      return 1;
    }
  }
  std::printf("Inserted 3 rows\n");

  // Compile only
  CompiledQuery compiled;
  Error err = db.Compile(*SelectEmps(), &compiled);
  if (!err.ok()) {
    std::fprintf(stderr, "Compile failed: %s\n", err.message);
    return 1;
  }
  std::printf("SQL: %s\n", compiled.sql.c_str());

  // Query
  std::printf("\n--- Query ---\n");
  err = db.Execute(*SelectEmps(), &result);
  if (!err.ok()) {
    std::fprintf(stderr, "Select failed: %s\n", err.message);
    return 1;
  }
  for (const auto& row : result.rows) {
    std::printf("  empno=%lld  empname=%s\n",
                static_cast<long long>(row.GetInt64("empno")),
                row.GetString("empname").c_str());
  }

  // Batch insert in a transaction
  std::printf("\n--- Batch insert in transaction ---\n");
  {
    Transaction tx;
    err = db.BeginTransaction(&tx);
    if (!err.ok()) {
      std::fprintf(stderr, "Begin failed: %s\n", err.message);
      return 1;
    }
    for (int64_t i = 10; i < 20; ++i) {
      err = tx.Execute(*InsertEmp(i, "Employee"), &result);
      if (!err.ok()) { break; }
    }
    err = err.ok() ? tx.Commit() : tx.Rollback();
    if (!err.ok()) {
      std::fprintf(stderr, "Transaction failed: %s\n", err.message);
      return 1;
    }
  }

  // Stream
  std::printf("\n--- Stream, 4 rows per batch ---\n");
  ConnectionLease lease;
  err = db.Acquire(&lease);
  if (!err.ok()) {
    std::fprintf(stderr, "Acquire failed: %s\n", err.message);
    return 1;
  }
  {
    QueryStream stream;
    err = lease.Stream(*SelectEmps(), 4, &stream);
    QueryResult batch;
    while (err.ok() && stream.Next(&batch, &err)) {
      std::printf("  batch of %zu rows\n", batch.rows.size());
    }
    if (!err.ok()) {
      std::fprintf(stderr, "Stream failed: %s\n", err.message);
      return 1;
    }
  }
  err = lease.Release();
  if (!err.ok()) {
    std::fprintf(stderr, "Release failed: %s\n", err.message);
    return 1;
  }

  // Update
  UpdateQueryParts update;
  update.table = TableNode::Create("emp");
  update.updates = MakeNodeList<ColumnUpdateNode>(
      ColumnUpdateNode::Create("empname", Value::Text("Boss")));
  update.where = WhereNode::Create(BinaryOperationNode::Create(
      ColumnNode::Create("empno"), BinaryOperator::kEq,
      ValueNode::Create(Value::Int(1))));
  err = db.Execute(*UpdateQueryNode::Create(std::move(update)), &result);
  if (!err.ok()) {
    std::fprintf(stderr, "Update failed: %s\n", err.message);
    return 1;
  }
  std::printf("\nUpdated %llu row(s)\n",
              static_cast<unsigned long long>(result.num_affected_rows));

  std::printf("\nDone.\n");
  return 0;
}
