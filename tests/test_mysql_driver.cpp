// Copyright (c) 2024 liudegui. MIT License.
// Tests for the mysql driver. The DSN tests run anywhere; the rest require
// a running MySQL/MariaDB server.
//
// Environment variables:
//   QBPP_MARIA_DSN  -- "host:port:user:password:database". The server
//                      tests are skipped when unset.

#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "qbpp/database.hpp"
#include "qbpp/mysql_dialect.hpp"
#include "qbpp/nodes.hpp"

using namespace qbpp;

static const char* GetDsn() { return std::getenv("QBPP_MARIA_DSN"); }

static MysqlDialect MakeDialect() {
  MysqlDialectConfig config;
  config.dsn = GetDsn();
  config.max_connections = 2;
  return MysqlDialect(std::move(config));
}

static void ResetTable(Database* db) {
  QueryResult result;
  REQUIRE(db->ExecuteCompiled(
                CompiledQuery::Raw("DROP TABLE IF EXISTS qbpp_emp"), &result)
              .ok());
  REQUIRE(db->ExecuteCompiled(
                CompiledQuery::Raw("CREATE TABLE qbpp_emp (id INT "
                                   "AUTO_INCREMENT PRIMARY KEY, "
                                   "name VARCHAR(64), salary DOUBLE)"),
                &result)
              .ok());
}

static NodePtr<InsertQueryNode> InsertEmp(const char* name, double salary) {
  InsertQueryParts parts;
  parts.into = TableNode::Create("qbpp_emp");
  parts.columns = MakeNodeList<ColumnNode>(ColumnNode::Create("name"),
                                           ColumnNode::Create("salary"));
  parts.values = ValuesNode::Create(MakeNodeList<ValueListNode>(
      ValueListNode::CreateFromValues(
          {Value::Text(name), Value::Double(salary)})));
  return InsertQueryNode::Create(std::move(parts));
}

// --- DSN ---

TEST_CASE("ParseMysqlDsn: full", "[mysql]") {
  MysqlDsn dsn;
  REQUIRE(ParseMysqlDsn("db.local:3307:app:secret:shop", &dsn).ok());
  REQUIRE(dsn.host == "db.local");
  REQUIRE(dsn.port == 3307);
  REQUIRE(dsn.user == "app");
  REQUIRE(dsn.password == "secret");
  REQUIRE(dsn.database == "shop");
}

TEST_CASE("ParseMysqlDsn: empty fields keep defaults", "[mysql]") {
  MysqlDsn dsn;
  REQUIRE(ParseMysqlDsn("::::test", &dsn).ok());
  REQUIRE(dsn.host == "localhost");
  REQUIRE(dsn.port == 3306);
  REQUIRE(dsn.user == "root");
  REQUIRE(dsn.password.empty());
  REQUIRE(dsn.database == "test");
}

TEST_CASE("ParseMysqlDsn: database keeps the remaining colons", "[mysql]") {
  MysqlDsn dsn;
  REQUIRE(ParseMysqlDsn("h:1:u:p:db:extra", &dsn).ok());
  REQUIRE(dsn.password == "p");
  REQUIRE(dsn.database == "db:extra");
}

TEST_CASE("ParseMysqlDsn: bad port", "[mysql]") {
  MysqlDsn dsn;
  Error err = ParseMysqlDsn("h:notaport:u::db", &dsn);
  REQUIRE(err.code == ErrorCode::kConfig);
  REQUIRE(std::strstr(err.message, "notaport") != nullptr);
  REQUIRE(ParseMysqlDsn("h:70000:u::db", &dsn).code == ErrorCode::kConfig);
}

TEST_CASE("MysqlDriver: init needs a pool or dsn", "[mysql]") {
  MysqlDriver driver{MysqlDialectConfig{}};
  REQUIRE(driver.Init().code == ErrorCode::kConfig);
}

// --- server ---

TEST_CASE("MysqlDialect: insert, select, update", "[mysql]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_MARIA_DSN not set"); }
  Database db{MakeDialect()};
  ResetTable(&db);

  QueryResult result;
  REQUIRE(db.Execute(*InsertEmp("Alice", 1000.5), &result).ok());
  REQUIRE(result.num_affected_rows == 1);
  REQUIRE(result.has_insert_id);
  REQUIRE(result.insert_id == 1);
  REQUIRE(db.Execute(*InsertEmp("Bob", 2000.0), &result).ok());

  SelectQueryParts select;
  select.selections = MakeNodeList<SelectionNode>(
      SelectionNode::Create(ColumnNode::Create("name")),
      SelectionNode::Create(ColumnNode::Create("salary")));
  select.from = FromNode::Create("qbpp_emp");
  select.order_by = OrderByNode::Create(MakeNodeList<OrderByItemNode>(
      OrderByItemNode::Create(ColumnNode::Create("id"))));
  REQUIRE(db.Execute(*SelectQueryNode::Create(std::move(select)), &result)
              .ok());
  REQUIRE(result.rows.size() == 2);
  REQUIRE(result.rows[0].GetString("name") == "Alice");
  REQUIRE(result.rows[1].GetDouble("salary") == 2000.0);

  UpdateQueryParts update;
  update.table = TableNode::Create("qbpp_emp");
  update.updates = MakeNodeList<ColumnUpdateNode>(
      ColumnUpdateNode::Create("salary", Value::Double(0)));
  REQUIRE(db.Execute(*UpdateQueryNode::Create(std::move(update)), &result)
              .ok());
  REQUIRE(result.num_affected_rows == 2);
}

TEST_CASE("MysqlDialect: stream", "[mysql]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_MARIA_DSN not set"); }
  Database db{MakeDialect()};
  ResetTable(&db);
  QueryResult result;
  for (int i = 0; i < 5; ++i) {
    REQUIRE(db.Execute(*InsertEmp("e", i), &result).ok());
  }

  ConnectionLease lease;
  REQUIRE(db.Acquire(&lease).ok());
  QueryStream stream;

  SelectQueryParts select;
  select.selections = MakeNodeList<SelectionNode>(
      SelectionNode::CreateSelectAll());
  select.from = FromNode::Create("qbpp_emp");
  REQUIRE(lease.Stream(*SelectQueryNode::Create(std::move(select)), 2, &stream)
              .ok());
  std::vector<size_t> sizes;
  QueryResult batch;
  while (stream.Next(&batch)) { sizes.push_back(batch.rows.size()); }
  REQUIRE(sizes == std::vector<size_t>{2, 2, 1});
}

TEST_CASE("MysqlDialect: transaction with isolation level", "[mysql]") {
  if (GetDsn() == nullptr) { SKIP("QBPP_MARIA_DSN not set"); }
  Database db{MakeDialect()};
  ResetTable(&db);

  {
    Transaction tx;
    TransactionSettings settings;
    settings.isolation_level = IsolationLevel::kRepeatableRead;
    REQUIRE(db.BeginTransaction(&tx, settings).ok());
    QueryResult result;
    REQUIRE(tx.Execute(*InsertEmp("ghost", 1), &result).ok());
    REQUIRE(tx.Rollback().ok());
  }

  QueryResult result;
  REQUIRE(db.ExecuteCompiled(CompiledQuery::Raw("SELECT COUNT(*) FROM qbpp_emp"),
                             &result)
              .ok());
  REQUIRE(result.rows[0].GetInt64(0) == 0);
}
