// Copyright (c) 2024 liudegui. MIT License.
// Tests for the mysql and sqlite compiler policies.

#include <catch2/catch_test_macros.hpp>
#include <cstring>

#include "qbpp/mysql_query_compiler.hpp"
#include "qbpp/nodes.hpp"
#include "qbpp/postgres_query_compiler.hpp"
#include "qbpp/sqlite_query_compiler.hpp"

using namespace qbpp;

namespace {

NodePtr<SelectQueryNode> SelectPersonByName() {
  SelectQueryParts parts;
  parts.selections = MakeNodeList<SelectionNode>(
      SelectionNode::Create(ReferenceNode::Create("person", "id")));
  parts.from = FromNode::Create("person");
  parts.where = WhereNode::Create(AndNode::Create(
      BinaryOperationNode::Create(ColumnNode::Create("first_name"),
                                  BinaryOperator::kEq,
                                  ValueNode::Create(Value::Text("Jennifer"))),
      BinaryOperationNode::Create(ColumnNode::Create("age"),
                                  BinaryOperator::kGt,
                                  ValueNode::Create(Value::Int(20)))));
  parts.limit = LimitNode::Create(1);
  return SelectQueryNode::Create(std::move(parts));
}

NodePtr<DeleteQueryNode> DeleteReturningId() {
  DeleteQueryParts parts;
  parts.from = FromNode::Create("person");
  parts.returning = ReturningNode::Create(MakeNodeList<SelectionNode>(
      SelectionNode::Create(ColumnNode::Create("id"))));
  return DeleteQueryNode::Create(std::move(parts));
}

NodePtr<AlterTableNode> DropPetConstraint() {
  AlterTableParts parts;
  parts.table = TableNode::Create("pet");
  parts.drop_constraint = DropConstraintNode::Create("pet_owner_fk");
  return AlterTableNode::Create(std::move(parts));
}

}  // namespace

TEST_CASE("MysqlQueryCompiler: backticks and question marks",
          "[dialect_compiler]") {
  MysqlQueryCompiler compiler;
  CompiledQuery query;
  REQUIRE(compiler.Compile(*SelectPersonByName(), &query).ok());
  REQUIRE(query.sql ==
          "select `person`.`id` from `person` "
          "where `first_name` = ? and `age` > ? limit ?");
  REQUIRE(query.parameters.size() == 3);
  REQUIRE(query.parameters[0] == Value::Text("Jennifer"));
  REQUIRE(query.parameters[2] == Value::Int(1));
}

TEST_CASE("MysqlQueryCompiler: backtick inside identifier is doubled",
          "[dialect_compiler]") {
  MysqlQueryCompiler compiler;
  CompiledQuery query;
  REQUIRE(compiler.Compile(*ColumnNode::Create("a`b"), &query).ok());
  REQUIRE(query.sql == "`a``b`");
}

TEST_CASE("MysqlQueryCompiler: returning is unsupported",
          "[dialect_compiler]") {
  MysqlQueryCompiler compiler;
  CompiledQuery query;
  Error err = compiler.Compile(*DeleteReturningId(), &query);
  REQUIRE(err.code == ErrorCode::kUnsupportedNode);
  REQUIRE(std::strcmp(err.message,
                      "ReturningNode is not supported by the mysql dialect") ==
          0);
  REQUIRE(query.sql.empty());
}

TEST_CASE("MysqlQueryCompiler: drop constraint is supported",
          "[dialect_compiler]") {
  MysqlQueryCompiler compiler;
  CompiledQuery query;
  REQUIRE(compiler.Compile(*DropPetConstraint(), &query).ok());
  REQUIRE(query.sql == "alter table `pet` drop constraint `pet_owner_fk`");
}

TEST_CASE("SqliteQueryCompiler: double quotes and question marks",
          "[dialect_compiler]") {
  SqliteQueryCompiler compiler;
  CompiledQuery query;
  REQUIRE(compiler.Compile(*SelectPersonByName(), &query).ok());
  REQUIRE(query.sql ==
          "select \"person\".\"id\" from \"person\" "
          "where \"first_name\" = ? and \"age\" > ? limit ?");
  REQUIRE(query.parameters.size() == 3);
}

TEST_CASE("SqliteQueryCompiler: returning is supported",
          "[dialect_compiler]") {
  SqliteQueryCompiler compiler;
  CompiledQuery query;
  REQUIRE(compiler.Compile(*DeleteReturningId(), &query).ok());
  REQUIRE(query.sql == "delete from \"person\" returning \"id\"");
}

TEST_CASE("SqliteQueryCompiler: drop constraint is unsupported",
          "[dialect_compiler]") {
  SqliteQueryCompiler compiler;
  CompiledQuery query;
  Error err = compiler.Compile(*DropPetConstraint(), &query);
  REQUIRE(err.code == ErrorCode::kUnsupportedNode);
  REQUIRE(std::strstr(err.message, "DropConstraintNode") != nullptr);
  REQUIRE(std::strstr(err.message, "sqlite") != nullptr);
}

TEST_CASE("QueryCompiler: same tree, three dialects", "[dialect_compiler]") {
  auto node = SelectPersonByName();
  PostgresQueryCompiler postgres;
  MysqlQueryCompiler mysql;
  SqliteQueryCompiler sqlite;
  CompiledQuery pg_query;
  CompiledQuery my_query;
  CompiledQuery lite_query;
  REQUIRE(postgres.Compile(*node, &pg_query).ok());
  REQUIRE(mysql.Compile(*node, &my_query).ok());
  REQUIRE(sqlite.Compile(*node, &lite_query).ok());

  REQUIRE(std::strstr(pg_query.sql.c_str(), "$3") != nullptr);
  REQUIRE(pg_query.parameters == my_query.parameters);
  REQUIRE(my_query.parameters == lite_query.parameters);
}
