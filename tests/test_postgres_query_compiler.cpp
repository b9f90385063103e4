// Copyright (c) 2024 liudegui. MIT License.
// Tests for qbpp::PostgresQueryCompiler (and the shared rendering rules of
// DefaultQueryCompiler).

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <string>
#include <vector>

#include "qbpp/nodes.hpp"
#include "qbpp/postgres_query_compiler.hpp"

using namespace qbpp;

namespace {

CompiledQuery MustCompile(const OperationNode& node) {
  PostgresQueryCompiler compiler;
  CompiledQuery query;
  Error err = compiler.Compile(node, &query);
  INFO(err.message);
  REQUIRE(err.ok());
  return query;
}

size_t CountPlaceholders(const std::string& sql) {
  size_t n = 0;
  for (char c : sql) {
    if (c == '$') { ++n; }
  }
  return n;
}

NodePtr<BinaryOperationNode> ColumnEquals(const char* column, Value value) {
  return BinaryOperationNode::Create(ColumnNode::Create(column),
                                     BinaryOperator::kEq,
                                     ValueNode::Create(std::move(value)));
}

NodePtr<SelectQueryNode> PersonById(int64_t id) {
  SelectQueryParts parts;
  parts.selections = MakeNodeList<SelectionNode>(
      SelectionNode::Create(ReferenceNode::Create("person", "first_name")));
  parts.from = FromNode::Create("person");
  parts.where = WhereNode::Create(BinaryOperationNode::Create(
      ReferenceNode::Create("person", "id"), BinaryOperator::kEq,
      ValueNode::Create(Value::Int(id))));
  return SelectQueryNode::Create(std::move(parts));
}

}  // namespace

// --- select ---

TEST_CASE("PostgresQueryCompiler: select with where", "[postgres_compiler]") {
  auto query = MustCompile(*PersonById(1));
  REQUIRE(query.sql ==
          "select \"person\".\"first_name\" from \"person\" "
          "where \"person\".\"id\" = $1");
  REQUIRE(query.parameters.size() == 1);
  REQUIRE(query.parameters[0] == Value::Int(1));
}

TEST_CASE("PostgresQueryCompiler: select clauses in order",
          "[postgres_compiler]") {
  SelectQueryParts parts;
  parts.distinct = true;
  parts.selections = MakeNodeList<SelectionNode>(
      SelectionNode::CreateSelectAll());
  parts.from = FromNode::Create("person");
  parts.joins = MakeNodeList<JoinNode>(JoinNode::Create(
      JoinType::kLeft, TableNode::Create("pet"),
      OnNode::Create(BinaryOperationNode::Create(
          ReferenceNode::Create("pet", "owner_id"), BinaryOperator::kEq,
          ReferenceNode::Create("person", "id")))));
  parts.order_by = OrderByNode::Create(MakeNodeList<OrderByItemNode>(
      OrderByItemNode::Create(ColumnNode::Create("first_name"),
                              OrderDirection::kDesc),
      OrderByItemNode::Create(ColumnNode::Create("id"))));
  parts.limit = LimitNode::Create(10);
  parts.offset = OffsetNode::Create(5);
  auto select = SelectQueryNode::Create(std::move(parts));

  auto query = MustCompile(*select);
  REQUIRE(query.sql ==
          "select distinct * from \"person\" "
          "left join \"pet\" on \"pet\".\"owner_id\" = \"person\".\"id\" "
          "order by \"first_name\" desc, \"id\" limit $1 offset $2");
  REQUIRE(query.parameters.size() == 2);
  REQUIRE(query.parameters[0] == Value::Int(10));
  REQUIRE(query.parameters[1] == Value::Int(5));
}

TEST_CASE("PostgresQueryCompiler: schema, alias and table star",
          "[postgres_compiler]") {
  SelectQueryParts parts;
  parts.selections = MakeNodeList<SelectionNode>(
      SelectionNode::Create(ReferenceNode::CreateSelectAll(
          TableNode::Create("p"))),
      SelectionNode::Create(
          AliasNode::Create(ColumnNode::Create("first_name"), "fn")));
  parts.from = FromNode::Create(MakeNodeList<OperationNode>(AliasNode::Create(
      TableNode::CreateWithSchema("public", "person"), "p")));
  auto query = MustCompile(*SelectQueryNode::Create(std::move(parts)));
  REQUIRE(query.sql ==
          "select \"p\".*, \"first_name\" as \"fn\" "
          "from \"public\".\"person\" as \"p\"");
  REQUIRE(query.parameters.empty());
}

TEST_CASE("PostgresQueryCompiler: and, or, not, parens",
          "[postgres_compiler]") {
  SelectQueryParts parts;
  parts.selections = MakeNodeList<SelectionNode>(
      SelectionNode::CreateSelectAll());
  parts.from = FromNode::Create("t");
  parts.where = WhereNode::Create(OrNode::Create(
      ParensNode::Create(AndNode::Create(ColumnEquals("a", Value::Int(1)),
                                         ColumnEquals("b", Value::Int(2)))),
      NotNode::Create(ColumnEquals("c", Value::Text("x")))));
  auto query = MustCompile(*SelectQueryNode::Create(std::move(parts)));
  REQUIRE(query.sql ==
          "select * from \"t\" where (\"a\" = $1 and \"b\" = $2) "
          "or not \"c\" = $3");
  REQUIRE(query.parameters.size() == 3);
  REQUIRE(query.parameters[2] == Value::Text("x"));
}

TEST_CASE("PostgresQueryCompiler: sub-select in expression is parenthesized",
          "[postgres_compiler]") {
  SelectQueryParts inner;
  inner.selections = MakeNodeList<SelectionNode>(
      SelectionNode::Create(ColumnNode::Create("owner_id")));
  inner.from = FromNode::Create("pet");
  inner.where = WhereNode::Create(ColumnEquals("species", Value::Text("cat")));

  SelectQueryParts outer;
  outer.selections = MakeNodeList<SelectionNode>(
      SelectionNode::CreateSelectAll());
  outer.from = FromNode::Create("person");
  outer.where = WhereNode::Create(AndNode::Create(
      ColumnEquals("active", Value::Bool(true)),
      BinaryOperationNode::Create(ColumnNode::Create("id"),
                                  BinaryOperator::kIn,
                                  SelectQueryNode::Create(std::move(inner)))));

  auto query = MustCompile(*SelectQueryNode::Create(std::move(outer)));
  REQUIRE(query.sql ==
          "select * from \"person\" where \"active\" = $1 and \"id\" in "
          "(select \"owner_id\" from \"pet\" where \"species\" = $2)");
  REQUIRE(query.parameters.size() == 2);
  REQUIRE(query.parameters[1] == Value::Text("cat"));
}

TEST_CASE("PostgresQueryCompiler: sub-select inside parens is not doubled",
          "[postgres_compiler]") {
  SelectQueryParts inner;
  inner.selections = MakeNodeList<SelectionNode>(
      SelectionNode::Create(RawNode::CreateWithSql("max(age)")));
  inner.from = FromNode::Create("person");
  auto parens = ParensNode::Create(SelectQueryNode::Create(std::move(inner)));
  auto query = MustCompile(*parens);
  REQUIRE(query.sql == "(select max(age) from \"person\")");
}

TEST_CASE("PostgresQueryCompiler: value list", "[postgres_compiler]") {
  auto in = BinaryOperationNode::Create(
      ColumnNode::Create("id"), BinaryOperator::kIn,
      ValueListNode::CreateFromValues(
          {Value::Int(1), Value::Int(2), Value::Int(3)}));
  auto query = MustCompile(*in);
  REQUIRE(query.sql == "\"id\" in ($1, $2, $3)");
  REQUIRE(query.parameters.size() == 3);
}

TEST_CASE("PostgresQueryCompiler: raw fragments interleave parameters",
          "[postgres_compiler]") {
  std::vector<std::string> fragments{"created_at > now() - ", "::interval"};
  auto raw = RawNode::Create(
      fragments,
      MakeNodeList<OperationNode>(ValueNode::Create(Value::Text("1 day"))));
  auto query = MustCompile(*raw);
  REQUIRE(query.sql == "created_at > now() - $1::interval");
  REQUIRE(query.parameters.size() == 1);
}

// --- insert / update / delete ---

TEST_CASE("PostgresQueryCompiler: insert with returning",
          "[postgres_compiler]") {
  InsertQueryParts parts;
  parts.into = TableNode::Create("person");
  parts.columns = MakeNodeList<ColumnNode>(ColumnNode::Create("first_name"),
                                           ColumnNode::Create("age"));
  parts.values = ValuesNode::Create(MakeNodeList<ValueListNode>(
      ValueListNode::CreateFromValues({Value::Text("Jennifer"), Value::Int(31)}),
      ValueListNode::CreateFromValues({Value::Text("Arnold"), Value::Null()})));
  parts.returning = ReturningNode::Create(
      MakeNodeList<SelectionNode>(SelectionNode::CreateSelectAll()));

  auto query = MustCompile(*InsertQueryNode::Create(std::move(parts)));
  REQUIRE(query.sql ==
          "insert into \"person\" (\"first_name\", \"age\") "
          "values ($1, $2), ($3, $4) returning *");
  REQUIRE(query.parameters.size() == 4);
  REQUIRE(query.parameters[3].IsNull());
}

TEST_CASE("PostgresQueryCompiler: update", "[postgres_compiler]") {
  UpdateQueryParts parts;
  parts.table = TableNode::Create("person");
  parts.updates = MakeNodeList<ColumnUpdateNode>(
      ColumnUpdateNode::Create("first_name", Value::Text("Jen")),
      ColumnUpdateNode::Create("age", Value::Int(32)));
  parts.where = WhereNode::Create(ColumnEquals("id", Value::Int(7)));
  parts.returning = ReturningNode::Create(MakeNodeList<SelectionNode>(
      SelectionNode::Create(ColumnNode::Create("id"))));

  auto query = MustCompile(*UpdateQueryNode::Create(std::move(parts)));
  REQUIRE(query.sql ==
          "update \"person\" set \"first_name\" = $1, \"age\" = $2 "
          "where \"id\" = $3 returning \"id\"");
  REQUIRE(query.parameters.size() == 3);
}

TEST_CASE("PostgresQueryCompiler: delete", "[postgres_compiler]") {
  DeleteQueryParts parts;
  parts.from = FromNode::Create("person");
  parts.where = WhereNode::Create(BinaryOperationNode::Create(
      ColumnNode::Create("age"), BinaryOperator::kLt,
      ValueNode::Create(Value::Int(18))));
  auto query = MustCompile(*DeleteQueryNode::Create(std::move(parts)));
  REQUIRE(query.sql == "delete from \"person\" where \"age\" < $1");
}

// --- schema ---

TEST_CASE("PostgresQueryCompiler: alter table drop constraint",
          "[postgres_compiler]") {
  AlterTableParts parts;
  parts.table = TableNode::Create("pet");
  parts.drop_constraint = DropConstraintNode::Create("pet_owner_fk");
  auto query = MustCompile(*AlterTableNode::Create(std::move(parts)));
  REQUIRE(query.sql ==
          "alter table \"pet\" drop constraint \"pet_owner_fk\"");
  REQUIRE(query.parameters.empty());
}

TEST_CASE("PostgresQueryCompiler: drop constraint modifiers",
          "[postgres_compiler]") {
  AlterTableParts cascade;
  cascade.table = TableNode::Create("pet");
  cascade.drop_constraint =
      DropConstraintNode::Create("c", true, DropModifier::kCascade);
  REQUIRE(MustCompile(*AlterTableNode::Create(std::move(cascade))).sql ==
          "alter table \"pet\" drop constraint if exists \"c\" cascade");

  AlterTableParts restrict;
  restrict.table = TableNode::Create("pet");
  restrict.drop_constraint =
      DropConstraintNode::Create("c", false, DropModifier::kRestrict);
  REQUIRE(MustCompile(*AlterTableNode::Create(std::move(restrict))).sql ==
          "alter table \"pet\" drop constraint \"c\" restrict");
}

TEST_CASE("PostgresQueryCompiler: alter table rename and drop column",
          "[postgres_compiler]") {
  AlterTableParts rename;
  rename.table = TableNode::Create("person");
  rename.rename_to = TableNode::Create("people");
  REQUIRE(MustCompile(*AlterTableNode::Create(std::move(rename))).sql ==
          "alter table \"person\" rename to \"people\"");

  AlterTableParts drop;
  drop.table = TableNode::Create("person");
  drop.column_alterations = MakeNodeList<OperationNode>(
      DropColumnNode::Create("age"), DropColumnNode::Create("nick"));
  REQUIRE(MustCompile(*AlterTableNode::Create(std::move(drop))).sql ==
          "alter table \"person\" drop column \"age\", drop column \"nick\"");
}

TEST_CASE("PostgresQueryCompiler: drop table", "[postgres_compiler]") {
  auto drop = DropTableNode::Create(TableNode::Create("person"), true, true);
  REQUIRE(MustCompile(*drop).sql == "drop table if exists \"person\" cascade");
}

// --- identifiers ---

TEST_CASE("PostgresQueryCompiler: wrapper inside identifier is doubled",
          "[postgres_compiler]") {
  auto column = ColumnNode::Create("we\"ird");
  REQUIRE(MustCompile(*column).sql == "\"we\"\"ird\"");
}

// --- properties ---

TEST_CASE("PostgresQueryCompiler: placeholders match parameters",
          "[postgres_compiler]") {
  UpdateQueryParts parts;
  parts.table = TableNode::Create("t");
  parts.updates = MakeNodeList<ColumnUpdateNode>(
      ColumnUpdateNode::Create("a", Value::Int(1)),
      ColumnUpdateNode::Create("b", Value::Int(2)));
  parts.where = WhereNode::Create(OrNode::Create(
      ColumnEquals("c", Value::Int(3)), ColumnEquals("d", Value::Int(4))));
  auto query = MustCompile(*UpdateQueryNode::Create(std::move(parts)));
  REQUIRE(CountPlaceholders(query.sql) == query.parameters.size());
  REQUIRE(std::strstr(query.sql.c_str(), "$4") != nullptr);
}

TEST_CASE("PostgresQueryCompiler: compiling twice is identical",
          "[postgres_compiler]") {
  auto node = PersonById(42);
  PostgresQueryCompiler compiler;
  CompiledQuery first;
  CompiledQuery second;
  REQUIRE(compiler.Compile(*node, &first).ok());
  REQUIRE(compiler.Compile(*node, &second).ok());
  REQUIRE(first.sql == second.sql);
  REQUIRE(first.parameters == second.parameters);
}

// --- errors ---

TEST_CASE("PostgresQueryCompiler: update without assignments is misuse",
          "[postgres_compiler]") {
  UpdateQueryParts parts;
  parts.table = TableNode::Create("t");
  auto node = UpdateQueryNode::Create(std::move(parts));

  PostgresQueryCompiler compiler;
  CompiledQuery query;
  query.sql = "untouched";
  Error err = compiler.Compile(*node, &query);
  REQUIRE(err.code == ErrorCode::kMisuse);
  REQUIRE(query.sql == "untouched");
}

TEST_CASE("PostgresQueryCompiler: raw fragment mismatch is misuse",
          "[postgres_compiler]") {
  std::vector<std::string> fragments{"a", "b", "c"};
  auto raw = RawNode::Create(
      fragments, MakeNodeList<OperationNode>(ValueNode::Create(Value::Int(1))));
  PostgresQueryCompiler compiler;
  CompiledQuery query;
  REQUIRE(compiler.Compile(*raw, &query).code == ErrorCode::kMisuse);
}

TEST_CASE("PostgresQueryCompiler: missing child reported",
          "[postgres_compiler]") {
  auto where = WhereNode::Create(nullptr);
  PostgresQueryCompiler compiler;
  CompiledQuery query;
  Error err = compiler.Compile(*where, &query);
  REQUIRE(err.code == ErrorCode::kNullParam);
  REQUIRE(query.sql.empty());
  REQUIRE(query.parameters.empty());
}
