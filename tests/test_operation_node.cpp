// Copyright (c) 2024 liudegui. MIT License.
// Tests for the syntax tree nodes: factories, kind checks, equality.

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <type_traits>

#include "qbpp/node_equals.hpp"
#include "qbpp/nodes.hpp"

using namespace qbpp;

static NodePtr<SelectQueryNode> MakePersonQuery(int64_t id) {
  SelectQueryParts parts;
  parts.selections = MakeNodeList<SelectionNode>(
      SelectionNode::Create(ReferenceNode::Create("person", "first_name")));
  parts.from = FromNode::Create("person");
  parts.where = WhereNode::Create(BinaryOperationNode::Create(
      ReferenceNode::Create("person", "id"), BinaryOperator::kEq,
      ValueNode::Create(Value::Int(id))));
  return SelectQueryNode::Create(std::move(parts));
}

TEST_CASE("OperationNode: nodes are not copyable or assignable",
          "[operation_node]") {
  STATIC_REQUIRE_FALSE(std::is_copy_constructible<ColumnNode>::value);
  STATIC_REQUIRE_FALSE(std::is_copy_assignable<ColumnNode>::value);
  STATIC_REQUIRE(std::is_same<NodePtr<ColumnNode>,
                              std::unique_ptr<const ColumnNode>>::value);
}

TEST_CASE("OperationNode: factories set kind and fields", "[operation_node]") {
  auto table = TableNode::CreateWithSchema("public", "person");
  REQUIRE(table->Kind() == NodeKind::kTable);
  REQUIRE(TableNode::Is(*table));
  REQUIRE_FALSE(ColumnNode::Is(*table));
  REQUIRE(table->Table().Schema() != nullptr);
  REQUIRE(table->Table().Schema()->Name() == "public");
  REQUIRE(table->Table().Identifier().Name() == "person");

  auto column = ColumnNode::Create("id");
  REQUIRE(column->Column().Name() == "id");

  auto drop = DropConstraintNode::Create("fk_owner", true,
                                         DropModifier::kCascade);
  REQUIRE(DropConstraintNode::Is(*drop));
  REQUIRE(drop->ConstraintName().Name() == "fk_owner");
  REQUIRE(drop->IfExists());
  REQUIRE(drop->Modifier() == DropModifier::kCascade);
}

TEST_CASE("OperationNode: NodeCast after Is", "[operation_node]") {
  NodePtr<> node = ValueNode::Create(Value::Text("x"));
  REQUIRE(ValueNode::Is(*node));
  REQUIRE(NodeCast<ValueNode>(*node).Value() == Value::Text("x"));
}

TEST_CASE("OperationNode: NodeKindName covers every kind",
          "[operation_node]") {
  REQUIRE(std::strcmp(NodeKindName(NodeKind::kSelectQuery),
                      "SelectQueryNode") == 0);
  REQUIRE(std::strcmp(NodeKindName(NodeKind::kDropConstraint),
                      "DropConstraintNode") == 0);
  REQUIRE(std::strcmp(NodeKindName(NodeKind::kReturning), "ReturningNode") == 0);
}

TEST_CASE("NodesEqual: structurally equal trees", "[operation_node]") {
  auto a = MakePersonQuery(1);
  auto b = MakePersonQuery(1);
  auto c = MakePersonQuery(2);
  REQUIRE(NodesEqual(a.get(), b.get()));
  REQUIRE_FALSE(NodesEqual(a.get(), c.get()));
  REQUIRE_FALSE(NodesEqual(a.get(), nullptr));
  REQUIRE(NodesEqual(nullptr, nullptr));
}

TEST_CASE("NodesEqual: different kinds never equal", "[operation_node]") {
  auto table = TableNode::Create("t");
  auto column = ColumnNode::Create("t");
  REQUIRE_FALSE(NodesEqual(table.get(), column.get()));
}

TEST_CASE("NodesEqual: drop constraint modifiers compared",
          "[operation_node]") {
  auto a = DropConstraintNode::Create("c", false, DropModifier::kCascade);
  auto b = DropConstraintNode::Create("c", false, DropModifier::kRestrict);
  auto c = DropConstraintNode::Create("c", false, DropModifier::kCascade);
  REQUIRE_FALSE(NodesEqual(a.get(), b.get()));
  REQUIRE(NodesEqual(a.get(), c.get()));
}
