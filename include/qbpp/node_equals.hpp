// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::NodesEqual -- structural equality of syntax trees.
//
// Two trees are equal when they have the same kinds and the same fields
// all the way down. Node addresses are never compared.

#pragma once

#include "qbpp/nodes.hpp"

namespace qbpp {

inline bool NodesEqual(const OperationNode* a, const OperationNode* b);

namespace detail {

template <typename T>
bool NodeListsEqual(const NodeList<T>& a, const NodeList<T>& b) {
  if (a.size() != b.size()) { return false; }
  for (size_t i = 0; i < a.size(); ++i) {
    if (!NodesEqual(a[i].get(), b[i].get())) { return false; }
  }
  return true;
}

}  // namespace detail

inline bool NodesEqual(const OperationNode* a, const OperationNode* b) {
  if (a == nullptr || b == nullptr) { return a == b; }
  if (a->Kind() != b->Kind()) { return false; }

  switch (a->Kind()) {
    case NodeKind::kIdentifier:
      return NodeCast<IdentifierNode>(*a).Name() ==
             NodeCast<IdentifierNode>(*b).Name();

    case NodeKind::kSchemableIdentifier: {
      const auto& x = NodeCast<SchemableIdentifierNode>(*a);
      const auto& y = NodeCast<SchemableIdentifierNode>(*b);
      return NodesEqual(x.Schema(), y.Schema()) &&
             NodesEqual(&x.Identifier(), &y.Identifier());
    }

    case NodeKind::kTable:
      return NodesEqual(&NodeCast<TableNode>(*a).Table(),
                        &NodeCast<TableNode>(*b).Table());

    case NodeKind::kColumn:
      return NodesEqual(&NodeCast<ColumnNode>(*a).Column(),
                        &NodeCast<ColumnNode>(*b).Column());

    case NodeKind::kSelectAll:
      return true;

    case NodeKind::kReference: {
      const auto& x = NodeCast<ReferenceNode>(*a);
      const auto& y = NodeCast<ReferenceNode>(*b);
      return NodesEqual(x.Table(), y.Table()) &&
             NodesEqual(x.Column(), y.Column());
    }

    case NodeKind::kAlias: {
      const auto& x = NodeCast<AliasNode>(*a);
      const auto& y = NodeCast<AliasNode>(*b);
      return NodesEqual(x.Node(), y.Node()) &&
             NodesEqual(&x.Alias(), &y.Alias());
    }

    case NodeKind::kValue:
      return NodeCast<ValueNode>(*a).Value() == NodeCast<ValueNode>(*b).Value();

    case NodeKind::kValueList:
      return detail::NodeListsEqual(NodeCast<ValueListNode>(*a).Values(),
                                    NodeCast<ValueListNode>(*b).Values());

    case NodeKind::kRaw: {
      const auto& x = NodeCast<RawNode>(*a);
      const auto& y = NodeCast<RawNode>(*b);
      return x.SqlFragments() == y.SqlFragments() &&
             detail::NodeListsEqual(x.Parameters(), y.Parameters());
    }

    case NodeKind::kBinaryOperation: {
      const auto& x = NodeCast<BinaryOperationNode>(*a);
      const auto& y = NodeCast<BinaryOperationNode>(*b);
      return x.Operator() == y.Operator() &&
             NodesEqual(x.Left(), y.Left()) &&
             NodesEqual(x.Right(), y.Right());
    }

    case NodeKind::kAnd: {
      const auto& x = NodeCast<AndNode>(*a);
      const auto& y = NodeCast<AndNode>(*b);
      return NodesEqual(x.Left(), y.Left()) && NodesEqual(x.Right(), y.Right());
    }

    case NodeKind::kOr: {
      const auto& x = NodeCast<OrNode>(*a);
      const auto& y = NodeCast<OrNode>(*b);
      return NodesEqual(x.Left(), y.Left()) && NodesEqual(x.Right(), y.Right());
    }

    case NodeKind::kNot:
      return NodesEqual(NodeCast<NotNode>(*a).Expression(),
                        NodeCast<NotNode>(*b).Expression());

    case NodeKind::kParens:
      return NodesEqual(NodeCast<ParensNode>(*a).Expression(),
                        NodeCast<ParensNode>(*b).Expression());

    case NodeKind::kWhere:
      return NodesEqual(NodeCast<WhereNode>(*a).Where(),
                        NodeCast<WhereNode>(*b).Where());

    case NodeKind::kOn:
      return NodesEqual(NodeCast<OnNode>(*a).On(), NodeCast<OnNode>(*b).On());

    case NodeKind::kJoin: {
      const auto& x = NodeCast<JoinNode>(*a);
      const auto& y = NodeCast<JoinNode>(*b);
      return x.Type() == y.Type() && NodesEqual(x.Table(), y.Table()) &&
             NodesEqual(x.On(), y.On());
    }

    case NodeKind::kFrom:
      return detail::NodeListsEqual(NodeCast<FromNode>(*a).Froms(),
                                    NodeCast<FromNode>(*b).Froms());

    case NodeKind::kSelection:
      return NodesEqual(NodeCast<SelectionNode>(*a).Selection(),
                        NodeCast<SelectionNode>(*b).Selection());

    case NodeKind::kOrderByItem: {
      const auto& x = NodeCast<OrderByItemNode>(*a);
      const auto& y = NodeCast<OrderByItemNode>(*b);
      return x.Direction() == y.Direction() &&
             NodesEqual(x.OrderBy(), y.OrderBy());
    }

    case NodeKind::kOrderBy:
      return detail::NodeListsEqual(NodeCast<OrderByNode>(*a).Items(),
                                    NodeCast<OrderByNode>(*b).Items());

    case NodeKind::kLimit:
      return NodesEqual(NodeCast<LimitNode>(*a).Limit(),
                        NodeCast<LimitNode>(*b).Limit());

    case NodeKind::kOffset:
      return NodesEqual(NodeCast<OffsetNode>(*a).Offset(),
                        NodeCast<OffsetNode>(*b).Offset());

    case NodeKind::kReturning:
      return detail::NodeListsEqual(NodeCast<ReturningNode>(*a).Selections(),
                                    NodeCast<ReturningNode>(*b).Selections());

    case NodeKind::kColumnUpdate: {
      const auto& x = NodeCast<ColumnUpdateNode>(*a);
      const auto& y = NodeCast<ColumnUpdateNode>(*b);
      return NodesEqual(x.Column(), y.Column()) &&
             NodesEqual(x.Value(), y.Value());
    }

    case NodeKind::kValues:
      return detail::NodeListsEqual(NodeCast<ValuesNode>(*a).Values(),
                                    NodeCast<ValuesNode>(*b).Values());

    case NodeKind::kSelectQuery: {
      const auto& x = NodeCast<SelectQueryNode>(*a);
      const auto& y = NodeCast<SelectQueryNode>(*b);
      return x.Distinct() == y.Distinct() &&
             detail::NodeListsEqual(x.Selections(), y.Selections()) &&
             NodesEqual(x.From(), y.From()) &&
             detail::NodeListsEqual(x.Joins(), y.Joins()) &&
             NodesEqual(x.Where(), y.Where()) &&
             NodesEqual(x.OrderBy(), y.OrderBy()) &&
             NodesEqual(x.Limit(), y.Limit()) &&
             NodesEqual(x.Offset(), y.Offset());
    }

    case NodeKind::kInsertQuery: {
      const auto& x = NodeCast<InsertQueryNode>(*a);
      const auto& y = NodeCast<InsertQueryNode>(*b);
      return NodesEqual(x.Into(), y.Into()) &&
             detail::NodeListsEqual(x.Columns(), y.Columns()) &&
             NodesEqual(x.Values(), y.Values()) &&
             NodesEqual(x.Returning(), y.Returning());
    }

    case NodeKind::kUpdateQuery: {
      const auto& x = NodeCast<UpdateQueryNode>(*a);
      const auto& y = NodeCast<UpdateQueryNode>(*b);
      return NodesEqual(x.Table(), y.Table()) &&
             detail::NodeListsEqual(x.Updates(), y.Updates()) &&
             NodesEqual(x.Where(), y.Where()) &&
             NodesEqual(x.Returning(), y.Returning());
    }

    case NodeKind::kDeleteQuery: {
      const auto& x = NodeCast<DeleteQueryNode>(*a);
      const auto& y = NodeCast<DeleteQueryNode>(*b);
      return NodesEqual(x.From(), y.From()) &&
             NodesEqual(x.Where(), y.Where()) &&
             NodesEqual(x.Returning(), y.Returning());
    }

    case NodeKind::kAlterTable: {
      const auto& x = NodeCast<AlterTableNode>(*a);
      const auto& y = NodeCast<AlterTableNode>(*b);
      return NodesEqual(x.Table(), y.Table()) &&
             NodesEqual(x.RenameTo(), y.RenameTo()) &&
             NodesEqual(x.DropConstraint(), y.DropConstraint()) &&
             detail::NodeListsEqual(x.ColumnAlterations(),
                                    y.ColumnAlterations());
    }

    case NodeKind::kDropConstraint: {
      const auto& x = NodeCast<DropConstraintNode>(*a);
      const auto& y = NodeCast<DropConstraintNode>(*b);
      return x.IfExists() == y.IfExists() && x.Modifier() == y.Modifier() &&
             NodesEqual(&x.ConstraintName(), &y.ConstraintName());
    }

    case NodeKind::kDropColumn:
      return NodesEqual(&NodeCast<DropColumnNode>(*a).Column(),
                        &NodeCast<DropColumnNode>(*b).Column());

    case NodeKind::kDropTable: {
      const auto& x = NodeCast<DropTableNode>(*a);
      const auto& y = NodeCast<DropTableNode>(*b);
      return x.IfExists() == y.IfExists() && x.Cascade() == y.Cascade() &&
             NodesEqual(x.Table(), y.Table());
    }
  }
  return false;
}

}  // namespace qbpp
