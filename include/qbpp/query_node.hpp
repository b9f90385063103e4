// Copyright (c) 2024 liudegui. MIT License.
//
// Root query nodes: select, insert, update, delete.
//
// Design:
//   - Each query is created from a *Parts struct. The parts struct is the
//     only mutable staging area; Create() moves it into a frozen node.

#pragma once

#include <utility>

#include "qbpp/clause_node.hpp"
#include "qbpp/identifier_node.hpp"
#include "qbpp/operation_node.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// SelectQueryNode
// ---------------------------------------------------------------------------

struct SelectQueryParts {
  bool distinct = false;
  NodeList<SelectionNode> selections;
  NodePtr<FromNode> from;
  NodeList<JoinNode> joins;
  NodePtr<WhereNode> where;
  NodePtr<OrderByNode> order_by;
  NodePtr<LimitNode> limit;
  NodePtr<OffsetNode> offset;
};

class SelectQueryNode final : public OperationNode {
 public:
  static NodePtr<SelectQueryNode> Create(SelectQueryParts parts) {
    return NodePtr<SelectQueryNode>(new SelectQueryNode(std::move(parts)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kSelectQuery;
  }

  bool Distinct() const { return parts_.distinct; }
  const NodeList<SelectionNode>& Selections() const {
    return parts_.selections;
  }
  const FromNode* From() const { return parts_.from.get(); }
  const NodeList<JoinNode>& Joins() const { return parts_.joins; }
  const WhereNode* Where() const { return parts_.where.get(); }
  const OrderByNode* OrderBy() const { return parts_.order_by.get(); }
  const LimitNode* Limit() const { return parts_.limit.get(); }
  const OffsetNode* Offset() const { return parts_.offset.get(); }

 private:
  explicit SelectQueryNode(SelectQueryParts parts)
      : OperationNode(NodeKind::kSelectQuery), parts_(std::move(parts)) {}

  const SelectQueryParts parts_;
};

// ---------------------------------------------------------------------------
// InsertQueryNode
// ---------------------------------------------------------------------------

struct InsertQueryParts {
  NodePtr<TableNode> into;
  NodeList<ColumnNode> columns;
  NodePtr<ValuesNode> values;
  NodePtr<ReturningNode> returning;
};

class InsertQueryNode final : public OperationNode {
 public:
  static NodePtr<InsertQueryNode> Create(InsertQueryParts parts) {
    return NodePtr<InsertQueryNode>(new InsertQueryNode(std::move(parts)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kInsertQuery;
  }

  const TableNode* Into() const { return parts_.into.get(); }
  const NodeList<ColumnNode>& Columns() const { return parts_.columns; }
  const ValuesNode* Values() const { return parts_.values.get(); }
  const ReturningNode* Returning() const { return parts_.returning.get(); }

 private:
  explicit InsertQueryNode(InsertQueryParts parts)
      : OperationNode(NodeKind::kInsertQuery), parts_(std::move(parts)) {}

  const InsertQueryParts parts_;
};

// ---------------------------------------------------------------------------
// UpdateQueryNode
// ---------------------------------------------------------------------------

struct UpdateQueryParts {
  NodePtr<> table;  // TableNode or AliasNode
  NodeList<ColumnUpdateNode> updates;
  NodePtr<WhereNode> where;
  NodePtr<ReturningNode> returning;
};

class UpdateQueryNode final : public OperationNode {
 public:
  static NodePtr<UpdateQueryNode> Create(UpdateQueryParts parts) {
    return NodePtr<UpdateQueryNode>(new UpdateQueryNode(std::move(parts)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kUpdateQuery;
  }

  const OperationNode* Table() const { return parts_.table.get(); }
  const NodeList<ColumnUpdateNode>& Updates() const { return parts_.updates; }
  const WhereNode* Where() const { return parts_.where.get(); }
  const ReturningNode* Returning() const { return parts_.returning.get(); }

 private:
  explicit UpdateQueryNode(UpdateQueryParts parts)
      : OperationNode(NodeKind::kUpdateQuery), parts_(std::move(parts)) {}

  const UpdateQueryParts parts_;
};

// ---------------------------------------------------------------------------
// DeleteQueryNode
// ---------------------------------------------------------------------------

struct DeleteQueryParts {
  NodePtr<FromNode> from;
  NodePtr<WhereNode> where;
  NodePtr<ReturningNode> returning;
};

class DeleteQueryNode final : public OperationNode {
 public:
  static NodePtr<DeleteQueryNode> Create(DeleteQueryParts parts) {
    return NodePtr<DeleteQueryNode>(new DeleteQueryNode(std::move(parts)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kDeleteQuery;
  }

  const FromNode* From() const { return parts_.from.get(); }
  const WhereNode* Where() const { return parts_.where.get(); }
  const ReturningNode* Returning() const { return parts_.returning.get(); }

 private:
  explicit DeleteQueryNode(DeleteQueryParts parts)
      : OperationNode(NodeKind::kDeleteQuery), parts_(std::move(parts)) {}

  const DeleteQueryParts parts_;
};

}  // namespace qbpp
