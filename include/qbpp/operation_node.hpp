// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::OperationNode -- base of the immutable SQL syntax tree.
//
// Design:
//   - Closed set of node kinds: NodeKind enumerates every variant and
//     OperationNode's constructor is private, befriending exactly the
//     concrete node classes below. Nothing else can derive from it.
//   - Every concrete node is final, has a private constructor, a static
//     Create() factory and a static Is() kind check
//   - Nodes expose only const accessors; children are owned through
//     NodePtr<T> (unique_ptr to const), so a subtree has exactly one parent
//   - Dispatch is a switch over Kind(), never virtual calls

#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace qbpp {

enum class NodeKind : uint8_t {
  kIdentifier = 0,
  kSchemableIdentifier,
  kTable,
  kColumn,
  kSelectAll,
  kReference,
  kAlias,
  kValue,
  kValueList,
  kRaw,
  kBinaryOperation,
  kAnd,
  kOr,
  kNot,
  kParens,
  kWhere,
  kOn,
  kJoin,
  kFrom,
  kSelection,
  kOrderByItem,
  kOrderBy,
  kLimit,
  kOffset,
  kReturning,
  kColumnUpdate,
  kValues,
  kSelectQuery,
  kInsertQuery,
  kUpdateQuery,
  kDeleteQuery,
  kAlterTable,
  kDropConstraint,
  kDropColumn,
  kDropTable,
};

inline const char* NodeKindName(NodeKind kind) {
  switch (kind) {
    case NodeKind::kIdentifier: return "IdentifierNode";
    case NodeKind::kSchemableIdentifier: return "SchemableIdentifierNode";
    case NodeKind::kTable: return "TableNode";
    case NodeKind::kColumn: return "ColumnNode";
    case NodeKind::kSelectAll: return "SelectAllNode";
    case NodeKind::kReference: return "ReferenceNode";
    case NodeKind::kAlias: return "AliasNode";
    case NodeKind::kValue: return "ValueNode";
    case NodeKind::kValueList: return "ValueListNode";
    case NodeKind::kRaw: return "RawNode";
    case NodeKind::kBinaryOperation: return "BinaryOperationNode";
    case NodeKind::kAnd: return "AndNode";
    case NodeKind::kOr: return "OrNode";
    case NodeKind::kNot: return "NotNode";
    case NodeKind::kParens: return "ParensNode";
    case NodeKind::kWhere: return "WhereNode";
    case NodeKind::kOn: return "OnNode";
    case NodeKind::kJoin: return "JoinNode";
    case NodeKind::kFrom: return "FromNode";
    case NodeKind::kSelection: return "SelectionNode";
    case NodeKind::kOrderByItem: return "OrderByItemNode";
    case NodeKind::kOrderBy: return "OrderByNode";
    case NodeKind::kLimit: return "LimitNode";
    case NodeKind::kOffset: return "OffsetNode";
    case NodeKind::kReturning: return "ReturningNode";
    case NodeKind::kColumnUpdate: return "ColumnUpdateNode";
    case NodeKind::kValues: return "ValuesNode";
    case NodeKind::kSelectQuery: return "SelectQueryNode";
    case NodeKind::kInsertQuery: return "InsertQueryNode";
    case NodeKind::kUpdateQuery: return "UpdateQueryNode";
    case NodeKind::kDeleteQuery: return "DeleteQueryNode";
    case NodeKind::kAlterTable: return "AlterTableNode";
    case NodeKind::kDropConstraint: return "DropConstraintNode";
    case NodeKind::kDropColumn: return "DropColumnNode";
    case NodeKind::kDropTable: return "DropTableNode";
  }
  return "UnknownNode";
}

class IdentifierNode;
class SchemableIdentifierNode;
class TableNode;
class ColumnNode;
class SelectAllNode;
class ReferenceNode;
class AliasNode;
class ValueNode;
class ValueListNode;
class RawNode;
class BinaryOperationNode;
class AndNode;
class OrNode;
class NotNode;
class ParensNode;
class WhereNode;
class OnNode;
class JoinNode;
class FromNode;
class SelectionNode;
class OrderByItemNode;
class OrderByNode;
class LimitNode;
class OffsetNode;
class ReturningNode;
class ColumnUpdateNode;
class ValuesNode;
class SelectQueryNode;
class InsertQueryNode;
class UpdateQueryNode;
class DeleteQueryNode;
class AlterTableNode;
class DropConstraintNode;
class DropColumnNode;
class DropTableNode;

// ---------------------------------------------------------------------------
// OperationNode
// ---------------------------------------------------------------------------

class OperationNode {
 public:
  virtual ~OperationNode() = default;

  OperationNode(const OperationNode&) = delete;
  OperationNode& operator=(const OperationNode&) = delete;

  NodeKind Kind() const { return kind_; }

 private:
  explicit OperationNode(NodeKind kind) : kind_(kind) {}

  friend class IdentifierNode;
  friend class SchemableIdentifierNode;
  friend class TableNode;
  friend class ColumnNode;
  friend class SelectAllNode;
  friend class ReferenceNode;
  friend class AliasNode;
  friend class ValueNode;
  friend class ValueListNode;
  friend class RawNode;
  friend class BinaryOperationNode;
  friend class AndNode;
  friend class OrNode;
  friend class NotNode;
  friend class ParensNode;
  friend class WhereNode;
  friend class OnNode;
  friend class JoinNode;
  friend class FromNode;
  friend class SelectionNode;
  friend class OrderByItemNode;
  friend class OrderByNode;
  friend class LimitNode;
  friend class OffsetNode;
  friend class ReturningNode;
  friend class ColumnUpdateNode;
  friend class ValuesNode;
  friend class SelectQueryNode;
  friend class InsertQueryNode;
  friend class UpdateQueryNode;
  friend class DeleteQueryNode;
  friend class AlterTableNode;
  friend class DropConstraintNode;
  friend class DropColumnNode;
  friend class DropTableNode;

  const NodeKind kind_;
};

template <typename T = OperationNode>
using NodePtr = std::unique_ptr<const T>;

template <typename T = OperationNode>
using NodeList = std::vector<NodePtr<T>>;

/// Narrow a node after T::Is(node) returned true.
template <typename T>
const T& NodeCast(const OperationNode& node) {
  return static_cast<const T&>(node);
}

/// Build a NodeList from move-only elements. Initializer lists cannot hold
/// unique_ptr, so builders use this instead.
template <typename T, typename... Nodes>
NodeList<T> MakeNodeList(Nodes&&... nodes) {
  NodeList<T> list;
  list.reserve(sizeof...(nodes));
  int unused[] = {0, (list.emplace_back(std::forward<Nodes>(nodes)), 0)...};
  (void)unused;
  return list;
}

}  // namespace qbpp
