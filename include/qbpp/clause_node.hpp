// Copyright (c) 2024 liudegui. MIT License.
//
// Clause nodes: where, on, join, from, selections, order by, limit,
// offset, returning, column updates and value rows.

#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "qbpp/identifier_node.hpp"
#include "qbpp/operation_node.hpp"
#include "qbpp/value_node.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// WhereNode / OnNode
// ---------------------------------------------------------------------------

class WhereNode final : public OperationNode {
 public:
  static NodePtr<WhereNode> Create(NodePtr<> filter) {
    return NodePtr<WhereNode>(new WhereNode(std::move(filter)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kWhere;
  }

  const OperationNode* Where() const { return where_.get(); }

 private:
  explicit WhereNode(NodePtr<> filter)
      : OperationNode(NodeKind::kWhere), where_(std::move(filter)) {}

  const NodePtr<> where_;
};

class OnNode final : public OperationNode {
 public:
  static NodePtr<OnNode> Create(NodePtr<> filter) {
    return NodePtr<OnNode>(new OnNode(std::move(filter)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kOn;
  }

  const OperationNode* On() const { return on_.get(); }

 private:
  explicit OnNode(NodePtr<> filter)
      : OperationNode(NodeKind::kOn), on_(std::move(filter)) {}

  const NodePtr<> on_;
};

// ---------------------------------------------------------------------------
// JoinNode
// ---------------------------------------------------------------------------

enum class JoinType : uint8_t {
  kInner = 0,
  kLeft,
  kRight,
  kFull,
};

inline const char* JoinTypeSql(JoinType type) {
  switch (type) {
    case JoinType::kInner: return "inner join";
    case JoinType::kLeft: return "left join";
    case JoinType::kRight: return "right join";
    case JoinType::kFull: return "full join";
  }
  return "inner join";
}

class JoinNode final : public OperationNode {
 public:
  /// `table` is a TableNode or an AliasNode. `on` may be null.
  static NodePtr<JoinNode> Create(JoinType type, NodePtr<> table,
                                  NodePtr<OnNode> on) {
    return NodePtr<JoinNode>(
        new JoinNode(type, std::move(table), std::move(on)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kJoin;
  }

  JoinType Type() const { return type_; }
  const OperationNode* Table() const { return table_.get(); }
  const OnNode* On() const { return on_.get(); }

 private:
  JoinNode(JoinType type, NodePtr<> table, NodePtr<OnNode> on)
      : OperationNode(NodeKind::kJoin),
        type_(type),
        table_(std::move(table)),
        on_(std::move(on)) {}

  const JoinType type_;
  const NodePtr<> table_;
  const NodePtr<OnNode> on_;
};

// ---------------------------------------------------------------------------
// FromNode
// ---------------------------------------------------------------------------

class FromNode final : public OperationNode {
 public:
  static NodePtr<FromNode> Create(NodeList<> froms) {
    return NodePtr<FromNode>(new FromNode(std::move(froms)));
  }

  static NodePtr<FromNode> Create(std::string table) {
    return Create(MakeNodeList<OperationNode>(TableNode::Create(std::move(table))));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kFrom;
  }

  const NodeList<>& Froms() const { return froms_; }

 private:
  explicit FromNode(NodeList<> froms)
      : OperationNode(NodeKind::kFrom), froms_(std::move(froms)) {}

  const NodeList<> froms_;
};

// ---------------------------------------------------------------------------
// SelectionNode
// ---------------------------------------------------------------------------

class SelectionNode final : public OperationNode {
 public:
  static NodePtr<SelectionNode> Create(NodePtr<> selection) {
    return NodePtr<SelectionNode>(new SelectionNode(std::move(selection)));
  }

  static NodePtr<SelectionNode> CreateSelectAll() {
    return Create(SelectAllNode::Create());
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kSelection;
  }

  const OperationNode* Selection() const { return selection_.get(); }

 private:
  explicit SelectionNode(NodePtr<> selection)
      : OperationNode(NodeKind::kSelection),
        selection_(std::move(selection)) {}

  const NodePtr<> selection_;
};

// ---------------------------------------------------------------------------
// OrderByItemNode / OrderByNode
// ---------------------------------------------------------------------------

enum class OrderDirection : uint8_t {
  kNone = 0,
  kAsc,
  kDesc,
};

class OrderByItemNode final : public OperationNode {
 public:
  static NodePtr<OrderByItemNode> Create(
      NodePtr<> order_by, OrderDirection direction = OrderDirection::kNone) {
    return NodePtr<OrderByItemNode>(
        new OrderByItemNode(std::move(order_by), direction));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kOrderByItem;
  }

  const OperationNode* OrderBy() const { return order_by_.get(); }
  OrderDirection Direction() const { return direction_; }

 private:
  OrderByItemNode(NodePtr<> order_by, OrderDirection direction)
      : OperationNode(NodeKind::kOrderByItem),
        order_by_(std::move(order_by)),
        direction_(direction) {}

  const NodePtr<> order_by_;
  const OrderDirection direction_;
};

class OrderByNode final : public OperationNode {
 public:
  static NodePtr<OrderByNode> Create(NodeList<OrderByItemNode> items) {
    return NodePtr<OrderByNode>(new OrderByNode(std::move(items)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kOrderBy;
  }

  const NodeList<OrderByItemNode>& Items() const { return items_; }

 private:
  explicit OrderByNode(NodeList<OrderByItemNode> items)
      : OperationNode(NodeKind::kOrderBy), items_(std::move(items)) {}

  const NodeList<OrderByItemNode> items_;
};

// ---------------------------------------------------------------------------
// LimitNode / OffsetNode
// ---------------------------------------------------------------------------

class LimitNode final : public OperationNode {
 public:
  static NodePtr<LimitNode> Create(NodePtr<> limit) {
    return NodePtr<LimitNode>(new LimitNode(std::move(limit)));
  }

  static NodePtr<LimitNode> Create(int64_t limit) {
    return Create(ValueNode::Create(qbpp::Value::Int(limit)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kLimit;
  }

  const OperationNode* Limit() const { return limit_.get(); }

 private:
  explicit LimitNode(NodePtr<> limit)
      : OperationNode(NodeKind::kLimit), limit_(std::move(limit)) {}

  const NodePtr<> limit_;
};

class OffsetNode final : public OperationNode {
 public:
  static NodePtr<OffsetNode> Create(NodePtr<> offset) {
    return NodePtr<OffsetNode>(new OffsetNode(std::move(offset)));
  }

  static NodePtr<OffsetNode> Create(int64_t offset) {
    return Create(ValueNode::Create(qbpp::Value::Int(offset)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kOffset;
  }

  const OperationNode* Offset() const { return offset_.get(); }

 private:
  explicit OffsetNode(NodePtr<> offset)
      : OperationNode(NodeKind::kOffset), offset_(std::move(offset)) {}

  const NodePtr<> offset_;
};

// ---------------------------------------------------------------------------
// ReturningNode
// ---------------------------------------------------------------------------

class ReturningNode final : public OperationNode {
 public:
  static NodePtr<ReturningNode> Create(NodeList<SelectionNode> selections) {
    return NodePtr<ReturningNode>(new ReturningNode(std::move(selections)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kReturning;
  }

  const NodeList<SelectionNode>& Selections() const { return selections_; }

 private:
  explicit ReturningNode(NodeList<SelectionNode> selections)
      : OperationNode(NodeKind::kReturning),
        selections_(std::move(selections)) {}

  const NodeList<SelectionNode> selections_;
};

// ---------------------------------------------------------------------------
// ColumnUpdateNode -- <column> = <value>
// ---------------------------------------------------------------------------

class ColumnUpdateNode final : public OperationNode {
 public:
  static NodePtr<ColumnUpdateNode> Create(NodePtr<ColumnNode> column,
                                          NodePtr<> value) {
    return NodePtr<ColumnUpdateNode>(
        new ColumnUpdateNode(std::move(column), std::move(value)));
  }

  static NodePtr<ColumnUpdateNode> Create(std::string column,
                                          qbpp::Value value) {
    return Create(ColumnNode::Create(std::move(column)),
                  ValueNode::Create(std::move(value)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kColumnUpdate;
  }

  const ColumnNode* Column() const { return column_.get(); }
  const OperationNode* Value() const { return value_.get(); }

 private:
  ColumnUpdateNode(NodePtr<ColumnNode> column, NodePtr<> value)
      : OperationNode(NodeKind::kColumnUpdate),
        column_(std::move(column)),
        value_(std::move(value)) {}

  const NodePtr<ColumnNode> column_;
  const NodePtr<> value_;
};

// ---------------------------------------------------------------------------
// ValuesNode -- values (...), (...)
// ---------------------------------------------------------------------------

class ValuesNode final : public OperationNode {
 public:
  static NodePtr<ValuesNode> Create(NodeList<ValueListNode> values) {
    return NodePtr<ValuesNode>(new ValuesNode(std::move(values)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kValues;
  }

  const NodeList<ValueListNode>& Values() const { return values_; }

 private:
  explicit ValuesNode(NodeList<ValueListNode> values)
      : OperationNode(NodeKind::kValues), values_(std::move(values)) {}

  const NodeList<ValueListNode> values_;
};

}  // namespace qbpp
