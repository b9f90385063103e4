// Copyright (c) 2024 liudegui. MIT License.
//
// Schema nodes: alter table and its alterations, drop table.

#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "qbpp/identifier_node.hpp"
#include "qbpp/operation_node.hpp"

namespace qbpp {

enum class DropModifier : uint8_t {
  kNone = 0,
  kCascade,
  kRestrict,
};

// ---------------------------------------------------------------------------
// DropConstraintNode -- drop constraint [if exists] <name> [cascade|restrict]
// ---------------------------------------------------------------------------

class DropConstraintNode final : public OperationNode {
 public:
  static NodePtr<DropConstraintNode> Create(
      std::string constraint_name, bool if_exists = false,
      DropModifier modifier = DropModifier::kNone) {
    return NodePtr<DropConstraintNode>(new DropConstraintNode(
        IdentifierNode::Create(std::move(constraint_name)), if_exists,
        modifier));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kDropConstraint;
  }

  const IdentifierNode& ConstraintName() const { return *constraint_name_; }
  bool IfExists() const { return if_exists_; }
  DropModifier Modifier() const { return modifier_; }

 private:
  DropConstraintNode(NodePtr<IdentifierNode> constraint_name, bool if_exists,
                     DropModifier modifier)
      : OperationNode(NodeKind::kDropConstraint),
        constraint_name_(std::move(constraint_name)),
        if_exists_(if_exists),
        modifier_(modifier) {}

  const NodePtr<IdentifierNode> constraint_name_;
  const bool if_exists_;
  const DropModifier modifier_;
};

// ---------------------------------------------------------------------------
// DropColumnNode
// ---------------------------------------------------------------------------

class DropColumnNode final : public OperationNode {
 public:
  static NodePtr<DropColumnNode> Create(std::string column) {
    return NodePtr<DropColumnNode>(
        new DropColumnNode(ColumnNode::Create(std::move(column))));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kDropColumn;
  }

  const ColumnNode& Column() const { return *column_; }

 private:
  explicit DropColumnNode(NodePtr<ColumnNode> column)
      : OperationNode(NodeKind::kDropColumn), column_(std::move(column)) {}

  const NodePtr<ColumnNode> column_;
};

// ---------------------------------------------------------------------------
// AlterTableNode
//
// Exactly one of rename_to, drop_constraint or column_alterations is set.
// ---------------------------------------------------------------------------

struct AlterTableParts {
  NodePtr<TableNode> table;
  NodePtr<TableNode> rename_to;
  NodePtr<DropConstraintNode> drop_constraint;
  NodeList<> column_alterations;  // DropColumnNode
};

class AlterTableNode final : public OperationNode {
 public:
  static NodePtr<AlterTableNode> Create(AlterTableParts parts) {
    return NodePtr<AlterTableNode>(new AlterTableNode(std::move(parts)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kAlterTable;
  }

  const TableNode* Table() const { return parts_.table.get(); }
  const TableNode* RenameTo() const { return parts_.rename_to.get(); }
  const DropConstraintNode* DropConstraint() const {
    return parts_.drop_constraint.get();
  }
  const NodeList<>& ColumnAlterations() const {
    return parts_.column_alterations;
  }

 private:
  explicit AlterTableNode(AlterTableParts parts)
      : OperationNode(NodeKind::kAlterTable), parts_(std::move(parts)) {}

  const AlterTableParts parts_;
};

// ---------------------------------------------------------------------------
// DropTableNode -- drop table [if exists] <table> [cascade]
// ---------------------------------------------------------------------------

class DropTableNode final : public OperationNode {
 public:
  static NodePtr<DropTableNode> Create(NodePtr<TableNode> table,
                                       bool if_exists = false,
                                       bool cascade = false) {
    return NodePtr<DropTableNode>(
        new DropTableNode(std::move(table), if_exists, cascade));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kDropTable;
  }

  const TableNode* Table() const { return table_.get(); }
  bool IfExists() const { return if_exists_; }
  bool Cascade() const { return cascade_; }

 private:
  DropTableNode(NodePtr<TableNode> table, bool if_exists, bool cascade)
      : OperationNode(NodeKind::kDropTable),
        table_(std::move(table)),
        if_exists_(if_exists),
        cascade_(cascade) {}

  const NodePtr<TableNode> table_;
  const bool if_exists_;
  const bool cascade_;
};

}  // namespace qbpp
