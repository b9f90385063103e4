// Copyright (c) 2024 liudegui. MIT License.
//
// Name nodes: identifiers, tables, columns, references, aliases.

#pragma once

#include <string>
#include <utility>

#include "qbpp/operation_node.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// IdentifierNode -- a bare name, quoted by the dialect on output
// ---------------------------------------------------------------------------

class IdentifierNode final : public OperationNode {
 public:
  static NodePtr<IdentifierNode> Create(std::string name) {
    return NodePtr<IdentifierNode>(new IdentifierNode(std::move(name)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kIdentifier;
  }

  const std::string& Name() const { return name_; }

 private:
  explicit IdentifierNode(std::string name)
      : OperationNode(NodeKind::kIdentifier), name_(std::move(name)) {}

  const std::string name_;
};

// ---------------------------------------------------------------------------
// SchemableIdentifierNode -- [schema.]name
// ---------------------------------------------------------------------------

class SchemableIdentifierNode final : public OperationNode {
 public:
  static NodePtr<SchemableIdentifierNode> Create(std::string name) {
    return NodePtr<SchemableIdentifierNode>(new SchemableIdentifierNode(
        nullptr, IdentifierNode::Create(std::move(name))));
  }

  static NodePtr<SchemableIdentifierNode> CreateWithSchema(
      std::string schema, std::string name) {
    return NodePtr<SchemableIdentifierNode>(new SchemableIdentifierNode(
        IdentifierNode::Create(std::move(schema)),
        IdentifierNode::Create(std::move(name))));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kSchemableIdentifier;
  }

  /// May be null.
  const IdentifierNode* Schema() const { return schema_.get(); }
  const IdentifierNode& Identifier() const { return *identifier_; }

 private:
  SchemableIdentifierNode(NodePtr<IdentifierNode> schema,
                          NodePtr<IdentifierNode> identifier)
      : OperationNode(NodeKind::kSchemableIdentifier),
        schema_(std::move(schema)),
        identifier_(std::move(identifier)) {}

  const NodePtr<IdentifierNode> schema_;
  const NodePtr<IdentifierNode> identifier_;
};

// ---------------------------------------------------------------------------
// TableNode
// ---------------------------------------------------------------------------

class TableNode final : public OperationNode {
 public:
  static NodePtr<TableNode> Create(std::string table) {
    return NodePtr<TableNode>(
        new TableNode(SchemableIdentifierNode::Create(std::move(table))));
  }

  static NodePtr<TableNode> CreateWithSchema(std::string schema,
                                             std::string table) {
    return NodePtr<TableNode>(new TableNode(
        SchemableIdentifierNode::CreateWithSchema(std::move(schema),
                                                  std::move(table))));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kTable;
  }

  const SchemableIdentifierNode& Table() const { return *table_; }

 private:
  explicit TableNode(NodePtr<SchemableIdentifierNode> table)
      : OperationNode(NodeKind::kTable), table_(std::move(table)) {}

  const NodePtr<SchemableIdentifierNode> table_;
};

// ---------------------------------------------------------------------------
// ColumnNode
// ---------------------------------------------------------------------------

class ColumnNode final : public OperationNode {
 public:
  static NodePtr<ColumnNode> Create(std::string column) {
    return NodePtr<ColumnNode>(
        new ColumnNode(IdentifierNode::Create(std::move(column))));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kColumn;
  }

  const IdentifierNode& Column() const { return *column_; }

 private:
  explicit ColumnNode(NodePtr<IdentifierNode> column)
      : OperationNode(NodeKind::kColumn), column_(std::move(column)) {}

  const NodePtr<IdentifierNode> column_;
};

// ---------------------------------------------------------------------------
// SelectAllNode -- *
// ---------------------------------------------------------------------------

class SelectAllNode final : public OperationNode {
 public:
  static NodePtr<SelectAllNode> Create() {
    return NodePtr<SelectAllNode>(new SelectAllNode());
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kSelectAll;
  }

 private:
  SelectAllNode() : OperationNode(NodeKind::kSelectAll) {}
};

// ---------------------------------------------------------------------------
// ReferenceNode -- [table.]column or [table.]*
// ---------------------------------------------------------------------------

class ReferenceNode final : public OperationNode {
 public:
  static NodePtr<ReferenceNode> Create(NodePtr<ColumnNode> column,
                                       NodePtr<TableNode> table = nullptr) {
    return NodePtr<ReferenceNode>(
        new ReferenceNode(std::move(column), std::move(table)));
  }

  /// "table.column"
  static NodePtr<ReferenceNode> Create(std::string table, std::string column) {
    return Create(ColumnNode::Create(std::move(column)),
                  TableNode::Create(std::move(table)));
  }

  static NodePtr<ReferenceNode> CreateSelectAll(NodePtr<TableNode> table) {
    return NodePtr<ReferenceNode>(
        new ReferenceNode(SelectAllNode::Create(), std::move(table)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kReference;
  }

  /// May be null.
  const TableNode* Table() const { return table_.get(); }

  /// A ColumnNode or a SelectAllNode.
  const OperationNode* Column() const { return column_.get(); }

 private:
  ReferenceNode(NodePtr<> column, NodePtr<TableNode> table)
      : OperationNode(NodeKind::kReference),
        table_(std::move(table)),
        column_(std::move(column)) {}

  const NodePtr<TableNode> table_;
  const NodePtr<> column_;
};

// ---------------------------------------------------------------------------
// AliasNode -- <node> as <alias>
// ---------------------------------------------------------------------------

class AliasNode final : public OperationNode {
 public:
  static NodePtr<AliasNode> Create(NodePtr<> node, std::string alias) {
    return NodePtr<AliasNode>(new AliasNode(
        std::move(node), IdentifierNode::Create(std::move(alias))));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kAlias;
  }

  const OperationNode* Node() const { return node_.get(); }
  const IdentifierNode& Alias() const { return *alias_; }

 private:
  AliasNode(NodePtr<> node, NodePtr<IdentifierNode> alias)
      : OperationNode(NodeKind::kAlias),
        node_(std::move(node)),
        alias_(std::move(alias)) {}

  const NodePtr<> node_;
  const NodePtr<IdentifierNode> alias_;
};

}  // namespace qbpp
