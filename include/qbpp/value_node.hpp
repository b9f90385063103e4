// Copyright (c) 2024 liudegui. MIT License.
//
// Value nodes: bound parameters, value lists and raw SQL.

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "qbpp/operation_node.hpp"
#include "qbpp/value.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// ValueNode -- one bound parameter
// ---------------------------------------------------------------------------

class ValueNode final : public OperationNode {
 public:
  static NodePtr<ValueNode> Create(qbpp::Value value) {
    return NodePtr<ValueNode>(new ValueNode(std::move(value)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kValue;
  }

  const qbpp::Value& Value() const { return value_; }

 private:
  explicit ValueNode(qbpp::Value value)
      : OperationNode(NodeKind::kValue), value_(std::move(value)) {}

  const qbpp::Value value_;
};

// ---------------------------------------------------------------------------
// ValueListNode -- (a, b, c)
// ---------------------------------------------------------------------------

class ValueListNode final : public OperationNode {
 public:
  static NodePtr<ValueListNode> Create(NodeList<> values) {
    return NodePtr<ValueListNode>(new ValueListNode(std::move(values)));
  }

  /// Shorthand for a list of plain parameters.
  static NodePtr<ValueListNode> CreateFromValues(
      const std::vector<qbpp::Value>& values) {
    NodeList<> nodes;
    nodes.reserve(values.size());
    for (const auto& v : values) {
      nodes.emplace_back(ValueNode::Create(v));
    }
    return Create(std::move(nodes));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kValueList;
  }

  const NodeList<>& Values() const { return values_; }

 private:
  explicit ValueListNode(NodeList<> values)
      : OperationNode(NodeKind::kValueList), values_(std::move(values)) {}

  const NodeList<> values_;
};

// ---------------------------------------------------------------------------
// RawNode -- SQL fragments interleaved with parameter nodes
//
// Rendered as fragment[0] param[0] fragment[1] ... fragment[n]. A well
// formed node has exactly one more fragment than parameters.
// ---------------------------------------------------------------------------

class RawNode final : public OperationNode {
 public:
  static NodePtr<RawNode> Create(std::vector<std::string> sql_fragments,
                                 NodeList<> parameters) {
    return NodePtr<RawNode>(
        new RawNode(std::move(sql_fragments), std::move(parameters)));
  }

  static NodePtr<RawNode> CreateWithSql(std::string sql) {
    std::vector<std::string> fragments;
    fragments.push_back(std::move(sql));
    return Create(std::move(fragments), NodeList<>{});
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kRaw;
  }

  const std::vector<std::string>& SqlFragments() const {
    return sql_fragments_;
  }
  const NodeList<>& Parameters() const { return parameters_; }

 private:
  RawNode(std::vector<std::string> sql_fragments, NodeList<> parameters)
      : OperationNode(NodeKind::kRaw),
        sql_fragments_(std::move(sql_fragments)),
        parameters_(std::move(parameters)) {}

  const std::vector<std::string> sql_fragments_;
  const NodeList<> parameters_;
};

}  // namespace qbpp
