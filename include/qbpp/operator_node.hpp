// Copyright (c) 2024 liudegui. MIT License.
//
// Expression nodes: binary operations, and/or/not, parentheses.

#pragma once

#include <cstdint>
#include <utility>

#include "qbpp/operation_node.hpp"

namespace qbpp {

enum class BinaryOperator : uint8_t {
  kEq = 0,
  kNotEq,
  kLt,
  kLtEq,
  kGt,
  kGtEq,
  kLike,
  kNotLike,
  kIn,
  kNotIn,
  kIs,
  kIsNot,
  kAdd,
  kSub,
  kMul,
  kDiv,
};

inline const char* BinaryOperatorSql(BinaryOperator op) {
  switch (op) {
    case BinaryOperator::kEq: return "=";
    case BinaryOperator::kNotEq: return "<>";
    case BinaryOperator::kLt: return "<";
    case BinaryOperator::kLtEq: return "<=";
    case BinaryOperator::kGt: return ">";
    case BinaryOperator::kGtEq: return ">=";
    case BinaryOperator::kLike: return "like";
    case BinaryOperator::kNotLike: return "not like";
    case BinaryOperator::kIn: return "in";
    case BinaryOperator::kNotIn: return "not in";
    case BinaryOperator::kIs: return "is";
    case BinaryOperator::kIsNot: return "is not";
    case BinaryOperator::kAdd: return "+";
    case BinaryOperator::kSub: return "-";
    case BinaryOperator::kMul: return "*";
    case BinaryOperator::kDiv: return "/";
  }
  return "=";
}

// ---------------------------------------------------------------------------
// BinaryOperationNode -- <left> <op> <right>
// ---------------------------------------------------------------------------

class BinaryOperationNode final : public OperationNode {
 public:
  static NodePtr<BinaryOperationNode> Create(NodePtr<> left,
                                             BinaryOperator op,
                                             NodePtr<> right) {
    return NodePtr<BinaryOperationNode>(
        new BinaryOperationNode(std::move(left), op, std::move(right)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kBinaryOperation;
  }

  const OperationNode* Left() const { return left_.get(); }
  BinaryOperator Operator() const { return op_; }
  const OperationNode* Right() const { return right_.get(); }

 private:
  BinaryOperationNode(NodePtr<> left, BinaryOperator op, NodePtr<> right)
      : OperationNode(NodeKind::kBinaryOperation),
        left_(std::move(left)),
        op_(op),
        right_(std::move(right)) {}

  const NodePtr<> left_;
  const BinaryOperator op_;
  const NodePtr<> right_;
};

// ---------------------------------------------------------------------------
// AndNode / OrNode
// ---------------------------------------------------------------------------

class AndNode final : public OperationNode {
 public:
  static NodePtr<AndNode> Create(NodePtr<> left, NodePtr<> right) {
    return NodePtr<AndNode>(new AndNode(std::move(left), std::move(right)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kAnd;
  }

  const OperationNode* Left() const { return left_.get(); }
  const OperationNode* Right() const { return right_.get(); }

 private:
  AndNode(NodePtr<> left, NodePtr<> right)
      : OperationNode(NodeKind::kAnd),
        left_(std::move(left)),
        right_(std::move(right)) {}

  const NodePtr<> left_;
  const NodePtr<> right_;
};

class OrNode final : public OperationNode {
 public:
  static NodePtr<OrNode> Create(NodePtr<> left, NodePtr<> right) {
    return NodePtr<OrNode>(new OrNode(std::move(left), std::move(right)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kOr;
  }

  const OperationNode* Left() const { return left_.get(); }
  const OperationNode* Right() const { return right_.get(); }

 private:
  OrNode(NodePtr<> left, NodePtr<> right)
      : OperationNode(NodeKind::kOr),
        left_(std::move(left)),
        right_(std::move(right)) {}

  const NodePtr<> left_;
  const NodePtr<> right_;
};

// ---------------------------------------------------------------------------
// NotNode -- not <expr>
// ---------------------------------------------------------------------------

class NotNode final : public OperationNode {
 public:
  static NodePtr<NotNode> Create(NodePtr<> expression) {
    return NodePtr<NotNode>(new NotNode(std::move(expression)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kNot;
  }

  const OperationNode* Expression() const { return expression_.get(); }

 private:
  explicit NotNode(NodePtr<> expression)
      : OperationNode(NodeKind::kNot), expression_(std::move(expression)) {}

  const NodePtr<> expression_;
};

// ---------------------------------------------------------------------------
// ParensNode -- (<expr>)
// ---------------------------------------------------------------------------

class ParensNode final : public OperationNode {
 public:
  static NodePtr<ParensNode> Create(NodePtr<> expression) {
    return NodePtr<ParensNode>(new ParensNode(std::move(expression)));
  }

  static bool Is(const OperationNode& node) {
    return node.Kind() == NodeKind::kParens;
  }

  const OperationNode* Expression() const { return expression_.get(); }

 private:
  explicit ParensNode(NodePtr<> expression)
      : OperationNode(NodeKind::kParens), expression_(std::move(expression)) {}

  const NodePtr<> expression_;
};

}  // namespace qbpp
