// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::QueryCompiler -- renders a syntax tree into SQL text + parameters.
//
// Design:
//   - QueryCompiler is the dialect-neutral interface used by drivers and
//     the Database facade
//   - DefaultQueryCompiler walks the tree with a switch over NodeKind and
//     renders every kind with lowercase keywords in conventional clause
//     order. Dialects override only the policy hooks: identifier
//     wrappers, parameter placeholders and the set of supported kinds.
//   - All per-call state lives in a local Context, so a compiler instance
//     is stateless, reusable from several threads, and deterministic
//   - Nothing is written to the output until the whole tree rendered, so
//     an unsupported node never leaves partial SQL behind

#pragma once

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "qbpp/compiled_query.hpp"
#include "qbpp/error.hpp"
#include "qbpp/nodes.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// QueryCompiler
// ---------------------------------------------------------------------------

class QueryCompiler {
 public:
  virtual ~QueryCompiler() = default;

  /// Compile `root` into `out`. On failure `out` is left untouched.
  virtual Error Compile(const OperationNode& root,
                        CompiledQuery* out) const = 0;
};

// ---------------------------------------------------------------------------
// DefaultQueryCompiler
// ---------------------------------------------------------------------------

class DefaultQueryCompiler : public QueryCompiler {
 public:
  Error Compile(const OperationNode& root, CompiledQuery* out) const override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    Context ctx;
    Error err = Visit(&root, ctx);
    if (!err.ok()) { return err; }
    out->sql = std::move(ctx.sql);
    out->parameters = std::move(ctx.parameters);
    return Error::Ok();
  }

 protected:
  // --- Dialect policies ---

  virtual const char* DialectName() const { return "default"; }
  virtual char LeftIdentifierWrapper() const { return '"'; }
  virtual char RightIdentifierWrapper() const { return '"'; }

  /// Emit the placeholder for the parameter at 1-based `index`.
  virtual void AppendParameterPlaceholder(size_t index,
                                          std::string* sql) const {
    (void)index;
    sql->push_back('?');
  }

  virtual bool SupportsNode(NodeKind kind) const {
    (void)kind;
    return true;
  }

 private:
  struct Context {
    std::string sql;
    std::vector<Value> parameters;
    std::vector<NodeKind> path;  // kinds from the root to the current node
  };

  // --- Traversal ---

  Error Visit(const OperationNode* node, Context& ctx) const {
    if (node == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "missing required child node");
    }
    if (!SupportsNode(node->Kind())) {
      return Error::Format(ErrorCode::kUnsupportedNode,
                           "%s is not supported by the %s dialect",
                           NodeKindName(node->Kind()), DialectName());
    }
    ctx.path.push_back(node->Kind());
    Error err = Dispatch(*node, ctx);
    ctx.path.pop_back();
    return err;
  }

  template <typename T>
  Error VisitList(const NodeList<T>& nodes, const char* separator,
                  Context& ctx) const {
    for (size_t i = 0; i < nodes.size(); ++i) {
      if (i > 0) { ctx.sql += separator; }
      Error err = Visit(nodes[i].get(), ctx);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  /// Visit an optional clause, preceded by a single space.
  Error VisitOptional(const OperationNode* node, Context& ctx) const {
    if (node == nullptr) { return Error::Ok(); }
    ctx.sql.push_back(' ');
    return Visit(node, ctx);
  }

  static bool HasParent(const Context& ctx) { return ctx.path.size() > 1; }

  static NodeKind ParentKind(const Context& ctx) {
    return ctx.path[ctx.path.size() - 2];
  }

  Error Dispatch(const OperationNode& node, Context& ctx) const {
    switch (node.Kind()) {
      case NodeKind::kIdentifier:
        AppendIdentifier(NodeCast<IdentifierNode>(node).Name(), ctx);
        return Error::Ok();
      case NodeKind::kSchemableIdentifier:
        return VisitSchemableIdentifier(
            NodeCast<SchemableIdentifierNode>(node), ctx);
      case NodeKind::kTable:
        return Visit(&NodeCast<TableNode>(node).Table(), ctx);
      case NodeKind::kColumn:
        return Visit(&NodeCast<ColumnNode>(node).Column(), ctx);
      case NodeKind::kSelectAll:
        ctx.sql.push_back('*');
        return Error::Ok();
      case NodeKind::kReference:
        return VisitReference(NodeCast<ReferenceNode>(node), ctx);
      case NodeKind::kAlias:
        return VisitAlias(NodeCast<AliasNode>(node), ctx);
      case NodeKind::kValue:
        AppendValue(NodeCast<ValueNode>(node).Value(), ctx);
        return Error::Ok();
      case NodeKind::kValueList:
        return VisitValueList(NodeCast<ValueListNode>(node), ctx);
      case NodeKind::kRaw:
        return VisitRaw(NodeCast<RawNode>(node), ctx);
      case NodeKind::kBinaryOperation:
        return VisitBinaryOperation(NodeCast<BinaryOperationNode>(node), ctx);
      case NodeKind::kAnd: {
        const auto& n = NodeCast<AndNode>(node);
        return VisitConnective(n.Left(), " and ", n.Right(), ctx);
      }
      case NodeKind::kOr: {
        const auto& n = NodeCast<OrNode>(node);
        return VisitConnective(n.Left(), " or ", n.Right(), ctx);
      }
      case NodeKind::kNot:
        ctx.sql += "not ";
        return Visit(NodeCast<NotNode>(node).Expression(), ctx);
      case NodeKind::kParens: {
        ctx.sql.push_back('(');
        Error err = Visit(NodeCast<ParensNode>(node).Expression(), ctx);
        ctx.sql.push_back(')');
        return err;
      }
      case NodeKind::kWhere:
        ctx.sql += "where ";
        return Visit(NodeCast<WhereNode>(node).Where(), ctx);
      case NodeKind::kOn:
        ctx.sql += "on ";
        return Visit(NodeCast<OnNode>(node).On(), ctx);
      case NodeKind::kJoin:
        return VisitJoin(NodeCast<JoinNode>(node), ctx);
      case NodeKind::kFrom:
        ctx.sql += "from ";
        return VisitList(NodeCast<FromNode>(node).Froms(), ", ", ctx);
      case NodeKind::kSelection:
        return Visit(NodeCast<SelectionNode>(node).Selection(), ctx);
      case NodeKind::kOrderByItem:
        return VisitOrderByItem(NodeCast<OrderByItemNode>(node), ctx);
      case NodeKind::kOrderBy:
        ctx.sql += "order by ";
        return VisitList(NodeCast<OrderByNode>(node).Items(), ", ", ctx);
      case NodeKind::kLimit:
        ctx.sql += "limit ";
        return Visit(NodeCast<LimitNode>(node).Limit(), ctx);
      case NodeKind::kOffset:
        ctx.sql += "offset ";
        return Visit(NodeCast<OffsetNode>(node).Offset(), ctx);
      case NodeKind::kReturning:
        ctx.sql += "returning ";
        return VisitList(NodeCast<ReturningNode>(node).Selections(), ", ",
                         ctx);
      case NodeKind::kColumnUpdate:
        return VisitColumnUpdate(NodeCast<ColumnUpdateNode>(node), ctx);
      case NodeKind::kValues:
        ctx.sql += "values ";
        return VisitList(NodeCast<ValuesNode>(node).Values(), ", ", ctx);
      case NodeKind::kSelectQuery:
        return VisitSelectQuery(NodeCast<SelectQueryNode>(node), ctx);
      case NodeKind::kInsertQuery:
        return VisitInsertQuery(NodeCast<InsertQueryNode>(node), ctx);
      case NodeKind::kUpdateQuery:
        return VisitUpdateQuery(NodeCast<UpdateQueryNode>(node), ctx);
      case NodeKind::kDeleteQuery:
        return VisitDeleteQuery(NodeCast<DeleteQueryNode>(node), ctx);
      case NodeKind::kAlterTable:
        return VisitAlterTable(NodeCast<AlterTableNode>(node), ctx);
      case NodeKind::kDropConstraint:
        return VisitDropConstraint(NodeCast<DropConstraintNode>(node), ctx);
      case NodeKind::kDropColumn:
        ctx.sql += "drop column ";
        return Visit(&NodeCast<DropColumnNode>(node).Column(), ctx);
      case NodeKind::kDropTable:
        return VisitDropTable(NodeCast<DropTableNode>(node), ctx);
    }
    return Error::Format(ErrorCode::kUnsupportedNode, "unknown node kind %d",
                         static_cast<int>(node.Kind()));
  }

  // --- Leaves ---

  void AppendIdentifier(const std::string& name, Context& ctx) const {
    const char left = LeftIdentifierWrapper();
    const char right = RightIdentifierWrapper();
    ctx.sql.push_back(left);
    for (char c : name) {
      // A wrapper character inside the name is escaped by doubling it.
      if (c == right) { ctx.sql.push_back(right); }
      ctx.sql.push_back(c);
    }
    ctx.sql.push_back(right);
  }

  void AppendValue(const Value& value, Context& ctx) const {
    ctx.parameters.push_back(value);
    AppendParameterPlaceholder(ctx.parameters.size(), &ctx.sql);
  }

  // --- Names ---

  Error VisitSchemableIdentifier(const SchemableIdentifierNode& node,
                                 Context& ctx) const {
    if (node.Schema() != nullptr) {
      Error err = Visit(node.Schema(), ctx);
      if (!err.ok()) { return err; }
      ctx.sql.push_back('.');
    }
    return Visit(&node.Identifier(), ctx);
  }

  Error VisitReference(const ReferenceNode& node, Context& ctx) const {
    if (node.Table() != nullptr) {
      Error err = Visit(node.Table(), ctx);
      if (!err.ok()) { return err; }
      ctx.sql.push_back('.');
    }
    return Visit(node.Column(), ctx);
  }

  Error VisitAlias(const AliasNode& node, Context& ctx) const {
    Error err = Visit(node.Node(), ctx);
    if (!err.ok()) { return err; }
    ctx.sql += " as ";
    return Visit(&node.Alias(), ctx);
  }

  // --- Values ---

  Error VisitValueList(const ValueListNode& node, Context& ctx) const {
    ctx.sql.push_back('(');
    Error err = VisitList(node.Values(), ", ", ctx);
    ctx.sql.push_back(')');
    return err;
  }

  Error VisitRaw(const RawNode& node, Context& ctx) const {
    const auto& fragments = node.SqlFragments();
    const auto& params = node.Parameters();
    if (fragments.size() != params.size() + 1) {
      return Error::Format(ErrorCode::kMisuse,
                           "raw node has %zu fragments for %zu parameters",
                           fragments.size(), params.size());
    }
    for (size_t i = 0; i < params.size(); ++i) {
      ctx.sql += fragments[i];
      Error err = Visit(params[i].get(), ctx);
      if (!err.ok()) { return err; }
    }
    ctx.sql += fragments.back();
    return Error::Ok();
  }

  // --- Expressions ---

  Error VisitBinaryOperation(const BinaryOperationNode& node,
                             Context& ctx) const {
    Error err = Visit(node.Left(), ctx);
    if (!err.ok()) { return err; }
    ctx.sql.push_back(' ');
    ctx.sql += BinaryOperatorSql(node.Operator());
    ctx.sql.push_back(' ');
    return Visit(node.Right(), ctx);
  }

  Error VisitConnective(const OperationNode* left, const char* connective,
                        const OperationNode* right, Context& ctx) const {
    Error err = Visit(left, ctx);
    if (!err.ok()) { return err; }
    ctx.sql += connective;
    return Visit(right, ctx);
  }

  // --- Clauses ---

  Error VisitJoin(const JoinNode& node, Context& ctx) const {
    ctx.sql += JoinTypeSql(node.Type());
    ctx.sql.push_back(' ');
    Error err = Visit(node.Table(), ctx);
    if (!err.ok()) { return err; }
    return VisitOptional(node.On(), ctx);
  }

  Error VisitOrderByItem(const OrderByItemNode& node, Context& ctx) const {
    Error err = Visit(node.OrderBy(), ctx);
    if (!err.ok()) { return err; }
    if (node.Direction() == OrderDirection::kAsc) {
      ctx.sql += " asc";
    } else if (node.Direction() == OrderDirection::kDesc) {
      ctx.sql += " desc";
    }
    return Error::Ok();
  }

  Error VisitColumnUpdate(const ColumnUpdateNode& node, Context& ctx) const {
    Error err = Visit(node.Column(), ctx);
    if (!err.ok()) { return err; }
    ctx.sql += " = ";
    return Visit(node.Value(), ctx);
  }

  // --- Queries ---

  Error VisitSelectQuery(const SelectQueryNode& node, Context& ctx) const {
    // Sub-selects are parenthesized unless the parent already does it.
    const bool wrap = HasParent(ctx) &&
                      ParentKind(ctx) != NodeKind::kParens &&
                      ParentKind(ctx) != NodeKind::kInsertQuery;
    if (wrap) { ctx.sql.push_back('('); }

    ctx.sql += "select";
    if (node.Distinct()) { ctx.sql += " distinct"; }
    if (!node.Selections().empty()) {
      ctx.sql.push_back(' ');
      Error err = VisitList(node.Selections(), ", ", ctx);
      if (!err.ok()) { return err; }
    }

    Error err = VisitOptional(node.From(), ctx);
    if (!err.ok()) { return err; }
    for (const auto& join : node.Joins()) {
      err = VisitOptional(join.get(), ctx);
      if (!err.ok()) { return err; }
    }
    err = VisitOptional(node.Where(), ctx);
    if (!err.ok()) { return err; }
    err = VisitOptional(node.OrderBy(), ctx);
    if (!err.ok()) { return err; }
    err = VisitOptional(node.Limit(), ctx);
    if (!err.ok()) { return err; }
    err = VisitOptional(node.Offset(), ctx);
    if (!err.ok()) { return err; }

    if (wrap) { ctx.sql.push_back(')'); }
    return Error::Ok();
  }

  Error VisitInsertQuery(const InsertQueryNode& node, Context& ctx) const {
    ctx.sql += "insert into ";
    Error err = Visit(node.Into(), ctx);
    if (!err.ok()) { return err; }
    if (!node.Columns().empty()) {
      ctx.sql += " (";
      err = VisitList(node.Columns(), ", ", ctx);
      if (!err.ok()) { return err; }
      ctx.sql.push_back(')');
    }
    err = VisitOptional(node.Values(), ctx);
    if (!err.ok()) { return err; }
    return VisitOptional(node.Returning(), ctx);
  }

  Error VisitUpdateQuery(const UpdateQueryNode& node, Context& ctx) const {
    if (node.Updates().empty()) {
      return Error::Make(ErrorCode::kMisuse, "update query has no updates");
    }
    ctx.sql += "update ";
    Error err = Visit(node.Table(), ctx);
    if (!err.ok()) { return err; }
    ctx.sql += " set ";
    err = VisitList(node.Updates(), ", ", ctx);
    if (!err.ok()) { return err; }
    err = VisitOptional(node.Where(), ctx);
    if (!err.ok()) { return err; }
    return VisitOptional(node.Returning(), ctx);
  }

  Error VisitDeleteQuery(const DeleteQueryNode& node, Context& ctx) const {
    ctx.sql += "delete ";
    Error err = Visit(node.From(), ctx);
    if (!err.ok()) { return err; }
    err = VisitOptional(node.Where(), ctx);
    if (!err.ok()) { return err; }
    return VisitOptional(node.Returning(), ctx);
  }

  // --- Schema ---

  Error VisitAlterTable(const AlterTableNode& node, Context& ctx) const {
    ctx.sql += "alter table ";
    Error err = Visit(node.Table(), ctx);
    if (!err.ok()) { return err; }

    if (node.RenameTo() != nullptr) {
      ctx.sql += " rename to ";
      return Visit(node.RenameTo(), ctx);
    }
    if (node.DropConstraint() != nullptr) {
      return VisitOptional(node.DropConstraint(), ctx);
    }
    if (!node.ColumnAlterations().empty()) {
      ctx.sql.push_back(' ');
      return VisitList(node.ColumnAlterations(), ", ", ctx);
    }
    return Error::Make(ErrorCode::kMisuse, "alter table node has no alteration");
  }

  Error VisitDropConstraint(const DropConstraintNode& node,
                            Context& ctx) const {
    ctx.sql += "drop constraint ";
    if (node.IfExists()) { ctx.sql += "if exists "; }
    Error err = Visit(&node.ConstraintName(), ctx);
    if (!err.ok()) { return err; }
    if (node.Modifier() == DropModifier::kCascade) {
      ctx.sql += " cascade";
    } else if (node.Modifier() == DropModifier::kRestrict) {
      ctx.sql += " restrict";
    }
    return Error::Ok();
  }

  Error VisitDropTable(const DropTableNode& node, Context& ctx) const {
    ctx.sql += "drop table ";
    if (node.IfExists()) { ctx.sql += "if exists "; }
    Error err = Visit(node.Table(), ctx);
    if (!err.ok()) { return err; }
    if (node.Cascade()) { ctx.sql += " cascade"; }
    return Error::Ok();
  }
};

}  // namespace qbpp
