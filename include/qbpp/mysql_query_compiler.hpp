// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::MysqlQueryCompiler -- `identifiers` and ? placeholders.
// MySQL has no RETURNING clause.

#pragma once

#include <string>

#include "qbpp/query_compiler.hpp"

namespace qbpp {

class MysqlQueryCompiler : public DefaultQueryCompiler {
 protected:
  const char* DialectName() const override { return "mysql"; }
  char LeftIdentifierWrapper() const override { return '`'; }
  char RightIdentifierWrapper() const override { return '`'; }

  bool SupportsNode(NodeKind kind) const override {
    return kind != NodeKind::kReturning;
  }
};

}  // namespace qbpp
