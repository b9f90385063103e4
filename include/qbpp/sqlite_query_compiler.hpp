// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::SqliteQueryCompiler -- "identifiers" and ? placeholders.
// SQLite cannot drop a constraint with ALTER TABLE.

#pragma once

#include <string>

#include "qbpp/query_compiler.hpp"

namespace qbpp {

class SqliteQueryCompiler : public DefaultQueryCompiler {
 protected:
  const char* DialectName() const override { return "sqlite"; }

  bool SupportsNode(NodeKind kind) const override {
    return kind != NodeKind::kDropConstraint;
  }
};

}  // namespace qbpp
