// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::PostgresQueryCompiler -- "identifiers" and $1, $2, ... placeholders.

#pragma once

#include <string>

#include "qbpp/query_compiler.hpp"

namespace qbpp {

class PostgresQueryCompiler : public DefaultQueryCompiler {
 protected:
  const char* DialectName() const override { return "postgres"; }

  void AppendParameterPlaceholder(size_t index,
                                  std::string* sql) const override {
    sql->push_back('$');
    *sql += std::to_string(index);
  }
};

}  // namespace qbpp
