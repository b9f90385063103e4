// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::CompiledQuery -- the hand-off between compiler and driver.
//
// Invariant: parameters.size() equals the number of placeholders in sql,
// in the order the placeholders appear.

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "qbpp/value.hpp"

namespace qbpp {

struct CompiledQuery {
  std::string sql;
  std::vector<Value> parameters;

  static CompiledQuery Raw(std::string sql,
                           std::vector<Value> parameters = {}) {
    CompiledQuery query;
    query.sql = std::move(sql);
    query.parameters = std::move(parameters);
    return query;
  }
};

}  // namespace qbpp
