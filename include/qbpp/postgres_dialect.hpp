// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::PostgresDialect -- PostgresDriver + PostgresQueryCompiler.

#pragma once

#include <memory>
#include <utility>

#include "qbpp/dialect.hpp"
#include "qbpp/postgres_dialect_config.hpp"
#include "qbpp/postgres_driver.hpp"
#include "qbpp/postgres_query_compiler.hpp"

namespace qbpp {

class PostgresDialect : public Dialect {
 public:
  explicit PostgresDialect(PostgresDialectConfig config)
      : config_(std::move(config)) {}

  std::unique_ptr<Driver> CreateDriver() const override {
    return std::unique_ptr<Driver>(new PostgresDriver(config_));
  }

  std::unique_ptr<QueryCompiler> CreateQueryCompiler() const override {
    return std::unique_ptr<QueryCompiler>(new PostgresQueryCompiler());
  }

 private:
  PostgresDialectConfig config_;
};

}  // namespace qbpp
