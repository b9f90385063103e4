// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::SqliteDialect -- SqliteDriver + SqliteQueryCompiler.

#pragma once

#include <memory>
#include <utility>

#include "qbpp/dialect.hpp"
#include "qbpp/sqlite_driver.hpp"
#include "qbpp/sqlite_query_compiler.hpp"

namespace qbpp {

class SqliteDialect : public Dialect {
 public:
  explicit SqliteDialect(SqliteDialectConfig config)
      : config_(std::move(config)) {}

  std::unique_ptr<Driver> CreateDriver() const override {
    return std::unique_ptr<Driver>(new SqliteDriver(config_));
  }

  std::unique_ptr<QueryCompiler> CreateQueryCompiler() const override {
    return std::unique_ptr<QueryCompiler>(new SqliteQueryCompiler());
  }

 private:
  SqliteDialectConfig config_;
};

}  // namespace qbpp
