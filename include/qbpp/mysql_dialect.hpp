// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::MysqlDialect -- MysqlDriver + MysqlQueryCompiler.

#pragma once

#include <memory>
#include <utility>

#include "qbpp/dialect.hpp"
#include "qbpp/mysql_driver.hpp"
#include "qbpp/mysql_query_compiler.hpp"

namespace qbpp {

class MysqlDialect : public Dialect {
 public:
  explicit MysqlDialect(MysqlDialectConfig config)
      : config_(std::move(config)) {}

  std::unique_ptr<Driver> CreateDriver() const override {
    return std::unique_ptr<Driver>(new MysqlDriver(config_));
  }

  std::unique_ptr<QueryCompiler> CreateQueryCompiler() const override {
    return std::unique_ptr<QueryCompiler>(new MysqlQueryCompiler());
  }

 private:
  MysqlDialectConfig config_;
};

}  // namespace qbpp
