// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::Dialect -- factory for the driver and compiler of one backend.

#pragma once

#include <memory>

#include "qbpp/driver.hpp"
#include "qbpp/query_compiler.hpp"

namespace qbpp {

class Dialect {
 public:
  virtual ~Dialect() = default;

  virtual std::unique_ptr<Driver> CreateDriver() const = 0;
  virtual std::unique_ptr<QueryCompiler> CreateQueryCompiler() const = 0;
};

}  // namespace qbpp
