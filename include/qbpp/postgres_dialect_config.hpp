// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::PostgresDialectConfig -- how the postgres driver gets connections.
//
// Either a pool (pool mode) or one dedicated client (client mode). The
// mode is fixed when the config is built and never changes.
//
// Usage:
//   qbpp::PostgresDialectPoolConfig pool_config;
//   pool_config.pool = std::make_shared<qbpp::PqPool>(conninfo, 10);
//   pool_config.cursor = qbpp::MakeSqlCursorConstructor();
//   qbpp::PostgresDialect dialect(
//       qbpp::PostgresDialectConfig::FromPool(std::move(pool_config)));

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "qbpp/driver.hpp"
#include "qbpp/error.hpp"
#include "qbpp/postgres_client.hpp"

namespace qbpp {

using PostgresPoolFactory =
    std::function<Error(std::shared_ptr<PostgresPool>* out)>;
using PostgresClientFactory =
    std::function<Error(std::shared_ptr<PostgresSingleClient>* out)>;

struct PostgresDialectPoolConfig {
  /// The pool, or a factory called at most once by Driver::Init().
  std::shared_ptr<PostgresPool> pool;
  PostgresPoolFactory pool_factory;

  /// Required for StreamQuery().
  PostgresCursorConstructor cursor;

  /// Called once for every native handle the first time it is leased.
  ConnectionCreatedHook on_create_connection;
};

struct PostgresDialectClientConfig {
  /// The client, or a factory called at most once on first acquisition.
  std::shared_ptr<PostgresSingleClient> client;
  PostgresClientFactory client_factory;

  /// Required for StreamQuery().
  PostgresCursorConstructor cursor;
};

enum class PostgresConnectionMode : uint8_t {
  kPool = 0,
  kClient,
};

class PostgresDialectConfig {
 public:
  static PostgresDialectConfig FromPool(PostgresDialectPoolConfig config) {
    PostgresDialectConfig result(PostgresConnectionMode::kPool);
    result.pool_ = std::move(config);
    return result;
  }

  static PostgresDialectConfig FromClient(PostgresDialectClientConfig config) {
    PostgresDialectConfig result(PostgresConnectionMode::kClient);
    result.client_ = std::move(config);
    return result;
  }

  PostgresConnectionMode Mode() const { return mode_; }
  bool IsPoolMode() const { return mode_ == PostgresConnectionMode::kPool; }

  const PostgresDialectPoolConfig& pool_config() const { return pool_; }
  const PostgresDialectClientConfig& client_config() const { return client_; }

  const PostgresCursorConstructor& cursor() const {
    return IsPoolMode() ? pool_.cursor : client_.cursor;
  }

 private:
  explicit PostgresDialectConfig(PostgresConnectionMode mode) : mode_(mode) {}

  PostgresConnectionMode mode_;
  PostgresDialectPoolConfig pool_;
  PostgresDialectClientConfig client_;
};

}  // namespace qbpp
