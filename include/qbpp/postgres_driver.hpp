// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::PostgresDriver / qbpp::PostgresConnection -- the postgres driver.
//
// Design:
//   - Pool mode: Init() resolves the pool once; every acquisition leases a
//     handle and maps it to its wrapper through a ConnectionRegistry
//   - Client mode: the first acquisition resolves and connects the client;
//     every later one returns the same wrapper
//   - A wrapper records at creation whether its handle is pooled, and
//     release only hands pooled handles back
//   - Transactions are plain statements on the acquired connection
//
// Thread safety: resolution of the pool and of the single client is
// serialized by the driver mutex. One connection is used by one thread at
// a time.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "qbpp/connection_registry.hpp"
#include "qbpp/database_connection.hpp"
#include "qbpp/driver.hpp"
#include "qbpp/error.hpp"
#include "qbpp/log.hpp"
#include "qbpp/postgres_client.hpp"
#include "qbpp/postgres_dialect_config.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// PostgresConnection
// ---------------------------------------------------------------------------

class PostgresConnection : public DatabaseConnection {
 public:
  /// Wrapper for a pooled handle; Release() returns it to the pool.
  PostgresConnection(const std::shared_ptr<PostgresPoolClient>& client,
                     PostgresCursorConstructor cursor)
      : client_(client),
        pool_client_(client),
        pooled_(true),
        cursor_(std::move(cursor)) {}

  /// Wrapper for a dedicated client; Release() does nothing.
  PostgresConnection(const std::shared_ptr<PostgresSingleClient>& client,
                     PostgresCursorConstructor cursor)
      : client_(client), pooled_(false), cursor_(std::move(cursor)) {}

  // Non-copyable, non-movable (the driver hands out its address)
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  Error ExecuteQuery(const CompiledQuery& query, QueryResult* out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    std::shared_ptr<PostgresClient> client = client_.lock();
    if (client == nullptr) {
      return Error::Make(ErrorCode::kNotOpen,
                         "native client is no longer alive");
    }

    PostgresNativeResult native;
    Error err = client->Query(query.sql, query.parameters, &native);
    if (!err.ok()) {
      err.AppendContext("PostgresConnection::ExecuteQuery");
      return err;
    }

    *out = QueryResult{};
    out->rows = std::move(native.rows);
    if (native.command == "INSERT" || native.command == "UPDATE" ||
        native.command == "DELETE") {
      out->has_num_affected_rows = true;
      out->num_affected_rows = native.row_count;
    }
    return Error::Ok();
  }

  Error StreamQuery(const CompiledQuery& query, int64_t chunk_size,
                    QueryStream* out) override {
    if (!cursor_) {
      return Error::Make(ErrorCode::kConfig,
                         "'cursor' is not present in the postgres dialect "
                         "config; it is required for streaming");
    }
    if (chunk_size <= 0) {
      return Error::Make(ErrorCode::kInvalidArgument,
                         "chunk_size must be a positive integer");
    }
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    std::shared_ptr<PostgresClient> client = client_.lock();
    if (client == nullptr) {
      return Error::Make(ErrorCode::kNotOpen,
                         "native client is no longer alive");
    }

    std::unique_ptr<RowCursor> cursor;
    Error err =
        cursor_(std::move(client), query.sql, query.parameters, &cursor);
    if (!err.ok()) {
      err.AppendContext("PostgresConnection::StreamQuery");
      return err;
    }
    if (cursor == nullptr) {
      return Error::Make(ErrorCode::kConfig,
                         "cursor constructor returned no cursor");
    }
    *out = QueryStream(std::move(cursor), chunk_size);
    return Error::Ok();
  }

  bool pooled() const { return pooled_; }

  Error Release() {
    if (!pooled_) { return Error::Ok(); }
    std::shared_ptr<PostgresPoolClient> client = pool_client_.lock();
    if (client == nullptr) { return Error::Ok(); }
    return client->Release();
  }

 private:
  std::weak_ptr<PostgresClient> client_;
  std::weak_ptr<PostgresPoolClient> pool_client_;
  bool pooled_;
  PostgresCursorConstructor cursor_;
};

// ---------------------------------------------------------------------------
// PostgresDriver
// ---------------------------------------------------------------------------

class PostgresDriver : public Driver {
 public:
  explicit PostgresDriver(PostgresDialectConfig config)
      : config_(std::move(config)) {}

  // Non-copyable, non-movable
  PostgresDriver(const PostgresDriver&) = delete;
  PostgresDriver& operator=(const PostgresDriver&) = delete;

  Error Init() override {
    if (!config_.IsPoolMode()) { return Error::Ok(); }

    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
      return Error::Make(ErrorCode::kMisuse, "driver has been destroyed");
    }
    if (pool_ != nullptr) { return Error::Ok(); }

    const PostgresDialectPoolConfig& pool_config = config_.pool_config();
    if (pool_config.pool != nullptr) {
      pool_ = pool_config.pool;
      return Error::Ok();
    }
    if (!pool_config.pool_factory) {
      return Error::Make(ErrorCode::kConfig,
                         "postgres pool config has neither pool nor "
                         "pool_factory");
    }
    if (factory_called_) { return factory_error_; }

    factory_called_ = true;
    std::shared_ptr<PostgresPool> pool;
    factory_error_ = pool_config.pool_factory(&pool);
    if (factory_error_.ok() && pool == nullptr) {
      factory_error_.Set(ErrorCode::kConfig, "pool_factory returned no pool");
    }
    if (!factory_error_.ok()) {
      factory_error_.AppendContext("PostgresDriver::Init");
      return factory_error_;
    }
    pool_ = std::move(pool);
    Logger().debug("postgres pool resolved");
    return Error::Ok();
  }

  Error AcquireConnection(DatabaseConnection** out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    *out = nullptr;
    return config_.IsPoolMode() ? AcquirePooled(out) : AcquireSingle(out);
  }

  Error BeginTransaction(DatabaseConnection* connection,
                         const TransactionSettings& settings) override {
    if (settings.isolation_level == IsolationLevel::kDefault) {
      return Run(connection, "begin");
    }
    std::string sql = "start transaction isolation level ";
    sql += IsolationLevelSql(settings.isolation_level);
    return Run(connection, sql);
  }

  Error CommitTransaction(DatabaseConnection* connection) override {
    return Run(connection, "commit");
  }

  Error RollbackTransaction(DatabaseConnection* connection) override {
    return Run(connection, "rollback");
  }

  Error ReleaseConnection(DatabaseConnection* connection) override {
    if (connection == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "connection is null");
    }
    bool owned = registry_.Contains(connection);
    if (!owned) {
      std::lock_guard<std::mutex> lock(mutex_);
      owned = (connection == single_connection_.get());
    }
    if (!owned) {
      return Error::Make(ErrorCode::kMisuse,
                         "connection was not acquired from this driver");
    }
    Error err = static_cast<PostgresConnection*>(connection)->Release();
    err.AppendContext("PostgresDriver::ReleaseConnection");
    return err;
  }

  Error Destroy() override {
    std::unique_lock<std::mutex> lock(mutex_);
    destroyed_ = true;
    if (single_client_ != nullptr) {
      std::shared_ptr<PostgresSingleClient> client = std::move(single_client_);
      single_connection_.reset();
      lock.unlock();
      Logger().debug("ending postgres client");
      Error err = client->End();
      err.AppendContext("PostgresDriver::Destroy");
      return err;
    }
    if (pool_ != nullptr) {
      // Drop our reference before ending, so a concurrent Destroy() sees
      // nothing left to end.
      std::shared_ptr<PostgresPool> pool = std::move(pool_);
      lock.unlock();
      registry_.Clear();
      Logger().debug("ending postgres pool");
      Error err = pool->End();
      err.AppendContext("PostgresDriver::Destroy");
      return err;
    }
    return Error::Ok();
  }

  /// Wrappers currently registered in pool mode. Exposed for tests.
  size_t NumRegisteredConnections() const { return registry_.Size(); }

 private:
  Error AcquireSingle(DatabaseConnection** out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
      return Error::Make(ErrorCode::kMisuse, "driver has been destroyed");
    }
    if (single_connection_ != nullptr) {
      *out = single_connection_.get();
      return Error::Ok();
    }

    const PostgresDialectClientConfig& client_config = config_.client_config();
    if (single_client_ == nullptr) {
      if (client_config.client != nullptr) {
        single_client_ = client_config.client;
      } else if (!client_config.client_factory) {
        return Error::Make(ErrorCode::kConfig,
                           "postgres client config has neither client nor "
                           "client_factory");
      } else if (factory_called_) {
        return factory_error_;
      } else {
        factory_called_ = true;
        std::shared_ptr<PostgresSingleClient> client;
        factory_error_ = client_config.client_factory(&client);
        if (factory_error_.ok() && client == nullptr) {
          factory_error_.Set(ErrorCode::kConfig,
                             "client_factory returned no client");
        }
        if (!factory_error_.ok()) {
          factory_error_.AppendContext("PostgresDriver::AcquireConnection");
          return factory_error_;
        }
        single_client_ = std::move(client);
      }
    }

    Error err = single_client_->Connect();
    if (!err.ok()) {
      err.AppendContext("PostgresDriver::AcquireConnection");
      return err;
    }
    single_connection_.reset(
        new PostgresConnection(single_client_, client_config.cursor));
    Logger().debug("postgres client connected");
    *out = single_connection_.get();
    return Error::Ok();
  }

  Error AcquirePooled(DatabaseConnection** out) {
    std::shared_ptr<PostgresPool> pool;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pool = pool_;
    }
    if (pool == nullptr) {
      return Error::Make(ErrorCode::kMisuse,
                         "AcquireConnection called before Init");
    }

    // Blocks here while the pool is exhausted.
    std::shared_ptr<PostgresPoolClient> client;
    Error err = pool->Connect(&client);
    if (!err.ok()) {
      err.AppendContext("PostgresDriver::AcquireConnection");
      return err;
    }
    if (client == nullptr) {
      return Error::Make(ErrorCode::kError, "pool returned no client");
    }

    const PostgresDialectPoolConfig& pool_config = config_.pool_config();
    bool created = false;
    PostgresConnection* connection = registry_.FindOrCreate(
        client,
        [&]() {
          return std::unique_ptr<PostgresConnection>(
              new PostgresConnection(client, pool_config.cursor));
        },
        &created);

    if (created && pool_config.on_create_connection) {
      Error hook_err = pool_config.on_create_connection(connection);
      if (!hook_err.ok()) {
        Error release_err = client->Release();
        if (!release_err.ok()) {
          Logger().warn("releasing connection after failed hook failed: {}",
                        release_err.message);
        }
        hook_err.AppendContext("on_create_connection");
        return hook_err;
      }
    }

    *out = connection;
    return Error::Ok();
  }

  static Error Run(DatabaseConnection* connection, const std::string& sql) {
    if (connection == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "connection is null");
    }
    QueryResult result;
    return connection->ExecuteQuery(CompiledQuery::Raw(sql), &result);
  }

  const PostgresDialectConfig config_;

  mutable std::mutex mutex_;
  std::shared_ptr<PostgresPool> pool_;
  std::shared_ptr<PostgresSingleClient> single_client_;
  std::unique_ptr<PostgresConnection> single_connection_;
  bool factory_called_ = false;
  Error factory_error_;
  bool destroyed_ = false;

  ConnectionRegistry<PostgresPoolClient, PostgresConnection> registry_;
};

}  // namespace qbpp
