// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::MysqlDriver -- the MariaDB/MySQL driver.
//
// Design:
//   - MysqlPool: bounded pool of MysqlHandle, opened from a DSN on demand;
//     Connect() waits while every handle is leased
//   - The driver maps leased handles to wrappers through a
//     ConnectionRegistry, like the postgres pool mode
//   - Transactions: "set transaction isolation level X" (when a level is
//     set) followed by "begin"
//   - Streaming fetches an unbuffered prepared statement chunk_size rows
//     at a time

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "qbpp/connection_registry.hpp"
#include "qbpp/database_connection.hpp"
#include "qbpp/driver.hpp"
#include "qbpp/error.hpp"
#include "qbpp/log.hpp"
#include "qbpp/mysql_db.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// MysqlPool
// ---------------------------------------------------------------------------

class MysqlPool {
 public:
  MysqlPool(MysqlDsn dsn, size_t max_connections)
      : dsn_(std::move(dsn)),
        max_connections_(max_connections == 0 ? 1 : max_connections) {}

  // Non-copyable, non-movable
  MysqlPool(const MysqlPool&) = delete;
  MysqlPool& operator=(const MysqlPool&) = delete;

  Error Connect(std::shared_ptr<MysqlHandle>* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] {
      return ended_ || !idle_.empty() || num_open_ < max_connections_;
    });
    if (ended_) {
      return Error::Make(ErrorCode::kNotOpen, "pool has been ended");
    }
    if (!idle_.empty()) {
      *out = idle_.front();
      idle_.pop_front();
      return Error::Ok();
    }

    ++num_open_;
    lock.unlock();
    auto handle = std::make_shared<MysqlHandle>();
    Error err = handle->Open(dsn_);
    lock.lock();
    if (!err.ok()) {
      --num_open_;
      cv_.notify_one();
      return err;
    }
    open_.push_back(handle);
    Logger().debug("mysql pool opened connection {}/{}", num_open_,
                   max_connections_);
    *out = std::move(handle);
    return Error::Ok();
  }

  Error Release(const std::shared_ptr<MysqlHandle>& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool known = false;
    for (const auto& open : open_) {
      if (open == handle) { known = true; }
    }
    if (!known) {
      return Error::Make(ErrorCode::kMisuse,
                         "handle does not belong to this pool");
    }
    if (ended_ || !handle->IsHealthy()) {
      if (!ended_) { Logger().warn("dropping broken mysql connection"); }
      Forget(handle.get());
    } else {
      idle_.push_back(handle);
    }
    cv_.notify_one();
    return Error::Ok();
  }

  Error End() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) { return Error::Ok(); }
    ended_ = true;
    for (const auto& handle : idle_) { Forget(handle.get()); }
    idle_.clear();
    cv_.notify_all();
    return Error::Ok();
  }

  size_t NumOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return num_open_;
  }

 private:
  // Caller holds mutex_.
  void Forget(const MysqlHandle* handle) {
    for (auto it = open_.begin(); it != open_.end(); ++it) {
      if (it->get() == handle) {
        open_.erase(it);
        --num_open_;
        return;
      }
    }
  }

  const MysqlDsn dsn_;
  const size_t max_connections_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::shared_ptr<MysqlHandle>> open_;
  std::deque<std::shared_ptr<MysqlHandle>> idle_;
  size_t num_open_ = 0;
  bool ended_ = false;
};

struct MysqlDialectConfig {
  /// The pool, or a DSN the driver opens its own pool from in Init().
  std::shared_ptr<MysqlPool> pool;
  std::string dsn;
  size_t max_connections = 10;

  ConnectionCreatedHook on_create_connection;
};

// ---------------------------------------------------------------------------
// MysqlRowCursor
// ---------------------------------------------------------------------------

class MysqlRowCursor : public RowCursor {
 public:
  explicit MysqlRowCursor(MysqlStatement stmt) : stmt_(std::move(stmt)) {}

  Error Read(int64_t max_rows, std::vector<Row>* out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    out->clear();
    while (!done_ && static_cast<int64_t>(out->size()) < max_rows) {
      bool has_row = false;
      Row row;
      Error err = stmt_.Fetch(&has_row, &row);
      if (!err.ok()) {
        err.AppendContext("MysqlRowCursor::Read");
        return err;
      }
      if (!has_row) {
        done_ = true;
        break;
      }
      out->push_back(std::move(row));
    }
    return Error::Ok();
  }

  Error Close() override {
    stmt_.Finalize();
    return Error::Ok();
  }

 private:
  MysqlStatement stmt_;
  bool done_ = false;
};

// ---------------------------------------------------------------------------
// MysqlConnection
// ---------------------------------------------------------------------------

class MysqlConnection : public DatabaseConnection {
 public:
  explicit MysqlConnection(const std::shared_ptr<MysqlHandle>& handle)
      : handle_(handle) {}

  // Non-copyable, non-movable
  MysqlConnection(const MysqlConnection&) = delete;
  MysqlConnection& operator=(const MysqlConnection&) = delete;

  Error ExecuteQuery(const CompiledQuery& query, QueryResult* out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    MysqlStatement stmt;
    Error err = Start(query, &stmt);
    if (err.ok() && stmt.IsReader()) { err = stmt.StoreResult(); }
    if (!err.ok()) {
      err.AppendContext("MysqlConnection::ExecuteQuery");
      return err;
    }

    QueryResult result;
    if (stmt.IsReader()) {
      bool has_row = true;
      while (has_row) {
        Row row;
        err = stmt.Fetch(&has_row, &row);
        if (!err.ok()) {
          err.AppendContext("MysqlConnection::ExecuteQuery");
          return err;
        }
        if (has_row) { result.rows.push_back(std::move(row)); }
      }
    } else {
      result.has_num_affected_rows = true;
      result.num_affected_rows = stmt.AffectedRows();
      result.has_insert_id = true;
      result.insert_id = static_cast<int64_t>(stmt.InsertId());
    }
    *out = std::move(result);
    return Error::Ok();
  }

  Error StreamQuery(const CompiledQuery& query, int64_t chunk_size,
                    QueryStream* out) override {
    if (chunk_size <= 0) {
      return Error::Make(ErrorCode::kInvalidArgument,
                         "chunk_size must be a positive integer");
    }
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    MysqlStatement stmt;
    Error err = Start(query, &stmt);
    if (!err.ok()) {
      err.AppendContext("MysqlConnection::StreamQuery");
      return err;
    }
    *out = QueryStream(
        std::unique_ptr<RowCursor>(new MysqlRowCursor(std::move(stmt))),
        chunk_size);
    return Error::Ok();
  }

 private:
  Error Start(const CompiledQuery& query, MysqlStatement* stmt) {
    std::shared_ptr<MysqlHandle> handle = handle_.lock();
    if (handle == nullptr) {
      return Error::Make(ErrorCode::kNotOpen,
                         "native handle is no longer alive");
    }
    Error err = handle->Prepare(query.sql, stmt);
    if (!err.ok()) { return err; }
    return stmt->Execute(query.parameters);
  }

  std::weak_ptr<MysqlHandle> handle_;
};

// ---------------------------------------------------------------------------
// MysqlDriver
// ---------------------------------------------------------------------------

class MysqlDriver : public Driver {
 public:
  explicit MysqlDriver(MysqlDialectConfig config)
      : config_(std::move(config)) {}

  // Non-copyable, non-movable
  MysqlDriver(const MysqlDriver&) = delete;
  MysqlDriver& operator=(const MysqlDriver&) = delete;

  Error Init() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
      return Error::Make(ErrorCode::kMisuse, "driver has been destroyed");
    }
    if (pool_ != nullptr) { return Error::Ok(); }
    if (config_.pool != nullptr) {
      pool_ = config_.pool;
      return Error::Ok();
    }
    if (config_.dsn.empty()) {
      return Error::Make(ErrorCode::kConfig,
                         "mysql config has neither pool nor dsn");
    }
    MysqlDsn dsn;
    Error err = ParseMysqlDsn(config_.dsn, &dsn);
    if (!err.ok()) { return err; }
    pool_ = std::make_shared<MysqlPool>(std::move(dsn), config_.max_connections);
    return Error::Ok();
  }

  Error AcquireConnection(DatabaseConnection** out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    *out = nullptr;
    std::shared_ptr<MysqlPool> pool;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pool = pool_;
    }
    if (pool == nullptr) {
      return Error::Make(ErrorCode::kMisuse,
                         "AcquireConnection called before Init");
    }

    std::shared_ptr<MysqlHandle> handle;
    Error err = pool->Connect(&handle);
    if (!err.ok()) {
      err.AppendContext("MysqlDriver::AcquireConnection");
      return err;
    }

    bool created = false;
    MysqlConnection* connection = registry_.FindOrCreate(
        handle,
        [&]() {
          return std::unique_ptr<MysqlConnection>(new MysqlConnection(handle));
        },
        &created);

    if (created && config_.on_create_connection) {
      Error hook_err = config_.on_create_connection(connection);
      if (!hook_err.ok()) {
        Error release_err = pool->Release(handle);
        if (!release_err.ok()) {
          Logger().warn("releasing connection after failed hook failed: {}",
                        release_err.message);
        }
        hook_err.AppendContext("on_create_connection");
        return hook_err;
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      leased_.push_back(Lease{connection, handle});
    }
    *out = connection;
    return Error::Ok();
  }

  Error BeginTransaction(DatabaseConnection* connection,
                         const TransactionSettings& settings) override {
    if (settings.isolation_level != IsolationLevel::kDefault) {
      std::string sql = "set transaction isolation level ";
      sql += IsolationLevelSql(settings.isolation_level);
      Error err = Run(connection, sql);
      if (!err.ok()) { return err; }
    }
    return Run(connection, "begin");
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
    std::shared_ptr<MysqlHandle> handle;
    std::shared_ptr<MysqlPool> pool;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto it = leased_.begin(); it != leased_.end(); ++it) {
        if (it->connection == connection) {
          handle = std::move(it->handle);
          leased_.erase(it);
          break;
        }
      }
      pool = pool_;
    }
    if (handle == nullptr) {
      return Error::Make(ErrorCode::kMisuse,
                         "connection is not leased from this driver");
    }
    // Pool already ended by Destroy(); the handle closes when dropped.
    if (pool == nullptr) { return Error::Ok(); }
    Error err = pool->Release(handle);
    err.AppendContext("MysqlDriver::ReleaseConnection");
    return err;
  }

  Error Destroy() override {
    std::shared_ptr<MysqlPool> pool;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      destroyed_ = true;
      pool = std::move(pool_);
      leased_.clear();
    }
    if (pool == nullptr) { return Error::Ok(); }
    registry_.Clear();
    Logger().debug("ending mysql pool");
    Error err = pool->End();
    err.AppendContext("MysqlDriver::Destroy");
    return err;
  }

 private:
  struct Lease {
    const DatabaseConnection* connection;
    std::shared_ptr<MysqlHandle> handle;
  };

  static Error Run(DatabaseConnection* connection, const std::string& sql) {
    if (connection == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "connection is null");
    }
    QueryResult result;
    return connection->ExecuteQuery(CompiledQuery::Raw(sql), &result);
  }

  const MysqlDialectConfig config_;

  std::mutex mutex_;
  std::shared_ptr<MysqlPool> pool_;
  std::vector<Lease> leased_;
  bool destroyed_ = false;

  ConnectionRegistry<MysqlHandle, MysqlConnection> registry_;
};

}  // namespace qbpp
