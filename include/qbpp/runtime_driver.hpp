// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::RuntimeDriver -- lifecycle guard and query logging around a Driver.
//
// Design:
//   - Init() of the wrapped driver runs lazily on first acquisition, once;
//     a failed Init() is retried by the next acquisition
//   - Destroy() reaches the wrapped driver once, and only after a
//     successful Init()
//   - Every acquired connection is wrapped in a LoggedConnection that logs
//     SQL and duration at debug level and failures at error level

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "qbpp/database_connection.hpp"
#include "qbpp/driver.hpp"
#include "qbpp/error.hpp"
#include "qbpp/log.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// LoggedConnection
// ---------------------------------------------------------------------------

class LoggedConnection : public DatabaseConnection {
 public:
  explicit LoggedConnection(DatabaseConnection* inner) : inner_(inner) {}

  Error ExecuteQuery(const CompiledQuery& query, QueryResult* out) override {
    auto start = std::chrono::steady_clock::now();
    Error err = inner_->ExecuteQuery(query, out);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    if (!err.ok()) {
      Logger().error("query failed ({}): {} | sql: {}",
                     ErrorCodeName(err.code), err.message, query.sql);
      return err;
    }
    Logger().debug("{} | {} params | {:.3f} ms", query.sql,
                   query.parameters.size(), elapsed.count() / 1000.0);
    return err;
  }

  Error StreamQuery(const CompiledQuery& query, int64_t chunk_size,
                    QueryStream* out) override {
    Error err = inner_->StreamQuery(query, chunk_size, out);
    if (!err.ok()) {
      Logger().error("stream failed ({}): {} | sql: {}",
                     ErrorCodeName(err.code), err.message, query.sql);
      return err;
    }
    Logger().debug("{} | streaming {} rows per chunk", query.sql, chunk_size);
    return err;
  }

  DatabaseConnection* inner() const { return inner_; }

 private:
  DatabaseConnection* inner_;
};

// ---------------------------------------------------------------------------
// RuntimeDriver
// ---------------------------------------------------------------------------

class RuntimeDriver : public Driver {
 public:
  explicit RuntimeDriver(std::unique_ptr<Driver> driver)
      : driver_(std::move(driver)) {}

  // Non-copyable, non-movable
  RuntimeDriver(const RuntimeDriver&) = delete;
  RuntimeDriver& operator=(const RuntimeDriver&) = delete;

  Error Init() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return InitLocked();
  }

  Error AcquireConnection(DatabaseConnection** out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    *out = nullptr;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Error err = InitLocked();
      if (!err.ok()) { return err; }
    }

    // Outside the lock: the wrapped driver may block on pool back-pressure.
    DatabaseConnection* inner = nullptr;
    Error err = driver_->AcquireConnection(&inner);
    if (!err.ok()) { return err; }

    std::lock_guard<std::mutex> lock(mutex_);
    std::unique_ptr<LoggedConnection>& logged = wrappers_[inner];
    if (logged == nullptr) { logged.reset(new LoggedConnection(inner)); }
    *out = logged.get();
    return Error::Ok();
  }

  Error BeginTransaction(DatabaseConnection* connection,
                         const TransactionSettings& settings) override {
    Logger().debug("begin transaction{}{}",
                   settings.isolation_level == IsolationLevel::kDefault
                       ? "" : ", isolation level ",
                   IsolationLevelSql(settings.isolation_level));
    return driver_->BeginTransaction(connection, settings);
  }

  Error CommitTransaction(DatabaseConnection* connection) override {
    return driver_->CommitTransaction(connection);
  }

  Error RollbackTransaction(DatabaseConnection* connection) override {
    return driver_->RollbackTransaction(connection);
  }

  Error ReleaseConnection(DatabaseConnection* connection) override {
    if (connection == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "connection is null");
    }
    DatabaseConnection* inner = nullptr;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& kv : wrappers_) {
        if (kv.second.get() == connection) {
          inner = kv.first;
          break;
        }
      }
    }
    if (inner == nullptr) {
      return Error::Make(ErrorCode::kMisuse,
                         "connection was not acquired from this driver");
    }
    return driver_->ReleaseConnection(inner);
  }

  Error Destroy() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_ || destroyed_) { return Error::Ok(); }
    destroyed_ = true;
    wrappers_.clear();
    Logger().debug("destroying driver");
    return driver_->Destroy();
  }

  bool initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
  }

 private:
  Error InitLocked() {
    if (destroyed_) {
      return Error::Make(ErrorCode::kMisuse, "driver has been destroyed");
    }
    if (initialized_) { return Error::Ok(); }
    Error err = driver_->Init();
    if (!err.ok()) {
      Logger().error("driver init failed ({}): {}", ErrorCodeName(err.code),
                     err.message);
      return err;
    }
    initialized_ = true;
    return Error::Ok();
  }

  std::unique_ptr<Driver> driver_;

  mutable std::mutex mutex_;
  bool initialized_ = false;
  bool destroyed_ = false;
  std::map<DatabaseConnection*, std::unique_ptr<LoggedConnection>> wrappers_;
};

}  // namespace qbpp
