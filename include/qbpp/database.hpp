// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::Database -- dialect-agnostic facade: compile, execute, lease,
// transact.
//
// Design:
//   - Built from a Dialect: owns its driver (behind a RuntimeDriver) and
//     its query compiler
//   - ConnectionLease: RAII holder of one acquired connection, released
//     on destruction
//   - Transaction: RAII; rolls back on destruction unless committed or
//     rolled back, then releases its connection
//   - Move-only, no exceptions
//
// Usage:
//   qbpp::SqliteDialectConfig config;
//   config.path = ":memory:";
//   qbpp::Database db(qbpp::SqliteDialect(std::move(config)));
//   qbpp::QueryResult result;
//   err = db.Execute(*query, &result);
//
//   qbpp::Transaction tx;
//   err = db.BeginTransaction(&tx);
//   err = tx.Execute(*insert, &result);
//   err = tx.Commit();

#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "qbpp/compiled_query.hpp"
#include "qbpp/database_connection.hpp"
#include "qbpp/dialect.hpp"
#include "qbpp/driver.hpp"
#include "qbpp/error.hpp"
#include "qbpp/log.hpp"
#include "qbpp/operation_node.hpp"
#include "qbpp/query_compiler.hpp"
#include "qbpp/query_result.hpp"
#include "qbpp/query_stream.hpp"
#include "qbpp/runtime_driver.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// ConnectionLease
// ---------------------------------------------------------------------------

class ConnectionLease {
 public:
  ConnectionLease() = default;

  ~ConnectionLease() {
    Error err = Release();
    if (!err.ok()) {
      Logger().warn("releasing leased connection failed: {}", err.message);
    }
  }

  // Move
  ConnectionLease(ConnectionLease&& other) noexcept
      : driver_(other.driver_),
        compiler_(other.compiler_),
        connection_(other.connection_) {
    other.driver_ = nullptr;
    other.compiler_ = nullptr;
    other.connection_ = nullptr;
  }

  ConnectionLease& operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
      Error err = Release();
      if (!err.ok()) {
        Logger().warn("releasing replaced lease failed: {}", err.message);
      }
      driver_ = other.driver_;
      compiler_ = other.compiler_;
      connection_ = other.connection_;
      other.driver_ = nullptr;
      other.compiler_ = nullptr;
      other.connection_ = nullptr;
    }
    return *this;
  }

  // No copy
  ConnectionLease(const ConnectionLease&) = delete;
  ConnectionLease& operator=(const ConnectionLease&) = delete;

  // --- Execute ---

  Error Execute(const OperationNode& node, QueryResult* out) {
    if (connection_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "lease holds no connection");
    }
    CompiledQuery query;
    Error err = compiler_->Compile(node, &query);
    if (!err.ok()) { return err; }
    return connection_->ExecuteQuery(query, out);
  }

  Error ExecuteCompiled(const CompiledQuery& query, QueryResult* out) {
    if (connection_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "lease holds no connection");
    }
    return connection_->ExecuteQuery(query, out);
  }

  /// The stream must be closed or destroyed before this lease.
  Error Stream(const OperationNode& node, int64_t chunk_size,
               QueryStream* out) {
    if (connection_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "lease holds no connection");
    }
    CompiledQuery query;
    Error err = compiler_->Compile(node, &query);
    if (!err.ok()) { return err; }
    return connection_->StreamQuery(query, chunk_size, out);
  }

  /// Give the connection back early. Idempotent.
  Error Release() {
    if (connection_ == nullptr) { return Error::Ok(); }
    DatabaseConnection* connection = connection_;
    connection_ = nullptr;
    return driver_->ReleaseConnection(connection);
  }

  bool Valid() const { return connection_ != nullptr; }
  DatabaseConnection* Connection() const { return connection_; }

 private:
  friend class Database;
  friend class Transaction;

  ConnectionLease(Driver* driver, const QueryCompiler* compiler,
                  DatabaseConnection* connection)
      : driver_(driver), compiler_(compiler), connection_(connection) {}

  Driver* driver_ = nullptr;
  const QueryCompiler* compiler_ = nullptr;
  DatabaseConnection* connection_ = nullptr;
};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

class Transaction {
 public:
  Transaction() = default;

  ~Transaction() {
    if (lease_.Valid() && !finished_) {
      Error err = Rollback();
      if (!err.ok()) {
        Logger().warn("rollback of abandoned transaction failed: {}",
                      err.message);
      }
    }
  }

  // Move
  Transaction(Transaction&& other) noexcept
      : lease_(std::move(other.lease_)), finished_(other.finished_) {
    other.finished_ = true;
  }

  Transaction& operator=(Transaction&& other) noexcept = delete;

  // No copy
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  Error Execute(const OperationNode& node, QueryResult* out) {
    if (finished_) {
      return Error::Make(ErrorCode::kMisuse, "transaction already finished");
    }
    return lease_.Execute(node, out);
  }

  Error ExecuteCompiled(const CompiledQuery& query, QueryResult* out) {
    if (finished_) {
      return Error::Make(ErrorCode::kMisuse, "transaction already finished");
    }
    return lease_.ExecuteCompiled(query, out);
  }

  /// Commit, then release the connection.
  Error Commit() { return Finish(true); }

  /// Roll back, then release the connection.
  Error Rollback() { return Finish(false); }

  bool Active() const { return lease_.Valid() && !finished_; }

 private:
  friend class Database;

  Error Finish(bool commit) {
    if (!lease_.Valid() || finished_) {
      return Error::Make(ErrorCode::kMisuse, "transaction is not active");
    }
    finished_ = true;
    Driver* driver = lease_.driver_;
    Error err = commit ? driver->CommitTransaction(lease_.Connection())
                       : driver->RollbackTransaction(lease_.Connection());
    Error release_err = lease_.Release();
    if (!release_err.ok()) {
      if (err.ok()) { return release_err; }
      Logger().warn("releasing transaction connection failed: {}",
                    release_err.message);
    }
    return err;
  }

  ConnectionLease lease_;
  bool finished_ = true;
};

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------

class Database {
 public:
  explicit Database(const Dialect& dialect)
      : driver_(new RuntimeDriver(dialect.CreateDriver())),
        compiler_(dialect.CreateQueryCompiler()) {}

  ~Database() {
    if (driver_ == nullptr) { return; }
    Error err = driver_->Destroy();
    if (!err.ok()) {
      Logger().warn("destroying database driver failed: {}", err.message);
    }
  }

  // Move
  Database(Database&& other) noexcept = default;
  Database& operator=(Database&& other) noexcept = delete;

  // No copy
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // --- Compile ---

  Error Compile(const OperationNode& node, CompiledQuery* out) const {
    return compiler_->Compile(node, out);
  }

  // --- Execute (acquire, run, release) ---

  Error Execute(const OperationNode& node, QueryResult* out) {
    CompiledQuery query;
    Error err = Compile(node, &query);
    if (!err.ok()) { return err; }
    return ExecuteCompiled(query, out);
  }

  Error ExecuteCompiled(const CompiledQuery& query, QueryResult* out) {
    ConnectionLease lease;
    Error err = Acquire(&lease);
    if (!err.ok()) { return err; }
    err = lease.ExecuteCompiled(query, out);
    Error release_err = lease.Release();
    if (!release_err.ok()) {
      if (err.ok()) { return release_err; }
      Logger().warn("releasing connection failed: {}", release_err.message);
    }
    return err;
  }

  // --- Lease / Transaction ---

  Error Acquire(ConnectionLease* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    DatabaseConnection* connection = nullptr;
    Error err = driver_->AcquireConnection(&connection);
    if (!err.ok()) { return err; }
    *out = ConnectionLease(driver_.get(), compiler_.get(), connection);
    return Error::Ok();
  }

  Error BeginTransaction(Transaction* out,
                         const TransactionSettings& settings = {}) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    if (out->Active()) {
      return Error::Make(ErrorCode::kMisuse, "transaction already active");
    }
    ConnectionLease lease;
    Error err = Acquire(&lease);
    if (!err.ok()) { return err; }
    err = driver_->BeginTransaction(lease.Connection(), settings);
    if (!err.ok()) { return err; }
    out->lease_ = std::move(lease);
    out->finished_ = false;
    return Error::Ok();
  }

  /// Release the driver's resources. Later calls do nothing.
  Error Destroy() { return driver_->Destroy(); }

  Driver& driver() { return *driver_; }

 private:
  std::unique_ptr<RuntimeDriver> driver_;
  std::unique_ptr<QueryCompiler> compiler_;
};

}  // namespace qbpp
