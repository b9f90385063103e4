// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::SqliteDriver / qbpp::SqliteConnection -- the sqlite driver.
//
// Design:
//   - One connection, opened on first acquisition
//   - Acquisition is exclusive: a second AcquireConnection() waits until
//     the holder releases
//   - Statements that produce rows return them; all others report
//     changes() and last_insert_rowid()
//   - Streaming steps a prepared statement chunk_size rows at a time and
//     needs no cursor configuration

#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "qbpp/database_connection.hpp"
#include "qbpp/driver.hpp"
#include "qbpp/error.hpp"
#include "qbpp/log.hpp"
#include "qbpp/sqlite_db.hpp"

namespace qbpp {

using SqliteDatabaseFactory = std::function<Error(SqliteDb* out)>;

struct SqliteDialectConfig {
  /// File path or ":memory:". Ignored when database_factory is set.
  std::string path;
  SqliteDatabaseFactory database_factory;

  ConnectionCreatedHook on_create_connection;
};

// ---------------------------------------------------------------------------
// SqliteRowCursor
// ---------------------------------------------------------------------------

class SqliteRowCursor : public RowCursor {
 public:
  explicit SqliteRowCursor(SqliteStatement stmt) : stmt_(std::move(stmt)) {}

  Error Read(int64_t max_rows, std::vector<Row>* out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    out->clear();
    while (!done_ && static_cast<int64_t>(out->size()) < max_rows) {
      bool has_row = false;
      Error err = stmt_.Step(&has_row);
      if (!err.ok()) {
        err.AppendContext("SqliteRowCursor::Read");
        return err;
      }
      if (!has_row) {
        done_ = true;
        break;
      }
      out->push_back(stmt_.ReadRow());
    }
    return Error::Ok();
  }

  Error Close() override {
    stmt_.Finalize();
    return Error::Ok();
  }

 private:
  SqliteStatement stmt_;
  bool done_ = false;
};

// ---------------------------------------------------------------------------
// SqliteConnection
// ---------------------------------------------------------------------------

class SqliteConnection : public DatabaseConnection {
 public:
  explicit SqliteConnection(SqliteDb db) : db_(std::move(db)) {}

  // Non-copyable, non-movable
  SqliteConnection(const SqliteConnection&) = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;

  Error ExecuteQuery(const CompiledQuery& query, QueryResult* out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    SqliteStatement stmt;
    Error err = Prepare(query, &stmt);
    if (!err.ok()) {
      err.AppendContext("SqliteConnection::ExecuteQuery");
      return err;
    }

    QueryResult result;
    bool data_change = stmt.IsDataChange();
    bool has_row = true;
    while (has_row) {
      err = stmt.Step(&has_row);
      if (!err.ok()) {
        err.AppendContext("SqliteConnection::ExecuteQuery");
        return err;
      }
      if (has_row) { result.rows.push_back(stmt.ReadRow()); }
    }

    if (data_change) {
      result.has_num_affected_rows = true;
      result.num_affected_rows = static_cast<uint64_t>(db_.Changes());
      result.has_insert_id = true;
      result.insert_id = db_.LastInsertRowId();
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
    SqliteStatement stmt;
    Error err = Prepare(query, &stmt);
    if (!err.ok()) {
      err.AppendContext("SqliteConnection::StreamQuery");
      return err;
    }
    *out = QueryStream(
        std::unique_ptr<RowCursor>(new SqliteRowCursor(std::move(stmt))),
        chunk_size);
    return Error::Ok();
  }

  SqliteDb& db() { return db_; }

 private:
  Error Prepare(const CompiledQuery& query, SqliteStatement* stmt) {
    Error err = db_.Prepare(query.sql, stmt);
    if (!err.ok()) { return err; }
    return stmt->BindAll(query.parameters);
  }

  SqliteDb db_;
};

// ---------------------------------------------------------------------------
// SqliteDriver
// ---------------------------------------------------------------------------

class SqliteDriver : public Driver {
 public:
  explicit SqliteDriver(SqliteDialectConfig config)
      : config_(std::move(config)) {}

  // Non-copyable, non-movable
  SqliteDriver(const SqliteDriver&) = delete;
  SqliteDriver& operator=(const SqliteDriver&) = delete;

  Error Init() override {
    if (config_.path.empty() && !config_.database_factory) {
      return Error::Make(ErrorCode::kConfig,
                         "sqlite config has neither path nor "
                         "database_factory");
    }
    return Error::Ok();
  }

  Error AcquireConnection(DatabaseConnection** out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    *out = nullptr;

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return destroyed_ || !leased_; });
    if (destroyed_) {
      return Error::Make(ErrorCode::kMisuse, "driver has been destroyed");
    }

    if (connection_ == nullptr) {
      SqliteDb db;
      Error err = config_.database_factory
                      ? config_.database_factory(&db)
                      : db.Open(config_.path.c_str());
      if (!err.ok()) {
        err.AppendContext("SqliteDriver::AcquireConnection");
        return err;
      }
      if (!db.IsOpen()) {
        return Error::Make(ErrorCode::kNotOpen,
                           "database_factory returned a closed database");
      }
      std::unique_ptr<SqliteConnection> connection(
          new SqliteConnection(std::move(db)));
      if (config_.on_create_connection) {
        err = config_.on_create_connection(connection.get());
        if (!err.ok()) {
          err.AppendContext("on_create_connection");
          return err;
        }
      }
      connection_ = std::move(connection);
      Logger().debug("sqlite database opened");
    }

    leased_ = true;
    *out = connection_.get();
    return Error::Ok();
  }

  Error BeginTransaction(DatabaseConnection* connection,
                         const TransactionSettings& settings) override {
    if (settings.isolation_level != IsolationLevel::kDefault) {
      return Error::Format(ErrorCode::kInvalidArgument,
                           "sqlite does not support isolation level '%s'",
                           IsolationLevelSql(settings.isolation_level));
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
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection != connection_.get() || !leased_) {
      return Error::Make(ErrorCode::kMisuse,
                         "connection is not leased from this driver");
    }
    leased_ = false;
    cv_.notify_one();
    return Error::Ok();
  }

  Error Destroy() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) { return Error::Ok(); }
    destroyed_ = true;
    if (connection_ != nullptr) {
      connection_->db().Close();
      Logger().debug("sqlite database closed");
    }
    cv_.notify_all();
    return Error::Ok();
  }

 private:
  static Error Run(DatabaseConnection* connection, const char* sql) {
    if (connection == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "connection is null");
    }
    QueryResult result;
    return connection->ExecuteQuery(CompiledQuery::Raw(sql), &result);
  }

  const SqliteDialectConfig config_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::unique_ptr<SqliteConnection> connection_;
  bool leased_ = false;
  bool destroyed_ = false;
};

}  // namespace qbpp
