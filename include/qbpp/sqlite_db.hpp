// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::SqliteDb / qbpp::SqliteStatement -- SQLite3 handles with RAII.
//
// Design:
//   - Wraps sqlite3* and sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error return values (no exceptions); SQLite
//     result codes map onto ErrorCode
//   - 1-based parameter binding (matches SQLite3 convention)
//   - Rows are read into qbpp::Row so they outlive the statement

#pragma once

#include <cctype>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sqlite3.h"

#include "qbpp/error.hpp"
#include "qbpp/query_result.hpp"
#include "qbpp/value.hpp"

namespace qbpp {

inline ErrorCode SqliteErrorCode(int32_t rc) {
  switch (rc & 0xff) {
    case SQLITE_OK: return ErrorCode::kOk;
    case SQLITE_BUSY:
    case SQLITE_LOCKED: return ErrorCode::kBusy;
    case SQLITE_NOTFOUND: return ErrorCode::kNotFound;
    case SQLITE_CONSTRAINT: return ErrorCode::kConstraint;
    case SQLITE_MISMATCH: return ErrorCode::kMismatch;
    case SQLITE_MISUSE: return ErrorCode::kMisuse;
    case SQLITE_RANGE: return ErrorCode::kRange;
    case SQLITE_IOERR: return ErrorCode::kIoError;
    case SQLITE_FULL: return ErrorCode::kFull;
    case SQLITE_CANTOPEN: return ErrorCode::kNotOpen;
    default: return ErrorCode::kError;
  }
}

inline Error SqliteError(sqlite3* db, int32_t rc) {
  return Error::Make(SqliteErrorCode(rc),
                     db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
}

// ---------------------------------------------------------------------------
// SqliteStatement
// ---------------------------------------------------------------------------

class SqliteStatement {
 public:
  SqliteStatement() = default;

  ~SqliteStatement() { Finalize(); }

  // Move
  SqliteStatement(SqliteStatement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_), columns_(std::move(other.columns_)) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  SqliteStatement& operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      columns_ = std::move(other.columns_);
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  SqliteStatement(const SqliteStatement&) = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  // --- Bind (1-based index) ---

  Error Bind(int32_t param, const Value& value) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t rc = SQLITE_OK;
    switch (value.Type()) {
      case ValueType::kNull:
        rc = sqlite3_bind_null(stmt_, param);
        break;
      case ValueType::kBool:
      case ValueType::kInt64:
        rc = sqlite3_bind_int64(stmt_, param,
                                static_cast<sqlite3_int64>(value.AsInt64()));
        break;
      case ValueType::kDouble:
        rc = sqlite3_bind_double(stmt_, param, value.AsDouble());
        break;
      case ValueType::kText:
        rc = sqlite3_bind_text(stmt_, param, value.AsText().c_str(),
                               static_cast<int>(value.AsText().size()),
                               SQLITE_TRANSIENT);
        break;
      case ValueType::kBlob:
        rc = sqlite3_bind_blob(stmt_, param, value.BlobData(),
                               static_cast<int>(value.BlobSize()),
                               SQLITE_TRANSIENT);
        break;
    }
    if (rc != SQLITE_OK) {
      return Error::Format(SqliteErrorCode(rc), "bind parameter %d failed: %s",
                           param, sqlite3_errstr(rc));
    }
    return Error::Ok();
  }

  /// Bind `params` to ?1..?n.
  Error BindAll(const std::vector<Value>& params) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t expected = sqlite3_bind_parameter_count(stmt_);
    if (expected != static_cast<int32_t>(params.size())) {
      return Error::Format(ErrorCode::kRange,
                           "statement takes %d parameters, %d given", expected,
                           static_cast<int32_t>(params.size()));
    }
    for (size_t i = 0; i < params.size(); ++i) {
      Error err = Bind(static_cast<int32_t>(i + 1), params[i]);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  // --- Execute ---

  /// Advance one row. `*has_row` is false once the statement is done.
  Error Step(bool* has_row) {
    *has_row = false;
    if (db_ == nullptr || stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      *has_row = true;
      return Error::Ok();
    }
    if (rc == SQLITE_DONE) { return Error::Ok(); }
    Error err = SqliteError(db_, rc);
    sqlite3_reset(stmt_);
    return err;
  }

  /// True for statements that produce rows (select, ... returning).
  bool IsReader() const {
    return stmt_ != nullptr && sqlite3_column_count(stmt_) > 0;
  }

  /// INSERT, UPDATE, DELETE or REPLACE, possibly behind a WITH clause.
  /// DDL and transaction control write but change no rows, and leave
  /// sqlite3_changes() at the previous statement's count.
  bool IsDataChange() const {
    if (stmt_ == nullptr || sqlite3_stmt_readonly(stmt_) != 0) {
      return false;
    }
    const char* sql = sqlite3_sql(stmt_);
    if (sql == nullptr) { return false; }
    while (std::isspace(static_cast<unsigned char>(*sql)) != 0) { ++sql; }
    std::string keyword;
    while (std::isalpha(static_cast<unsigned char>(*sql)) != 0) {
      keyword.push_back(static_cast<char>(
          std::tolower(static_cast<unsigned char>(*sql))));
      ++sql;
    }
    return keyword == "insert" || keyword == "update" ||
           keyword == "delete" || keyword == "replace" || keyword == "with";
  }

  /// Copy the current row out of the statement.
  Row ReadRow() {
    int32_t num_fields = sqlite3_column_count(stmt_);
    if (columns_ == nullptr) {
      auto names = std::make_shared<std::vector<std::string>>();
      for (int32_t i = 0; i < num_fields; ++i) {
        const char* name = sqlite3_column_name(stmt_, i);
        names->emplace_back(name != nullptr ? name : "");
      }
      columns_ = names;
    }

    std::vector<Value> values;
    values.reserve(static_cast<size_t>(num_fields));
    for (int32_t i = 0; i < num_fields; ++i) {
      switch (sqlite3_column_type(stmt_, i)) {
        case SQLITE_INTEGER:
          values.push_back(Value::Int(sqlite3_column_int64(stmt_, i)));
          break;
        case SQLITE_FLOAT:
          values.push_back(Value::Double(sqlite3_column_double(stmt_, i)));
          break;
        case SQLITE_TEXT: {
          const char* text =
              reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
          int32_t len = sqlite3_column_bytes(stmt_, i);
          values.push_back(Value::Text(
              text != nullptr ? std::string(text, static_cast<size_t>(len))
                              : std::string()));
          break;
        }
        case SQLITE_BLOB: {
          const uint8_t* blob =
              static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, i));
          int32_t len = sqlite3_column_bytes(stmt_, i);
          values.push_back(Value::Blob(blob, static_cast<size_t>(len)));
          break;
        }
        default:
          values.push_back(Value::Null());
          break;
      }
    }
    return Row(columns_, std::move(values));
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }
  sqlite3_stmt* Handle() const { return stmt_; }

 private:
  friend class SqliteDb;

  SqliteStatement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  ColumnNames columns_;
};

// ---------------------------------------------------------------------------
// SqliteDb
// ---------------------------------------------------------------------------

class SqliteDb {
 public:
  SqliteDb() = default;

  ~SqliteDb() { Close(); }

  // Move
  SqliteDb(SqliteDb&& other) noexcept : db_(other.db_) { other.db_ = nullptr; }

  SqliteDb& operator=(SqliteDb&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;

  // --- Open / Close ---

  Error Open(const char* path) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Close();
    int32_t rc = sqlite3_open(path, &db_);
    if (rc != SQLITE_OK) {
      Error err = SqliteError(db_, rc);
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close_v2(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- Statement ---

  /// Compile a prepared statement. `sql` holds exactly one statement.
  Error Prepare(const std::string& sql, SqliteStatement* out) {
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                    static_cast<int>(sql.size()), &stmt,
                                    nullptr);
    if (rc != SQLITE_OK) { return SqliteError(db_, rc); }
    if (stmt == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "sql contains no statement");
    }
    *out = SqliteStatement(db_, stmt);
    return Error::Ok();
  }

  // --- Misc ---

  int64_t Changes() const {
    return (db_ != nullptr) ? static_cast<int64_t>(sqlite3_changes(db_)) : 0;
  }

  int64_t LastInsertRowId() const {
    return (db_ != nullptr)
               ? static_cast<int64_t>(sqlite3_last_insert_rowid(db_))
               : 0;
  }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }

  sqlite3* Handle() const { return db_; }

 private:
  sqlite3* db_ = nullptr;
};

}  // namespace qbpp
