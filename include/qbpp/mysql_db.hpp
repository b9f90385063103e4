// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::MysqlHandle / qbpp::MysqlStatement -- MariaDB/MySQL client handles.
//
// Design:
//   - Wraps MYSQL* and MYSQL_STMT* with RAII
//   - Move-only (no copy)
//   - Parameters bound through MYSQL_BIND with storage owned by the
//     statement; results fetched into growable buffers, re-fetching a
//     column when the server reports truncation
//   - Error reporting via Error return values (no exceptions)
//
// DSN format: "host:port:user:password:database"
//   e.g. "localhost:3306:root:pass:testdb"
//   or   "127.0.0.1:3306:root::mydb" (empty password)

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <mysql.h>

#include "qbpp/error.hpp"
#include "qbpp/query_result.hpp"
#include "qbpp/value.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// DSN
// ---------------------------------------------------------------------------

struct MysqlDsn {
  std::string host = "localhost";
  uint16_t port = 3306;
  std::string user = "root";
  std::string password;
  std::string database;
};

/// Parse "host:port:user:password:database". Empty fields keep defaults.
inline Error ParseMysqlDsn(const std::string& dsn, MysqlDsn* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  std::vector<std::string> parts;
  size_t start = 0;
  while (parts.size() < 4) {
    size_t colon = dsn.find(':', start);
    if (colon == std::string::npos) { break; }
    parts.push_back(dsn.substr(start, colon - start));
    start = colon + 1;
  }
  parts.push_back(dsn.substr(start));

  MysqlDsn result;
  if (!parts[0].empty()) { result.host = parts[0]; }
  if (parts.size() >= 2 && !parts[1].empty()) {
    char* end = nullptr;
    unsigned long port = std::strtoul(parts[1].c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || port == 0 || port > 65535) {
      return Error::Format(ErrorCode::kConfig, "invalid port '%s' in mysql dsn",
                           parts[1].c_str());
    }
    result.port = static_cast<uint16_t>(port);
  }
  if (parts.size() >= 3 && !parts[2].empty()) { result.user = parts[2]; }
  if (parts.size() >= 4) { result.password = parts[3]; }
  if (parts.size() >= 5) { result.database = parts[4]; }
  *out = std::move(result);
  return Error::Ok();
}

inline ErrorCode MysqlErrorCode(unsigned int mysql_errno) {
  switch (mysql_errno) {
    case 0: return ErrorCode::kOk;
    case 1062:  // ER_DUP_ENTRY
    case 1451:  // ER_ROW_IS_REFERENCED_2
    case 1452:  // ER_NO_REFERENCED_ROW_2
    case 1048:  // ER_BAD_NULL_ERROR
      return ErrorCode::kConstraint;
    case 1146:  // ER_NO_SUCH_TABLE
      return ErrorCode::kNotFound;
    case 1205:  // ER_LOCK_WAIT_TIMEOUT
    case 1213:  // ER_LOCK_DEADLOCK
      return ErrorCode::kBusy;
    case 1264:  // ER_WARN_DATA_OUT_OF_RANGE
      return ErrorCode::kRange;
    case 2006:  // CR_SERVER_GONE_ERROR
    case 2013:  // CR_SERVER_LOST
      return ErrorCode::kIoError;
    default:
      return ErrorCode::kError;
  }
}

// ---------------------------------------------------------------------------
// MysqlStatement
// ---------------------------------------------------------------------------

class MysqlStatement {
 public:
  MysqlStatement() = default;

  ~MysqlStatement() { Finalize(); }

  // Move
  MysqlStatement(MysqlStatement&& other) noexcept
      : stmt_(other.stmt_),
        params_(std::move(other.params_)),
        param_storage_(std::move(other.param_storage_)),
        columns_(std::move(other.columns_)),
        field_types_(std::move(other.field_types_)),
        field_binary_(std::move(other.field_binary_)) {
    other.stmt_ = nullptr;
  }

  MysqlStatement& operator=(MysqlStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      stmt_ = other.stmt_;
      params_ = std::move(other.params_);
      param_storage_ = std::move(other.param_storage_);
      columns_ = std::move(other.columns_);
      field_types_ = std::move(other.field_types_);
      field_binary_ = std::move(other.field_binary_);
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  MysqlStatement(const MysqlStatement&) = delete;
  MysqlStatement& operator=(const MysqlStatement&) = delete;

  // --- Execute ---

  /// Bind `params` to the ? placeholders and execute. `params` must stay
  /// alive until Execute() returns.
  Error Execute(const std::vector<Value>& params) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    unsigned long expected = mysql_stmt_param_count(stmt_);
    if (expected != params.size()) {
      return Error::Format(ErrorCode::kRange,
                           "statement takes %lu parameters, %lu given",
                           expected, static_cast<unsigned long>(params.size()));
    }

    params_.assign(params.size(), MYSQL_BIND{});
    param_storage_.assign(params.size(), ParamStorage{});
    for (size_t i = 0; i < params.size(); ++i) {
      BindParam(i, params[i]);
    }
    if (!params_.empty() && mysql_stmt_bind_param(stmt_, params_.data()) != 0) {
      return StmtError();
    }
    if (mysql_stmt_execute(stmt_) != 0) { return StmtError(); }
    return ReadMetadata();
  }

  /// True when the executed statement produces rows.
  bool IsReader() const { return columns_ != nullptr; }

  /// Buffer the whole result client-side.
  Error StoreResult() {
    if (mysql_stmt_store_result(stmt_) != 0) { return StmtError(); }
    return Error::Ok();
  }

  /// Fetch the next row. `*has_row` is false once the result is done.
  Error Fetch(bool* has_row, Row* out) {
    *has_row = false;
    size_t n = field_types_.size();
    std::vector<MYSQL_BIND> binds(n, MYSQL_BIND{});
    std::vector<std::string> buffers(n, std::string(256, '\0'));
    std::vector<unsigned long> lengths(n, 0);
    // bool in MySQL 8, my_bool in MariaDB; never std::vector<bool>.
    using Flag = decltype(MYSQL_BIND::is_null_value);
    std::unique_ptr<Flag[]> nulls(new Flag[n]());
    std::unique_ptr<Flag[]> errors(new Flag[n]());
    for (size_t i = 0; i < n; ++i) {
      binds[i].buffer_type = MYSQL_TYPE_STRING;
      binds[i].buffer = &buffers[i][0];
      binds[i].buffer_length = static_cast<unsigned long>(buffers[i].size());
      binds[i].length = &lengths[i];
      binds[i].is_null = &nulls[i];
      binds[i].error = &errors[i];
    }
    if (n > 0 && mysql_stmt_bind_result(stmt_, binds.data()) != 0) {
      return StmtError();
    }

    int rc = mysql_stmt_fetch(stmt_);
    if (rc == MYSQL_NO_DATA) { return Error::Ok(); }
    if (rc == 1) { return StmtError(); }

    if (rc == MYSQL_DATA_TRUNCATED) {
      for (size_t i = 0; i < n; ++i) {
        if (errors[i] == 0 || lengths[i] <= buffers[i].size()) { continue; }
        buffers[i].assign(lengths[i], '\0');
        binds[i].buffer = &buffers[i][0];
        binds[i].buffer_length = lengths[i];
        if (mysql_stmt_fetch_column(stmt_, &binds[i],
                                    static_cast<unsigned int>(i), 0) != 0) {
          return StmtError();
        }
      }
    }

    std::vector<Value> values;
    values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      if (nulls[i] != 0) {
        values.push_back(Value::Null());
        continue;
      }
      buffers[i].resize(lengths[i]);
      values.push_back(ConvertField(i, std::move(buffers[i])));
    }
    *out = Row(columns_, std::move(values));
    *has_row = true;
    return Error::Ok();
  }

  uint64_t AffectedRows() const {
    return (stmt_ != nullptr) ? mysql_stmt_affected_rows(stmt_) : 0;
  }

  uint64_t InsertId() const {
    return (stmt_ != nullptr) ? mysql_stmt_insert_id(stmt_) : 0;
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      mysql_stmt_free_result(stmt_);
      mysql_stmt_close(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class MysqlHandle;

  // Per-parameter storage MYSQL_BIND points into.
  struct ParamStorage {
    int64_t int_value = 0;
    double double_value = 0.0;
    unsigned long length = 0;
  };

  explicit MysqlStatement(MYSQL_STMT* stmt) : stmt_(stmt) {}

  void BindParam(size_t i, const Value& value) {
    MYSQL_BIND& bind = params_[i];
    ParamStorage& storage = param_storage_[i];
    switch (value.Type()) {
      case ValueType::kNull:
        bind.buffer_type = MYSQL_TYPE_NULL;
        break;
      case ValueType::kBool:
      case ValueType::kInt64:
        storage.int_value = value.AsInt64();
        bind.buffer_type = MYSQL_TYPE_LONGLONG;
        bind.buffer = &storage.int_value;
        break;
      case ValueType::kDouble:
        storage.double_value = value.AsDouble();
        bind.buffer_type = MYSQL_TYPE_DOUBLE;
        bind.buffer = &storage.double_value;
        break;
      case ValueType::kText:
      case ValueType::kBlob:
        storage.length = static_cast<unsigned long>(value.AsText().size());
        bind.buffer_type = (value.Type() == ValueType::kBlob)
                               ? MYSQL_TYPE_BLOB
                               : MYSQL_TYPE_STRING;
        bind.buffer = const_cast<char*>(value.AsText().data());
        bind.buffer_length = storage.length;
        bind.length = &storage.length;
        break;
    }
  }

  Error ReadMetadata() {
    columns_.reset();
    field_types_.clear();
    field_binary_.clear();
    MYSQL_RES* meta = mysql_stmt_result_metadata(stmt_);
    if (meta == nullptr) {
      if (mysql_stmt_errno(stmt_) != 0) { return StmtError(); }
      return Error::Ok();
    }
    unsigned int n = mysql_num_fields(meta);
    MYSQL_FIELD* fields = mysql_fetch_fields(meta);
    auto names = std::make_shared<std::vector<std::string>>();
    for (unsigned int i = 0; i < n; ++i) {
      names->emplace_back(fields[i].name);
      field_types_.push_back(fields[i].type);
      field_binary_.push_back(fields[i].charsetnr == 63);  // binary charset
    }
    mysql_free_result(meta);
    columns_ = names;
    return Error::Ok();
  }

  Value ConvertField(size_t i, std::string text) const {
    switch (field_types_[i]) {
      case MYSQL_TYPE_TINY:
      case MYSQL_TYPE_SHORT:
      case MYSQL_TYPE_INT24:
      case MYSQL_TYPE_LONG:
      case MYSQL_TYPE_LONGLONG:
      case MYSQL_TYPE_YEAR:
        return Value::Int(static_cast<int64_t>(std::strtoll(text.c_str(), nullptr, 10)));
      case MYSQL_TYPE_FLOAT:
      case MYSQL_TYPE_DOUBLE:
        return Value::Double(std::strtod(text.c_str(), nullptr));
      case MYSQL_TYPE_TINY_BLOB:
      case MYSQL_TYPE_MEDIUM_BLOB:
      case MYSQL_TYPE_LONG_BLOB:
      case MYSQL_TYPE_BLOB:
      case MYSQL_TYPE_VAR_STRING:
      case MYSQL_TYPE_STRING:
        if (field_binary_[i]) {
          return Value::Blob(reinterpret_cast<const uint8_t*>(text.data()),
                             text.size());
        }
        return Value::Text(std::move(text));
      default:
        return Value::Text(std::move(text));
    }
  }

  Error StmtError() const {
    return Error::Make(MysqlErrorCode(mysql_stmt_errno(stmt_)),
                       mysql_stmt_error(stmt_));
  }

  MYSQL_STMT* stmt_ = nullptr;
  std::vector<MYSQL_BIND> params_;
  std::vector<ParamStorage> param_storage_;
  ColumnNames columns_;
  std::vector<enum_field_types> field_types_;
  std::vector<bool> field_binary_;
};

// ---------------------------------------------------------------------------
// MysqlHandle
// ---------------------------------------------------------------------------

class MysqlHandle {
 public:
  MysqlHandle() = default;

  ~MysqlHandle() { Close(); }

  // Move
  MysqlHandle(MysqlHandle&& other) noexcept : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  MysqlHandle& operator=(MysqlHandle&& other) noexcept {
    if (this != &other) {
      Close();
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  // No copy
  MysqlHandle(const MysqlHandle&) = delete;
  MysqlHandle& operator=(const MysqlHandle&) = delete;

  // --- Open / Close ---

  Error Open(const MysqlDsn& dsn) {
    Close();
    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_init failed");
    }

    if (mysql_real_connect(conn_, dsn.host.c_str(), dsn.user.c_str(),
                           dsn.password.empty() ? nullptr : dsn.password.c_str(),
                           dsn.database.empty() ? nullptr : dsn.database.c_str(),
                           dsn.port, nullptr, 0) == nullptr) {
      Error err = Error::Make(MysqlErrorCode(mysql_errno(conn_)),
                              mysql_error(conn_));
      mysql_close(conn_);
      conn_ = nullptr;
      return err;
    }

    if (mysql_set_character_set(conn_, "utf8mb4") != 0) {
      Error err = Error::Make(ErrorCode::kError, mysql_error(conn_));
      Close();
      return err;
    }
    return Error::Ok();
  }

  void Close() {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
  }

  bool IsOpen() const { return conn_ != nullptr; }

  /// False once the server has gone away.
  bool IsHealthy() const { return conn_ != nullptr && mysql_ping(conn_) == 0; }

  // --- Statement ---

  Error Prepare(const std::string& sql, MysqlStatement* out) {
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    MYSQL_STMT* stmt = mysql_stmt_init(conn_);
    if (stmt == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_stmt_init failed");
    }
    if (mysql_stmt_prepare(stmt, sql.c_str(),
                           static_cast<unsigned long>(sql.size())) != 0) {
      Error err = Error::Make(MysqlErrorCode(mysql_stmt_errno(stmt)),
                              mysql_stmt_error(stmt));
      mysql_stmt_close(stmt);
      return err;
    }
    *out = MysqlStatement(stmt);
    return Error::Ok();
  }

  MYSQL* Handle() const { return conn_; }

 private:
  MYSQL* conn_ = nullptr;
};

}  // namespace qbpp
