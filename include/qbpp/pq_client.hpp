// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::PqClient / qbpp::PqPool -- native postgres clients over libpq.
//
// Design:
//   - PGconn handles owned by unique_ptr with PQfinish as deleter
//   - Statements run through PQexecParams; blob parameters are bound in
//     binary format, everything else as text
//   - Result fields are typed by column OID (bool, int2/4/8, float4/8,
//     bytea); any other type arrives as text
//   - PqPool is bounded: Connect() waits on a condition variable while all
//     handles are leased. Broken handles are dropped on release
//
// PqPool hands out handles that call back into it, so it must be owned by
// a shared_ptr (std::make_shared<PqPool>(...)).
//
// Usage:
//   auto pool = std::make_shared<qbpp::PqPool>("host=localhost dbname=app", 8);
//   std::shared_ptr<qbpp::PostgresPoolClient> client;
//   err = pool->Connect(&client);
//   qbpp::PostgresNativeResult result;
//   err = client->Query("select 1", {}, &result);
//   err = client->Release();

#pragma once

#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <libpq-fe.h>

#include "qbpp/error.hpp"
#include "qbpp/log.hpp"
#include "qbpp/postgres_client.hpp"
#include "qbpp/query_result.hpp"
#include "qbpp/value.hpp"

namespace qbpp {

namespace detail {

using PgConnPtr = std::unique_ptr<PGconn, decltype(&PQfinish)>;
using PgResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

// Type OIDs from pg_type.h (not part of the libpq client headers).
constexpr Oid kBoolOid = 16;
constexpr Oid kByteaOid = 17;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;

inline Error PgConnect(const std::string& conninfo, PgConnPtr* out) {
  PgConnPtr conn(PQconnectdb(conninfo.c_str()), &PQfinish);
  if (conn == nullptr) {
    return Error::Make(ErrorCode::kIoError, "PQconnectdb: out of memory");
  }
  if (PQstatus(conn.get()) != CONNECTION_OK) {
    return Error::Format(ErrorCode::kIoError, "PQconnectdb: %s",
                         PQerrorMessage(conn.get()));
  }
  *out = std::move(conn);
  return Error::Ok();
}

inline ErrorCode PgErrorCode(const PGresult* res) {
  const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
  if (state == nullptr) { return ErrorCode::kIoError; }
  if (std::strncmp(state, "23", 2) == 0) { return ErrorCode::kConstraint; }
  if (std::strncmp(state, "22", 2) == 0) { return ErrorCode::kRange; }
  if (std::strcmp(state, "42P01") == 0) { return ErrorCode::kNotFound; }
  return ErrorCode::kError;
}

inline Value PgFieldValue(const PGresult* res, int row, int col) {
  if (PQgetisnull(res, row, col) == 1) { return Value::Null(); }
  const char* text = PQgetvalue(res, row, col);
  switch (PQftype(res, col)) {
    case kBoolOid:
      return Value::Bool(text[0] == 't');
    case kInt2Oid:
    case kInt4Oid:
    case kInt8Oid:
      return Value::Int(static_cast<int64_t>(std::strtoll(text, nullptr, 10)));
    case kFloat4Oid:
    case kFloat8Oid:
      return Value::Double(std::strtod(text, nullptr));
    case kByteaOid: {
      size_t len = 0;
      unsigned char* bytes = PQunescapeBytea(
          reinterpret_cast<const unsigned char*>(text), &len);
      if (bytes == nullptr) { return Value::Null(); }
      Value value = Value::Blob(bytes, len);
      PQfreemem(bytes);
      return value;
    }
    default:
      return Value::Text(std::string(text, static_cast<size_t>(
                                               PQgetlength(res, row, col))));
  }
}

/// Run one statement on `conn` and convert the result.
inline Error PgExec(PGconn* conn, const std::string& sql,
                    const std::vector<Value>& params,
                    PostgresNativeResult* out) {
  if (conn == nullptr) {
    return Error::Make(ErrorCode::kNotOpen, "postgres connection not open");
  }
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }

  // Text renderings must outlive PQexecParams.
  std::vector<std::string> storage(params.size());
  std::vector<const char*> values(params.size(), nullptr);
  std::vector<int> lengths(params.size(), 0);
  std::vector<int> formats(params.size(), 0);
  for (size_t i = 0; i < params.size(); ++i) {
    const Value& p = params[i];
    switch (p.Type()) {
      case ValueType::kNull:
        break;
      case ValueType::kBool:
        storage[i] = p.AsBool() ? "true" : "false";
        values[i] = storage[i].c_str();
        break;
      case ValueType::kInt64:
        storage[i] = std::to_string(p.AsInt64());
        values[i] = storage[i].c_str();
        break;
      case ValueType::kDouble: {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", p.AsDouble());
        storage[i] = buf;
        values[i] = storage[i].c_str();
        break;
      }
      case ValueType::kText:
        values[i] = p.AsText().c_str();
        break;
      case ValueType::kBlob:
        values[i] = p.AsText().data();
        lengths[i] = static_cast<int>(p.BlobSize());
        formats[i] = 1;
        break;
    }
  }

  PgResultPtr res(
      PQexecParams(conn, sql.c_str(), static_cast<int>(params.size()),
                   nullptr, values.data(), lengths.data(), formats.data(), 0),
      &PQclear);
  if (res == nullptr) {
    return Error::Format(ErrorCode::kIoError, "PQexecParams: %s",
                         PQerrorMessage(conn));
  }

  ExecStatusType status = PQresultStatus(res.get());
  if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
    return Error::Format(PgErrorCode(res.get()), "%s",
                         PQresultErrorMessage(res.get()));
  }

  *out = PostgresNativeResult{};
  const char* tag = PQcmdStatus(res.get());
  if (tag != nullptr) {
    const char* space = std::strchr(tag, ' ');
    out->command = (space != nullptr) ? std::string(tag, space) : tag;
  }

  int num_rows = PQntuples(res.get());
  int num_fields = PQnfields(res.get());
  const char* tuples = PQcmdTuples(res.get());
  out->row_count = (tuples != nullptr && tuples[0] != '\0')
                       ? static_cast<uint64_t>(std::strtoull(tuples, nullptr, 10))
                       : static_cast<uint64_t>(num_rows);

  if (num_fields > 0) {
    auto names = std::make_shared<std::vector<std::string>>();
    names->reserve(static_cast<size_t>(num_fields));
    for (int c = 0; c < num_fields; ++c) {
      names->emplace_back(PQfname(res.get(), c));
    }
    ColumnNames columns = names;
    out->rows.reserve(static_cast<size_t>(num_rows));
    for (int r = 0; r < num_rows; ++r) {
      std::vector<Value> fields;
      fields.reserve(static_cast<size_t>(num_fields));
      for (int c = 0; c < num_fields; ++c) {
        fields.push_back(PgFieldValue(res.get(), r, c));
      }
      out->rows.emplace_back(columns, std::move(fields));
    }
  }
  return Error::Ok();
}

}  // namespace detail

// ---------------------------------------------------------------------------
// PqClient
// ---------------------------------------------------------------------------

class PqClient : public PostgresSingleClient {
 public:
  explicit PqClient(std::string conninfo)
      : conninfo_(std::move(conninfo)), conn_(nullptr, &PQfinish) {}

  // Non-copyable, non-movable
  PqClient(const PqClient&) = delete;
  PqClient& operator=(const PqClient&) = delete;

  Error Connect() override {
    if (conn_ != nullptr) { return Error::Ok(); }
    return detail::PgConnect(conninfo_, &conn_);
  }

  Error End() override {
    conn_.reset();
    return Error::Ok();
  }

  Error Query(const std::string& sql, const std::vector<Value>& params,
              PostgresNativeResult* out) override {
    return detail::PgExec(conn_.get(), sql, params, out);
  }

  bool IsOpen() const { return conn_ != nullptr; }

 private:
  std::string conninfo_;
  detail::PgConnPtr conn_;
};

// ---------------------------------------------------------------------------
// PqPool
// ---------------------------------------------------------------------------

class PqPool;

class PqPoolClient : public PostgresPoolClient {
 public:
  PqPoolClient(std::weak_ptr<PqPool> pool, detail::PgConnPtr conn)
      : pool_(std::move(pool)), conn_(std::move(conn)) {}

  // Non-copyable, non-movable
  PqPoolClient(const PqPoolClient&) = delete;
  PqPoolClient& operator=(const PqPoolClient&) = delete;

  Error Query(const std::string& sql, const std::vector<Value>& params,
              PostgresNativeResult* out) override {
    return detail::PgExec(conn_.get(), sql, params, out);
  }

  Error Release() override;

  bool IsHealthy() const {
    return conn_ != nullptr && PQstatus(conn_.get()) == CONNECTION_OK;
  }

 private:
  std::weak_ptr<PqPool> pool_;
  detail::PgConnPtr conn_;
};

class PqPool : public PostgresPool,
               public std::enable_shared_from_this<PqPool> {
 public:
  PqPool(std::string conninfo, size_t max_connections)
      : conninfo_(std::move(conninfo)),
        max_connections_(max_connections == 0 ? 1 : max_connections) {}

  // Non-copyable, non-movable
  PqPool(const PqPool&) = delete;
  PqPool& operator=(const PqPool&) = delete;

  Error Connect(std::shared_ptr<PostgresPoolClient>* out) override {
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

    // Reserve the slot, then connect without holding the lock.
    ++num_open_;
    lock.unlock();
    detail::PgConnPtr conn(nullptr, &PQfinish);
    Error err = detail::PgConnect(conninfo_, &conn);
    lock.lock();
    if (!err.ok()) {
      --num_open_;
      cv_.notify_one();
      return err;
    }
    auto client = std::make_shared<PqPoolClient>(shared_from_this(),
                                                 std::move(conn));
    open_.push_back(client);
    Logger().debug("postgres pool opened connection {}/{}", num_open_,
                   max_connections_);
    *out = std::move(client);
    return Error::Ok();
  }

  Error End() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) { return Error::Ok(); }
    ended_ = true;
    for (const auto& client : idle_) { Forget(client.get()); }
    idle_.clear();
    cv_.notify_all();
    return Error::Ok();
  }

  size_t NumOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return num_open_;
  }

  size_t NumIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
  }

 private:
  friend class PqPoolClient;

  Error Return(PqPoolClient* client) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_.begin();
    for (; it != open_.end(); ++it) {
      if (it->get() == client) { break; }
    }
    if (it == open_.end()) {
      return Error::Make(ErrorCode::kMisuse,
                         "client does not belong to this pool");
    }
    for (const auto& idle : idle_) {
      if (idle.get() == client) {
        return Error::Make(ErrorCode::kMisuse, "client released twice");
      }
    }

    if (ended_ || !client->IsHealthy()) {
      if (!ended_) { Logger().warn("dropping broken postgres connection"); }
      Forget(client);
    } else {
      idle_.push_back(*it);
    }
    cv_.notify_one();
    return Error::Ok();
  }

  // Caller holds mutex_.
  void Forget(const PqPoolClient* client) {
    for (auto it = open_.begin(); it != open_.end(); ++it) {
      if (it->get() == client) {
        open_.erase(it);
        --num_open_;
        return;
      }
    }
  }

  const std::string conninfo_;
  const size_t max_connections_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::shared_ptr<PqPoolClient>> open_;
  std::deque<std::shared_ptr<PqPoolClient>> idle_;
  size_t num_open_ = 0;
  bool ended_ = false;
};

inline Error PqPoolClient::Release() {
  std::shared_ptr<PqPool> pool = pool_.lock();
  if (pool == nullptr) {
    conn_.reset();
    return Error::Ok();
  }
  return pool->Return(this);
}

}  // namespace qbpp
