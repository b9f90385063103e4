// Copyright (c) 2024 liudegui. MIT License.
//
// Native PostgreSQL client interfaces the postgres driver runs on.
//
// Design:
//   - PostgresClient runs one parameterized statement
//   - PostgresPool hands out PostgresPoolClient handles; the pool owns them,
//     callers hold a shared_ptr only for the length of a lease
//   - PostgresSingleClient is one dedicated connection
//   - A cursor constructor turns (client, sql, params) into a RowCursor
//
// pq_client.hpp implements these over libpq. Tests implement them in
// memory.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "qbpp/error.hpp"
#include "qbpp/query_result.hpp"
#include "qbpp/query_stream.hpp"
#include "qbpp/value.hpp"

namespace qbpp {

/// What the server answered to one statement.
struct PostgresNativeResult {
  std::string command;     // first word of the command tag: "SELECT", ...
  uint64_t row_count = 0;  // rows returned or affected
  std::vector<Row> rows;
};

class PostgresClient {
 public:
  virtual ~PostgresClient() = default;

  virtual Error Query(const std::string& sql, const std::vector<Value>& params,
                      PostgresNativeResult* out) = 0;
};

class PostgresPoolClient : public PostgresClient {
 public:
  /// Hand the handle back to its pool.
  virtual Error Release() = 0;
};

class PostgresSingleClient : public PostgresClient {
 public:
  virtual Error Connect() = 0;
  virtual Error End() = 0;
};

class PostgresPool {
 public:
  virtual ~PostgresPool() = default;

  /// Lease a handle. May block until one is free. A handle returned twice
  /// is the same object both times.
  virtual Error Connect(std::shared_ptr<PostgresPoolClient>* out) = 0;

  virtual Error End() = 0;
};

/// Opens a server-side cursor for `sql` on `client`. The cursor keeps the
/// client alive until it is destroyed.
using PostgresCursorConstructor = std::function<Error(
    std::shared_ptr<PostgresClient> client, const std::string& sql,
    const std::vector<Value>& params, std::unique_ptr<RowCursor>* out)>;

}  // namespace qbpp
