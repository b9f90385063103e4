// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::DatabaseConnection -- one live connection handed out by a Driver.
//
// Design:
//   - Owned by the driver that created it; callers hold a non-owning
//     pointer between AcquireConnection() and ReleaseConnection()
//   - Statements issued on one connection run in issue order

#pragma once

#include <cstdint>

#include "qbpp/compiled_query.hpp"
#include "qbpp/error.hpp"
#include "qbpp/query_result.hpp"
#include "qbpp/query_stream.hpp"

namespace qbpp {

class DatabaseConnection {
 public:
  virtual ~DatabaseConnection() = default;

  /// Run one statement. Native failures keep their code and gain the
  /// call site in their message.
  virtual Error ExecuteQuery(const CompiledQuery& query,
                             QueryResult* out) = 0;

  /// Open a cursor over `query`, read `chunk_size` rows per batch.
  /// `chunk_size` must be positive.
  virtual Error StreamQuery(const CompiledQuery& query, int64_t chunk_size,
                            QueryStream* out) = 0;
};

}  // namespace qbpp
