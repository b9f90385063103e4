// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::MakeSqlCursorConstructor -- server-side cursors in plain SQL.
//
// Opens the cursor with DECLARE ... NO SCROLL CURSOR WITH HOLD, reads with
// FETCH FORWARD n and closes with CLOSE, all through the client's own
// Query(). WITH HOLD keeps the cursor usable outside a transaction block.
// Outside a transaction the server materializes the whole result when the
// implicit transaction commits, so only client memory stays bounded by the
// chunk size. Cursor names are unique per process.
//
// The cursor holds a strong reference to its client; closing a stream after
// its connection was released or dropped by the pool still reaches a live
// handle.

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "qbpp/error.hpp"
#include "qbpp/postgres_client.hpp"
#include "qbpp/query_stream.hpp"

namespace qbpp {

class PostgresSqlCursor : public RowCursor {
 public:
  PostgresSqlCursor(std::shared_ptr<PostgresClient> client, std::string name)
      : client_(std::move(client)), name_(std::move(name)) {}

  Error Read(int64_t max_rows, std::vector<Row>* out) override {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    out->clear();
    std::string sql =
        "fetch forward " + std::to_string(max_rows) + " from " + name_;
    PostgresNativeResult result;
    Error err = client_->Query(sql, {}, &result);
    if (!err.ok()) {
      err.AppendContext("PostgresSqlCursor::Read");
      return err;
    }
    *out = std::move(result.rows);
    return Error::Ok();
  }

  Error Close() override {
    PostgresNativeResult result;
    Error err = client_->Query("close " + name_, {}, &result);
    err.AppendContext("PostgresSqlCursor::Close");
    return err;
  }

  const std::string& name() const { return name_; }

 private:
  std::shared_ptr<PostgresClient> client_;
  std::string name_;
};

inline PostgresCursorConstructor MakeSqlCursorConstructor() {
  return [](std::shared_ptr<PostgresClient> client, const std::string& sql,
            const std::vector<Value>& params,
            std::unique_ptr<RowCursor>* out) -> Error {
    if (client == nullptr || out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "client or out is null");
    }
    static std::atomic<uint64_t> next_id{1};
    std::string name = "qbpp_cursor_" + std::to_string(next_id.fetch_add(1));

    PostgresNativeResult result;
    Error err = client->Query(
        "declare " + name + " no scroll cursor with hold for " + sql, params,
        &result);
    if (!err.ok()) {
      err.AppendContext("declare cursor");
      return err;
    }
    out->reset(new PostgresSqlCursor(std::move(client), std::move(name)));
    return Error::Ok();
  };
}

}  // namespace qbpp
