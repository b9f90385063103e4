// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::QueryStream -- lazy, finite, non-restartable sequence of batches.
//
// Design:
//   - A RowCursor is the backend's server-side cursor: Read(n) returns up
//     to n rows, Close() releases it
//   - QueryStream owns the cursor (RAII, move-only) and yields one
//     QueryResult per non-empty read; the first empty read ends it
//   - The cursor is closed exactly once on every exit path: exhaustion,
//     Close() by the consumer, destruction, or a failed read
//   - When a read fails and the close that follows fails too, the read
//     error is returned and the close error is logged
//
// Usage:
//   qbpp::QueryStream stream;
//   err = conn->StreamQuery(query, 100, &stream);
//   qbpp::QueryResult batch;
//   while (stream.Next(&batch, &err)) { ... }
//   if (!err.ok()) { ... }

#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "qbpp/error.hpp"
#include "qbpp/log.hpp"
#include "qbpp/query_result.hpp"

namespace qbpp {

// ---------------------------------------------------------------------------
// RowCursor
// ---------------------------------------------------------------------------

class RowCursor {
 public:
  virtual ~RowCursor() = default;

  /// Read up to `max_rows` rows into `out` (cleared first). An empty
  /// result means the cursor is exhausted.
  virtual Error Read(int64_t max_rows, std::vector<Row>* out) = 0;

  virtual Error Close() = 0;
};

// ---------------------------------------------------------------------------
// QueryStream
// ---------------------------------------------------------------------------

class QueryStream {
 public:
  QueryStream() = default;

  QueryStream(std::unique_ptr<RowCursor> cursor, int64_t chunk_size)
      : cursor_(std::move(cursor)), chunk_size_(chunk_size) {}

  ~QueryStream() {
    Error err = Close();
    if (!err.ok()) {
      Logger().warn("closing cursor of abandoned stream failed: {}",
                    err.message);
    }
  }

  // Move
  QueryStream(QueryStream&& other) noexcept
      : cursor_(std::move(other.cursor_)), chunk_size_(other.chunk_size_) {
    other.chunk_size_ = 0;
  }

  QueryStream& operator=(QueryStream&& other) noexcept {
    if (this != &other) {
      Error err = Close();
      if (!err.ok()) {
        Logger().warn("closing replaced stream failed: {}", err.message);
      }
      cursor_ = std::move(other.cursor_);
      chunk_size_ = other.chunk_size_;
      other.chunk_size_ = 0;
    }
    return *this;
  }

  // No copy
  QueryStream(const QueryStream&) = delete;
  QueryStream& operator=(const QueryStream&) = delete;

  // --- Iteration ---

  /// Fetch the next batch. Returns false when the stream has ended, in
  /// which case `out_error` says whether it ended cleanly.
  bool Next(QueryResult* out, Error* out_error = nullptr) {
    if (out_error != nullptr) { out_error->Clear(); }
    if (cursor_ == nullptr) { return false; }
    if (out == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "out is null");
      }
      return false;
    }

    std::vector<Row> rows;
    Error err = cursor_->Read(chunk_size_, &rows);
    if (!err.ok()) {
      Error close_err = Close();
      if (!close_err.ok()) {
        Logger().warn("closing cursor after failed read failed: {}",
                      close_err.message);
      }
      if (out_error != nullptr) { *out_error = err; }
      return false;
    }

    if (rows.empty()) {
      Error close_err = Close();
      if (!close_err.ok() && out_error != nullptr) { *out_error = close_err; }
      return false;
    }

    *out = QueryResult{};
    out->rows = std::move(rows);
    return true;
  }

  /// Stop early. Closes the cursor if it is still open; idempotent.
  Error Close() {
    if (cursor_ == nullptr) { return Error::Ok(); }
    std::unique_ptr<RowCursor> cursor = std::move(cursor_);
    return cursor->Close();
  }

  bool IsOpen() const { return cursor_ != nullptr; }

 private:
  std::unique_ptr<RowCursor> cursor_;
  int64_t chunk_size_ = 0;
};

}  // namespace qbpp
