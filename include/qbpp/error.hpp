// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::Error -- error handling without exceptions.
//
// Every compiler, driver and connection call returns an Error. Native
// client failures keep their mapped code; each layer they pass through
// appends its name with AppendContext(), so a failed statement reads like
//
//   duplicate key value [at PostgresConnection::ExecuteQuery]
//       [at Database::Execute]
//
// Works with -fno-exceptions.

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace qbpp {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,             // native failure with no closer mapping
  kNotOpen = -2,           // connection or handle already closed
  kBusy = -3,              // pool exhausted, database locked
  kNotFound = -4,          // missing relation or column
  kConstraint = -5,        // unique, foreign key, not null, check
  kMismatch = -6,          // value type does not fit the column
  kMisuse = -7,            // call out of order, malformed raw node
  kRange = -8,             // parameter count or index out of range
  kNullParam = -9,
  kIoError = -10,          // connect or network failure
  kFull = -11,
  kConfig = -12,           // dialect config lacks a required field
  kInvalidArgument = -13,  // chunk size, isolation level
  kUnsupportedNode = -14,  // node kind the dialect cannot render
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kError: return "error";
    case ErrorCode::kNotOpen: return "not open";
    case ErrorCode::kBusy: return "busy";
    case ErrorCode::kNotFound: return "not found";
    case ErrorCode::kConstraint: return "constraint";
    case ErrorCode::kMismatch: return "mismatch";
    case ErrorCode::kMisuse: return "misuse";
    case ErrorCode::kRange: return "range";
    case ErrorCode::kNullParam: return "null param";
    case ErrorCode::kIoError: return "io error";
    case ErrorCode::kFull: return "full";
    case ErrorCode::kConfig: return "configuration error";
    case ErrorCode::kInvalidArgument: return "invalid argument";
    case ErrorCode::kUnsupportedNode: return "unsupported node";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    SetFormatV(c, fmt, ap);
    va_end(ap);
  }

  void SetFormatV(ErrorCode c, const char* fmt, va_list ap) {
    code = c;
    if (fmt == nullptr) {
      message[0] = '\0';
      return;
    }
    std::vsnprintf(message, kMaxMessageLen, fmt, ap);
  }

  /// Append " [at where]" to the message. The code is left unchanged.
  /// Silently truncates once the buffer is full.
  void AppendContext(const char* where) {
    if (where == nullptr || ok()) { return; }
    size_t len = std::strlen(message);
    if (len >= kMaxMessageLen - 1) { return; }
    std::snprintf(message + len, kMaxMessageLen - len, " [at %s]", where);
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  /// printf-style Make().
  static Error Format(ErrorCode c, const char* fmt, ...) {
    Error e;
    va_list ap;
    va_start(ap, fmt);
    e.SetFormatV(c, fmt, ap);
    va_end(ap);
    return e;
  }
};

}  // namespace qbpp
