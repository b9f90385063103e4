// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::Driver -- connection and transaction lifecycle of one backend.
//
// Lifecycle: Init() -> (AcquireConnection() / ReleaseConnection())* ->
// Destroy(). Transactions are opened, committed and rolled back on an
// acquired connection; the driver does not track transaction state.

#pragma once

#include <cstdint>
#include <functional>

#include "qbpp/database_connection.hpp"
#include "qbpp/error.hpp"

namespace qbpp {

enum class IsolationLevel : uint8_t {
  kDefault = 0,  // let the server decide; plain "begin"
  kReadUncommitted,
  kReadCommitted,
  kRepeatableRead,
  kSerializable,
  kSnapshot,
};

inline const char* IsolationLevelSql(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::kDefault: return "";
    case IsolationLevel::kReadUncommitted: return "read uncommitted";
    case IsolationLevel::kReadCommitted: return "read committed";
    case IsolationLevel::kRepeatableRead: return "repeatable read";
    case IsolationLevel::kSerializable: return "serializable";
    case IsolationLevel::kSnapshot: return "snapshot";
  }
  return "";
}

struct TransactionSettings {
  IsolationLevel isolation_level = IsolationLevel::kDefault;
};

// ---------------------------------------------------------------------------
// Driver
// ---------------------------------------------------------------------------

class Driver {
 public:
  virtual ~Driver() = default;

  virtual Error Init() = 0;

  /// On success `*out` points at a connection owned by the driver.
  virtual Error AcquireConnection(DatabaseConnection** out) = 0;

  virtual Error BeginTransaction(DatabaseConnection* connection,
                                 const TransactionSettings& settings) = 0;
  virtual Error CommitTransaction(DatabaseConnection* connection) = 0;
  virtual Error RollbackTransaction(DatabaseConnection* connection) = 0;

  virtual Error ReleaseConnection(DatabaseConnection* connection) = 0;

  virtual Error Destroy() = 0;
};

/// Called once for every newly created connection.
using ConnectionCreatedHook = std::function<Error(DatabaseConnection*)>;

}  // namespace qbpp
