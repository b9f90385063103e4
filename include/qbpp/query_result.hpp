// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::Row / qbpp::QueryResult -- driver-neutral query results.
//
// Design:
//   - Row owns its field values; column names are shared by every row of
//     one result
//   - Field accessors with null defaults, in the style of the backend
//     query cursors (FieldIndex, FieldValue, GetInt64, GetString, ...)
//   - QueryResult carries the affected-row count only for statements that
//     report one (insert, update, delete)

#pragma once

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "qbpp/value.hpp"

namespace qbpp {

using ColumnNames = std::shared_ptr<const std::vector<std::string>>;

// ---------------------------------------------------------------------------
// Row
// ---------------------------------------------------------------------------

class Row {
 public:
  Row() = default;

  Row(ColumnNames columns, std::vector<Value> values)
      : columns_(std::move(columns)), values_(std::move(values)) {}

  // --- Field info ---

  int32_t NumFields() const { return static_cast<int32_t>(values_.size()); }

  int32_t FieldIndex(const char* name) const {
    if (columns_ == nullptr || name == nullptr) { return -1; }
    for (size_t i = 0; i < columns_->size(); ++i) {
      if ((*columns_)[i] == name) { return static_cast<int32_t>(i); }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (columns_ == nullptr || col < 0 ||
        col >= static_cast<int32_t>(columns_->size())) {
      return nullptr;
    }
    return (*columns_)[static_cast<size_t>(col)].c_str();
  }

  // --- Field values ---

  const Value& FieldValue(int32_t col) const {
    static const Value kNull;
    if (col < 0 || col >= NumFields()) { return kNull; }
    return values_[static_cast<size_t>(col)];
  }

  const Value& FieldValue(const char* name) const {
    return FieldValue(FieldIndex(name));
  }

  bool FieldIsNull(int32_t col) const { return FieldValue(col).IsNull(); }

  // --- Typed accessors ---

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    const Value& v = FieldValue(col);
    switch (v.Type()) {
      case ValueType::kBool:
      case ValueType::kInt64:
        return v.AsInt64();
      case ValueType::kDouble:
        return static_cast<int64_t>(v.AsDouble());
      case ValueType::kText:
        return static_cast<int64_t>(std::strtoll(v.AsText().c_str(), nullptr, 10));
      default:
        return null_value;
    }
  }

  int64_t GetInt64(const char* name, int64_t null_value = 0) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetInt64(idx, null_value) : null_value;
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    const Value& v = FieldValue(col);
    switch (v.Type()) {
      case ValueType::kBool:
      case ValueType::kInt64:
        return static_cast<double>(v.AsInt64());
      case ValueType::kDouble:
        return v.AsDouble();
      case ValueType::kText:
        return std::strtod(v.AsText().c_str(), nullptr);
      default:
        return null_value;
    }
  }

  double GetDouble(const char* name, double null_value = 0.0) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetDouble(idx, null_value) : null_value;
  }

  std::string GetString(int32_t col, const char* null_value = "") const {
    const Value& v = FieldValue(col);
    switch (v.Type()) {
      case ValueType::kNull:
        return null_value;
      case ValueType::kText:
      case ValueType::kBlob:
        return v.AsText();
      default:
        return v.ToString();
    }
  }

  std::string GetString(const char* name, const char* null_value = "") const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetString(idx, null_value) : null_value;
  }

  const std::vector<Value>& Values() const { return values_; }

 private:
  ColumnNames columns_;
  std::vector<Value> values_;
};

// ---------------------------------------------------------------------------
// QueryResult
// ---------------------------------------------------------------------------

struct QueryResult {
  std::vector<Row> rows;

  /// Set for insert/update/delete. 64-bit: counts may exceed int32 range.
  bool has_num_affected_rows = false;
  uint64_t num_affected_rows = 0;

  /// Set by backends that report the generated key of an insert.
  bool has_insert_id = false;
  int64_t insert_id = 0;
};

}  // namespace qbpp
