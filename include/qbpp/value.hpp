// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::Value -- a bound parameter or a result field.
//
// Design:
//   - Tagged value: null, bool, int64, double, text, blob
//   - Blob bytes share the text storage
//   - Copyable, structural equality

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace qbpp {

enum class ValueType : uint8_t {
  kNull = 0,
  kBool,
  kInt64,
  kDouble,
  kText,
  kBlob,
};

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

class Value {
 public:
  Value() = default;

  static Value Null() { return Value{}; }

  static Value Bool(bool v) {
    Value value(ValueType::kBool);
    value.int_ = v ? 1 : 0;
    return value;
  }

  static Value Int(int64_t v) {
    Value value(ValueType::kInt64);
    value.int_ = v;
    return value;
  }

  static Value Double(double v) {
    Value value(ValueType::kDouble);
    value.double_ = v;
    return value;
  }

  static Value Text(std::string v) {
    Value value(ValueType::kText);
    value.bytes_ = std::move(v);
    return value;
  }

  static Value Blob(const uint8_t* data, size_t len) {
    Value value(ValueType::kBlob);
    if (data != nullptr) {
      value.bytes_.assign(reinterpret_cast<const char*>(data), len);
    }
    return value;
  }

  ValueType Type() const { return type_; }
  bool IsNull() const { return type_ == ValueType::kNull; }

  bool AsBool() const { return int_ != 0; }
  int64_t AsInt64() const { return int_; }
  double AsDouble() const { return double_; }

  /// Text content, or raw bytes for a blob.
  const std::string& AsText() const { return bytes_; }

  const uint8_t* BlobData() const {
    return reinterpret_cast<const uint8_t*>(bytes_.data());
  }
  size_t BlobSize() const { return bytes_.size(); }

  /// Human-readable rendering for logs. Blobs show their size only.
  std::string ToString() const {
    char buf[64];
    switch (type_) {
      case ValueType::kNull:
        return "null";
      case ValueType::kBool:
        return int_ != 0 ? "true" : "false";
      case ValueType::kInt64:
        std::snprintf(buf, sizeof(buf), "%lld",
                      static_cast<long long>(int_));
        return buf;
      case ValueType::kDouble:
        std::snprintf(buf, sizeof(buf), "%.17g", double_);
        return buf;
      case ValueType::kText:
        return "'" + bytes_ + "'";
      case ValueType::kBlob:
        std::snprintf(buf, sizeof(buf), "<blob %zu bytes>", bytes_.size());
        return buf;
    }
    return "";
  }

  bool operator==(const Value& other) const {
    if (type_ != other.type_) { return false; }
    switch (type_) {
      case ValueType::kNull:
        return true;
      case ValueType::kBool:
      case ValueType::kInt64:
        return int_ == other.int_;
      case ValueType::kDouble:
        return double_ == other.double_;
      case ValueType::kText:
      case ValueType::kBlob:
        return bytes_ == other.bytes_;
    }
    return false;
  }

  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  explicit Value(ValueType type) : type_(type) {}

  ValueType type_ = ValueType::kNull;
  int64_t int_ = 0;
  double double_ = 0.0;
  std::string bytes_;
};

}  // namespace qbpp
