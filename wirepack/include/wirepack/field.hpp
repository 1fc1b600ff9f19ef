// Copyright (c) 2025 The Wirepack Authors
/**
 * @file field.hpp
 * @brief Per-field wire metadata: kind, width, presence and constraints.
 *
 * A FieldDescriptor is produced by SchemaBuilder and owned by exactly one
 * StructureSchema. It carries type-erased accessors bound to a member of the
 * described struct, so the codec can read and write values without knowing
 * the concrete C++ type.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "wirepack/export.hpp"

namespace wirepack {

class StructureSchema;

enum class FieldKind {
  kInteger,        ///< 8/16/32-bit big-endian integer
  kBitField,       ///< Sub-byte field, packed MSB-first into a byte group
  kFixedBytes,     ///< Byte string of fixed length (e.g. a MAC address)
  kVariableBytes,  ///< Trailing byte string, consumes the rest of the buffer
  kNested,         ///< Nested structure with its own schema
};

/** Comparison used by conditional fields. */
enum class CompareOp { kEq, kNe, kLt, kGt, kLe, kGe };

/** Byte range covered by an auto-computed checksum. */
enum class ChecksumScope {
  kStructure,  ///< Every byte of the structure, tail included
  kHeader,     ///< Bytes before the variable-length tail
  /** First 4 * N bytes, N read from an earlier header-length field */
  kHeaderWords,
};

WIREPACK_API const char* ToString(FieldKind kind);
WIREPACK_API const char* ToString(CompareOp op);

/**
 * @brief Presence predicate over an earlier field of the same structure.
 */
struct WIREPACK_API Condition {
  std::string field;
  CompareOp op = CompareOp::kEq;
  int64_t value = 0;

  bool Evaluate(int64_t actual) const;
  std::string Describe() const;
};

/**
 * @brief Value constraint checked after a field is decoded.
 *
 * Integer constraints apply to the field value; LengthRange applies to the
 * length of a byte-string field.
 */
class WIREPACK_API Constraint {
 public:
  enum class Kind { kRange, kOneOf, kNoneOf, kLength };

  static Constraint Range(int64_t min, int64_t max);
  static Constraint Min(int64_t min);
  static Constraint Max(int64_t max);
  static Constraint OneOf(std::vector<int64_t> values);
  static Constraint NoneOf(std::vector<int64_t> values);
  static Constraint LengthRange(size_t min, size_t max);

  Kind kind() const { return kind_; }
  bool AppliesToLength() const { return kind_ == Kind::kLength; }

  /** Returns true when v satisfies the constraint. */
  bool Check(int64_t v) const;

  /** Short text such as "range[5,15]" or "one_of{1,2}". */
  std::string Describe() const;

 private:
  Constraint(Kind kind, int64_t min, int64_t max, std::vector<int64_t> set)
      : kind_(kind), min_(min), max_(max), set_(std::move(set)) {}

  Kind kind_;
  int64_t min_;
  int64_t max_;
  std::vector<int64_t> set_;
};

/**
 * @brief Wire description of a single structure field.
 *
 * Layout members (group_start, group_bits, bit_shift, condition_index,
 * checksum_length_index) are
 * filled in by StructureSchema::Create and are meaningless before that.
 */
struct WIREPACK_API FieldDescriptor {
  std::string name;
  FieldKind kind = FieldKind::kInteger;
  uint32_t width_bits = 0;  ///< Integer/bit-field width in bits
  size_t byte_length = 0;   ///< Integer/fixed-bytes width in bytes
  bool is_signed = false;

  // Bit-field group placement.
  bool group_start = false;
  uint32_t group_bits = 0;  ///< Total bits of the group (leader only)
  uint32_t bit_shift = 0;   ///< Shift of this field within its group

  bool conditional = false;
  Condition condition;
  size_t condition_index = 0;  ///< Index of the referenced field

  std::vector<Constraint> constraints;

  bool auto_checksum = false;
  ChecksumScope checksum_scope = ChecksumScope::kStructure;
  std::string checksum_length_field;  ///< kHeaderWords only
  size_t checksum_length_index = 0;   ///< Index of checksum_length_field

  std::shared_ptr<const StructureSchema> nested;
  bool boxed = false;  ///< Nested value held in a std::unique_ptr

  /** @name Type-erased accessors (obj points to the described struct) */
  ///@{
  std::function<int64_t(const void*)> get_int;
  std::function<void(void*, int64_t)> set_int;
  std::function<std::pair<const uint8_t*, size_t>(const void*)> view_bytes;
  std::function<void(void*, const uint8_t*, size_t)> assign_bytes;
  /** Returns nullptr when a boxed member is empty. */
  std::function<const void*(const void*)> view_nested;
  /** Returns the nested object, allocating a boxed member if needed. */
  std::function<void*(void*)> mutable_nested;
  ///@}

  bool IsIntegerLike() const {
    return kind == FieldKind::kInteger || kind == FieldKind::kBitField;
  }
};

}  // namespace wirepack
