// Copyright (c) 2025 The Wirepack Authors
/**
 * @file codec.hpp
 * @brief Schema-driven encoding and decoding of wire structures.
 *
 * All entry points read the SecurityGuard limits once, then:
 *  - Encode computes the exact output size, rejects it if it exceeds the
 *    maximum buffer size, writes fields in declaration order (big-endian,
 *    bit-fields packed MSB-first) and patches auto checksums.
 *  - Decode checks buffer size, then nesting depth, then the fixed-size
 *    prefix, before interpreting any field.
 *
 * Outputs are left untouched on failure.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "wirepack/error.hpp"
#include "wirepack/export.hpp"
#include "wirepack/schema.hpp"

namespace wirepack {

namespace internal {

/** Number of bytes obj encodes to. Fails on depth or missing values. */
WIREPACK_API bool ComputeSize(const StructureSchema& schema, const void* obj,
                              size_t* size, Error* err);

/** Appends the encoding of obj to *out. */
WIREPACK_API bool EncodeObject(const StructureSchema& schema, const void* obj,
                               std::vector<uint8_t>* out, Error* err);

/**
 * @brief Decodes data[0, size) into obj.
 * @param consumed Receives the number of bytes used (may be nullptr).
 */
WIREPACK_API bool DecodeObject(const StructureSchema& schema,
                               const uint8_t* data, size_t size, void* obj,
                               size_t* consumed, Error* err);

}  // namespace internal

/**
 * @brief Computes the encoded size of value without encoding it.
 * @return false on schema errors, missing nested values or depth limits.
 */
template <typename T>
bool EncodedSize(const T& value, size_t* size, Error* err = nullptr) {
  auto schema = SchemaRegistry::Instance().Get<T>(err);
  if (!schema) return false;
  size_t n = 0;
  if (!internal::ComputeSize(*schema, &value, &n, err)) return false;
  *size = n;
  return true;
}

/**
 * @brief Encodes value into a freshly sized buffer.
 * @param out Replaced with the encoded bytes on success.
 */
template <typename T>
bool Encode(const T& value, std::vector<uint8_t>* out, Error* err = nullptr) {
  auto schema = SchemaRegistry::Instance().Get<T>(err);
  if (!schema) return false;
  std::vector<uint8_t> buf;
  if (!internal::EncodeObject(*schema, &value, &buf, err)) return false;
  *out = std::move(buf);
  return true;
}

/**
 * @brief Decodes a T from data. Bytes beyond a fixed layout are ignored.
 */
template <typename T>
bool Decode(const uint8_t* data, size_t size, T* out, Error* err = nullptr) {
  auto schema = SchemaRegistry::Instance().Get<T>(err);
  if (!schema) return false;
  T tmp;
  if (!internal::DecodeObject(*schema, data, size, &tmp, nullptr, err)) {
    return false;
  }
  *out = std::move(tmp);
  return true;
}

template <typename T>
bool Decode(const std::vector<uint8_t>& data, T* out, Error* err = nullptr) {
  return Decode(data.data(), data.size(), out, err);
}

/**
 * @brief Decodes a T from the front of data and reports its length.
 * @param consumed Receives the bytes used by T on success.
 */
template <typename T>
bool DecodePrefix(const uint8_t* data, size_t size, T* out, size_t* consumed,
                  Error* err = nullptr) {
  auto schema = SchemaRegistry::Instance().Get<T>(err);
  if (!schema) return false;
  T tmp;
  size_t used = 0;
  if (!internal::DecodeObject(*schema, data, size, &tmp, &used, err)) {
    return false;
  }
  *out = std::move(tmp);
  if (consumed) *consumed = used;
  return true;
}

}  // namespace wirepack
