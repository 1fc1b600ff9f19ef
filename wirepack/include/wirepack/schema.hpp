// Copyright (c) 2025 The Wirepack Authors
/**
 * @file schema.hpp
 * @brief Structure schemas: declaration, validation and process-wide cache.
 *
 * A wire structure is a plain default-constructible struct that describes
 * its layout once, in declaration order:
 *
 * @code
 * struct Echo {
 *   uint8_t type = 8;
 *   uint8_t code = 0;
 *   uint16_t checksum = 0;
 *   std::vector<uint8_t> data;
 *
 *   static void Describe(wirepack::SchemaBuilder<Echo>* b) {
 *     b->Name("Echo")
 *         .Int("type", &Echo::type)
 *         .Int("code", &Echo::code)
 *         .Int("checksum", &Echo::checksum)
 *         .AutoChecksum()
 *         .Bytes("data", &Echo::data);
 *   }
 * };
 * @endcode
 *
 * SchemaRegistry::Get<Echo>() runs Describe on first use, validates the
 * resulting layout and caches an immutable StructureSchema shared by all
 * subsequent encode/decode calls.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "wirepack/error.hpp"
#include "wirepack/export.hpp"
#include "wirepack/field.hpp"

namespace wirepack {

/**
 * @brief Immutable, validated layout of one structure type.
 */
class WIREPACK_API StructureSchema {
 public:
  /**
   * @brief Validate fields and compute derived layout data.
   * @param name Structure name used in diagnostics.
   * @param fields Fields in declaration order.
   * @param err Receives kSchemaLayout on an ambiguous or invalid layout.
   * @return Shared schema on success, nullptr on failure.
   */
  static std::shared_ptr<const StructureSchema> Create(
      std::string name, std::vector<FieldDescriptor> fields, Error* err);

  const std::string& Name() const { return name_; }
  const std::vector<FieldDescriptor>& Fields() const { return fields_; }

  /** Bytes required by all unconditional fixed-width fields (recursive). */
  size_t MinSize() const { return min_size_; }

  /** True when the last field consumes the rest of the buffer. */
  bool HasVariableTail() const { return has_tail_; }

  /** True when every instance encodes to exactly MinSize() bytes. */
  bool IsFixedSize() const { return fixed_size_; }

  /** Returns nullptr when no field has that name. */
  const FieldDescriptor* Find(const std::string& field_name) const;

  /**
   * @brief Name of the first field that does not fit in `available` bytes.
   *
   * Walks the unconditional fixed-width prefix. Returns the structure name
   * when every prefix field fits.
   */
  std::string FirstMissingField(size_t available) const;

 private:
  StructureSchema() = default;

  std::string name_;
  std::vector<FieldDescriptor> fields_;
  size_t min_size_ = 0;
  bool has_tail_ = false;
  bool fixed_size_ = true;
};

namespace internal {

template <typename M, bool = std::is_enum<M>::value>
struct IntegerOf {
  using type = M;
};

template <typename M>
struct IntegerOf<M, true> {
  using type = typename std::underlying_type<M>::type;
};

inline std::pair<const uint8_t*, size_t> ViewBytes(
    const std::vector<uint8_t>& v) {
  return {v.data(), v.size()};
}

inline std::pair<const uint8_t*, size_t> ViewBytes(const std::string& s) {
  return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

inline void AssignBytes(std::vector<uint8_t>* v, const uint8_t* p, size_t n) {
  v->assign(p, p + n);
}

inline void AssignBytes(std::string* s, const uint8_t* p, size_t n) {
  s->assign(reinterpret_cast<const char*>(p), n);
}

}  // namespace internal

/**
 * @brief Fluent builder used by a struct's static Describe function.
 *
 * Modifiers (When, Validate, AutoChecksum) apply to the most recently
 * declared field. Declaration errors are deferred and reported by Build().
 */
template <typename T>
class SchemaBuilder {
 public:
  explicit SchemaBuilder(std::string name) : name_(std::move(name)) {}

  SchemaBuilder& Name(const std::string& name);

  /** Fixed-width integer; width and signedness come from the member. */
  template <typename M>
  SchemaBuilder& Int(const std::string& name, M T::*member);

  /** Bit-field of `bits` bits, grouped with adjacent bit-fields. */
  template <typename M>
  SchemaBuilder& Bits(const std::string& name, M T::*member, uint32_t bits);

  template <size_t N>
  SchemaBuilder& FixedBytes(const std::string& name,
                            std::array<uint8_t, N> T::*member);

  /** Variable-length tail held in std::vector<uint8_t> or std::string. */
  template <typename M>
  SchemaBuilder& Bytes(const std::string& name, M T::*member);

  template <typename U>
  SchemaBuilder& Nested(const std::string& name, U T::*member);

  template <typename U>
  SchemaBuilder& Nested(const std::string& name,
                        std::unique_ptr<U> T::*member);

  SchemaBuilder& When(const std::string& field, CompareOp op, int64_t value);
  SchemaBuilder& Validate(Constraint constraint);
  SchemaBuilder& AutoChecksum(ChecksumScope scope = ChecksumScope::kStructure);
  /** kHeaderWords checksum sized by `length_field` (32-bit words). */
  SchemaBuilder& AutoChecksum(ChecksumScope scope,
                              const std::string& length_field);

  /** Validates the declared layout. Reports the first deferred error. */
  std::shared_ptr<const StructureSchema> Build(Error* err) const;

 private:
  FieldDescriptor* Last(const char* modifier);
  void Defer(Error e) {
    if (error_.ok()) error_ = std::move(e);
  }

  std::string name_;
  std::vector<FieldDescriptor> fields_;
  Error error_;
};

/**
 * @brief Process-wide cache of schemas keyed by structure type.
 *
 * Thread-safe: lookups and inserts are serialized by an internal mutex;
 * schemas themselves are immutable once published.
 */
class WIREPACK_API SchemaRegistry {
 public:
  static SchemaRegistry& Instance();

  SchemaRegistry(const SchemaRegistry&) = delete;
  SchemaRegistry& operator=(const SchemaRegistry&) = delete;

  /**
   * @brief Returns the cached schema of T, building it on first use.
   * @param err Receives kSchemaCycle or kSchemaLayout on failure.
   * @return Shared schema, or nullptr when T's layout is invalid.
   */
  template <typename T>
  std::shared_ptr<const StructureSchema> Get(Error* err = nullptr);

  /** Number of cached schemas. */
  size_t Size() const;

  /** Records the display name of the structure currently being built. */
  static void NoteBuildName(const std::string& name);

 private:
  SchemaRegistry() = default;

  std::shared_ptr<const StructureSchema> Lookup(std::type_index key) const;
  std::shared_ptr<const StructureSchema> Store(
      std::type_index key, std::shared_ptr<const StructureSchema> schema);

  /** Pushes key on this thread's build stack; fails on re-entry. */
  static bool BeginBuild(std::type_index key, const std::string& name,
                         Error* err);
  static void EndBuild();

  mutable std::mutex mtx_;
  std::unordered_map<std::type_index, std::shared_ptr<const StructureSchema>>
      cache_;
};

// ---------------- SchemaBuilder implementation ----------------

template <typename T>
SchemaBuilder<T>& SchemaBuilder<T>::Name(const std::string& name) {
  name_ = name;
  SchemaRegistry::NoteBuildName(name);
  return *this;
}

template <typename T>
template <typename M>
SchemaBuilder<T>& SchemaBuilder<T>::Int(const std::string& name,
                                        M T::*member) {
  using I = typename internal::IntegerOf<M>::type;
  static_assert(std::is_integral<I>::value,
                "Int fields must be integers or enums");
  static_assert(sizeof(I) == 1 || sizeof(I) == 2 || sizeof(I) == 4,
                "Int fields are 8, 16 or 32 bits wide");
  FieldDescriptor f;
  f.name = name;
  f.kind = FieldKind::kInteger;
  f.width_bits = static_cast<uint32_t>(sizeof(I) * 8);
  f.byte_length = sizeof(I);
  f.is_signed = std::is_signed<I>::value;
  f.get_int = [member](const void* obj) {
    return static_cast<int64_t>(
        static_cast<I>(static_cast<const T*>(obj)->*member));
  };
  f.set_int = [member](void* obj, int64_t v) {
    static_cast<T*>(obj)->*member = static_cast<M>(static_cast<I>(v));
  };
  fields_.push_back(std::move(f));
  return *this;
}

template <typename T>
template <typename M>
SchemaBuilder<T>& SchemaBuilder<T>::Bits(const std::string& name,
                                         M T::*member, uint32_t bits) {
  using I = typename internal::IntegerOf<M>::type;
  static_assert(std::is_integral<I>::value,
                "Bit-fields must be integers or enums");
  if (bits == 0 || bits > 32 || bits > sizeof(I) * 8) {
    Defer(Error::SchemaLayout(name, "bit width does not fit the member"));
  }
  FieldDescriptor f;
  f.name = name;
  f.kind = FieldKind::kBitField;
  f.width_bits = bits;
  f.is_signed = std::is_signed<I>::value;
  f.get_int = [member](const void* obj) {
    return static_cast<int64_t>(
        static_cast<I>(static_cast<const T*>(obj)->*member));
  };
  f.set_int = [member](void* obj, int64_t v) {
    static_cast<T*>(obj)->*member = static_cast<M>(static_cast<I>(v));
  };
  fields_.push_back(std::move(f));
  return *this;
}

template <typename T>
template <size_t N>
SchemaBuilder<T>& SchemaBuilder<T>::FixedBytes(
    const std::string& name, std::array<uint8_t, N> T::*member) {
  static_assert(N > 0, "FixedBytes needs at least one byte");
  FieldDescriptor f;
  f.name = name;
  f.kind = FieldKind::kFixedBytes;
  f.width_bits = static_cast<uint32_t>(N * 8);
  f.byte_length = N;
  f.view_bytes = [member](const void* obj) {
    const auto& a = static_cast<const T*>(obj)->*member;
    return std::pair<const uint8_t*, size_t>(a.data(), a.size());
  };
  f.assign_bytes = [member](void* obj, const uint8_t* p, size_t n) {
    auto& a = static_cast<T*>(obj)->*member;
    a.fill(0);
    for (size_t i = 0; i < n && i < N; ++i) a[i] = p[i];
  };
  fields_.push_back(std::move(f));
  return *this;
}

template <typename T>
template <typename M>
SchemaBuilder<T>& SchemaBuilder<T>::Bytes(const std::string& name,
                                          M T::*member) {
  static_assert(std::is_same<M, std::vector<uint8_t>>::value ||
                    std::is_same<M, std::string>::value,
                "Bytes fields are std::vector<uint8_t> or std::string");
  FieldDescriptor f;
  f.name = name;
  f.kind = FieldKind::kVariableBytes;
  f.view_bytes = [member](const void* obj) {
    return internal::ViewBytes(static_cast<const T*>(obj)->*member);
  };
  f.assign_bytes = [member](void* obj, const uint8_t* p, size_t n) {
    internal::AssignBytes(&(static_cast<T*>(obj)->*member), p, n);
  };
  fields_.push_back(std::move(f));
  return *this;
}

template <typename T>
template <typename U>
SchemaBuilder<T>& SchemaBuilder<T>::Nested(const std::string& name,
                                           U T::*member) {
  FieldDescriptor f;
  f.name = name;
  f.kind = FieldKind::kNested;
  Error nested_err;
  f.nested = SchemaRegistry::Instance().Get<U>(&nested_err);
  if (!f.nested) Defer(std::move(nested_err));
  f.view_nested = [member](const void* obj) -> const void* {
    return &(static_cast<const T*>(obj)->*member);
  };
  f.mutable_nested = [member](void* obj) -> void* {
    return &(static_cast<T*>(obj)->*member);
  };
  fields_.push_back(std::move(f));
  return *this;
}

template <typename T>
template <typename U>
SchemaBuilder<T>& SchemaBuilder<T>::Nested(const std::string& name,
                                           std::unique_ptr<U> T::*member) {
  FieldDescriptor f;
  f.name = name;
  f.kind = FieldKind::kNested;
  f.boxed = true;
  Error nested_err;
  f.nested = SchemaRegistry::Instance().Get<U>(&nested_err);
  if (!f.nested) Defer(std::move(nested_err));
  f.view_nested = [member](const void* obj) -> const void* {
    return (static_cast<const T*>(obj)->*member).get();
  };
  f.mutable_nested = [member](void* obj) -> void* {
    auto& box = static_cast<T*>(obj)->*member;
    if (!box) box = std::make_unique<U>();
    return box.get();
  };
  fields_.push_back(std::move(f));
  return *this;
}

template <typename T>
SchemaBuilder<T>& SchemaBuilder<T>::When(const std::string& field,
                                         CompareOp op, int64_t value) {
  if (FieldDescriptor* f = Last("When")) {
    f->conditional = true;
    f->condition.field = field;
    f->condition.op = op;
    f->condition.value = value;
  }
  return *this;
}

template <typename T>
SchemaBuilder<T>& SchemaBuilder<T>::Validate(Constraint constraint) {
  if (FieldDescriptor* f = Last("Validate")) {
    f->constraints.push_back(std::move(constraint));
  }
  return *this;
}

template <typename T>
SchemaBuilder<T>& SchemaBuilder<T>::AutoChecksum(ChecksumScope scope) {
  if (FieldDescriptor* f = Last("AutoChecksum")) {
    f->auto_checksum = true;
    f->checksum_scope = scope;
  }
  return *this;
}

template <typename T>
SchemaBuilder<T>& SchemaBuilder<T>::AutoChecksum(
    ChecksumScope scope, const std::string& length_field) {
  if (FieldDescriptor* f = Last("AutoChecksum")) {
    f->auto_checksum = true;
    f->checksum_scope = scope;
    f->checksum_length_field = length_field;
  }
  return *this;
}

template <typename T>
std::shared_ptr<const StructureSchema> SchemaBuilder<T>::Build(
    Error* err) const {
  if (!error_.ok()) {
    Fail(err, error_);
    return nullptr;
  }
  return StructureSchema::Create(name_, fields_, err);
}

template <typename T>
FieldDescriptor* SchemaBuilder<T>::Last(const char* modifier) {
  if (fields_.empty()) {
    Defer(Error::SchemaLayout(name_, std::string(modifier) +
                                         " used before any field"));
    return nullptr;
  }
  return &fields_.back();
}

// ---------------- SchemaRegistry implementation ----------------

template <typename T>
std::shared_ptr<const StructureSchema> SchemaRegistry::Get(Error* err) {
  const std::type_index key(typeid(T));
  if (auto cached = Lookup(key)) return cached;

  if (!BeginBuild(key, typeid(T).name(), err)) return nullptr;
  SchemaBuilder<T> builder(typeid(T).name());
  T::Describe(&builder);
  EndBuild();

  auto schema = builder.Build(err);
  if (!schema) return nullptr;
  return Store(key, std::move(schema));
}

}  // namespace wirepack
