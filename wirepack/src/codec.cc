// Copyright (c) 2025 The Wirepack Authors
/**
 * @file codec.cc
 * @brief Encoder and decoder walking a StructureSchema.
 */
#include "wirepack/codec.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/byte_io.hpp"
#include "wirepack/checksum.hpp"
#include "wirepack/security_guard.hpp"

namespace wirepack {
namespace internal {

namespace {

/** True when a conditional field is present for obj. */
bool IsPresent(const StructureSchema& schema, const FieldDescriptor& f,
               const void* obj) {
  if (!f.conditional) return true;
  const FieldDescriptor& ref = schema.Fields()[f.condition_index];
  return f.condition.Evaluate(ref.get_int(obj));
}

bool CheckIntConstraints(const FieldDescriptor& f, int64_t v, Error* err) {
  for (const Constraint& c : f.constraints) {
    if (!c.Check(v)) {
      return Fail(err, Error::Validation(f.name, v, c.Describe()));
    }
  }
  return true;
}

bool CheckLengthConstraints(const FieldDescriptor& f, size_t len, Error* err) {
  return CheckIntConstraints(f, static_cast<int64_t>(len), err);
}

/** Index one past the last member of the bit-field group led by i. */
size_t GroupEnd(const std::vector<FieldDescriptor>& fields, size_t i) {
  size_t j = i + 1;
  while (j < fields.size() && fields[j].kind == FieldKind::kBitField &&
         !fields[j].group_start) {
    ++j;
  }
  return j;
}

// ---------------- size ----------------

bool SizeOf(const StructureSchema& schema, const void* obj, size_t depth,
            const SecurityLimits& limits, size_t* size, Error* err) {
  if (depth > limits.max_nesting_depth) {
    return Fail(err,
                Error::NestingDepthExceeded(depth, limits.max_nesting_depth));
  }
  size_t total = 0;
  for (const FieldDescriptor& f : schema.Fields()) {
    if (!IsPresent(schema, f, obj)) continue;
    switch (f.kind) {
      case FieldKind::kInteger:
      case FieldKind::kFixedBytes:
        total += f.byte_length;
        break;
      case FieldKind::kBitField:
        if (f.group_start) total += f.group_bits / 8;
        break;
      case FieldKind::kVariableBytes:
        total += f.view_bytes(obj).second;
        break;
      case FieldKind::kNested: {
        const void* child = f.view_nested(obj);
        if (child == nullptr) return Fail(err, Error::MissingField(f.name));
        size_t n = 0;
        if (!SizeOf(*f.nested, child, depth + 1, limits, &n, err)) {
          return false;
        }
        total += n;
        break;
      }
    }
  }
  *size = total;
  return true;
}

// ---------------- encode ----------------

bool EncodeStruct(const StructureSchema& schema, const void* obj,
                  std::vector<uint8_t>* out, Error* err) {
  const std::vector<FieldDescriptor>& fields = schema.Fields();
  const size_t start = out->size();
  size_t tail_start = 0;
  bool has_tail = false;
  const FieldDescriptor* checksum = nullptr;
  size_t checksum_offset = 0;

  for (size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& f = fields[i];
    if (!IsPresent(schema, f, obj)) continue;
    switch (f.kind) {
      case FieldKind::kInteger: {
        const int64_t v = f.get_int(obj);
        if (!CheckIntConstraints(f, v, err)) return false;
        if (f.auto_checksum) {
          checksum = &f;
          checksum_offset = out->size();
        }
        AppendBe(out, static_cast<uint32_t>(v), f.byte_length);
        break;
      }
      case FieldKind::kBitField: {
        if (!f.group_start) break;
        uint32_t packed = 0;
        const size_t end = GroupEnd(fields, i);
        for (size_t j = i; j < end; ++j) {
          const FieldDescriptor& b = fields[j];
          const int64_t v = b.get_int(obj);
          if (!FitsWidth(v, b.width_bits, b.is_signed)) {
            return Fail(err, Error::Validation(
                                 b.name, v,
                                 std::to_string(b.width_bits) + "-bit width"));
          }
          if (!CheckIntConstraints(b, v, err)) return false;
          const uint32_t mask = b.width_bits >= 32
                                    ? 0xffffffffU
                                    : ((1U << b.width_bits) - 1U);
          packed |= (static_cast<uint32_t>(v) & mask) << b.bit_shift;
        }
        AppendBe(out, packed, f.group_bits / 8);
        break;
      }
      case FieldKind::kFixedBytes: {
        const auto view = f.view_bytes(obj);
        if (!CheckLengthConstraints(f, view.second, err)) return false;
        out->insert(out->end(), view.first, view.first + view.second);
        break;
      }
      case FieldKind::kVariableBytes: {
        const auto view = f.view_bytes(obj);
        if (!CheckLengthConstraints(f, view.second, err)) return false;
        has_tail = true;
        tail_start = out->size();
        out->insert(out->end(), view.first, view.first + view.second);
        break;
      }
      case FieldKind::kNested: {
        const void* child = f.view_nested(obj);
        if (child == nullptr) return Fail(err, Error::MissingField(f.name));
        if (!EncodeStruct(*f.nested, child, out, err)) return false;
        break;
      }
    }
  }

  if (checksum != nullptr && checksum->get_int(obj) == 0) {
    size_t end = out->size();
    if (checksum->checksum_scope == ChecksumScope::kHeader && has_tail) {
      end = tail_start;
    } else if (checksum->checksum_scope == ChecksumScope::kHeaderWords) {
      const int64_t words =
          fields[checksum->checksum_length_index].get_int(obj);
      const size_t len = words > 0 ? static_cast<size_t>(words) * 4 : 0;
      if (len < checksum_offset + 2 - start || len > end - start) {
        return Fail(err, Error::Validation(
                             fields[checksum->checksum_length_index].name,
                             words, "header covers the checksum and fits "
                                    "the encoded structure"));
      }
      end = start + len;
    }
    const uint16_t sum = InternetChecksum(out->data() + start, end - start);
    WriteBe16(out->data() + checksum_offset, sum);
  }
  return true;
}

// ---------------- decode ----------------

struct Reader {
  const uint8_t* data;
  size_t size;
  SecurityLimits limits;
};

bool NeedBytes(const Reader& r, size_t cursor, size_t width,
               const std::string& field, Error* err) {
  if (cursor + width > r.size) {
    return Fail(err, Error::InsufficientData(cursor + width, r.size, field));
  }
  return true;
}

bool DecodeStruct(const Reader& r, const StructureSchema& schema, size_t depth,
                  size_t* cursor, void* obj, Error* err) {
  if (depth > r.limits.max_nesting_depth) {
    return Fail(err,
                Error::NestingDepthExceeded(depth, r.limits.max_nesting_depth));
  }
  if (r.size - *cursor < schema.MinSize()) {
    return Fail(err, Error::InsufficientData(
                         *cursor + schema.MinSize(), r.size,
                         schema.FirstMissingField(r.size - *cursor)));
  }

  const std::vector<FieldDescriptor>& fields = schema.Fields();
  for (size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& f = fields[i];
    if (!IsPresent(schema, f, obj)) continue;
    switch (f.kind) {
      case FieldKind::kInteger: {
        if (!NeedBytes(r, *cursor, f.byte_length, f.name, err)) return false;
        const uint32_t raw = ReadBe(r.data + *cursor, f.byte_length);
        const int64_t v = f.is_signed ? SignExtend(raw, f.width_bits)
                                      : static_cast<int64_t>(raw);
        *cursor += f.byte_length;
        f.set_int(obj, v);
        if (!CheckIntConstraints(f, v, err)) return false;
        break;
      }
      case FieldKind::kBitField: {
        if (!f.group_start) break;
        const size_t bytes = f.group_bits / 8;
        if (!NeedBytes(r, *cursor, bytes, f.name, err)) return false;
        const uint32_t packed = ReadBe(r.data + *cursor, bytes);
        *cursor += bytes;
        const size_t end = GroupEnd(fields, i);
        for (size_t j = i; j < end; ++j) {
          const FieldDescriptor& b = fields[j];
          const uint32_t mask = b.width_bits >= 32
                                    ? 0xffffffffU
                                    : ((1U << b.width_bits) - 1U);
          const uint32_t raw = (packed >> b.bit_shift) & mask;
          const int64_t v = b.is_signed ? SignExtend(raw, b.width_bits)
                                        : static_cast<int64_t>(raw);
          b.set_int(obj, v);
          if (!CheckIntConstraints(b, v, err)) return false;
        }
        break;
      }
      case FieldKind::kFixedBytes: {
        if (!NeedBytes(r, *cursor, f.byte_length, f.name, err)) return false;
        f.assign_bytes(obj, r.data + *cursor, f.byte_length);
        *cursor += f.byte_length;
        if (!CheckLengthConstraints(f, f.byte_length, err)) return false;
        break;
      }
      case FieldKind::kVariableBytes: {
        const size_t n = r.size - *cursor;
        f.assign_bytes(obj, r.data + *cursor, n);
        *cursor = r.size;
        if (!CheckLengthConstraints(f, n, err)) return false;
        break;
      }
      case FieldKind::kNested: {
        void* child = f.mutable_nested(obj);
        if (!DecodeStruct(r, *f.nested, depth + 1, cursor, child, err)) {
          return false;
        }
        break;
      }
    }
  }
  return true;
}

}  // namespace

bool ComputeSize(const StructureSchema& schema, const void* obj, size_t* size,
                 Error* err) {
  const SecurityLimits limits = SecurityGuard::Instance().Limits();
  return SizeOf(schema, obj, 0, limits, size, err);
}

bool EncodeObject(const StructureSchema& schema, const void* obj,
                  std::vector<uint8_t>* out, Error* err) {
  const SecurityLimits limits = SecurityGuard::Instance().Limits();
  size_t size = 0;
  if (!SizeOf(schema, obj, 0, limits, &size, err)) return false;
  if (size > limits.max_buffer_size) {
    return Fail(err, Error::BufferOverflow(size, limits.max_buffer_size));
  }
  std::vector<uint8_t> buf;
  buf.reserve(size);
  if (!EncodeStruct(schema, obj, &buf, err)) return false;
  out->insert(out->end(), buf.begin(), buf.end());
  return true;
}

bool DecodeObject(const StructureSchema& schema, const uint8_t* data,
                  size_t size, void* obj, size_t* consumed, Error* err) {
  const SecurityLimits limits = SecurityGuard::Instance().Limits();
  if (size > limits.max_buffer_size) {
    return Fail(err, Error::BufferOverflow(size, limits.max_buffer_size));
  }
  if (data == nullptr && size != 0) {
    return Fail(err, Error::InvalidArgument("null buffer with non-zero size"));
  }
  Reader r{data, size, limits};
  size_t cursor = 0;
  if (!DecodeStruct(r, schema, 0, &cursor, obj, err)) return false;
  if (consumed) *consumed = cursor;
  return true;
}

}  // namespace internal
}  // namespace wirepack
