// Copyright (c) 2025 The Wirepack Authors
/**
 * @file schema.cc
 * @brief StructureSchema layout validation and the schema registry.
 */
#include "wirepack/schema.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace wirepack {

namespace {

/** Closes the bit-field group [first, end) and assigns shifts MSB-first. */
bool CloseBitGroup(std::vector<FieldDescriptor>* fields, size_t first,
                   size_t end, Error* err) {
  uint32_t total = 0;
  for (size_t i = first; i < end; ++i) total += (*fields)[i].width_bits;
  if (total % 8 != 0) {
    return Fail(err, Error::SchemaLayout(
                         (*fields)[first].name,
                         "bit-field group of " + std::to_string(total) +
                             " bits is not byte-aligned"));
  }
  if (total > 32) {
    return Fail(err, Error::SchemaLayout(
                         (*fields)[first].name,
                         "bit-field group exceeds 32 bits"));
  }
  uint32_t remaining = total;
  for (size_t i = first; i < end; ++i) {
    FieldDescriptor& f = (*fields)[i];
    remaining -= f.width_bits;
    f.bit_shift = remaining;
    f.group_start = (i == first);
    f.group_bits = (i == first) ? total : 0;
  }
  return true;
}

/** Wire width of an unconditional fixed field; 0 for tails. */
size_t FixedWidth(const FieldDescriptor& f) {
  switch (f.kind) {
    case FieldKind::kInteger:
    case FieldKind::kFixedBytes:
      return f.byte_length;
    case FieldKind::kBitField:
      return f.group_start ? f.group_bits / 8 : 0;
    case FieldKind::kNested:
      return f.nested ? f.nested->MinSize() : 0;
    case FieldKind::kVariableBytes:
      return 0;
  }
  return 0;
}

}  // namespace

std::shared_ptr<const StructureSchema> StructureSchema::Create(
    std::string name, std::vector<FieldDescriptor> fields, Error* err) {
  std::set<std::string> seen;
  const size_t n = fields.size();
  size_t checksum_count = 0;
  size_t group_first = n;  // n means "no open group"

  for (size_t i = 0; i < n; ++i) {
    FieldDescriptor& f = fields[i];
    if (f.name.empty()) {
      Fail(err, Error::SchemaLayout(name, "field without a name"));
      return nullptr;
    }
    if (!seen.insert(f.name).second) {
      Fail(err, Error::SchemaLayout(f.name, "duplicate field name"));
      return nullptr;
    }

    if (f.kind == FieldKind::kBitField) {
      if (f.conditional) {
        Fail(err, Error::SchemaLayout(f.name, "bit-fields cannot be "
                                              "conditional"));
        return nullptr;
      }
      if (group_first == n) group_first = i;
    } else if (group_first != n) {
      if (!CloseBitGroup(&fields, group_first, i, err)) return nullptr;
      group_first = n;
    }

    if (f.kind == FieldKind::kVariableBytes && i + 1 != n) {
      Fail(err, Error::SchemaLayout(
                    f.name, "variable-length field must be the last field"));
      return nullptr;
    }
    if (f.kind == FieldKind::kNested) {
      if (!f.nested) {
        Fail(err, Error::SchemaLayout(f.name, "nested schema unavailable"));
        return nullptr;
      }
      if (f.nested->HasVariableTail() && i + 1 != n) {
        Fail(err, Error::SchemaLayout(
                      f.name,
                      "nested structure with a variable tail must be last"));
        return nullptr;
      }
    }

    if (f.conditional) {
      bool found = false;
      for (size_t j = 0; j < i; ++j) {
        if (fields[j].name != f.condition.field) continue;
        if (!fields[j].IsIntegerLike()) {
          Fail(err, Error::SchemaLayout(
                        f.name, "condition references non-integer field '" +
                                    f.condition.field + "'"));
          return nullptr;
        }
        f.condition_index = j;
        found = true;
        break;
      }
      if (!found) {
        Fail(err, Error::SchemaLayout(
                      f.name, "condition references unknown or later field '" +
                                  f.condition.field + "'"));
        return nullptr;
      }
    }

    if (f.auto_checksum) {
      if (f.kind != FieldKind::kInteger || f.width_bits != 16 || f.is_signed ||
          f.conditional) {
        Fail(err, Error::SchemaLayout(
                      f.name, "checksum must be an unconditional unsigned "
                              "16-bit integer"));
        return nullptr;
      }
      if (++checksum_count > 1) {
        Fail(err, Error::SchemaLayout(f.name,
                                      "more than one checksum field"));
        return nullptr;
      }
      const bool sized = f.checksum_scope == ChecksumScope::kHeaderWords;
      if (sized != !f.checksum_length_field.empty()) {
        Fail(err, Error::SchemaLayout(
                      f.name, "a length field goes with the header-words "
                              "checksum scope only"));
        return nullptr;
      }
      if (sized) {
        bool found = false;
        for (size_t j = 0; j < i; ++j) {
          if (fields[j].name != f.checksum_length_field) continue;
          if (!fields[j].IsIntegerLike() || fields[j].conditional) {
            Fail(err, Error::SchemaLayout(
                          f.name, "checksum length field '" +
                                      f.checksum_length_field +
                                      "' is not an unconditional integer"));
            return nullptr;
          }
          f.checksum_length_index = j;
          found = true;
          break;
        }
        if (!found) {
          Fail(err, Error::SchemaLayout(
                        f.name, "checksum length field '" +
                                    f.checksum_length_field +
                                    "' is unknown or declared later"));
          return nullptr;
        }
      }
    }

    for (const Constraint& c : f.constraints) {
      const bool bytes_field = f.kind == FieldKind::kFixedBytes ||
                               f.kind == FieldKind::kVariableBytes;
      if (c.AppliesToLength() != bytes_field || f.kind == FieldKind::kNested) {
        Fail(err, Error::SchemaLayout(
                      f.name, "constraint " + c.Describe() +
                                  " does not apply to a " +
                                  ToString(f.kind) + " field"));
        return nullptr;
      }
    }
  }
  if (group_first != n && !CloseBitGroup(&fields, group_first, n, err)) {
    return nullptr;
  }

  std::shared_ptr<StructureSchema> schema(new StructureSchema());
  schema->name_ = std::move(name);
  for (const FieldDescriptor& f : fields) {
    if (f.kind == FieldKind::kVariableBytes) {
      schema->has_tail_ = true;
      schema->fixed_size_ = false;
      continue;
    }
    if (f.kind == FieldKind::kNested) {
      if (f.nested->HasVariableTail()) schema->has_tail_ = true;
      if (!f.nested->IsFixedSize()) schema->fixed_size_ = false;
    }
    if (f.conditional) {
      schema->fixed_size_ = false;
      continue;
    }
    schema->min_size_ += FixedWidth(f);
  }
  schema->fields_ = std::move(fields);
  return schema;
}

const FieldDescriptor* StructureSchema::Find(
    const std::string& field_name) const {
  for (const FieldDescriptor& f : fields_) {
    if (f.name == field_name) return &f;
  }
  return nullptr;
}

std::string StructureSchema::FirstMissingField(size_t available) const {
  size_t offset = 0;
  for (const FieldDescriptor& f : fields_) {
    if (f.conditional) continue;
    if (f.kind == FieldKind::kBitField && !f.group_start) continue;
    const size_t width = FixedWidth(f);
    if (offset + width > available) {
      if (f.kind == FieldKind::kNested) {
        return f.nested->FirstMissingField(available - offset);
      }
      return f.name;
    }
    offset += width;
  }
  return name_;
}

// ---------------- SchemaRegistry ----------------

namespace {

struct BuildFrame {
  std::type_index key;
  std::string name;
};

/** Types whose schema is under construction on this thread. */
std::vector<BuildFrame>& BuildStack() {
  thread_local std::vector<BuildFrame> stack;
  return stack;
}

}  // namespace

SchemaRegistry& SchemaRegistry::Instance() {
  static SchemaRegistry instance;
  return instance;
}

size_t SchemaRegistry::Size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return cache_.size();
}

void SchemaRegistry::NoteBuildName(const std::string& name) {
  auto& stack = BuildStack();
  if (!stack.empty()) stack.back().name = name;
}

std::shared_ptr<const StructureSchema> SchemaRegistry::Lookup(
    std::type_index key) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = cache_.find(key);
  if (it == cache_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<const StructureSchema> SchemaRegistry::Store(
    std::type_index key, std::shared_ptr<const StructureSchema> schema) {
  std::lock_guard<std::mutex> lk(mtx_);
  // Another thread may have published the same type first; keep that one.
  auto res = cache_.emplace(key, std::move(schema));
  return res.first->second;
}

bool SchemaRegistry::BeginBuild(std::type_index key, const std::string& name,
                                Error* err) {
  auto& stack = BuildStack();
  for (size_t i = 0; i < stack.size(); ++i) {
    if (stack[i].key != key) continue;
    std::string path;
    for (size_t j = i; j < stack.size(); ++j) {
      path += stack[j].name;
      path += " -> ";
    }
    path += stack[i].name;
    return Fail(err, Error::SchemaCycle(path));
  }
  stack.push_back(BuildFrame{key, name});
  return true;
}

void SchemaRegistry::EndBuild() {
  auto& stack = BuildStack();
  if (!stack.empty()) stack.pop_back();
}

}  // namespace wirepack
