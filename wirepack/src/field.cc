// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/field.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace wirepack {

const char* ToString(FieldKind kind) {
  switch (kind) {
    case FieldKind::kInteger:
      return "integer";
    case FieldKind::kBitField:
      return "bits";
    case FieldKind::kFixedBytes:
      return "fixed_bytes";
    case FieldKind::kVariableBytes:
      return "bytes";
    case FieldKind::kNested:
      return "nested";
  }
  return "unknown";
}

const char* ToString(CompareOp op) {
  switch (op) {
    case CompareOp::kEq:
      return "==";
    case CompareOp::kNe:
      return "!=";
    case CompareOp::kLt:
      return "<";
    case CompareOp::kGt:
      return ">";
    case CompareOp::kLe:
      return "<=";
    case CompareOp::kGe:
      return ">=";
  }
  return "?";
}

bool Condition::Evaluate(int64_t actual) const {
  switch (op) {
    case CompareOp::kEq:
      return actual == value;
    case CompareOp::kNe:
      return actual != value;
    case CompareOp::kLt:
      return actual < value;
    case CompareOp::kGt:
      return actual > value;
    case CompareOp::kLe:
      return actual <= value;
    case CompareOp::kGe:
      return actual >= value;
  }
  return false;
}

std::string Condition::Describe() const {
  std::ostringstream oss;
  oss << field << ' ' << ToString(op) << ' ' << value;
  return oss.str();
}

Constraint Constraint::Range(int64_t min, int64_t max) {
  return Constraint(Kind::kRange, min, max, {});
}

Constraint Constraint::Min(int64_t min) {
  return Constraint(Kind::kRange, min, std::numeric_limits<int64_t>::max(), {});
}

Constraint Constraint::Max(int64_t max) {
  return Constraint(Kind::kRange, std::numeric_limits<int64_t>::min(), max, {});
}

Constraint Constraint::OneOf(std::vector<int64_t> values) {
  return Constraint(Kind::kOneOf, 0, 0, std::move(values));
}

Constraint Constraint::NoneOf(std::vector<int64_t> values) {
  return Constraint(Kind::kNoneOf, 0, 0, std::move(values));
}

Constraint Constraint::LengthRange(size_t min, size_t max) {
  return Constraint(Kind::kLength, static_cast<int64_t>(min),
                    static_cast<int64_t>(max), {});
}

bool Constraint::Check(int64_t v) const {
  switch (kind_) {
    case Kind::kRange:
    case Kind::kLength:
      return v >= min_ && v <= max_;
    case Kind::kOneOf:
      return std::find(set_.begin(), set_.end(), v) != set_.end();
    case Kind::kNoneOf:
      return std::find(set_.begin(), set_.end(), v) == set_.end();
  }
  return false;
}

std::string Constraint::Describe() const {
  std::ostringstream oss;
  const auto join = [&oss](const std::vector<int64_t>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
      if (i != 0) oss << ',';
      oss << values[i];
    }
  };
  switch (kind_) {
    case Kind::kRange:
      if (max_ == std::numeric_limits<int64_t>::max()) {
        oss << "min " << min_;
      } else if (min_ == std::numeric_limits<int64_t>::min()) {
        oss << "max " << max_;
      } else {
        oss << "range[" << min_ << ',' << max_ << ']';
      }
      break;
    case Kind::kLength:
      oss << "length[" << min_ << ',' << max_ << ']';
      break;
    case Kind::kOneOf:
      oss << "one_of{";
      join(set_);
      oss << '}';
      break;
    case Kind::kNoneOf:
      oss << "none_of{";
      join(set_);
      oss << '}';
      break;
  }
  return oss.str();
}

}  // namespace wirepack
