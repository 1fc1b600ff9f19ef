// Copyright (c) 2025 The Wirepack Authors
/**
 * @file schema_test.cc
 * @brief Layout validation, derived sizes and the schema cache.
 */
#include "wirepack/schema.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wirepack {

namespace {

struct Header {
  uint8_t version = 0;
  uint8_t flags = 0;
  uint16_t length = 0;
  std::array<uint8_t, 6> mac{};
  std::vector<uint8_t> payload;

  static void Describe(SchemaBuilder<Header>* b) {
    b->Name("Header")
        .Bits("version", &Header::version, 4)
        .Bits("flags", &Header::flags, 4)
        .Int("length", &Header::length)
        .FixedBytes("mac", &Header::mac)
        .Bytes("payload", &Header::payload);
  }
};

struct UnalignedBits {
  uint8_t a = 0;
  uint8_t b = 0;
  uint8_t c = 0;

  static void Describe(SchemaBuilder<UnalignedBits>* b) {
    b->Name("UnalignedBits")
        .Bits("a", &UnalignedBits::a, 3)
        .Bits("b", &UnalignedBits::b, 4)
        .Int("c", &UnalignedBits::c);
  }
};

struct TailNotLast {
  std::vector<uint8_t> data;
  uint8_t trailer = 0;

  static void Describe(SchemaBuilder<TailNotLast>* b) {
    b->Name("TailNotLast")
        .Bytes("data", &TailNotLast::data)
        .Int("trailer", &TailNotLast::trailer);
  }
};

struct ForwardCondition {
  uint8_t extra = 0;
  uint8_t kind = 0;

  static void Describe(SchemaBuilder<ForwardCondition>* b) {
    b->Name("ForwardCondition")
        .Int("extra", &ForwardCondition::extra)
        .When("kind", CompareOp::kEq, 1)
        .Int("kind", &ForwardCondition::kind);
  }
};

struct NarrowChecksum {
  uint8_t sum = 0;

  static void Describe(SchemaBuilder<NarrowChecksum>* b) {
    b->Name("NarrowChecksum").Int("sum", &NarrowChecksum::sum).AutoChecksum();
  }
};

struct LengthDeclaredLater {
  uint16_t sum = 0;
  uint8_t words = 0;

  static void Describe(SchemaBuilder<LengthDeclaredLater>* b) {
    b->Name("LengthDeclaredLater")
        .Int("sum", &LengthDeclaredLater::sum)
        .AutoChecksum(ChecksumScope::kHeaderWords, "words")
        .Int("words", &LengthDeclaredLater::words);
  }
};

struct WordsWithoutLength {
  uint8_t words = 0;
  uint16_t sum = 0;

  static void Describe(SchemaBuilder<WordsWithoutLength>* b) {
    b->Name("WordsWithoutLength")
        .Int("words", &WordsWithoutLength::words)
        .Int("sum", &WordsWithoutLength::sum)
        .AutoChecksum(ChecksumScope::kHeaderWords);
  }
};

struct DuplicateName {
  uint8_t a = 0;
  uint8_t b = 0;

  static void Describe(SchemaBuilder<DuplicateName>* b) {
    b->Name("DuplicateName")
        .Int("x", &DuplicateName::a)
        .Int("x", &DuplicateName::b);
  }
};

struct LengthOnInteger {
  uint16_t v = 0;

  static void Describe(SchemaBuilder<LengthOnInteger>* b) {
    b->Name("LengthOnInteger")
        .Int("v", &LengthOnInteger::v)
        .Validate(Constraint::LengthRange(0, 4));
  }
};

struct Optional {
  uint8_t kind = 0;
  uint32_t extra = 0;
  uint16_t tail = 0;

  static void Describe(SchemaBuilder<Optional>* b) {
    b->Name("Optional")
        .Int("kind", &Optional::kind)
        .Int("extra", &Optional::extra)
        .When("kind", CompareOp::kEq, 1)
        .Int("tail", &Optional::tail);
  }
};

struct Inner {
  uint16_t a = 0;
  uint8_t b = 0;

  static void Describe(SchemaBuilder<Inner>* b) {
    b->Name("Inner").Int("a", &Inner::a).Int("b", &Inner::b);
  }
};

struct Outer {
  uint8_t tag = 0;
  Inner inner;

  static void Describe(SchemaBuilder<Outer>* b) {
    b->Name("Outer").Int("tag", &Outer::tag).Nested("inner", &Outer::inner);
  }
};

struct CycleB;

struct CycleA {
  uint8_t v = 0;
  std::unique_ptr<CycleB> next;

  static void Describe(SchemaBuilder<CycleA>* b);
};

struct CycleB {
  uint8_t v = 0;
  std::unique_ptr<CycleA> back;

  static void Describe(SchemaBuilder<CycleB>* b);
};

void CycleA::Describe(SchemaBuilder<CycleA>* b) {
  b->Name("CycleA").Int("v", &CycleA::v).Nested("next", &CycleA::next);
}

void CycleB::Describe(SchemaBuilder<CycleB>* b) {
  b->Name("CycleB").Int("v", &CycleB::v).Nested("back", &CycleB::back);
}

template <typename T>
Error LayoutErrorOf() {
  Error err;
  auto schema = SchemaRegistry::Instance().Get<T>(&err);
  EXPECT_EQ(schema, nullptr);
  return err;
}

}  // namespace

/**
 * @test SchemaTest.DerivesSizesFromDeclaredFields
 * @brief Verify min size, tail detection and field lookup.
 *
 * @steps
 * 1. Fetch the schema of a header with bits, integer, MAC and payload.
 *
 * @expected
 * - MinSize is 1 + 2 + 6 bytes; the payload is a variable tail.
 * - Bit-fields are shifted MSB-first within their byte.
 */
TEST(SchemaTest, DerivesSizesFromDeclaredFields) {
  Error err;
  auto schema = SchemaRegistry::Instance().Get<Header>(&err);
  ASSERT_NE(schema, nullptr) << err;
  EXPECT_EQ(schema->Name(), "Header");
  EXPECT_EQ(schema->MinSize(), 9u);
  EXPECT_TRUE(schema->HasVariableTail());
  EXPECT_FALSE(schema->IsFixedSize());

  const FieldDescriptor* version = schema->Find("version");
  ASSERT_NE(version, nullptr);
  EXPECT_TRUE(version->group_start);
  EXPECT_EQ(version->group_bits, 8u);
  EXPECT_EQ(version->bit_shift, 4u);
  EXPECT_EQ(schema->Find("flags")->bit_shift, 0u);
  EXPECT_EQ(schema->Find("missing"), nullptr);
}

TEST(SchemaTest, CachesOneSchemaPerType) {
  auto first = SchemaRegistry::Instance().Get<Header>();
  auto second = SchemaRegistry::Instance().Get<Header>();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first.get(), second.get());
  EXPECT_GE(SchemaRegistry::Instance().Size(), 1u);
}

/**
 * @test SchemaTest.FirstMissingFieldWalksPrefix
 * @brief Verify the field named when a buffer is too short.
 *
 * @expected
 * - 0 bytes -> "version"; 1 byte -> "length"; 3 bytes -> "mac".
 * - Nested structures report their own inner field.
 */
TEST(SchemaTest, FirstMissingFieldWalksPrefix) {
  auto schema = SchemaRegistry::Instance().Get<Header>();
  ASSERT_NE(schema, nullptr);
  EXPECT_EQ(schema->FirstMissingField(0), "version");
  EXPECT_EQ(schema->FirstMissingField(1), "length");
  EXPECT_EQ(schema->FirstMissingField(3), "mac");

  auto outer = SchemaRegistry::Instance().Get<Outer>();
  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(outer->MinSize(), 4u);
  EXPECT_TRUE(outer->IsFixedSize());
  EXPECT_EQ(outer->FirstMissingField(1), "a");
  EXPECT_EQ(outer->FirstMissingField(3), "b");
}

TEST(SchemaTest, ConditionalFieldsAreExcludedFromMinSize) {
  Error err;
  auto schema = SchemaRegistry::Instance().Get<Optional>(&err);
  ASSERT_NE(schema, nullptr) << err;
  EXPECT_EQ(schema->MinSize(), 3u);
  EXPECT_FALSE(schema->IsFixedSize());
  const FieldDescriptor* extra = schema->Find("extra");
  ASSERT_NE(extra, nullptr);
  EXPECT_TRUE(extra->conditional);
  EXPECT_EQ(extra->condition_index, 0u);
  EXPECT_EQ(extra->condition.Describe(), "kind == 1");

  // The absent conditional field is skipped, not reported.
  EXPECT_EQ(schema->FirstMissingField(0), "kind");
  EXPECT_EQ(schema->FirstMissingField(2), "tail");
}

/**
 * @test SchemaTest.RejectsAmbiguousLayouts
 * @brief Verify that invalid layouts are reported as kSchemaLayout.
 *
 * @expected
 * - Unaligned bit groups, tails before other fields, forward conditions,
 *   8-bit checksums, duplicate names and misplaced length constraints all
 *   fail with the offending field named.
 * - A header-words checksum needs an earlier length field.
 */
TEST(SchemaTest, RejectsAmbiguousLayouts) {
  Error e = LayoutErrorOf<UnalignedBits>();
  EXPECT_EQ(e.code, ErrorCode::kSchemaLayout);
  EXPECT_EQ(e.field, "a");
  EXPECT_NE(e.message.find("7 bits"), std::string::npos);

  e = LayoutErrorOf<TailNotLast>();
  EXPECT_EQ(e.code, ErrorCode::kSchemaLayout);
  EXPECT_EQ(e.field, "data");

  e = LayoutErrorOf<ForwardCondition>();
  EXPECT_EQ(e.code, ErrorCode::kSchemaLayout);
  EXPECT_EQ(e.field, "extra");

  e = LayoutErrorOf<NarrowChecksum>();
  EXPECT_EQ(e.code, ErrorCode::kSchemaLayout);
  EXPECT_EQ(e.field, "sum");

  e = LayoutErrorOf<DuplicateName>();
  EXPECT_EQ(e.code, ErrorCode::kSchemaLayout);
  EXPECT_EQ(e.field, "x");

  e = LayoutErrorOf<LengthOnInteger>();
  EXPECT_EQ(e.code, ErrorCode::kSchemaLayout);
  EXPECT_EQ(e.field, "v");

  e = LayoutErrorOf<LengthDeclaredLater>();
  EXPECT_EQ(e.code, ErrorCode::kSchemaLayout);
  EXPECT_EQ(e.field, "sum");
  EXPECT_NE(e.message.find("'words'"), std::string::npos) << e.message;

  e = LayoutErrorOf<WordsWithoutLength>();
  EXPECT_EQ(e.code, ErrorCode::kSchemaLayout);
  EXPECT_EQ(e.field, "sum");
}

/**
 * @test SchemaTest.DetectsCyclicReferences
 * @brief Verify that mutually nested structures fail instead of recursing.
 *
 * @steps
 * 1. Request the schema of CycleA, which nests CycleB, which nests CycleA.
 *
 * @expected
 * - kSchemaCycle with the path "CycleA -> CycleB -> CycleA".
 * - The failure repeats on a second request (nothing cached).
 */
TEST(SchemaTest, DetectsCyclicReferences) {
  Error err;
  EXPECT_EQ(SchemaRegistry::Instance().Get<CycleA>(&err), nullptr);
  EXPECT_EQ(err.code, ErrorCode::kSchemaCycle);
  EXPECT_NE(err.message.find("CycleA -> CycleB -> CycleA"), std::string::npos)
      << err.message;

  Error again;
  EXPECT_EQ(SchemaRegistry::Instance().Get<CycleA>(&again), nullptr);
  EXPECT_EQ(again.code, ErrorCode::kSchemaCycle);
}

TEST(SchemaTest, ConstraintDescriptions) {
  EXPECT_EQ(Constraint::Range(5, 15).Describe(), "range[5,15]");
  EXPECT_EQ(Constraint::Min(5).Describe(), "min 5");
  EXPECT_EQ(Constraint::Max(9).Describe(), "max 9");
  EXPECT_EQ(Constraint::OneOf({1, 2}).Describe(), "one_of{1,2}");
  EXPECT_EQ(Constraint::NoneOf({0}).Describe(), "none_of{0}");
  EXPECT_EQ(Constraint::LengthRange(1, 4).Describe(), "length[1,4]");
  EXPECT_TRUE(Constraint::OneOf({1, 2}).Check(2));
  EXPECT_FALSE(Constraint::NoneOf({0}).Check(0));
}

}  // namespace wirepack
