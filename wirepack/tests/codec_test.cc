// Copyright (c) 2025 The Wirepack Authors
/**
 * @file codec_test.cc
 * @brief Encoding and decoding against schemas, including limit checks.
 */
#include "wirepack/codec.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <vector>

#include "test_util.hpp"
#include "wirepack/checksum.hpp"
#include "wirepack/protocols/icmp.hpp"
#include "wirepack/protocols/ipv4.hpp"
#include "wirepack/security_guard.hpp"

namespace wirepack {

namespace {

struct Reading {
  int8_t delta = 0;
  int16_t temperature = 0;
  int32_t offset = 0;

  static void Describe(SchemaBuilder<Reading>* b) {
    b->Name("Reading")
        .Int("delta", &Reading::delta)
        .Int("temperature", &Reading::temperature)
        .Int("offset", &Reading::offset);
  }
};

struct Packed {
  uint8_t hi = 0;
  uint8_t lo = 0;
  uint16_t word = 0;

  static void Describe(SchemaBuilder<Packed>* b) {
    b->Name("Packed")
        .Bits("hi", &Packed::hi, 3)
        .Bits("lo", &Packed::lo, 5)
        .Int("word", &Packed::word);
  }
};

struct Ranged {
  uint8_t level = 5;
  std::vector<uint8_t> note;

  static void Describe(SchemaBuilder<Ranged>* b) {
    b->Name("Ranged")
        .Int("level", &Ranged::level)
        .Validate(Constraint::Range(5, 15))
        .Bytes("note", &Ranged::note)
        .Validate(Constraint::LengthRange(0, 4));
  }
};

struct Tagged {
  uint8_t kind = 0;
  uint32_t extra = 0;
  uint16_t tail = 0;

  static void Describe(SchemaBuilder<Tagged>* b) {
    b->Name("Tagged")
        .Int("kind", &Tagged::kind)
        .Int("extra", &Tagged::extra)
        .When("kind", CompareOp::kEq, 1)
        .Int("tail", &Tagged::tail);
  }
};

struct Triple {
  uint16_t a = 0;
  uint8_t b = 0;

  static void Describe(SchemaBuilder<Triple>* b) {
    b->Name("Triple").Int("a", &Triple::a).Int("b", &Triple::b);
  }
};

struct Envelope {
  uint8_t tag = 0;
  Triple inner;
  std::vector<uint8_t> rest;

  static void Describe(SchemaBuilder<Envelope>* b) {
    b->Name("Envelope")
        .Int("tag", &Envelope::tag)
        .Nested("inner", &Envelope::inner)
        .Bytes("rest", &Envelope::rest);
  }
};

struct Leaf {
  uint8_t v = 0;

  static void Describe(SchemaBuilder<Leaf>* b) {
    b->Name("Leaf").Int("v", &Leaf::v);
  }
};

struct Node {
  uint8_t id = 0;
  std::unique_ptr<Leaf> leaf;

  static void Describe(SchemaBuilder<Node>* b) {
    b->Name("Node").Int("id", &Node::id).Nested("leaf", &Node::leaf);
  }
};

struct Level2 {
  Leaf leaf;

  static void Describe(SchemaBuilder<Level2>* b) {
    b->Name("Level2").Nested("leaf", &Level2::leaf);
  }
};

struct Level1 {
  Level2 child;

  static void Describe(SchemaBuilder<Level1>* b) {
    b->Name("Level1").Nested("child", &Level1::child);
  }
};

}  // namespace

class CodecTest : public testing::SecurityGuardTest {};

/**
 * @test CodecTest.EncodesIcmpEchoRequestWithChecksum
 * @brief Verify the ICMP echo request layout and its auto checksum.
 *
 * @steps
 * 1. Encode {type 8, code 0, checksum 0, id 1234, seq 1, 32 zero bytes}.
 * 2. Decode the result.
 *
 * @expected
 * - 40 bytes: 08 00 f3 2c 04 d2 00 01 followed by 32 zeros.
 * - The checksum over the whole buffer verifies to zero.
 * - Decoding reproduces every field, including the computed checksum.
 */
TEST_F(CodecTest, EncodesIcmpEchoRequestWithChecksum) {
  IcmpPacket p;
  p.type = 8;
  p.code = 0;
  p.checksum = 0;
  p.identifier = 1234;
  p.sequence_number = 1;
  p.data.assign(32, 0);

  std::vector<uint8_t> wire;
  Error err;
  ASSERT_TRUE(Encode(p, &wire, &err)) << err;
  ASSERT_EQ(wire.size(), 40u);
  const std::vector<uint8_t> head = {0x08, 0x00, 0xf3, 0x2c,
                                     0x04, 0xd2, 0x00, 0x01};
  EXPECT_EQ(std::vector<uint8_t>(wire.begin(), wire.begin() + 8), head);
  EXPECT_EQ(InternetChecksum(wire), 0);

  IcmpPacket back;
  ASSERT_TRUE(Decode(wire, &back, &err)) << err;
  EXPECT_EQ(back.type, 8);
  EXPECT_EQ(back.checksum, 0xf32c);
  EXPECT_EQ(back.identifier, 1234);
  EXPECT_EQ(back.sequence_number, 1);
  EXPECT_EQ(back.data, p.data);
}

TEST_F(CodecTest, ExplicitChecksumIsKept) {
  IcmpPacket p = IcmpPacket::EchoRequest(1, 2, {});
  p.checksum = 0x1234;
  std::vector<uint8_t> wire;
  ASSERT_TRUE(Encode(p, &wire));
  EXPECT_EQ(wire[2], 0x12);
  EXPECT_EQ(wire[3], 0x34);
}

/**
 * @test CodecTest.Ipv4HeaderChecksumExcludesPayload
 * @brief Verify the header-scoped checksum of IPv4.
 *
 * @expected
 * - The first 20 bytes checksum to zero; the payload follows untouched.
 * - Encoding the same value twice yields identical bytes.
 */
TEST_F(CodecTest, Ipv4HeaderChecksumExcludesPayload) {
  uint32_t src = 0, dst = 0;
  ASSERT_TRUE(ParseIpv4Address("192.168.0.1", &src));
  ASSERT_TRUE(ParseIpv4Address("192.168.0.199", &dst));
  Ipv4Packet p = Ipv4Packet::Make(src, dst, kProtocolUdp, {1, 2, 3, 4, 5});

  std::vector<uint8_t> wire;
  Error err;
  ASSERT_TRUE(Encode(p, &wire, &err)) << err;
  ASSERT_EQ(wire.size(), 25u);
  EXPECT_EQ(wire[0], 0x45);
  EXPECT_EQ(wire[3], 25);
  EXPECT_EQ(InternetChecksum(wire.data(), Ipv4Packet::kHeaderSize), 0);

  std::vector<uint8_t> again;
  ASSERT_TRUE(Encode(p, &again));
  EXPECT_EQ(wire, again);

  Ipv4Packet back;
  ASSERT_TRUE(Decode(wire, &back, &err)) << err;
  EXPECT_EQ(back.source, src);
  EXPECT_EQ(back.destination, dst);
  EXPECT_EQ(back.payload, p.payload);
}

/**
 * @test CodecTest.TruncatedIpv4ReportsFirstMissingField
 * @brief Verify the diagnostics of a short buffer.
 *
 * @expected
 * - InsufficientData with expected 20, available 10 and the field
 *   "header_checksum", the first field that does not fit.
 */
TEST_F(CodecTest, TruncatedIpv4ReportsFirstMissingField) {
  const std::vector<uint8_t> wire = {0x45, 0, 0, 20, 0, 0, 0, 0, 64, 1};
  Ipv4Packet out;
  Error err;
  EXPECT_FALSE(Decode(wire, &out, &err));
  EXPECT_EQ(err.code, ErrorCode::kInsufficientData);
  EXPECT_EQ(err.expected, 20u);
  EXPECT_EQ(err.available, 10u);
  EXPECT_EQ(err.field, "header_checksum");
}

/**
 * @test CodecTest.Ipv4HeaderChecksumCoversOptions
 * @brief Verify that IPv4 options are part of the header checksum.
 *
 * @steps
 * 1. Build a datagram with ihl=6 whose payload starts with 4 option bytes
 *    (NOP, NOP, NOP, EOL) followed by 2 data bytes.
 * 2. Encode it, then raise ihl past the encoded length.
 *
 * @expected
 * - The first 24 bytes checksum to zero; the first 20 alone do not.
 * - ihl=15 on a 26-byte datagram fails with kValidation on "ihl".
 */
TEST_F(CodecTest, Ipv4HeaderChecksumCoversOptions) {
  uint32_t src = 0, dst = 0;
  ASSERT_TRUE(ParseIpv4Address("10.0.0.1", &src));
  ASSERT_TRUE(ParseIpv4Address("10.0.0.2", &dst));
  Ipv4Packet p = Ipv4Packet::Make(src, dst, kProtocolIcmp,
                                  {0x01, 0x01, 0x01, 0x00, 0xde, 0xad});
  p.ihl = 6;
  p.total_length = 26;

  std::vector<uint8_t> wire;
  Error err;
  ASSERT_TRUE(Encode(p, &wire, &err)) << err;
  ASSERT_EQ(wire.size(), 26u);
  EXPECT_EQ(wire[0], 0x46);
  EXPECT_EQ(InternetChecksum(wire.data(), 24), 0);
  EXPECT_NE(InternetChecksum(wire.data(), Ipv4Packet::kHeaderSize), 0);

  p.ihl = 15;
  EXPECT_FALSE(Encode(p, &wire, &err));
  EXPECT_EQ(err.code, ErrorCode::kValidation);
  EXPECT_EQ(err.field, "ihl");
  EXPECT_EQ(err.value, 15);
}

/**
 * @test CodecTest.EveryIpv4TruncationIsRejected
 * @brief Verify bounds checking for each prefix of a valid header.
 *
 * @expected
 * - Each length 0..19 fails with kInsufficientData, expected 20 and the
 *   available length reported.
 */
TEST_F(CodecTest, EveryIpv4TruncationIsRejected) {
  std::vector<uint8_t> wire;
  ASSERT_TRUE(Encode(Ipv4Packet::Make(0x0a000001, 0x0a000002, kProtocolUdp,
                                      {}),
                     &wire));
  ASSERT_EQ(wire.size(), Ipv4Packet::kHeaderSize);
  for (size_t n = 0; n < Ipv4Packet::kHeaderSize; ++n) {
    Ipv4Packet out;
    Error err;
    EXPECT_FALSE(Decode(wire.data(), n, &out, &err)) << "length " << n;
    EXPECT_EQ(err.code, ErrorCode::kInsufficientData) << "length " << n;
    EXPECT_EQ(err.expected, Ipv4Packet::kHeaderSize);
    EXPECT_EQ(err.available, n);
  }
}

TEST_F(CodecTest, SignedIntegersUseTwosComplement) {
  Reading r;
  r.delta = -1;
  r.temperature = -300;
  r.offset = -2;
  std::vector<uint8_t> wire;
  ASSERT_TRUE(Encode(r, &wire));
  const std::vector<uint8_t> expected = {0xff, 0xfe, 0xd4, 0xff,
                                         0xff, 0xff, 0xfe};
  EXPECT_EQ(wire, expected);

  Reading back;
  ASSERT_TRUE(Decode(wire, &back));
  EXPECT_EQ(back.delta, -1);
  EXPECT_EQ(back.temperature, -300);
  EXPECT_EQ(back.offset, -2);
}

/**
 * @test CodecTest.PacksBitFieldsMsbFirst
 * @brief Verify packing order and width checks of bit-fields.
 *
 * @expected
 * - hi=5 (3 bits), lo=3 (5 bits) pack into 0xa3.
 * - hi=8 does not fit 3 bits and fails validation before any output.
 */
TEST_F(CodecTest, PacksBitFieldsMsbFirst) {
  Packed p;
  p.hi = 5;
  p.lo = 3;
  p.word = 0x0102;
  std::vector<uint8_t> wire;
  ASSERT_TRUE(Encode(p, &wire));
  const std::vector<uint8_t> expected = {0xa3, 0x01, 0x02};
  EXPECT_EQ(wire, expected);

  Packed back;
  ASSERT_TRUE(Decode(wire, &back));
  EXPECT_EQ(back.hi, 5);
  EXPECT_EQ(back.lo, 3);
  EXPECT_EQ(back.word, 0x0102);

  p.hi = 8;
  std::vector<uint8_t> untouched = {0xaa};
  Error err;
  EXPECT_FALSE(Encode(p, &untouched, &err));
  EXPECT_EQ(err.code, ErrorCode::kValidation);
  EXPECT_EQ(err.field, "hi");
  EXPECT_EQ(err.value, 8);
  EXPECT_EQ(err.constraint, "3-bit width");
  EXPECT_EQ(untouched, std::vector<uint8_t>{0xaa});
}

/**
 * @test CodecTest.ConstraintsApplyOnBothDirections
 * @brief Verify that value and length constraints reject bad data.
 *
 * @expected
 * - Encoding level 20 fails with constraint "range[5,15]".
 * - Decoding level 3 fails; the target is left unchanged.
 * - A 5-byte note violates length[0,4].
 */
TEST_F(CodecTest, ConstraintsApplyOnBothDirections) {
  Ranged r;
  r.level = 20;
  std::vector<uint8_t> wire;
  Error err;
  EXPECT_FALSE(Encode(r, &wire, &err));
  EXPECT_EQ(err.code, ErrorCode::kValidation);
  EXPECT_EQ(err.field, "level");
  EXPECT_EQ(err.value, 20);
  EXPECT_EQ(err.constraint, "range[5,15]");

  Ranged target;
  target.level = 9;
  const std::vector<uint8_t> low = {3};
  EXPECT_FALSE(Decode(low, &target, &err));
  EXPECT_EQ(err.code, ErrorCode::kValidation);
  EXPECT_EQ(target.level, 9);

  const std::vector<uint8_t> long_note = {7, 'h', 'e', 'l', 'l', 'o'};
  EXPECT_FALSE(Decode(long_note, &target, &err));
  EXPECT_EQ(err.field, "note");
  EXPECT_EQ(err.constraint, "length[0,4]");

  const std::vector<uint8_t> ok = {7, 'o', 'k'};
  ASSERT_TRUE(Decode(ok, &target, &err)) << err;
  EXPECT_EQ(target.level, 7);
  EXPECT_EQ(target.note, (std::vector<uint8_t>{'o', 'k'}));
}

/**
 * @test CodecTest.ConditionalFieldFollowsEarlierValue
 * @brief Verify presence of a field guarded by an earlier field.
 *
 * @expected
 * - kind=1 encodes 7 bytes; kind=0 encodes 3 bytes.
 * - A 3-byte buffer announcing kind=1 fails at "extra".
 * - A 2-byte buffer with kind=0 fails at "tail", past the absent field.
 */
TEST_F(CodecTest, ConditionalFieldFollowsEarlierValue) {
  Tagged with;
  with.kind = 1;
  with.extra = 0x01020304;
  with.tail = 0xbeef;
  std::vector<uint8_t> wire;
  ASSERT_TRUE(Encode(with, &wire));
  EXPECT_EQ(wire.size(), 7u);
  Tagged back;
  ASSERT_TRUE(Decode(wire, &back));
  EXPECT_EQ(back.extra, 0x01020304u);
  EXPECT_EQ(back.tail, 0xbeef);

  Tagged without;
  without.extra = 99;
  without.tail = 7;
  ASSERT_TRUE(Encode(without, &wire));
  EXPECT_EQ(wire, (std::vector<uint8_t>{0, 0, 7}));
  ASSERT_TRUE(Decode(wire, &back));
  EXPECT_EQ(back.kind, 0);
  EXPECT_EQ(back.extra, 0u);

  Error err;
  const std::vector<uint8_t> short_buf = {1, 0, 0};
  EXPECT_FALSE(Decode(short_buf, &back, &err));
  EXPECT_EQ(err.code, ErrorCode::kInsufficientData);
  EXPECT_EQ(err.field, "extra");
  EXPECT_EQ(err.expected, 5u);
  EXPECT_EQ(err.available, 3u);

  const std::vector<uint8_t> no_tail = {0, 7};
  EXPECT_FALSE(Decode(no_tail, &back, &err));
  EXPECT_EQ(err.code, ErrorCode::kInsufficientData);
  EXPECT_EQ(err.field, "tail");
  EXPECT_EQ(err.expected, 3u);
}

TEST_F(CodecTest, NestedStructuresAreInlined) {
  Envelope o;
  o.tag = 9;
  o.inner.a = 0x0a0b;
  o.inner.b = 0x0c;
  o.rest = {0xee};
  std::vector<uint8_t> wire;
  ASSERT_TRUE(Encode(o, &wire));
  EXPECT_EQ(wire, (std::vector<uint8_t>{9, 0x0a, 0x0b, 0x0c, 0xee}));

  Envelope back;
  ASSERT_TRUE(Decode(wire, &back));
  EXPECT_EQ(back.inner.a, 0x0a0b);
  EXPECT_EQ(back.inner.b, 0x0c);
  EXPECT_EQ(back.rest, o.rest);

  size_t n = 0;
  ASSERT_TRUE(EncodedSize(o, &n));
  EXPECT_EQ(n, 5u);
}

/**
 * @test CodecTest.EmptyBoxedValueIsMissing
 * @brief Verify that an unset nested pointer cannot be encoded.
 *
 * @expected
 * - Encode and EncodedSize fail with kMissingField naming "leaf".
 * - Decoding allocates the nested value.
 */
TEST_F(CodecTest, EmptyBoxedValueIsMissing) {
  Node n;
  n.id = 1;
  std::vector<uint8_t> wire;
  Error err;
  EXPECT_FALSE(Encode(n, &wire, &err));
  EXPECT_EQ(err.code, ErrorCode::kMissingField);
  EXPECT_EQ(err.field, "leaf");
  size_t size = 0;
  EXPECT_FALSE(EncodedSize(n, &size, &err));
  EXPECT_EQ(err.code, ErrorCode::kMissingField);

  const std::vector<uint8_t> data = {1, 42};
  Node back;
  ASSERT_TRUE(Decode(data, &back, &err)) << err;
  ASSERT_NE(back.leaf, nullptr);
  EXPECT_EQ(back.leaf->v, 42);

  ASSERT_TRUE(Encode(back, &wire, &err)) << err;
  EXPECT_EQ(wire, data);
}

/**
 * @test CodecTest.NestingDepthIsEnforced
 * @brief Verify that depth counts nested structures below the top level.
 *
 * @steps
 * 1. Limit the nesting depth to 1.
 * 2. Decode and encode a three-level structure.
 *
 * @expected
 * - Both fail with NestingDepthExceeded(depth 2, max 1).
 * - With depth 2 allowed, decoding succeeds.
 */
TEST_F(CodecTest, NestingDepthIsEnforced) {
  ASSERT_TRUE(SecurityGuard::Instance().SetMaxNestingDepth(1));
  const std::vector<uint8_t> data = {7};
  Level1 v;
  Error err;
  EXPECT_FALSE(Decode(data, &v, &err));
  EXPECT_EQ(err.code, ErrorCode::kNestingDepthExceeded);
  EXPECT_EQ(err.depth, 2u);
  EXPECT_EQ(err.max_depth, 1u);

  std::vector<uint8_t> wire;
  EXPECT_FALSE(Encode(v, &wire, &err));
  EXPECT_EQ(err.code, ErrorCode::kNestingDepthExceeded);

  ASSERT_TRUE(SecurityGuard::Instance().SetMaxNestingDepth(2));
  ASSERT_TRUE(Decode(data, &v, &err)) << err;
  EXPECT_EQ(v.child.leaf.v, 7);
}

/**
 * @test CodecTest.BufferLimitIsCheckedFirst
 * @brief Verify buffer overflow protection on both directions.
 *
 * @expected
 * - Encoding 30 bytes with a 10-byte limit fails with (30, 10).
 * - Decoding a 2-byte buffer with a 1-byte limit fails with BufferOverflow
 *   even though the depth limit would also be exceeded.
 */
TEST_F(CodecTest, BufferLimitIsCheckedFirst) {
  ASSERT_TRUE(SecurityGuard::Instance().SetMaxBufferSize(10));
  IcmpPacket p = IcmpPacket::EchoRequest(1, 1, std::vector<uint8_t>(22, 0));
  std::vector<uint8_t> wire;
  Error err;
  EXPECT_FALSE(Encode(p, &wire, &err));
  EXPECT_EQ(err.code, ErrorCode::kBufferOverflow);
  EXPECT_EQ(err.requested_size, 30u);
  EXPECT_EQ(err.max_size, 10u);
  EXPECT_TRUE(wire.empty());

  ASSERT_TRUE(SecurityGuard::Instance().SetMaxBufferSize(1));
  ASSERT_TRUE(SecurityGuard::Instance().SetMaxNestingDepth(1));
  const std::vector<uint8_t> data = {7, 8};
  Level1 v;
  EXPECT_FALSE(Decode(data, &v, &err));
  EXPECT_EQ(err.code, ErrorCode::kBufferOverflow);
  EXPECT_EQ(err.requested_size, 2u);
}

TEST_F(CodecTest, EmptyBufferReportsFirstField) {
  IcmpPacket p;
  Error err;
  EXPECT_FALSE(Decode(std::vector<uint8_t>(), &p, &err));
  EXPECT_EQ(err.code, ErrorCode::kInsufficientData);
  EXPECT_EQ(err.expected, IcmpPacket::kHeaderSize);
  EXPECT_EQ(err.available, 0u);
  EXPECT_EQ(err.field, "type");

  EXPECT_FALSE(Decode(nullptr, 4, &p, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
}

/**
 * @test CodecTest.FixedLayoutIgnoresTrailingBytes
 * @brief Verify Decode and DecodePrefix on buffers longer than a struct.
 *
 * @expected
 * - Decode succeeds on 5 bytes for a 3-byte structure.
 * - DecodePrefix reports 3 consumed bytes.
 */
TEST_F(CodecTest, FixedLayoutIgnoresTrailingBytes) {
  const std::vector<uint8_t> data = {0x00, 0x10, 0x20, 0xff, 0xff};
  Triple in;
  ASSERT_TRUE(Decode(data, &in));
  EXPECT_EQ(in.a, 0x0010);
  EXPECT_EQ(in.b, 0x20);

  size_t consumed = 0;
  Triple first;
  ASSERT_TRUE(DecodePrefix(data.data(), data.size(), &first, &consumed));
  EXPECT_EQ(consumed, 3u);
  EXPECT_EQ(first.b, 0x20);
}

}  // namespace wirepack
