#include "cvdebug/parse_buffer.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <vector>

using cvdebug::ByteSpan;
using cvdebug::Error;
using cvdebug::ErrorKind;
using cvdebug::ParseBuffer;

namespace {

const std::vector<uint8_t> kData = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09};

ErrorKind KindOf(const std::function<void()>& call) {
  try {
    call();
  } catch (const Error& error) {
    return error.kind();
  }
  ADD_FAILURE() << "no error thrown";
  return ErrorKind::kInvalidStreamLength;
}

}  // namespace

TEST(ParseBufferTest, ParsesLittleEndianIntegers) {
  ParseBuffer buf(kData.data(), kData.size());
  EXPECT_EQ(buf.Parse<uint8_t>(), 0x01);
  EXPECT_EQ(buf.Parse<uint16_t>(), 0x0302);
  EXPECT_EQ(buf.Parse<uint32_t>(), 0x07060504u);
  EXPECT_EQ(buf.Pos(), 7u);
  EXPECT_EQ(buf.Len(), 2u);
  EXPECT_FALSE(buf.IsEmpty());
}

TEST(ParseBufferTest, ParsesSignedIntegers) {
  const std::vector<uint8_t> data = {0xfe, 0xff, 0xff, 0xff};
  ParseBuffer buf{ByteSpan(data)};
  EXPECT_EQ(buf.Parse<int32_t>(), -2);
  EXPECT_TRUE(buf.IsEmpty());
}

TEST(ParseBufferTest, TakeReturnsSpanAndAdvances) {
  ParseBuffer buf(kData.data(), kData.size());
  ByteSpan span = buf.Take(3);
  EXPECT_EQ(span.size, 3u);
  EXPECT_EQ(span.data, kData.data());
  EXPECT_EQ(buf.Pos(), 3u);
  EXPECT_EQ(buf.Remaining().size, 6u);
}

TEST(ParseBufferTest, TakeBeyondEndFailsWithoutAdvancing) {
  ParseBuffer buf(kData.data(), kData.size());
  buf.Take(5);
  EXPECT_EQ(KindOf([&] { buf.Take(5); }), ErrorKind::kUnexpectedEof);
  EXPECT_EQ(buf.Pos(), 5u);
  EXPECT_EQ(buf.Parse<uint32_t>(), 0x09080706u);
  EXPECT_THROW(buf.Parse<uint8_t>(), Error);
}

TEST(ParseBufferTest, AlignIsMeasuredFromBufferStart) {
  ParseBuffer buf(kData.data(), kData.size());
  buf.Align(4);
  EXPECT_EQ(buf.Pos(), 0u);
  buf.Take(1);
  buf.Align(4);
  EXPECT_EQ(buf.Pos(), 4u);
  buf.Align(4);
  EXPECT_EQ(buf.Pos(), 4u);
  buf.Take(1);
  buf.Align(0);
  EXPECT_EQ(buf.Pos(), 5u);
}

TEST(ParseBufferTest, AlignPastEndFails) {
  ParseBuffer buf(kData.data(), kData.size());
  buf.Take(6);
  EXPECT_EQ(KindOf([&] { buf.Align(16); }), ErrorKind::kUnexpectedEof);
  EXPECT_EQ(buf.Pos(), 6u);
}

TEST(ParseBufferTest, CopiesAreIndependentCursors) {
  ParseBuffer buf(kData.data(), kData.size());
  buf.Take(2);
  ParseBuffer copy = buf;
  copy.Take(4);
  EXPECT_EQ(buf.Pos(), 2u);
  EXPECT_EQ(copy.Pos(), 6u);
}

TEST(ParseBufferTest, EmptyBuffer) {
  ParseBuffer buf;
  EXPECT_TRUE(buf.IsEmpty());
  EXPECT_EQ(buf.Len(), 0u);
  EXPECT_EQ(buf.Take(0).size, 0u);
  EXPECT_THROW(buf.Parse<uint16_t>(), Error);
}

TEST(ParseBufferTest, ReadU32AtIndexesWords) {
  const std::vector<uint8_t> data = {0x78, 0x56, 0x34, 0x12, 0xef, 0xbe, 0xad, 0xde};
  EXPECT_EQ(cvdebug::ReadU32At(ByteSpan(data), 0), 0x12345678u);
  EXPECT_EQ(cvdebug::ReadU32At(ByteSpan(data), 1), 0xdeadbeefu);
}
