#include <gtest/gtest.h>

#include "Codec.hpp"
#include "Errors.hpp"

using namespace pythia;

namespace {

value_t maxValue() { return (value_t(1) << 127) - 1; }
value_t minValue() { return -(value_t(1) << 127); }

} // namespace

TEST(Codec, SmallValues) {
  EXPECT_EQ("0x00000000000000000000000000000000", encodeValueHex(0));
  EXPECT_EQ("0x01000000000000000000000000000000", encodeValueHex(1));
  EXPECT_EQ("0xffffffffffffffffffffffffffffffff", encodeValueHex(-1));
  EXPECT_EQ("0x2a000000000000000000000000000000", encodeValueHex(42));
  EXPECT_EQ("0x0000000000000000000000000000002a", encodeValueHex(42, Endianness::eBig));
  EXPECT_EQ("0xfeffffffffffffffffffffffffffffff", encodeValueHex(-2));
}

TEST(Codec, Extremes) {
  EXPECT_EQ("0xffffffffffffffffffffffffffffff7f", encodeValueHex(maxValue()));
  EXPECT_EQ("0x00000000000000000000000000000080", encodeValueHex(minValue()));
  EXPECT_EQ("0x80000000000000000000000000000000", encodeValueHex(minValue(), Endianness::eBig));

  for (const auto &lValue : {maxValue(), minValue(), value_t(0), value_t(-1), value_t(1)}) {
    for (auto lOrder : {Endianness::eLittle, Endianness::eBig}) {
      auto lEncoded = encodeValue(lValue, lOrder);
      EXPECT_EQ(lValue, decodeValue(lEncoded.view(), lOrder));
    }
  }

  EXPECT_THROW(encodeValue(maxValue() + 1), std::out_of_range);
  EXPECT_THROW(encodeValue(minValue() - 1), std::out_of_range);
}

TEST(Codec, SignExtension) {
  u8 lMinusOne[] = {0xff};
  EXPECT_EQ(value_t(-1), decodeValue({lMinusOne, sizeof(lMinusOne)}));

  u8 l127[] = {0x7f};
  EXPECT_EQ(value_t(127), decodeValue({l127, sizeof(l127)}));

  // -129, little endian on two bytes
  u8 lShortLE[] = {0x7f, 0xff};
  EXPECT_EQ(value_t(-129), decodeValue({lShortLE, sizeof(lShortLE)}));
  u8 lShortBE[] = {0xff, 0x7f};
  EXPECT_EQ(value_t(-129), decodeValue({lShortBE, sizeof(lShortBE)}, Endianness::eBig));

  u8 lPositive[] = {0x00, 0x80};
  EXPECT_EQ(value_t(32768), decodeValue({lPositive, sizeof(lPositive)}, Endianness::eBig));
}

TEST(Codec, RejectsBadSizes) {
  u8 lTooLong[sValueSize + 1] = {};
  EXPECT_THROW(decodeValue({lTooLong, sizeof(lTooLong)}), std::invalid_argument);
  EXPECT_THROW(decodeValue({lTooLong, 0}), std::invalid_argument);

  EXPECT_FALSE(decodeValueHex("0x").has_value());
  EXPECT_FALSE(decodeValueHex("0xzz").has_value());
  EXPECT_FALSE(decodeValueHex("0x" + std::string(34, '0')).has_value());
  ASSERT_TRUE(decodeValueHex("0xff").has_value());
  EXPECT_EQ(value_t(-1), *decodeValueHex("0xff"));
}

TEST(Codec, RandomValues) {
  for (size_t i = 0; i < 1000; i++) {
    auto lBytes = rand<u128>();
    for (auto lOrder : {Endianness::eLittle, Endianness::eBig}) {
      value_t lValue = decodeValue(lBytes.view(), lOrder);
      EXPECT_GE(lValue, minValue());
      EXPECT_LE(lValue, maxValue());
      EXPECT_EQ(lBytes, encodeValue(lValue, lOrder));
    }
  }
}

TEST(Codec, Strings) {
  EXPECT_EQ("-170141183460469231731687303715884105728", toString(minValue()));
  EXPECT_EQ("170141183460469231731687303715884105727", toString(maxValue()));
  EXPECT_EQ("0", toString(0));
}

TEST(Errors, Category) {
  auto lError = PythiaErrorCategory::wrap(PythiaErrorCode::eAlreadyAnswered);
  EXPECT_TRUE(lError);
  EXPECT_EQ("0x2007: eAlreadyAnswered", lError.message());
  EXPECT_TRUE(isError(lError, PythiaErrorCode::eAlreadyAnswered));
  EXPECT_FALSE(isError(lError, PythiaErrorCode::eBadNonce));
  EXPECT_FALSE(isTimeout(lError));
  EXPECT_TRUE(isTimeout(net::error::timed_out));

  EXPECT_EQ("0x2009: eRequestTooLarge", PythiaErrorCategory::wrap(PythiaErrorCode::eRequestTooLarge).message());
  EXPECT_FALSE(PythiaErrorCategory::wrap(PythiaErrorCode::eNoError));
}

TEST(Utils, MutableViewAsConst) {
  u128 lBuff;
  lBuff[0] = 0xab;
  lBuff[15] = 0x01;
  buff_view_t lView = lBuff.view();
  EXPECT_EQ("0xab000000000000000000000000000001", toHex(lView, true));

  cbuff_view_t lConst = lView;
  EXPECT_EQ(lBuff.data(), lConst.data);
  EXPECT_EQ(16u, lConst.size);
}
