#include <stdexcept>

#include "Codec.hpp"

using namespace pythia;
using boost::multiprecision::uint128_t;

static const value_t sMaxValue = (value_t(1) << 127) - 1;
static const value_t sMinValue = -(value_t(1) << 127);

u128 pythia::encodeValue(const value_t &pValue, Endianness pOrder) {
  if (pValue > sMaxValue || pValue < sMinValue)
    throw std::out_of_range("value does not fit 128 bits two's complement: " + pValue.str());

  // int128_t is sign-magnitude, fold it to two's complement by hand
  uint128_t lRaw;
  if (pValue < 0) {
    lRaw = uint128_t(-pValue);
    lRaw = ~lRaw + 1;
  } else {
    lRaw = uint128_t(pValue);
  }

  u128 lResult;
  for (size_t i = 0; i < sValueSize; i++) {
    u8 lByte = static_cast<u8>(lRaw & 0xFF);
    lRaw >>= 8;
    lResult[pOrder == Endianness::eLittle ? i : sValueSize - 1 - i] = lByte;
  }
  return lResult;
}

value_t pythia::decodeValue(const cbuff_view_t &pBytes, Endianness pOrder) {
  if (pBytes.size == 0 || pBytes.size > sValueSize)
    throw std::invalid_argument("value must be 1 to 16 bytes, got " + std::to_string(pBytes.size));

  // Most significant byte first
  std::array<u8, sValueSize> lBytes;
  const u8 lMSB = pOrder == Endianness::eLittle ? pBytes.data[pBytes.size - 1] : pBytes.data[0];
  lBytes.fill((lMSB & 0x80u) ? 0xFF : 0x00);
  for (size_t i = 0; i < pBytes.size; i++) {
    u8 lByte = pOrder == Endianness::eLittle ? pBytes.data[pBytes.size - 1 - i] : pBytes.data[i];
    lBytes[sValueSize - pBytes.size + i] = lByte;
  }

  uint128_t lRaw = 0;
  for (u8 lByte : lBytes) {
    lRaw <<= 8;
    lRaw |= lByte;
  }

  if (lBytes[0] & 0x80u) {
    uint128_t lMagnitude = ~lRaw + 1;
    return -value_t(lMagnitude);
  }
  return value_t(lRaw);
}

std::string pythia::encodeValueHex(const value_t &pValue, Endianness pOrder) {
  return toHex(encodeValue(pValue, pOrder).view(), true);
}

std::optional<value_t> pythia::decodeValueHex(std::string_view pHex, Endianness pOrder) {
  auto lBytes = parseHex(pHex);
  if (!lBytes || lBytes->empty() || lBytes->size() > sValueSize)
    return {};
  return decodeValue({lBytes->data(), lBytes->size()}, pOrder);
}

std::string pythia::toString(const value_t &pValue) { return pValue.str(); }
