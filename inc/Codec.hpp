#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include "utils.hpp"

namespace pythia {

using value_t = boost::multiprecision::int128_t;

enum class Endianness { eLittle, eBig };

constexpr size_t sValueSize = 16;

/** Two's complement, sValueSize bytes. Throws std::out_of_range outside [-2^127, 2^127). */
u128 encodeValue(const value_t &pValue, Endianness pOrder = Endianness::eLittle);

/** Accepts 1 to sValueSize bytes, shorter inputs are sign-extended from their most significant byte.
 * Throws std::invalid_argument on an empty or oversized input. */
value_t decodeValue(const cbuff_view_t &pBytes, Endianness pOrder = Endianness::eLittle);

/** 0x prefixed hex of encodeValue, the payload format of a callback. */
std::string encodeValueHex(const value_t &pValue, Endianness pOrder = Endianness::eLittle);
std::optional<value_t> decodeValueHex(std::string_view pHex, Endianness pOrder = Endianness::eLittle);

std::string toString(const value_t &pValue);

} // namespace pythia
