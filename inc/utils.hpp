#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>

#include <array>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <utility>

#include <sodium.h>

#define PYTHIA_TIMEOUT boost::posix_time::seconds(1)
#define PYTHIA_FEED_TIMEOUT boost::posix_time::seconds(5)
#define PYTHIA_FINALITY_TIMEOUT boost::posix_time::seconds(60)

#define PYTHIA_CCALL(expr)                                                                                             \
  if (expr)                                                                                                            \
    throw std::runtime_error(std::string(#expr) + " failed at " __FILE__ ":" + std::to_string(__LINE__));

namespace pythia {

namespace net = boost::asio;

using Clock = std::chrono::steady_clock;
using ErrorCode = boost::system::error_code;

static ErrorCode sNoError = ErrorCode(boost::system::errc::success, boost::system::generic_category());

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

struct cbuff_view_t {
  const u8 *data;
  size_t size;

  void seek(size_t pBytes);
};

struct buff_view_t {
  u8 *data;
  size_t size;

  void seek(size_t pBytes);

  operator cbuff_view_t() const { return cbuff_view_t{data, size}; }
};
std::ostream &operator<<(std::ostream &pOS, const buff_view_t &pBuff);
std::ostream &operator<<(std::ostream &pOS, const cbuff_view_t &pBuff);

/** @return false if pSource is not exactly pDest.size bytes of hex, an optional 0x prefix is accepted */
bool parseHex(const buff_view_t &pDest, std::string_view pSource);
std::optional<std::vector<u8>> parseHex(std::string_view pSource);
std::string toHex(const cbuff_view_t &pBuff, bool pPrefixed = false);

template <const size_t TSize> struct buff_t : public std::array<u8, TSize> {
  static constexpr size_t sSize = TSize;

  buff_t() { std::array<u8, TSize>::fill(0); }
  bool operator==(const buff_t<TSize> &pOther) const {
    return memcmp(std::array<u8, TSize>::data(), pOther.data(), TSize) == 0;
  }
  bool operator!=(const buff_t<TSize> &pOther) const { return !(*this == pOther); }

  buff_view_t view() { return buff_view_t{std::array<u8, TSize>::data(), std::array<u8, TSize>::size()}; }

  cbuff_view_t view() const { return cbuff_view_t{std::array<u8, TSize>::data(), std::array<u8, TSize>::size()}; }
};

/** Throws std::out_of_range when pSource is shorter than pDest, so truncated datagrams never read past the end. */
void readBuff(const buff_view_t &pDest, cbuff_view_t &pSource);
void writeBuff(buff_view_t &pDest, const cbuff_view_t &pSource);

template <typename T> void readField(T *pDest, cbuff_view_t &pSource) {
  buff_view_t lDest{(u8 *)pDest, sizeof(T)};
  readBuff(lDest, pSource);
}

template <typename T> void writeField(buff_view_t &pDest, const T &pSource) {
  cbuff_view_t lSource{(const u8 *)&pSource, sizeof(T)};
  writeBuff(pDest, lSource);
}

// Length prefixed (u16, big endian) byte strings
void readBytes(std::vector<u8> &pDest, cbuff_view_t &pSource);
void writeBytes(buff_view_t &pDest, const cbuff_view_t &pSource);
void readString(std::string &pDest, cbuff_view_t &pSource);
void writeString(buff_view_t &pDest, std::string_view pSource);

u64 readU64(cbuff_view_t &pSource);
void writeU64(buff_view_t &pDest, u64 pValue);

template <const size_t TSize> std::ostream &operator<<(std::ostream &pOS, const buff_t<TSize> &pBuff) {
  return pOS << pBuff.view();
}

using u128 = buff_t<16>;
using u192 = buff_t<24>;
using u256 = buff_t<32>;
using u512 = buff_t<64>;

struct dur_t {
  std::chrono::nanoseconds time;

  template <typename TRep, typename TPeriod>
  explicit dur_t(std::chrono::duration<TRep, TPeriod> pTime)
      : time(std::chrono::duration_cast<std::chrono::nanoseconds>(pTime)) {}
};
std::ostream &operator<<(std::ostream &pOS, const dur_t &pDur);

template <typename T> struct sensitive_t {
  T contained;

  sensitive_t() { sodium_mlock(contained.data(), contained.size()); }
  explicit sensitive_t(T pInit) : contained(std::move(pInit)) { sodium_mlock(contained.data(), contained.size()); }
  sensitive_t(const sensitive_t &pOther) : contained(pOther.contained) {
    sodium_mlock(contained.data(), contained.size());
  }

  ~sensitive_t() {
    sodium_memzero(contained.data(), contained.size());
    sodium_munlock(contained.data(), contained.size());
  }

  sensitive_t &operator=(const sensitive_t &pOther) {
    contained = pOther.contained;
    return *this;
  }

  T *operator->() { return &contained; }

  const T *operator->() const { return &contained; }
};

using passphrase_t = sensitive_t<std::string>;

struct keypairs_t {
  // crypto_box, seals node protocol datagrams
  u256 msgPK;
  sensitive_t<u256> msgSK;

  // crypto_sign, signs extrinsics
  u256 signPK;
  sensitive_t<u512> signSK;

  const u256 &address() const { return signPK; }
};

/** Derives both keypairs from a seed, the same seed always gives the same identity. */
keypairs_t keypairsFromSeed(const sensitive_t<u256> &pSeed);

/** Development identities ("//Alice"), the seed is the BLAKE2b hash of pSecret. */
keypairs_t keypairsFromSecret(std::string_view pSecret);

keypairs_t randomKeypairs();

template <typename T> T rand() {
  T lResult;
  randombytes_buf(lResult.data(), lResult.size());
  return lResult;
}

template <size_t TSize> struct array_hasher_t {
  using sType = std::array<u8, TSize>;

  inline std::size_t operator()(const sType &p) const {
    std::string_view pView{(const char *)p.data(), p.size()};
    return std::hash<std::string_view>()(pView);
  }
};

} // namespace pythia
