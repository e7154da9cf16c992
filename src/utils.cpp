#include <stdexcept>

#include <boost/endian/conversion.hpp>

#include "utils.hpp"

using namespace pythia;

void buff_view_t::seek(size_t pBytes) {
  data += pBytes;
  size -= pBytes;
}

void cbuff_view_t::seek(size_t pBytes) {
  data += pBytes;
  size -= pBytes;
}

std::ostream &pythia::operator<<(std::ostream &pOS, const buff_view_t &pBuff) {
  return pOS << cbuff_view_t{pBuff.data, pBuff.size};
}

std::ostream &pythia::operator<<(std::ostream &pOS, const cbuff_view_t &pBuff) { return pOS << toHex(pBuff); }

std::string pythia::toHex(const cbuff_view_t &pBuff, bool pPrefixed) {
  std::string lHex(pBuff.size * 2 + 1, '\0');
  sodium_bin2hex(&lHex[0], lHex.size(), pBuff.data, pBuff.size);
  lHex.pop_back();
  return pPrefixed ? "0x" + lHex : lHex;
}

static std::string_view stripPrefix(std::string_view pSource) {
  if (pSource.size() >= 2 && pSource[0] == '0' && (pSource[1] == 'x' || pSource[1] == 'X'))
    pSource.remove_prefix(2);
  return pSource;
}

bool pythia::parseHex(const buff_view_t &pDest, std::string_view pSource) {
  pSource = stripPrefix(pSource);
  if (pSource.size() != pDest.size * 2)
    return false;
  size_t lDecoded = 0;
  if (sodium_hex2bin(pDest.data, pDest.size, pSource.data(), pSource.size(), nullptr, &lDecoded, nullptr) != 0)
    return false;
  return lDecoded == pDest.size;
}

std::optional<std::vector<u8>> pythia::parseHex(std::string_view pSource) {
  pSource = stripPrefix(pSource);
  if (pSource.size() % 2 != 0)
    return {};
  std::vector<u8> lResult(pSource.size() / 2);
  if (!parseHex(buff_view_t{lResult.data(), lResult.size()}, pSource))
    return {};
  return lResult;
}

void pythia::readBuff(const buff_view_t &pDest, cbuff_view_t &pSource) {
  if (pSource.size < pDest.size)
    throw std::out_of_range("buffer underflow");
  memcpy(pDest.data, pSource.data, pDest.size);
  pSource.seek(pDest.size);
}

void pythia::writeBuff(buff_view_t &pDest, const cbuff_view_t &pSource) {
  if (pDest.size < pSource.size)
    throw std::out_of_range("buffer overflow");
  memcpy(pDest.data, pSource.data, pSource.size);
  pDest.seek(pSource.size);
}

void pythia::readBytes(std::vector<u8> &pDest, cbuff_view_t &pSource) {
  u16 lSize = 0;
  readField<u16>(&lSize, pSource);
  pDest.resize(boost::endian::big_to_native(lSize));
  readBuff({pDest.data(), pDest.size()}, pSource);
}

void pythia::writeBytes(buff_view_t &pDest, const cbuff_view_t &pSource) {
  if (pSource.size > 0xFFFF)
    throw std::length_error("byte string too long");
  writeField(pDest, boost::endian::native_to_big((u16)pSource.size));
  writeBuff(pDest, pSource);
}

void pythia::readString(std::string &pDest, cbuff_view_t &pSource) {
  std::vector<u8> lBytes;
  readBytes(lBytes, pSource);
  pDest.assign(lBytes.begin(), lBytes.end());
}

void pythia::writeString(buff_view_t &pDest, std::string_view pSource) {
  writeBytes(pDest, {(const u8 *)pSource.data(), pSource.size()});
}

u64 pythia::readU64(cbuff_view_t &pSource) {
  u64 lValue = 0;
  readField<u64>(&lValue, pSource);
  return boost::endian::big_to_native(lValue);
}

void pythia::writeU64(buff_view_t &pDest, u64 pValue) { writeField(pDest, boost::endian::native_to_big(pValue)); }

std::ostream &pythia::operator<<(std::ostream &pOS, const dur_t &pDur) {
  auto lNano = pDur.time.count();
  if (lNano < 1000) {
    return pOS << lNano << "ns";
  }
  if (lNano < 1'000'000) {
    return pOS << lNano / 1000.0 << "µs";
  }
  if (lNano < 1'000'000'000) {
    return pOS << lNano / 1'000'000.0 << "ms";
  }
  return pOS << lNano / 1'000'000'000.0 << "s";
}

keypairs_t pythia::keypairsFromSeed(const sensitive_t<u256> &pSeed) {
  keypairs_t lResult;
  static_assert(u256::sSize == crypto_box_SEEDBYTES);
  static_assert(u256::sSize == crypto_sign_SEEDBYTES);
  static_assert(u512::sSize == crypto_sign_SECRETKEYBYTES);
  PYTHIA_CCALL(crypto_box_seed_keypair(lResult.msgPK.data(), lResult.msgSK->data(), pSeed->data()));
  PYTHIA_CCALL(crypto_sign_seed_keypair(lResult.signPK.data(), lResult.signSK->data(), pSeed->data()));
  return lResult;
}

keypairs_t pythia::keypairsFromSecret(std::string_view pSecret) {
  sensitive_t<u256> lSeed;
  PYTHIA_CCALL(crypto_generichash(lSeed->data(), lSeed->size(), (const u8 *)pSecret.data(), pSecret.size(), nullptr,
                                  0));
  return keypairsFromSeed(lSeed);
}

keypairs_t pythia::randomKeypairs() {
  sensitive_t<u256> lSeed;
  randombytes_buf(lSeed->data(), lSeed->size());
  return keypairsFromSeed(lSeed);
}
