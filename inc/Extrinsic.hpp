#pragma once

#include "Codec.hpp"
#include "Errors.hpp"
#include "utils.hpp"

namespace pythia {

using Address = u256;
using Balance = u64;

constexpr const char *sOracleSection = "chainlink";
constexpr const char *sOracleRequestMethod = "OracleRequest";

struct AccountInfo {
  u64 nonce = 0;
  Balance free = 0;
};

/** Registry record of an operator, absent and explicitly disabled are distinct states. */
enum class Registration : u8 {
  eAbsent = 0x00,
  eDisabled = 0x01,
  eRegistered = 0x02,
};
std::ostream &operator<<(std::ostream &pOS, Registration pRegistration);

struct Call {
  enum class Type : u8 {
    eTransfer = 0x01,
    eRegisterOperator = 0x02,
    eUnregisterOperator = 0x03,
    eInitiateRequest = 0x04,
    eCallback = 0x05,
  } type = Type::eTransfer;

  Address dest;          // transfer recipient, request operator
  Balance amount = 0;    // transfer amount, request fee
  u64 requestId = 0;     // callback
  u64 dataVersion = 0;   // request
  std::vector<u8> spec;  // request
  std::vector<u8> data;  // request parameters, callback result

  static Call transfer(const Address &pDest, Balance pAmount);
  static Call registerOperator();
  static Call unregisterOperator();
  static Call initiateRequest(const Address &pOperator, std::string_view pSpec, u64 pDataVersion,
                              const std::vector<u8> &pData, Balance pFee);
  static Call callback(u64 pRequestId, const value_t &pValue);

  void read(cbuff_view_t &pSource);
  void write(buff_view_t &pDest) const;
  size_t serializedSize() const;
};

const char *callName(Call::Type pType);

struct Extrinsic {
  Address signer;
  u64 nonce = 0;
  Call call;
  u512 signature;

  void read(cbuff_view_t &pSource);
  void write(buff_view_t &pDest, bool pWithSign = true) const;

  size_t serializedSize(bool pWithSign = true) const;
  u512 computeSignature(const sensitive_t<u512> &pKey) const;
  bool signatureValid() const;

  /** BLAKE2b-256 of the signed serialization */
  u256 hash() const;
};

Extrinsic signExtrinsic(const Call &pCall, u64 pNonce, const keypairs_t &pSigner);

struct TxStatus {
  enum class Type : u8 {
    eReady = 0x00,
    eInBlock = 0x01,
    eFinalized = 0x02,
    eInvalid = 0x03,
    eDropped = 0x04,
  } type = Type::eReady;

  u256 hash;
  u64 block = 0;
  // Outcome of dispatching the call for eInBlock and eFinalized, rejection reason for eInvalid
  PythiaErrorCode dispatch = PythiaErrorCode::eNoError;

  bool terminal() const;

  void read(cbuff_view_t &pSource);
  void write(buff_view_t &pDest) const;
  static constexpr size_t sSerializedSize = 1 + 32 + 8 + 4;
};
std::ostream &operator<<(std::ostream &pOS, const TxStatus &pStatus);

/** Largest serialized event the chain emits, an events push always has room for one. */
constexpr size_t sMaxEventSize = 1142;

struct ChainEvent {
  u64 block = 0;
  std::string section, method;
  std::vector<std::string> data;

  bool is(std::string_view pSection, std::string_view pMethod) const;

  void read(cbuff_view_t &pSource);
  void write(buff_view_t &pDest) const;
  size_t serializedSize() const;
};
std::ostream &operator<<(std::ostream &pOS, const ChainEvent &pEvent);

} // namespace pythia
