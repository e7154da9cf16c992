#include <stdexcept>

#include <boost/endian/conversion.hpp>

#include "Extrinsic.hpp"

using namespace pythia;

std::ostream &pythia::operator<<(std::ostream &pOS, Registration pRegistration) {
  switch (pRegistration) {
  case Registration::eAbsent:
    return pOS << "absent";
  case Registration::eDisabled:
    return pOS << "disabled";
  case Registration::eRegistered:
    return pOS << "registered";
  }
  return pOS << "unknown";
}

Call Call::transfer(const Address &pDest, Balance pAmount) {
  Call lCall;
  lCall.type = Type::eTransfer;
  lCall.dest = pDest;
  lCall.amount = pAmount;
  return lCall;
}

Call Call::registerOperator() {
  Call lCall;
  lCall.type = Type::eRegisterOperator;
  return lCall;
}

Call Call::unregisterOperator() {
  Call lCall;
  lCall.type = Type::eUnregisterOperator;
  return lCall;
}

Call Call::initiateRequest(const Address &pOperator, std::string_view pSpec, u64 pDataVersion,
                           const std::vector<u8> &pData, Balance pFee) {
  Call lCall;
  lCall.type = Type::eInitiateRequest;
  lCall.dest = pOperator;
  lCall.spec.assign(pSpec.begin(), pSpec.end());
  lCall.dataVersion = pDataVersion;
  lCall.data = pData;
  lCall.amount = pFee;
  return lCall;
}

Call Call::callback(u64 pRequestId, const value_t &pValue) {
  Call lCall;
  lCall.type = Type::eCallback;
  lCall.requestId = pRequestId;
  auto lEncoded = encodeValue(pValue);
  lCall.data.assign(lEncoded.begin(), lEncoded.end());
  return lCall;
}

void Call::read(cbuff_view_t &pSource) {
  u8 lType = 0;
  readField<u8>(&lType, pSource);
  if (lType < (u8)Type::eTransfer || lType > (u8)Type::eCallback)
    throw std::invalid_argument("unknown call type " + std::to_string(lType));
  type = (Type)lType;
  readBuff(dest.view(), pSource);
  amount = readU64(pSource);
  requestId = readU64(pSource);
  dataVersion = readU64(pSource);
  readBytes(spec, pSource);
  readBytes(data, pSource);
}

void Call::write(buff_view_t &pDest) const {
  writeField(pDest, (u8)type);
  writeBuff(pDest, dest.view());
  writeU64(pDest, amount);
  writeU64(pDest, requestId);
  writeU64(pDest, dataVersion);
  writeBytes(pDest, {spec.data(), spec.size()});
  writeBytes(pDest, {data.data(), data.size()});
}

size_t Call::serializedSize() const { return 1 + dest.size() + 8 * 3 + 2 + spec.size() + 2 + data.size(); }

const char *pythia::callName(Call::Type pType) {
  switch (pType) {
  case Call::Type::eTransfer:
    return "balances.transfer";
  case Call::Type::eRegisterOperator:
    return "chainlink.registerOperator";
  case Call::Type::eUnregisterOperator:
    return "chainlink.unregisterOperator";
  case Call::Type::eInitiateRequest:
    return "chainlink.initiateRequest";
  case Call::Type::eCallback:
    return "chainlink.callback";
  }
  return "unknown";
}

void Extrinsic::read(cbuff_view_t &pSource) {
  readBuff(signer.view(), pSource);
  nonce = readU64(pSource);
  call.read(pSource);
  readBuff(signature.view(), pSource);
}

void Extrinsic::write(buff_view_t &pDest, bool pWithSign) const {
  writeBuff(pDest, signer.view());
  writeU64(pDest, nonce);
  call.write(pDest);
  if (pWithSign)
    writeBuff(pDest, signature.view());
}

size_t Extrinsic::serializedSize(bool pWithSign) const {
  return signer.size() + 8 + call.serializedSize() + (pWithSign ? signature.size() : 0);
}

u512 Extrinsic::computeSignature(const sensitive_t<u512> &pKey) const {
  u512 lResult;
  std::vector<u8> lData(serializedSize(false));
  buff_view_t lBuff{lData.data(), lData.size()};
  write(lBuff, false);
  assert(lBuff.size == 0);
  PYTHIA_CCALL(crypto_sign_detached(lResult.data(), nullptr, lData.data(), lData.size(), pKey->data()));
  return lResult;
}

bool Extrinsic::signatureValid() const {
  std::vector<u8> lData(serializedSize(false));
  buff_view_t lBuff{lData.data(), lData.size()};
  write(lBuff, false);
  assert(lBuff.size == 0);
  return crypto_sign_verify_detached(signature.data(), lData.data(), lData.size(), signer.data()) == 0;
}

u256 Extrinsic::hash() const {
  std::vector<u8> lData(serializedSize(true));
  buff_view_t lBuff{lData.data(), lData.size()};
  write(lBuff, true);
  u256 lResult;
  PYTHIA_CCALL(crypto_generichash(lResult.data(), lResult.size(), lData.data(), lData.size(), nullptr, 0));
  return lResult;
}

Extrinsic pythia::signExtrinsic(const Call &pCall, u64 pNonce, const keypairs_t &pSigner) {
  Extrinsic lResult;
  lResult.signer = pSigner.signPK;
  lResult.nonce = pNonce;
  lResult.call = pCall;
  lResult.signature = lResult.computeSignature(pSigner.signSK);
  return lResult;
}

bool TxStatus::terminal() const {
  return type == Type::eFinalized || type == Type::eInvalid || type == Type::eDropped;
}

void TxStatus::read(cbuff_view_t &pSource) {
  u8 lType = 0;
  readField<u8>(&lType, pSource);
  if (lType > (u8)Type::eDropped)
    throw std::invalid_argument("unknown status " + std::to_string(lType));
  type = (Type)lType;
  readBuff(hash.view(), pSource);
  block = readU64(pSource);
  u32 lDispatch = 0;
  readField<u32>(&lDispatch, pSource);
  dispatch = (PythiaErrorCode)boost::endian::big_to_native(lDispatch);
}

void TxStatus::write(buff_view_t &pDest) const {
  writeField(pDest, (u8)type);
  writeBuff(pDest, hash.view());
  writeU64(pDest, block);
  writeField(pDest, boost::endian::native_to_big((u32)dispatch));
}

std::ostream &pythia::operator<<(std::ostream &pOS, const TxStatus &pStatus) {
  switch (pStatus.type) {
  case TxStatus::Type::eReady:
    pOS << "ready";
    break;
  case TxStatus::Type::eInBlock:
    pOS << "in block #" << pStatus.block;
    break;
  case TxStatus::Type::eFinalized:
    pOS << "finalized in #" << pStatus.block;
    break;
  case TxStatus::Type::eInvalid:
    pOS << "invalid";
    break;
  case TxStatus::Type::eDropped:
    pOS << "dropped";
    break;
  }
  if (pStatus.dispatch != PythiaErrorCode::eNoError)
    pOS << " (" << PythiaErrorCategory::instance().message((int)pStatus.dispatch) << ')';
  return pOS;
}

bool ChainEvent::is(std::string_view pSection, std::string_view pMethod) const {
  return section == pSection && method == pMethod;
}

void ChainEvent::read(cbuff_view_t &pSource) {
  block = readU64(pSource);
  readString(section, pSource);
  readString(method, pSource);
  u16 lCount = 0;
  readField<u16>(&lCount, pSource);
  data.resize(boost::endian::big_to_native(lCount));
  for (auto &lField : data)
    readString(lField, pSource);
}

void ChainEvent::write(buff_view_t &pDest) const {
  writeU64(pDest, block);
  writeString(pDest, section);
  writeString(pDest, method);
  writeField(pDest, boost::endian::native_to_big((u16)data.size()));
  for (const auto &lField : data)
    writeString(pDest, lField);
}

size_t ChainEvent::serializedSize() const {
  size_t lResult = 8 + 2 + section.size() + 2 + method.size() + 2;
  for (const auto &lField : data)
    lResult += 2 + lField.size();
  return lResult;
}

std::ostream &pythia::operator<<(std::ostream &pOS, const ChainEvent &pEvent) {
  pOS << '#' << pEvent.block << ' ' << pEvent.section << '.' << pEvent.method << '(';
  for (size_t i = 0; i < pEvent.data.size(); i++)
    pOS << (i ? ", " : "") << pEvent.data[i];
  return pOS << ')';
}
