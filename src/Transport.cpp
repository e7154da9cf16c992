#include <boost/endian/conversion.hpp>
#include <boost/functional/hash.hpp>

#include "Transport.hpp"

using namespace pythia;

std::ostream &pythia::operator<<(std::ostream &pOS, MessageType pType) {
  switch (pType) {
  case eResult:
    return pOS << "result";
  case eQueryAccount:
    return pOS << "query-account";
  case eQueryOperator:
    return pOS << "query-operator";
  case eQueryResult:
    return pOS << "query-result";
  case eSubmit:
    return pOS << "submit";
  case eSubscribe:
    return pOS << "subscribe";
  case eUnsubscribe:
    return pOS << "unsubscribe";
  case eQueryRequest:
    return pOS << "query-request";
  case eAccountResult:
    return pOS << "account-result";
  case eOperatorResult:
    return pOS << "operator-result";
  case eValueResult:
    return pOS << "value-result";
  case eSubmitted:
    return pOS << "submitted";
  case eSubscribed:
    return pOS << "subscribed";
  case eRequestResult:
    return pOS << "request-result";
  case eTxStatusPush:
    return pOS << "tx-status";
  case eEventsPush:
    return pOS << "events";
  }
  return pOS << "0x" << std::hex << (int)pType << std::dec;
}

inflight_t::inflight_t(net::io_service &pService, MessageType pType, Contact pDest, Callback pCallback)
    : timeout(pService, PYTHIA_TIMEOUT), type(pType), dest(std::move(pDest)), callback(std::move(pCallback)) {}

Transport::Transport(net::io_service &pService, const keypairs_t &pKeypair, const udp::endpoint &pEndpoint)
    : service(pService), sock(pService, pEndpoint), keypair(pKeypair) {
  recieve();
}

Transport::~Transport() {
  ErrorCode lError;
  sock.close(lError);
  for (auto &lInflight : inflights)
    lInflight.second.timeout.cancel();
}

Contact Transport::self() const {
  return Contact::fromEndpoint(keypair.msgPK, sock.local_endpoint());
}

size_t Transport::inflightCount() const { return inflights.size(); }

bool Transport::isReply(MessageType pType) {
  switch (pType) {
  case eResult:
  case eAccountResult:
  case eOperatorResult:
  case eValueResult:
  case eSubmitted:
  case eSubscribed:
  case eRequestResult:
    return true;
  default:
    return false;
  }
}

size_t Transport::hashInflight(const u256 &pDest, uint32_t pToken) {
  std::size_t seed = 0;
  boost::hash_combine(seed, boost::hash_value(pToken));
  boost::hash_combine(seed, boost::hash_value(pDest));
  return seed;
}

uint32_t Transport::readToken(const u8 *pData) {
  uint32_t lToken = 0;
  memcpy(&lToken, pData + 1, 3);
  return lToken;
}

void Transport::send(const Contact &pDest, const cbuff_view_t &pBuff) {
  assert(pBuff.size <= sMaxBody);
  size_t lMessSize = sHeaderSize + pBuff.size;
  auto lBuff = new u8[lMessSize];
  u8 *lNonce = lBuff + sNonceOffset;
  u8 *lMac = lBuff + sMacOffset;
  u8 *lCrypt = lBuff + sHeaderSize;
  memcpy(lBuff, keypair.msgPK.data(), keypair.msgPK.size());
  randombytes_buf(lNonce, sNonceSize);
  if (crypto_box_detached(lCrypt, lMac, pBuff.data, pBuff.size, lNonce, pDest.id.data(),
                          keypair.msgSK.contained.data()) == 0) {
    sock.async_send_to(boost::asio::const_buffer(lBuff, lMessSize), pDest.endpoint(),
                       [lMessSize, lBuff](const ErrorCode &pError, size_t pBytesWritten) {
                         if (pError) {
                           if (pError != net::error::operation_aborted)
                             std::cout << "[NET] Got error on send: " << pError.message() << " (" << pError.value()
                                       << ')' << std::endl;
                         } else if (pBytesWritten != lMessSize) {
                           std::cout << "[NET] Got error on send: sent less bytes than expected" << std::endl;
                         }
                         delete[] lBuff;
                       });
  } else {
    std::cout << "[NET] Error while boxing message, skipping." << std::endl;
    delete[] lBuff;
  }
}

void Transport::recieve() {
  sock.async_receive_from(boost::asio::buffer(recvBuff.data(), sBuffSize), lastDist,
                          [this](ErrorCode pError, size_t pBytesRecv) {
                            if (pError == net::error::operation_aborted)
                              return;
                            if (pError) {
                              std::cout << "[NET] Got error on recv: " << pError.message() << std::endl;
                            } else if (pBytesRecv < sHeaderSize + sPayloadOffset) {
                              std::cout << "[NET] Runt datagram from " << lastDist << ", ignoring." << std::endl;
                            } else {
                              u256 lSourceID;
                              memcpy(lSourceID.data(), recvBuff.data(), lSourceID.size());
                              Contact lSource = Contact::fromEndpoint(lSourceID, lastDist);
                              size_t lMessLen = pBytesRecv - sHeaderSize;
                              buff_t<sMaxBody> lDecrypted;
                              u8 *lNonce = recvBuff.data() + sNonceOffset;
                              u8 *lMac = recvBuff.data() + sMacOffset;
                              u8 *lCrypt = recvBuff.data() + sHeaderSize;

                              if (crypto_box_open_detached(lDecrypted.data(), lCrypt, lMac, lMessLen, lNonce,
                                                           lSource.id.data(), keypair.msgSK.contained.data()) == 0) {
                                cbuff_view_t lBuff{lDecrypted.data(), lMessLen};
                                auto lType = (MessageType)lBuff.data[0];
                                try {
                                  if (isReply(lType))
                                    recvResponse(lSource, lBuff);
                                  else
                                    handle(lSource, lBuff);
                                } catch (const std::exception &pException) {
                                  std::cout << "[NET] Ill-formed " << lType << " from " << lSource << ": "
                                            << pException.what() << std::endl;
                                  if (!isReply(lType) && readToken(lBuff.data) != 0)
                                    replyWithResult(lSource, lBuff.data, PythiaErrorCode::eIllformed);
                                }
                              } else {
                                std::cout << "[NET] Error while opening message, ignoring." << std::endl;
                              }
                            }
                            recieve();
                          });
}

size_t Transport::prepareCommand(const Contact &pDest, MessageType pCommandType, u8 *pBuffer,
                                 const inflight_t::Callback &pCallback) {
  uint32_t lToken;
  size_t lID;
  do {
    lToken = randombytes_random() & 0xFFFFFFu;
    lID = hashInflight(pDest.id, lToken);
    // Zero is the token of pushes
  } while (lToken == 0 || inflights.find(lID) != inflights.end());

  inflight_t lInflight{service, pCommandType, pDest, pCallback};

  lInflight.timeout.async_wait([this, lID, lToken](const ErrorCode &pError) {
    if (pError == boost::asio::error::operation_aborted)
      return;
    auto lRef = inflights.find(lID);
    if (lRef != inflights.end()) {
      std::cout << "[NET] Inflight timeout to " << lRef->second.dest << ", token: " << std::hex << lToken << std::dec
                << ", type: " << lRef->second.type << std::endl;
      auto lCallback = std::move(lRef->second.callback);
      inflights.erase(lRef);
      if (lCallback)
        lCallback(boost::asio::error::timed_out, {nullptr, 0});
    }
  });

  pBuffer[0] = (u8)pCommandType;
  memcpy(pBuffer + 1, &lToken, 3);

  inflights.emplace(lID, std::move(lInflight));
  return lID;
}

void Transport::prepareReply(MessageType pReplyType, const u8 *pCommandBuffer, u8 *pReplyBuffer) {
  pReplyBuffer[0] = pReplyType;
  memcpy(pReplyBuffer + 1, pCommandBuffer + 1, 3);
}

void Transport::preparePush(MessageType pType, u8 *pBuffer) {
  pBuffer[0] = pType;
  memset(pBuffer + 1, 0, 3);
}

void Transport::replyWithResult(const Contact &pSource, const u8 *pCommandBuffer, PythiaErrorCode pError) {
  u8 lReply[sPayloadOffset + 4];
  prepareReply(eResult, pCommandBuffer, lReply);
  uint32_t lError = boost::endian::native_to_big((uint32_t)pError);
  memcpy(lReply + sPayloadOffset, &lError, sizeof(lError));
  send(pSource, {lReply, sizeof(lReply)});
}

void Transport::recvResponse(const Contact &pSource, const cbuff_view_t &pBuff) {
  uint32_t lToken = readToken(pBuff.data);

  auto lInflight = inflights.find(hashInflight(pSource.id, lToken));
  if (lInflight == inflights.end() || lInflight->second.dest.id != pSource.id) {
    std::cout << "[NET] Non inflight from " << pSource << ", token: " << std::hex << lToken << std::dec << std::endl;
    return;
  }

  lInflight->second.timeout.cancel();
  auto lCallback = std::move(lInflight->second.callback);
  inflights.erase(lInflight);
  if (!lCallback)
    return;

  cbuff_view_t lPayload{pBuff.data + sPayloadOffset, pBuff.size - sPayloadOffset};
  if (pBuff.data[0] != eResult) {
    lCallback(sNoError, lPayload);
  } else {
    uint32_t lError = 0;
    readField<uint32_t>(&lError, lPayload);
    lCallback(ErrorCode((int)boost::endian::big_to_native(lError), PythiaErrorCategory::instance()), lPayload);
  }
}
