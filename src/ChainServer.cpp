#include <boost/endian/conversion.hpp>

#include "ChainServer.hpp"

using namespace pythia;

ChainServer::ChainServer(net::io_service &pService, LocalChain &pChain, const keypairs_t &pKeypair,
                         const udp::endpoint &pEndpoint)
    : Transport(pService, pKeypair, pEndpoint), chain(pChain) {}

ChainServer::~ChainServer() {
  for (const auto &lSubscriber : subscribers)
    chain.unsubscribe(lSubscriber.second.chainSubscription);
}

size_t ChainServer::subscriberCount() const { return subscribers.size(); }

void ChainServer::handle(const Contact &pSource, const cbuff_view_t &pBuff) {
  switch ((MessageType)pBuff.data[0]) {
  case eQueryAccount:
    replyQueryAccount(pSource, pBuff);
    break;
  case eQueryOperator:
    replyQueryOperator(pSource, pBuff);
    break;
  case eQueryResult:
    replyQueryResult(pSource, pBuff);
    break;
  case eQueryRequest:
    replyQueryRequest(pSource, pBuff);
    break;
  case eSubmit:
    replySubmit(pSource, pBuff);
    break;
  case eSubscribe:
    replySubscribe(pSource, pBuff);
    break;
  case eUnsubscribe:
    replyUnsubscribe(pSource, pBuff);
    break;
  default:
    std::cout << "[NET] unexpected command identifier " << (MessageType)pBuff.data[0] << " from " << pSource
              << std::endl;
    if (readToken(pBuff.data) != 0)
      replyWithResult(pSource, pBuff.data, PythiaErrorCode::eUnknownCommand);
  }
}

void ChainServer::replyQueryAccount(const Contact &pSource, const cbuff_view_t &pBuff) {
  cbuff_view_t lPayload{pBuff.data + sPayloadOffset, pBuff.size - sPayloadOffset};
  Address lAddress;
  readBuff(lAddress.view(), lPayload);

  u8 lReply[sPayloadOffset + 8 + 8];
  prepareReply(eAccountResult, pBuff.data, lReply);
  buff_view_t lOut{lReply + sPayloadOffset, sizeof(lReply) - sPayloadOffset};
  writeU64(lOut, chain.nextNonce(lAddress));
  writeU64(lOut, chain.account(lAddress).free);
  send(pSource, {lReply, sizeof(lReply)});
}

void ChainServer::replyQueryOperator(const Contact &pSource, const cbuff_view_t &pBuff) {
  cbuff_view_t lPayload{pBuff.data + sPayloadOffset, pBuff.size - sPayloadOffset};
  Address lAddress;
  readBuff(lAddress.view(), lPayload);

  u8 lReply[sPayloadOffset + 1];
  prepareReply(eOperatorResult, pBuff.data, lReply);
  lReply[sPayloadOffset] = (u8)chain.registration(lAddress);
  send(pSource, {lReply, sizeof(lReply)});
}

void ChainServer::replyQueryResult(const Contact &pSource, const cbuff_view_t &pBuff) {
  u8 lReply[sPayloadOffset + sValueSize];
  prepareReply(eValueResult, pBuff.data, lReply);
  auto lEncoded = encodeValue(chain.currentResult());
  memcpy(lReply + sPayloadOffset, lEncoded.data(), lEncoded.size());
  send(pSource, {lReply, sizeof(lReply)});
}

void ChainServer::replyQueryRequest(const Contact &pSource, const cbuff_view_t &pBuff) {
  cbuff_view_t lPayload{pBuff.data + sPayloadOffset, pBuff.size - sPayloadOffset};
  u64 lID = readU64(lPayload);

  u8 lReply[sPayloadOffset + 1];
  prepareReply(eRequestResult, pBuff.data, lReply);
  lReply[sPayloadOffset] = chain.pendingRequest(lID).has_value() ? 1 : 0;
  send(pSource, {lReply, sizeof(lReply)});
}

void ChainServer::replySubmit(const Contact &pSource, const cbuff_view_t &pBuff) {
  cbuff_view_t lPayload{pBuff.data + sPayloadOffset, pBuff.size - sPayloadOffset};
  Extrinsic lExtrinsic;
  lExtrinsic.read(lPayload);
  auto lHash = lExtrinsic.hash();

  u8 lReply[sPayloadOffset + u256::sSize];
  prepareReply(eSubmitted, pBuff.data, lReply);
  memcpy(lReply + sPayloadOffset, lHash.data(), lHash.size());
  send(pSource, {lReply, sizeof(lReply)});

  std::cout << "[NET] " << callName(lExtrinsic.call.type) << " from " << lExtrinsic.signer << " nonce "
            << lExtrinsic.nonce << std::endl;
  chain.submitExtrinsic(lExtrinsic, [this, pSource](const ErrorCode &, const TxStatus &pStatus) {
    pushStatus(pSource, pStatus);
  });
}

void ChainServer::replySubscribe(const Contact &pSource, const cbuff_view_t &pBuff) {
  u64 lID = nextSubscription++;
  size_t lChainSubscription =
      chain.subscribeEvents([this, lID](const ErrorCode &pError, const std::vector<ChainEvent> &pEvents) {
        pushEvents(lID, pError, pEvents);
      });
  subscribers[lID] = subscriber_t{pSource, lChainSubscription};
  std::cout << "[NET] " << pSource << " subscribed as #" << lID << std::endl;

  u8 lReply[sPayloadOffset + 8];
  prepareReply(eSubscribed, pBuff.data, lReply);
  buff_view_t lOut{lReply + sPayloadOffset, 8};
  writeU64(lOut, lID);
  send(pSource, {lReply, sizeof(lReply)});
}

void ChainServer::replyUnsubscribe(const Contact &pSource, const cbuff_view_t &pBuff) {
  cbuff_view_t lPayload{pBuff.data + sPayloadOffset, pBuff.size - sPayloadOffset};
  u64 lID = readU64(lPayload);

  auto lFound = subscribers.find(lID);
  if (lFound == subscribers.end() || lFound->second.peer.id != pSource.id) {
    replyWithResult(pSource, pBuff.data, PythiaErrorCode::eNotSubscribed);
    return;
  }

  chain.unsubscribe(lFound->second.chainSubscription);
  subscribers.erase(lFound);
  std::cout << "[NET] " << pSource << " unsubscribed #" << lID << std::endl;
  replyWithResult(pSource, pBuff.data, PythiaErrorCode::eNoError);
}

void ChainServer::pushStatus(const Contact &pDest, const TxStatus &pStatus) {
  u8 lPush[sPayloadOffset + TxStatus::sSerializedSize];
  preparePush(eTxStatusPush, lPush);
  buff_view_t lOut{lPush + sPayloadOffset, TxStatus::sSerializedSize};
  pStatus.write(lOut);
  send(pDest, {lPush, sizeof(lPush)});
}

void ChainServer::pushEvents(u64 pSubscription, const ErrorCode &pError, const std::vector<ChainEvent> &pEvents) {
  auto lFound = subscribers.find(pSubscription);
  if (lFound == subscribers.end())
    return;
  Contact lPeer = lFound->second.peer;
  u32 lError = pError ? (u32)pError.value() : 0;
  if (pError) {
    std::cout << "[NET] Subscription #" << pSubscription << " of " << lPeer << " ended: " << pError.message()
              << std::endl;
    subscribers.erase(lFound);
  }

  std::vector<u8> lBody(sMaxBody);
  size_t i = 0;
  do {
    buff_view_t lOut{lBody.data() + sPayloadOffset + sEventsPushHeader, sMaxPayload - sEventsPushHeader};
    u16 lCount = 0;
    for (; i < pEvents.size(); i++) {
      if (pEvents[i].serializedSize() > lOut.size) {
        if (lCount > 0)
          break;
        std::cout << "[NET] Event too large for a datagram, skipping " << pEvents[i] << std::endl;
        continue;
      }
      pEvents[i].write(lOut);
      lCount++;
    }

    preparePush(eEventsPush, lBody.data());
    buff_view_t lHeader{lBody.data() + sPayloadOffset, sEventsPushHeader};
    writeU64(lHeader, pSubscription);
    writeField(lHeader, boost::endian::native_to_big(lError));
    writeField(lHeader, boost::endian::native_to_big(lCount));
    send(lPeer, {lBody.data(), lBody.size() - lOut.size});
  } while (i < pEvents.size());
}
