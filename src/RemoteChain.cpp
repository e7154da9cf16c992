#include <boost/endian/conversion.hpp>

#include "RemoteChain.hpp"

using namespace pythia;

static ErrorCode illformed() { return PythiaErrorCategory::wrap(PythiaErrorCode::eIllformed); }

RemoteChain::RemoteChain(net::io_service &pService, const keypairs_t &pKeypair, const Contact &pNode,
                         boost::posix_time::time_duration pFeedTimeout, boost::posix_time::time_duration pWatchTimeout)
    : Transport(pService, pKeypair, udp::endpoint(pNode.address.is_v4() ? udp::v4() : udp::v6(), 0)), node(pNode),
      feedTimeout(pFeedTimeout), watchTimeout(pWatchTimeout) {}

RemoteChain::~RemoteChain() {
  for (auto &lSubscription : subscriptions)
    lSubscription.second.watchdog->cancel();
  for (auto &lWatch : watches)
    lWatch.second.expiry->cancel();
}

size_t RemoteChain::watchCount() const { return watches.size(); }

void RemoteChain::queryAccount(const Address &pAddress, const AccountCallback &pCallback) {
  u8 lCommand[sPayloadOffset + u256::sSize];
  prepareCommand(node, eQueryAccount, lCommand, [pCallback](const ErrorCode &pError, cbuff_view_t pReply) {
    if (pError) {
      pCallback(pError, {});
      return;
    }
    AccountInfo lInfo;
    try {
      lInfo.nonce = readU64(pReply);
      lInfo.free = readU64(pReply);
    } catch (const std::out_of_range &) {
      pCallback(illformed(), {});
      return;
    }
    pCallback(sNoError, lInfo);
  });
  memcpy(lCommand + sPayloadOffset, pAddress.data(), pAddress.size());
  send(node, {lCommand, sizeof(lCommand)});
}

void RemoteChain::queryRegistration(const Address &pAddress, const RegistrationCallback &pCallback) {
  u8 lCommand[sPayloadOffset + u256::sSize];
  prepareCommand(node, eQueryOperator, lCommand, [pCallback](const ErrorCode &pError, const cbuff_view_t &pReply) {
    if (pError) {
      pCallback(pError, Registration::eAbsent);
      return;
    }
    if (pReply.size != 1 || pReply.data[0] > (u8)Registration::eRegistered) {
      pCallback(illformed(), Registration::eAbsent);
      return;
    }
    pCallback(sNoError, (Registration)pReply.data[0]);
  });
  memcpy(lCommand + sPayloadOffset, pAddress.data(), pAddress.size());
  send(node, {lCommand, sizeof(lCommand)});
}

void RemoteChain::queryResult(const ResultCallback &pCallback) {
  u8 lCommand[sPayloadOffset];
  prepareCommand(node, eQueryResult, lCommand, [pCallback](const ErrorCode &pError, const cbuff_view_t &pReply) {
    if (pError) {
      pCallback(pError, 0);
      return;
    }
    if (pReply.size != sValueSize) {
      pCallback(illformed(), 0);
      return;
    }
    pCallback(sNoError, decodeValue(pReply));
  });
  send(node, {lCommand, sizeof(lCommand)});
}

void RemoteChain::queryRequest(u64 pRequestId, const RequestCallback &pCallback) {
  u8 lCommand[sPayloadOffset + 8];
  prepareCommand(node, eQueryRequest, lCommand, [pCallback](const ErrorCode &pError, const cbuff_view_t &pReply) {
    if (pError) {
      pCallback(pError, false);
      return;
    }
    if (pReply.size != 1 || pReply.data[0] > 1) {
      pCallback(illformed(), false);
      return;
    }
    pCallback(sNoError, pReply.data[0] == 1);
  });
  buff_view_t lOut{lCommand + sPayloadOffset, 8};
  writeU64(lOut, pRequestId);
  send(node, {lCommand, sizeof(lCommand)});
}

void RemoteChain::submit(const Call &pCall, const keypairs_t &pSigner, const StatusCallback &pCallback) {
  Extrinsic lUnsigned;
  lUnsigned.call = pCall;
  size_t lSize = lUnsigned.serializedSize();
  if (lSize > sMaxPayload) {
    std::cout << "[NET] " << callName(pCall.type) << " too large for a datagram (" << lSize << " bytes)" << std::endl;
    service.post([pCallback]() { pCallback(illformed(), {}); });
    return;
  }

  // The node counts pending extrinsics in the nonce it reports
  queryAccount(pSigner.address(), [this, pCall, pSigner, pCallback](const ErrorCode &pError, const AccountInfo &pInfo) {
    if (pError) {
      pCallback(pError, {});
      return;
    }
    sendExtrinsic(signExtrinsic(pCall, pInfo.nonce, pSigner), pCallback);
  });
}

void RemoteChain::sendExtrinsic(const Extrinsic &pExtrinsic, const StatusCallback &pCallback) {
  u256 lHash = pExtrinsic.hash();
  auto &lWatch = watches[lHash];
  lWatch.callback = pCallback;
  if (!lWatch.expiry)
    lWatch.expiry = std::make_unique<net::deadline_timer>(service);
  lWatch.expiry->expires_from_now(watchTimeout);
  lWatch.expiry->async_wait([this, lHash](const ErrorCode &pError) {
    if (pError == net::error::operation_aborted)
      return;
    std::cout << "[NET] No terminal status for " << lHash << " after " << watchTimeout.total_milliseconds() << "ms"
              << std::endl;
    endWatch(lHash, net::error::timed_out, {});
  });

  size_t lSize = pExtrinsic.serializedSize();
  std::vector<u8> lCommand(sPayloadOffset + lSize);
  prepareCommand(node, eSubmit, lCommand.data(), [this, lHash](const ErrorCode &pError, const cbuff_view_t &) {
    // Statuses follow the acknowledgement, only a failed submission ends the watch here
    if (pError)
      endWatch(lHash, pError, {});
  });
  buff_view_t lOut{lCommand.data() + sPayloadOffset, lSize};
  pExtrinsic.write(lOut);
  send(node, {lCommand.data(), lCommand.size()});
}

void RemoteChain::endWatch(const u256 &pHash, const ErrorCode &pError, const TxStatus &pStatus) {
  auto lFound = watches.find(pHash);
  if (lFound == watches.end())
    return;
  auto lCallback = std::move(lFound->second.callback);
  lFound->second.expiry->cancel();
  watches.erase(lFound);
  lCallback(pError, pStatus);
}

size_t RemoteChain::subscribeEvents(const EventsCallback &pCallback) {
  size_t lID = nextSubscription++;
  auto &lSubscription = subscriptions[lID];
  lSubscription.callback = pCallback;
  lSubscription.watchdog = std::make_unique<net::deadline_timer>(service);
  armWatchdog(lID);

  u8 lCommand[sPayloadOffset];
  prepareCommand(node, eSubscribe, lCommand, [this, lID](const ErrorCode &pError, cbuff_view_t pReply) {
    auto lFound = subscriptions.find(lID);
    if (pError) {
      std::cout << "[NET] Can't subscribe: " << pError.message() << std::endl;
      if (lFound != subscriptions.end())
        endSubscription(lID, PythiaErrorCategory::wrap(PythiaErrorCode::eFeedDisconnected), false);
      return;
    }

    u64 lRemote = readU64(pReply);
    if (lFound == subscriptions.end()) {
      // Unsubscribed before the node answered
      sendUnsubscribe(lRemote);
      return;
    }
    lFound->second.remote = lRemote;
  });
  send(node, {lCommand, sizeof(lCommand)});
  return lID;
}

void RemoteChain::unsubscribe(size_t pSubscription) {
  auto lFound = subscriptions.find(pSubscription);
  if (lFound == subscriptions.end())
    return;
  lFound->second.watchdog->cancel();
  if (lFound->second.remote)
    sendUnsubscribe(*lFound->second.remote);
  subscriptions.erase(lFound);
}

void RemoteChain::sendUnsubscribe(u64 pRemote) {
  u8 lCommand[sPayloadOffset + 8];
  prepareCommand(node, eUnsubscribe, lCommand, [pRemote](const ErrorCode &pError, const cbuff_view_t &) {
    if (pError && !isError(pError, PythiaErrorCode::eNotSubscribed))
      std::cout << "[NET] Can't unsubscribe #" << pRemote << ": " << pError.message() << std::endl;
  });
  buff_view_t lOut{lCommand + sPayloadOffset, 8};
  writeU64(lOut, pRemote);
  send(node, {lCommand, sizeof(lCommand)});
}

void RemoteChain::armWatchdog(size_t pSubscription) {
  auto &lWatchdog = *subscriptions.at(pSubscription).watchdog;
  lWatchdog.expires_from_now(feedTimeout);
  lWatchdog.async_wait([this, pSubscription](const ErrorCode &pError) {
    if (pError == net::error::operation_aborted)
      return;
    std::cout << "[NET] No events for " << feedTimeout.total_milliseconds() << "ms on subscription #"
              << pSubscription << std::endl;
    endSubscription(pSubscription, PythiaErrorCategory::wrap(PythiaErrorCode::eFeedDisconnected), true);
  });
}

void RemoteChain::endSubscription(size_t pSubscription, const ErrorCode &pError, bool pNotifyNode) {
  auto lFound = subscriptions.find(pSubscription);
  if (lFound == subscriptions.end())
    return;

  auto lCallback = std::move(lFound->second.callback);
  auto lRemote = lFound->second.remote;
  lFound->second.watchdog->cancel();
  subscriptions.erase(lFound);

  if (pNotifyNode && lRemote)
    sendUnsubscribe(*lRemote);
  lCallback(pError, {});
}

void RemoteChain::handle(const Contact &pSource, const cbuff_view_t &pBuff) {
  if (pSource.id != node.id) {
    std::cout << "[NET] Ignoring " << (MessageType)pBuff.data[0] << " from unknown peer " << pSource << std::endl;
    return;
  }

  cbuff_view_t lPayload{pBuff.data + sPayloadOffset, pBuff.size - sPayloadOffset};
  switch ((MessageType)pBuff.data[0]) {
  case eTxStatusPush:
    recvStatus(lPayload);
    break;
  case eEventsPush:
    recvEvents(lPayload);
    break;
  default:
    std::cout << "[NET] unexpected command identifier " << (MessageType)pBuff.data[0] << std::endl;
  }
}

void RemoteChain::recvStatus(const cbuff_view_t &pPayload) {
  cbuff_view_t lPayload = pPayload;
  TxStatus lStatus;
  lStatus.read(lPayload);

  if (lStatus.terminal()) {
    endWatch(lStatus.hash, sNoError, lStatus);
    return;
  }
  auto lFound = watches.find(lStatus.hash);
  if (lFound == watches.end())
    return;
  auto lCallback = lFound->second.callback;
  lCallback(sNoError, lStatus);
}

void RemoteChain::recvEvents(const cbuff_view_t &pPayload) {
  cbuff_view_t lPayload = pPayload;
  u64 lRemote = readU64(lPayload);
  u32 lError = 0;
  u16 lCount = 0;
  readField<u32>(&lError, lPayload);
  readField<u16>(&lCount, lPayload);
  lError = boost::endian::big_to_native(lError);

  std::vector<ChainEvent> lEvents(boost::endian::big_to_native(lCount));
  for (auto &lEvent : lEvents)
    lEvent.read(lPayload);

  size_t lLocal = 0;
  for (const auto &lSubscription : subscriptions) {
    if (lSubscription.second.remote == lRemote) {
      lLocal = lSubscription.first;
      break;
    }
  }
  if (lLocal == 0)
    return;

  if (lError != 0) {
    endSubscription(lLocal, ErrorCode((int)lError, PythiaErrorCategory::instance()), false);
    return;
  }

  armWatchdog(lLocal);
  auto lCallback = subscriptions.at(lLocal).callback;
  lCallback(sNoError, lEvents);
}
