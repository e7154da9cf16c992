#pragma once

#include <map>
#include <memory>

#include "ChainClient.hpp"
#include "Transport.hpp"

namespace pythia {

/** ChainClient reaching a development node over the node protocol.
 *
 * A status watch ends on a terminal status, or with net::error::timed_out once watchTimeout passed without one. */
class RemoteChain : public ChainClient, public Transport {
  struct watch_t {
    StatusCallback callback;
    std::unique_ptr<net::deadline_timer> expiry;
  };

  struct subscription_t {
    EventsCallback callback;
    std::optional<u64> remote;
    std::unique_ptr<net::deadline_timer> watchdog;
  };

  Contact node;
  boost::posix_time::time_duration feedTimeout;
  boost::posix_time::time_duration watchTimeout;

  std::unordered_map<u256, watch_t, array_hasher_t<32>> watches;
  size_t nextSubscription = 1;
  std::map<size_t, subscription_t> subscriptions;

  void handle(const Contact &pSource, const cbuff_view_t &pBuff) override;
  void recvStatus(const cbuff_view_t &pPayload);
  void recvEvents(const cbuff_view_t &pPayload);

  void armWatchdog(size_t pSubscription);
  void endSubscription(size_t pSubscription, const ErrorCode &pError, bool pNotifyNode);
  void sendUnsubscribe(u64 pRemote);
  void sendExtrinsic(const Extrinsic &pExtrinsic, const StatusCallback &pCallback);
  void endWatch(const u256 &pHash, const ErrorCode &pError, const TxStatus &pStatus);

public:
  RemoteChain(net::io_service &pService, const keypairs_t &pKeypair, const Contact &pNode,
              boost::posix_time::time_duration pFeedTimeout = PYTHIA_FEED_TIMEOUT,
              boost::posix_time::time_duration pWatchTimeout = PYTHIA_FINALITY_TIMEOUT);
  ~RemoteChain() override;

  void queryAccount(const Address &pAddress, const AccountCallback &pCallback) override;
  void queryRegistration(const Address &pAddress, const RegistrationCallback &pCallback) override;
  void queryResult(const ResultCallback &pCallback) override;
  void queryRequest(u64 pRequestId, const RequestCallback &pCallback) override;
  void submit(const Call &pCall, const keypairs_t &pSigner, const StatusCallback &pCallback) override;
  size_t subscribeEvents(const EventsCallback &pCallback) override;
  void unsubscribe(size_t pSubscription) override;

  size_t watchCount() const;
};

} // namespace pythia
