#pragma once

#include <map>

#include "LocalChain.hpp"
#include "Transport.hpp"

namespace pythia {

/** Serves a LocalChain over the node protocol. */
class ChainServer : public Transport {
  struct subscriber_t {
    Contact peer;
    size_t chainSubscription;
  };

  LocalChain &chain;
  u64 nextSubscription = 1;
  std::map<u64, subscriber_t> subscribers;

  void handle(const Contact &pSource, const cbuff_view_t &pBuff) override;

  void replyQueryAccount(const Contact &pSource, const cbuff_view_t &pBuff);
  void replyQueryOperator(const Contact &pSource, const cbuff_view_t &pBuff);
  void replyQueryResult(const Contact &pSource, const cbuff_view_t &pBuff);
  void replyQueryRequest(const Contact &pSource, const cbuff_view_t &pBuff);
  void replySubmit(const Contact &pSource, const cbuff_view_t &pBuff);
  void replySubscribe(const Contact &pSource, const cbuff_view_t &pBuff);
  void replyUnsubscribe(const Contact &pSource, const cbuff_view_t &pBuff);

  void pushStatus(const Contact &pDest, const TxStatus &pStatus);
  void pushEvents(u64 pSubscription, const ErrorCode &pError, const std::vector<ChainEvent> &pEvents);

public:
  ChainServer(net::io_service &pService, LocalChain &pChain, const keypairs_t &pKeypair,
              const udp::endpoint &pEndpoint);
  ~ChainServer() override;

  size_t subscriberCount() const;
};

} // namespace pythia
