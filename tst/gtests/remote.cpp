#include "Chain.hpp"
#include "ChainServer.hpp"
#include "Operator.hpp"
#include "RemoteChain.hpp"

using namespace pythia;

class PythiaRemoteTest : public PythiaChainTest {
protected:
  ChainServer server;
  RemoteChain remote;

  static net::ip::udp::endpoint loopback() {
    return net::ip::udp::endpoint(net::ip::make_address("127.0.0.1"), 0);
  }

  PythiaRemoteTest()
      : server(service, chain, randomKeypairs(), loopback()), remote(service, randomKeypairs(), server.self()) {}

  /** Runs the loop without producing blocks until pDone holds or pTimeout elapsed. @return pDone() */
  bool waitFor(const std::function<bool()> &pDone,
               std::chrono::milliseconds pTimeout = std::chrono::milliseconds(3000)) {
    auto lDeadline = Clock::now() + pTimeout;
    while (!pDone() && Clock::now() < lDeadline) {
      service.restart();
      service.run_for(std::chrono::milliseconds(10));
    }
    return pDone();
  }
};

TEST_F(PythiaRemoteTest, Queries) {
  bool lAccountDone = false;
  remote.queryAccount(alice.address(), [&](const ErrorCode &pError, const AccountInfo &pInfo) {
    EXPECT_FALSE(pError) << pError.message();
    EXPECT_EQ(0u, pInfo.nonce);
    EXPECT_EQ(sEndowment, pInfo.free);
    lAccountDone = true;
  });
  Registration lBefore = Registration::eDisabled;
  bool lRegistrationDone = false;
  remote.queryRegistration(bob.address(), [&](const ErrorCode &pError, Registration pRegistration) {
    EXPECT_FALSE(pError) << pError.message();
    lBefore = pRegistration;
    lRegistrationDone = true;
  });
  ASSERT_TRUE(waitFor([&]() { return lAccountDone && lRegistrationDone; }));
  EXPECT_EQ(Registration::eAbsent, lBefore);
  EXPECT_EQ(0u, remote.inflightCount());

  registerOperator(bob);
  sendRequest(bob.address());
  produceBlocks(1);
  chain.submit(Call::callback(0, value_t(-42)), bob, [](const ErrorCode &, const TxStatus &) {});
  produceBlocks(1);

  std::optional<Registration> lAfter;
  std::optional<value_t> lResult;
  remote.queryRegistration(bob.address(), [&](const ErrorCode &pError, Registration pRegistration) {
    EXPECT_FALSE(pError);
    lAfter = pRegistration;
  });
  remote.queryResult([&](const ErrorCode &pError, const value_t &pResult) {
    EXPECT_FALSE(pError);
    lResult = pResult;
  });
  std::optional<bool> lPending;
  remote.queryRequest(0, [&](const ErrorCode &pError, bool pPending) {
    EXPECT_FALSE(pError);
    lPending = pPending;
  });
  ASSERT_TRUE(waitFor([&]() { return lAfter && lResult && lPending; }));
  EXPECT_EQ(Registration::eRegistered, *lAfter);
  EXPECT_EQ(value_t(-42), *lResult);
  // Answered
  EXPECT_FALSE(*lPending);
}

TEST_F(PythiaRemoteTest, SubmitToFinality) {
  std::vector<TxStatus> lStatuses;
  remote.submit(Call::registerOperator(), bob, [&lStatuses](const ErrorCode &pError, const TxStatus &pStatus) {
    EXPECT_FALSE(pError) << pError.message();
    lStatuses.push_back(pStatus);
  });
  ASSERT_TRUE(waitFor([&]() { return chain.pendingCount() == 1; }));
  EXPECT_EQ(1u, remote.watchCount());

  ASSERT_TRUE(runUntil([&]() { return !lStatuses.empty() && lStatuses.back().terminal(); }));
  EXPECT_EQ(TxStatus::Type::eFinalized, lStatuses.back().type);
  EXPECT_EQ(PythiaErrorCode::eNoError, lStatuses.back().dispatch);
  EXPECT_EQ(1u, lStatuses.back().block);
  EXPECT_EQ(0u, remote.watchCount());
  EXPECT_EQ(Registration::eRegistered, chain.registration(bob.address()));

  // Nonce comes from the node
  lStatuses.clear();
  remote.submit(Call::unregisterOperator(), bob, [&lStatuses](const ErrorCode &, const TxStatus &pStatus) {
    lStatuses.push_back(pStatus);
  });
  ASSERT_TRUE(runUntil([&]() { return !lStatuses.empty() && lStatuses.back().terminal(); }));
  EXPECT_EQ(PythiaErrorCode::eNoError, lStatuses.back().dispatch);
  EXPECT_EQ(2u, chain.account(bob.address()).nonce);
}

TEST_F(PythiaRemoteTest, SubmitInvalid) {
  std::vector<TxStatus> lStatuses;
  remote.submit(Call::registerOperator(), randomKeypairs(), [&lStatuses](const ErrorCode &, const TxStatus &pStatus) {
    lStatuses.push_back(pStatus);
  });
  ASSERT_TRUE(waitFor([&]() { return !lStatuses.empty() && lStatuses.back().terminal(); }));
  EXPECT_EQ(TxStatus::Type::eInvalid, lStatuses.back().type);
  EXPECT_EQ(PythiaErrorCode::eInsufficientBalance, lStatuses.back().dispatch);
  EXPECT_EQ(0u, remote.watchCount());
}

TEST_F(PythiaRemoteTest, SubmitTooLarge) {
  bool lCalled = false;
  ErrorCode lError;
  remote.submit(Call::initiateRequest(bob.address(), "", 1, std::vector<u8>(1200), 100), alice,
                [&](const ErrorCode &pError, const TxStatus &) {
                  lCalled = true;
                  lError = pError;
                });
  // Never from within submit()
  EXPECT_FALSE(lCalled);
  ASSERT_TRUE(waitFor([&]() { return lCalled; }));
  EXPECT_TRUE(isError(lError, PythiaErrorCode::eIllformed));
  EXPECT_EQ(0u, remote.watchCount());
  EXPECT_EQ(0u, remote.inflightCount());
  EXPECT_EQ(0u, chain.pendingCount());
}

TEST_F(PythiaRemoteTest, WatchExpires) {
  RemoteChain lRemote(service, randomKeypairs(), server.self(), PYTHIA_FEED_TIMEOUT,
                      boost::posix_time::milliseconds(300));
  chain.stallFinality(true);

  std::vector<TxStatus> lStatuses;
  ErrorCode lError;
  lRemote.submit(Call::registerOperator(), bob, [&](const ErrorCode &pError, const TxStatus &pStatus) {
    if (pError)
      lError = pError;
    else
      lStatuses.push_back(pStatus);
  });
  ASSERT_TRUE(waitFor([&]() { return chain.pendingCount() == 1; }));
  EXPECT_EQ(1u, lRemote.watchCount());
  produceBlocks(1);

  // In a block, then no terminal status
  ASSERT_TRUE(waitFor([&]() { return bool(lError); }));
  EXPECT_TRUE(isTimeout(lError));
  EXPECT_EQ(0u, lRemote.watchCount());
  ASSERT_FALSE(lStatuses.empty());
  EXPECT_EQ(TxStatus::Type::eInBlock, lStatuses.back().type);

  // A late final status is not delivered
  size_t lSeen = lStatuses.size();
  chain.stallFinality(false);
  produceBlocks(2);
  waitFor([]() { return false; }, std::chrono::milliseconds(50));
  EXPECT_EQ(lSeen, lStatuses.size());
  EXPECT_EQ(Registration::eRegistered, chain.registration(bob.address()));
}

TEST_F(PythiaRemoteTest, LargestRequestFitsEventsPush) {
  registerOperator(bob);
  std::vector<ChainEvent> lEvents;
  remote.subscribeEvents([&](const ErrorCode &pError, const std::vector<ChainEvent> &pEvents) {
    EXPECT_FALSE(pError) << pError.message();
    lEvents.insert(lEvents.end(), pEvents.begin(), pEvents.end());
  });
  ASSERT_TRUE(waitFor([&]() { return server.subscriberCount() == 1; }));

  auto lRequestWith = [&](size_t pDataSize) {
    std::optional<TxStatus> lResult;
    chain.submit(Call::initiateRequest(bob.address(), "", 1, std::vector<u8>(pDataSize), 100), alice,
                 [&lResult](const ErrorCode &, const TxStatus &pStatus) {
                   if (pStatus.terminal())
                     lResult = pStatus;
                 });
    EXPECT_TRUE(runUntil([&lResult]() { return lResult.has_value(); }));
    return lResult.value_or(TxStatus{});
  };

  // One byte too many for a single events push
  Balance lBefore = chain.account(alice.address()).free;
  TxStatus lRejected = lRequestWith(468);
  EXPECT_EQ(TxStatus::Type::eFinalized, lRejected.type);
  EXPECT_EQ(PythiaErrorCode::eRequestTooLarge, lRejected.dispatch);
  EXPECT_FALSE(chain.pendingRequest(0).has_value());
  // The fee is not reserved, only the transaction fee is charged
  EXPECT_EQ(lBefore - chain.config().txFee, chain.account(alice.address()).free);

  TxStatus lAccepted = lRequestWith(467);
  EXPECT_EQ(PythiaErrorCode::eNoError, lAccepted.dispatch);
  ASSERT_TRUE(chain.pendingRequest(0).has_value());
  std::optional<bool> lPending;
  remote.queryRequest(0, [&lPending](const ErrorCode &pError, bool pPending) {
    EXPECT_FALSE(pError);
    lPending = pPending;
  });
  ASSERT_TRUE(waitFor([&]() { return lPending.has_value(); }));
  EXPECT_TRUE(*lPending);

  std::vector<Request> lRequests;
  ASSERT_TRUE(waitFor([&]() {
    lRequests.clear();
    for (const auto &lEvent : lEvents)
      if (auto lRequest = Request::fromEvent(lEvent))
        lRequests.push_back(*lRequest);
    return !lRequests.empty();
  }));
  ASSERT_EQ(1u, lRequests.size());
  EXPECT_EQ(0u, lRequests[0].id);
  EXPECT_EQ(467u, lRequests[0].data.size());
}

TEST_F(PythiaRemoteTest, EventFeed) {
  registerOperator(bob);

  std::vector<ChainEvent> lEvents;
  size_t lBatches = 0;
  size_t lSubscription = remote.subscribeEvents([&](const ErrorCode &pError, const std::vector<ChainEvent> &pEvents) {
    EXPECT_FALSE(pError) << pError.message();
    lBatches++;
    lEvents.insert(lEvents.end(), pEvents.begin(), pEvents.end());
  });
  ASSERT_TRUE(waitFor([&]() { return server.subscriberCount() == 1; }));

  sendRequest(bob.address());
  ASSERT_TRUE(runUntil([&]() {
    for (const auto &lEvent : lEvents)
      if (lEvent.is(sOracleSection, sOracleRequestMethod))
        return true;
    return false;
  }));

  std::optional<Request> lRequest;
  for (const auto &lEvent : lEvents)
    if (!lRequest)
      lRequest = Request::fromEvent(lEvent);
  ASSERT_TRUE(lRequest.has_value());
  EXPECT_EQ(0u, lRequest->id);
  EXPECT_EQ(bob.address(), lRequest->operatorAddr);
  EXPECT_EQ(alice.address(), lRequest->requester);
  EXPECT_EQ(100u, lRequest->fee);

  // Empty blocks are heartbeats
  size_t lBefore = lBatches;
  produceBlocks(2);
  ASSERT_TRUE(waitFor([&]() { return lBatches == lBefore + 2; }));

  remote.unsubscribe(lSubscription);
  ASSERT_TRUE(waitFor([&]() { return server.subscriberCount() == 0; }));
  produceBlocks(2);
  waitFor([]() { return false; }, std::chrono::milliseconds(50));
  EXPECT_EQ(lBefore + 2, lBatches);
}

TEST_F(PythiaRemoteTest, FeedDisconnected) {
  ErrorCode lError;
  size_t lCalls = 0;
  remote.subscribeEvents([&](const ErrorCode &pError, const std::vector<ChainEvent> &) {
    lCalls++;
    lError = pError;
  });
  ASSERT_TRUE(waitFor([&]() { return server.subscriberCount() == 1; }));

  chain.disconnectSubscribers();
  ASSERT_TRUE(waitFor([&]() { return lCalls > 0; }));
  EXPECT_EQ(1u, lCalls);
  EXPECT_TRUE(isError(lError, PythiaErrorCode::eFeedDisconnected));
  EXPECT_EQ(0u, server.subscriberCount());
}

TEST_F(PythiaRemoteTest, FeedTimeout) {
  RemoteChain lImpatient(service, randomKeypairs(), server.self(), boost::posix_time::milliseconds(300));
  ErrorCode lError;
  size_t lCalls = 0;
  lImpatient.subscribeEvents([&](const ErrorCode &pError, const std::vector<ChainEvent> &) {
    lCalls++;
    lError = pError;
  });
  ASSERT_TRUE(waitFor([&]() { return server.subscriberCount() == 1; }));

  // Heartbeats keep the feed alive
  for (size_t i = 0; i < 4; i++) {
    chain.produceBlock();
    waitFor([]() { return false; }, std::chrono::milliseconds(150));
  }
  EXPECT_EQ(4u, lCalls);
  EXPECT_FALSE(lError);

  // No block for longer than the feed timeout, the node is told to drop the subscription
  ASSERT_TRUE(waitFor([&]() { return lError && server.subscriberCount() == 0; }));
  EXPECT_EQ(5u, lCalls);
  EXPECT_TRUE(isError(lError, PythiaErrorCode::eFeedDisconnected));
}

TEST_F(PythiaRemoteTest, NodeUnreachable) {
  Contact lGone;
  {
    ChainServer lServer(service, chain, randomKeypairs(), loopback());
    lGone = lServer.self();
  }
  RemoteChain lRemote(service, randomKeypairs(), lGone);

  bool lCalled = false;
  ErrorCode lError;
  lRemote.queryResult([&](const ErrorCode &pError, const value_t &) {
    lCalled = true;
    lError = pError;
  });
  ASSERT_TRUE(waitFor([&]() { return lCalled; }));
  EXPECT_TRUE(isTimeout(lError));
  EXPECT_EQ(0u, lRemote.inflightCount());
}

TEST_F(PythiaRemoteTest, OperatorRoundTrip) {
  Database lDB(memoryDb().c_str());
  auto lSelf = lDB.loadProfile(passphrase_t(std::string("remote")));
  RandomResolver lResolver(service);
  Operator::Options lOptions;
  lOptions.funder = alice;
  Operator lOperator(service, remote, lDB, lSelf, lResolver, lOptions);

  bool lStarted = false;
  lOperator.start([&lStarted](const ErrorCode &pError) {
    EXPECT_FALSE(pError) << pError.message();
    lStarted = true;
  });
  ASSERT_TRUE(runUntil([&]() { return lStarted; }));
  EXPECT_EQ(Registration::eRegistered, chain.registration(lSelf.address()));
  ASSERT_TRUE(waitFor([&]() { return server.subscriberCount() == 1; }));

  sendRequest(lSelf.address());
  sendRequest(lSelf.address());
  ASSERT_TRUE(runUntil([&]() { return lOperator.answeredCount() == 2; }));
  EXPECT_FALSE(chain.pendingRequest(0).has_value());
  EXPECT_FALSE(chain.pendingRequest(1).has_value());
  EXPECT_EQ(2u, lDB.countResponses(ResponseState::eFinalized));

  lOperator.stop();
  ASSERT_TRUE(waitFor([&]() { return server.subscriberCount() == 0; }));
}
