#include "Chain.hpp"
#include "Listener.hpp"

using namespace pythia;

namespace {

ChainEvent requestEvent(const Address &pOperator, u64 pId, u64 pBlock = 1) {
  return ChainEvent{pBlock,
                    sOracleSection,
                    sOracleRequestMethod,
                    {toHex(pOperator.view(), true), "spec", std::to_string(pId), toHex(u256().view(), true), "1",
                     "0x", "example.callback", "100"}};
}

/** Feed driven by hand, queries and submissions are not served. */
class FeedChain : public ChainClient {
  net::io_service &service;

public:
  std::map<size_t, EventsCallback> subscriptions;
  size_t nextSubscription = 1;
  size_t subscribeCount = 0;

  explicit FeedChain(net::io_service &pService) : service(pService) {}

  void queryAccount(const Address &, const AccountCallback &pCallback) override {
    service.post([pCallback]() { pCallback(net::error::operation_not_supported, {}); });
  }
  void queryRegistration(const Address &, const RegistrationCallback &pCallback) override {
    service.post([pCallback]() { pCallback(net::error::operation_not_supported, Registration::eAbsent); });
  }
  void queryResult(const ResultCallback &pCallback) override {
    service.post([pCallback]() { pCallback(net::error::operation_not_supported, 0); });
  }
  void queryRequest(u64, const RequestCallback &pCallback) override {
    service.post([pCallback]() { pCallback(net::error::operation_not_supported, false); });
  }
  void submit(const Call &, const keypairs_t &, const StatusCallback &pCallback) override {
    service.post([pCallback]() { pCallback(net::error::operation_not_supported, {}); });
  }
  size_t subscribeEvents(const EventsCallback &pCallback) override {
    subscribeCount++;
    subscriptions[nextSubscription] = pCallback;
    return nextSubscription++;
  }
  void unsubscribe(size_t pSubscription) override { subscriptions.erase(pSubscription); }

  void push(const ErrorCode &pError, const std::vector<ChainEvent> &pEvents) {
    auto lSubscriptions = subscriptions;
    if (pError)
      subscriptions.clear();
    for (const auto &lSubscription : lSubscriptions)
      lSubscription.second(pError, pEvents);
  }
};

} // namespace

TEST(Request, FromEvent) {
  auto lOperator = randomKeypairs().address();
  auto lRequest = Request::fromEvent(requestEvent(lOperator, 12, 3));
  ASSERT_TRUE(lRequest.has_value());
  EXPECT_EQ(12u, lRequest->id);
  EXPECT_EQ(lOperator, lRequest->operatorAddr);
  EXPECT_EQ("spec", lRequest->spec);
  EXPECT_EQ(1u, lRequest->dataVersion);
  EXPECT_TRUE(lRequest->data.empty());
  EXPECT_EQ("example.callback", lRequest->callback);
  EXPECT_EQ(100u, lRequest->fee);
  EXPECT_EQ(3u, lRequest->block);

  auto lShort = requestEvent(lOperator, 1);
  lShort.data.pop_back();
  EXPECT_FALSE(Request::fromEvent(lShort).has_value());

  auto lBadId = requestEvent(lOperator, 1);
  lBadId.data[2] = "one";
  EXPECT_FALSE(Request::fromEvent(lBadId).has_value());

  auto lBadOperator = requestEvent(lOperator, 1);
  lBadOperator.data[0] = "0x1234";
  EXPECT_FALSE(Request::fromEvent(lBadOperator).has_value());

  auto lOther = requestEvent(lOperator, 1);
  lOther.method = "OracleAnswer";
  EXPECT_FALSE(Request::fromEvent(lOther).has_value());
}

TEST_F(PythiaChainTest, ListenerFiltersAddressee) {
  registerOperator(bob);
  registerOperator(alice);

  std::vector<u64> lMine, lAll;
  Listener lListener(service, chain, bob.address());
  Listener lAnyListener(service, chain, bob.address(), true);
  lListener.start([&lMine](const Request &pRequest) { lMine.push_back(pRequest.id); });
  lAnyListener.start([&lAll](const Request &pRequest) { lAll.push_back(pRequest.id); });

  sendRequest(bob.address());
  sendRequest(alice.address());
  sendRequest(bob.address());
  produceBlocks(1);

  EXPECT_EQ((std::vector<u64>{0, 2}), lMine);
  EXPECT_EQ((std::vector<u64>{0, 1, 2}), lAll);
  EXPECT_EQ(2u, lListener.deliveredCount());
  EXPECT_EQ(1u, lListener.skippedCount());
  EXPECT_EQ(3u, lAnyListener.deliveredCount());
}

TEST_F(PythiaChainTest, ListenerRedelivery) {
  registerOperator(bob);

  std::vector<u64> lSeen;
  Listener lListener(service, chain, bob.address());
  lListener.start([&lSeen](const Request &pRequest) { lSeen.push_back(pRequest.id); });
  sendRequest(bob.address());
  produceBlocks(1);
  ASSERT_EQ(1u, lSeen.size());

  // Duplicates are left to the caller
  chain.replayBlock(chain.bestNumber());
  EXPECT_EQ((std::vector<u64>{0, 0}), lSeen);
}

TEST_F(PythiaChainTest, ListenerReconnects) {
  registerOperator(bob);

  std::vector<u64> lSeen;
  Listener lListener(service, chain, bob.address());
  lListener.start([&lSeen](const Request &pRequest) { lSeen.push_back(pRequest.id); });

  chain.disconnectSubscribers();
  process();
  EXPECT_EQ(0u, lListener.reconnectCount());
  EXPECT_TRUE(lListener.isRunning());

  // Resubscribed after the initial backoff
  process(std::chrono::milliseconds(Listener::sInitialBackoff.total_milliseconds() + 100));
  EXPECT_EQ(1u, lListener.reconnectCount());

  sendRequest(bob.address());
  produceBlocks(1);
  EXPECT_EQ((std::vector<u64>{0}), lSeen);
}

TEST_F(PythiaChainTest, ListenerStopsFromCallback) {
  registerOperator(bob);

  std::vector<u64> lSeen;
  Listener lListener(service, chain, bob.address());
  lListener.start([&](const Request &pRequest) {
    lSeen.push_back(pRequest.id);
    lListener.stop();
  });
  EXPECT_THROW(lListener.start([](const Request &) {}), std::logic_error);

  sendRequest(bob.address());
  sendRequest(bob.address());
  produceBlocks(2);
  EXPECT_EQ((std::vector<u64>{0}), lSeen);
  EXPECT_FALSE(lListener.isRunning());
}

TEST(Listener, SkipsMalformed) {
  net::io_service lService;
  FeedChain lChain(lService);
  auto lSelf = randomKeypairs().address();

  std::vector<u64> lSeen;
  Listener lListener(lService, lChain, lSelf);
  lListener.start([&lSeen](const Request &pRequest) { lSeen.push_back(pRequest.id); });

  auto lMalformed = requestEvent(lSelf, 1);
  lMalformed.data[7] = "-3";
  ChainEvent lUnrelated{1, "balances", "Transfer", {}};
  lChain.push(sNoError, {lUnrelated, lMalformed, requestEvent(lSelf, 2)});

  EXPECT_EQ((std::vector<u64>{2}), lSeen);
  EXPECT_EQ(1u, lListener.skippedCount());
}

TEST(Listener, BackoffDoubles) {
  net::io_service lService;
  FeedChain lChain(lService);
  Listener lListener(lService, lChain, randomKeypairs().address());
  lListener.start([](const Request &) {});
  ASSERT_EQ(1u, lChain.subscribeCount);

  // Milliseconds from a feed loss to the resubscription
  auto lDisconnect = [&]() {
    auto lStart = Clock::now();
    size_t lCount = lChain.subscribeCount;
    lChain.push(PythiaErrorCategory::wrap(PythiaErrorCode::eFeedDisconnected), {});
    while (lChain.subscribeCount == lCount) {
      lService.restart();
      lService.run_for(std::chrono::milliseconds(10));
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - lStart).count();
  };

  auto lFirst = lDisconnect();
  auto lSecond = lDisconnect();
  EXPECT_GE(lFirst, 240);
  EXPECT_GE(lSecond, 490);
  EXPECT_EQ(2u, lListener.reconnectCount());

  // A healthy batch resets the delay
  lChain.push(sNoError, {});
  auto lThird = lDisconnect();
  EXPECT_GE(lThird, 240);
  EXPECT_LT(lThird, 500);
}
