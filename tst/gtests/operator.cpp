#include <set>

#include "Chain.hpp"
#include "Operator.hpp"

using namespace pythia;

namespace {

class FailingResolver : public Resolver {
  net::io_service &service;

public:
  size_t calls = 0;

  explicit FailingResolver(net::io_service &pService) : service(pService) {}

  void resolve(const Request &, const Callback &pCallback) override {
    calls++;
    service.post([pCallback]() { pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eCannotAnswer), 0); });
  }
};

} // namespace

class PythiaOperatorTest : public PythiaChainTest {
protected:
  Database db;
  keypairs_t self;
  RandomResolver resolver;

  PythiaOperatorTest()
      : db(memoryDb().c_str()), self(db.loadProfile(passphrase_t(std::string("test")))), resolver(service, 1000) {}

  Operator::Options options() {
    Operator::Options lResult;
    lResult.funder = alice;
    return lResult;
  }

  /** Starts pOperator, fails the test on a startup error. */
  void startOperator(Operator &pOperator) {
    bool lStarted = false;
    pOperator.start([&lStarted](const ErrorCode &pError) {
      EXPECT_FALSE(pError) << pError.message();
      lStarted = true;
    });
    ASSERT_TRUE(runUntil([&lStarted]() { return lStarted; }));
    ASSERT_TRUE(pOperator.isRunning());
  }

  /** Sends pCount requests to the operator, all in one block. @return the block number */
  u64 sendRequests(size_t pCount) {
    for (size_t i = 0; i < pCount; i++)
      sendRequest(self.address());
    produceBlocks(1);
    return chain.bestNumber();
  }
};

TEST_F(PythiaOperatorTest, AnswersEveryRequestOnce) {
  Operator lOperator(service, chain, db, self, resolver, options());
  startOperator(lOperator);
  EXPECT_EQ(Registration::eRegistered, chain.registration(self.address()));
  EXPECT_EQ(sDefaultProvisioningAmount, chain.account(self.address()).free + chain.config().txFee);

  constexpr size_t lCount = 5;
  u64 lBlock = sendRequests(lCount);
  ASSERT_TRUE(runUntil([&]() { return lOperator.answeredCount() == lCount; }, 100));

  EXPECT_EQ(lCount, lOperator.observedCount());
  EXPECT_EQ(lCount, db.countResponses(ResponseState::eFinalized));
  for (u64 i = 0; i < lCount; i++) {
    EXPECT_FALSE(chain.pendingRequest(i).has_value());
    auto lRecord = db.loadResponse(i);
    ASSERT_TRUE(lRecord.has_value());
    EXPECT_EQ(ResponseState::eFinalized, lRecord->state);
    ASSERT_TRUE(lRecord->value.has_value());
    EXPECT_GE(*lRecord->value, 0);
    EXPECT_LT(*lRecord->value, 1000);
  }

  // Redelivered requests are not answered again
  chain.replayBlock(lBlock);
  chain.replayBlock(lBlock);
  produceBlocks(5);
  EXPECT_EQ(3 * lCount, lOperator.observedCount());
  EXPECT_EQ(2 * lCount, lOperator.alreadyClaimedCount());
  EXPECT_EQ(lCount, lOperator.answeredCount());
  Address lSelf = self.address();
  EXPECT_EQ(lCount, chain.countIncluded(Call::Type::eCallback, &lSelf));
  EXPECT_EQ(0u, lOperator.duplicateCount());
  EXPECT_EQ(0u, lOperator.failedCount());
}

TEST_F(PythiaOperatorTest, RestartKeepsLedger) {
  u64 lBlock;
  {
    Operator lOperator(service, chain, db, self, resolver, options());
    startOperator(lOperator);
    lBlock = sendRequests(3);
    ASSERT_TRUE(runUntil([&]() { return lOperator.answeredCount() == 3; }, 100));
    lOperator.stop();
    EXPECT_FALSE(lOperator.isRunning());
  }

  Operator lRestarted(service, chain, db, self, resolver, options());
  startOperator(lRestarted);
  // Already funded and registered
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eRegisterOperator));

  chain.replayBlock(lBlock);
  produceBlocks(5);
  EXPECT_EQ(3u, lRestarted.alreadyClaimedCount());
  EXPECT_EQ(0u, lRestarted.answeredCount());

  sendRequests(1);
  ASSERT_TRUE(runUntil([&]() { return lRestarted.answeredCount() == 1; }, 100));
  EXPECT_EQ(4u, db.countResponses(ResponseState::eFinalized));
}

TEST_F(PythiaOperatorTest, ExitAfter) {
  auto lOptions = options();
  lOptions.exitAfter = 2;
  Operator lOperator(service, chain, db, self, resolver, lOptions);
  size_t lExits = 0;
  lOperator.setExitHandler([&lExits]() { lExits++; });
  startOperator(lOperator);

  sendRequests(3);
  ASSERT_TRUE(runUntil([&]() { return lExits > 0; }, 100));
  EXPECT_EQ(1u, lExits);
  EXPECT_FALSE(lOperator.isRunning());
  EXPECT_EQ(2u, lOperator.answeredCount());

  // Answers in flight still settle, nothing new is observed
  produceBlocks(10);
  EXPECT_EQ(1u, lExits);
  EXPECT_EQ(3u, lOperator.observedCount());
  sendRequests(1);
  EXPECT_EQ(3u, lOperator.observedCount());
}

TEST_F(PythiaOperatorTest, ExitAfterFinalityStall) {
  auto lOptions = options();
  lOptions.exitAfter = 1;
  lOptions.submit.timeout = boost::posix_time::milliseconds(150);
  Operator lOperator(service, chain, db, self, resolver, lOptions);
  size_t lExits = 0;
  lOperator.setExitHandler([&lExits]() { lExits++; });
  startOperator(lOperator);

  sendRequests(1);
  chain.stallFinality(true);
  // The answer goes into a block, then sits there past a deadline
  produceBlocks(3);
  auto lUntil = Clock::now() + std::chrono::milliseconds(250);
  while (Clock::now() < lUntil) {
    service.restart();
    service.run_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(0u, lExits);

  chain.stallFinality(false);
  ASSERT_TRUE(runUntil([&]() { return lExits > 0; }));
  EXPECT_EQ(1u, lExits);
  EXPECT_EQ(1u, lOperator.answeredCount());
  EXPECT_EQ(0u, lOperator.failedCount());
  EXPECT_EQ(0u, lOperator.getSubmitter().retryCount());

  auto lRecord = db.loadResponse(0);
  ASSERT_TRUE(lRecord.has_value());
  EXPECT_EQ(ResponseState::eFinalized, lRecord->state);

  produceBlocks(5);
  Address lSelf = self.address();
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eCallback, &lSelf));
  EXPECT_EQ(0u, chain.countIncluded(Call::Type::eCallback, &lSelf, PythiaErrorCode::eAlreadyAnswered));
}

TEST_F(PythiaOperatorTest, Unfunded) {
  Operator::Options lOptions;
  Operator lOperator(service, chain, db, self, resolver, lOptions);
  bool lCalled = false;
  ErrorCode lError;
  lOperator.start([&](const ErrorCode &pError) {
    lCalled = true;
    lError = pError;
  });
  ASSERT_TRUE(runUntil([&]() { return lCalled; }));
  EXPECT_TRUE(isError(lError, PythiaErrorCode::eProvisionUnfunded));
  EXPECT_FALSE(lOperator.isRunning());
  EXPECT_EQ(Registration::eAbsent, chain.registration(self.address()));
}

TEST_F(PythiaOperatorTest, AlreadyFundedWithoutFunder) {
  chain.endow(self.address(), sEndowment);
  Operator::Options lOptions;
  Operator lOperator(service, chain, db, self, resolver, lOptions);
  startOperator(lOperator);
  EXPECT_EQ(Registration::eRegistered, chain.registration(self.address()));
}

TEST_F(PythiaOperatorTest, DemoRequest) {
  auto lOptions = options();
  lOptions.demoRequest = true;
  lOptions.exitAfter = 1;
  Operator lOperator(service, chain, db, self, resolver, lOptions);
  bool lExited = false;
  lOperator.setExitHandler([&lExited]() { lExited = true; });
  startOperator(lOperator);

  ASSERT_TRUE(runUntil([&]() { return lExited; }, 100));
  auto lRecord = db.loadResponse(0);
  ASSERT_TRUE(lRecord.has_value());
  ASSERT_TRUE(lRecord->value.has_value());
  EXPECT_EQ(*lRecord->value, chain.currentResult());
}

TEST_F(PythiaOperatorTest, ResolverFailureReleasesClaim) {
  FailingResolver lResolver(service);
  Operator lOperator(service, chain, db, self, lResolver, options());
  startOperator(lOperator);

  u64 lBlock = sendRequests(1);
  process();
  EXPECT_EQ(1u, lOperator.failedCount());
  EXPECT_FALSE(db.loadResponse(0).has_value());

  // A redelivery gets another chance
  chain.replayBlock(lBlock);
  process();
  EXPECT_EQ(2u, lResolver.calls);
  EXPECT_EQ(0u, lOperator.alreadyClaimedCount());
  EXPECT_TRUE(chain.pendingRequest(0).has_value());
}

TEST_F(PythiaOperatorTest, IgnoresOtherOperators) {
  registerOperator(bob);
  Operator lOperator(service, chain, db, self, resolver, options());
  startOperator(lOperator);

  sendRequest(bob.address());
  produceBlocks(5);
  EXPECT_EQ(0u, lOperator.observedCount());
  EXPECT_EQ(1u, lOperator.getListener().skippedCount());
  EXPECT_TRUE(chain.pendingRequest(0).has_value());
}

TEST(RandomResolver, Bound) {
  net::io_service lService;
  RandomResolver lResolver(lService, 3);
  std::set<value_t> lSeen;
  size_t lCalls = 0;
  for (size_t i = 0; i < 200; i++)
    lResolver.resolve(Request{}, [&](const ErrorCode &pError, const value_t &pValue) {
      EXPECT_FALSE(pError);
      lSeen.insert(pValue);
      lCalls++;
    });
  // Answers are posted, never given from within resolve()
  EXPECT_EQ(0u, lCalls);
  lService.run();
  EXPECT_EQ(200u, lCalls);
  EXPECT_EQ((std::set<value_t>{0, 1, 2}), lSeen);

  EXPECT_THROW(RandomResolver(lService, 0), std::invalid_argument);
}
