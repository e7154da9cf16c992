#include "Chain.hpp"

using namespace pythia;

namespace {

struct status_log_t {
  std::vector<TxStatus> statuses;

  ChainClient::StatusCallback callback() {
    return [this](const ErrorCode &pError, const TxStatus &pStatus) {
      EXPECT_FALSE(pError);
      statuses.push_back(pStatus);
    };
  }

  bool terminal() const { return !statuses.empty() && statuses.back().terminal(); }
  const TxStatus &last() const { return statuses.back(); }
};

} // namespace

TEST_F(PythiaChainTest, TransferLifecycle) {
  auto lCarol = randomKeypairs();
  status_log_t lLog;
  chain.submit(Call::transfer(lCarol.address(), 5000), alice, lLog.callback());
  EXPECT_TRUE(lLog.statuses.empty());
  EXPECT_EQ(1u, chain.pendingCount());

  process();
  ASSERT_EQ(1u, lLog.statuses.size());
  EXPECT_EQ(TxStatus::Type::eReady, lLog.last().type);

  chain.produceBlock();
  ASSERT_EQ(2u, lLog.statuses.size());
  EXPECT_EQ(TxStatus::Type::eInBlock, lLog.last().type);
  EXPECT_EQ(1u, lLog.last().block);
  EXPECT_EQ(5000u, chain.account(lCarol.address()).free);
  EXPECT_EQ(sEndowment - 5000 - chain.config().txFee, chain.account(alice.address()).free);
  EXPECT_EQ(1u, chain.account(alice.address()).nonce);

  // Final finalityDepth blocks later
  chain.produceBlock();
  EXPECT_EQ(2u, lLog.statuses.size());
  chain.produceBlock();
  ASSERT_EQ(3u, lLog.statuses.size());
  EXPECT_EQ(TxStatus::Type::eFinalized, lLog.last().type);
  EXPECT_EQ(1u, lLog.last().block);
  EXPECT_EQ(PythiaErrorCode::eNoError, lLog.last().dispatch);
  EXPECT_EQ(1u, chain.finalizedNumber());
}

TEST_F(PythiaChainTest, Validation) {
  status_log_t lForged, lStale, lPoor;

  auto lExtrinsic = signExtrinsic(Call::registerOperator(), 0, alice);
  lExtrinsic.signer = bob.address();
  chain.submitExtrinsic(lExtrinsic, lForged.callback());

  chain.submitExtrinsic(signExtrinsic(Call::registerOperator(), 3, bob), lStale.callback());

  auto lNobody = randomKeypairs();
  chain.submit(Call::registerOperator(), lNobody, lPoor.callback());

  runUntil([&]() { return lForged.terminal() && lStale.terminal() && lPoor.terminal(); });
  EXPECT_EQ(TxStatus::Type::eInvalid, lForged.last().type);
  EXPECT_EQ(PythiaErrorCode::eInvalidSignature, lForged.last().dispatch);
  EXPECT_EQ(TxStatus::Type::eInvalid, lStale.last().type);
  EXPECT_EQ(PythiaErrorCode::eBadNonce, lStale.last().dispatch);
  EXPECT_EQ(TxStatus::Type::eInvalid, lPoor.last().type);
  EXPECT_EQ(PythiaErrorCode::eInsufficientBalance, lPoor.last().dispatch);

  EXPECT_EQ(0u, chain.account(bob.address()).nonce);
  EXPECT_EQ(Registration::eAbsent, chain.registration(bob.address()));
}

TEST_F(PythiaChainTest, PoolAwareNonces) {
  status_log_t lFirst, lSecond, lThird;
  chain.submit(Call::transfer(bob.address(), 1), alice, lFirst.callback());
  chain.submit(Call::transfer(bob.address(), 2), alice, lSecond.callback());
  EXPECT_EQ(2u, chain.nextNonce(alice.address()));
  chain.produceBlock();
  chain.submit(Call::transfer(bob.address(), 3), alice, lThird.callback());
  EXPECT_EQ(3u, chain.nextNonce(alice.address()));

  runUntil([&]() { return lFirst.terminal() && lSecond.terminal() && lThird.terminal(); });
  for (const auto *lLog : {&lFirst, &lSecond, &lThird}) {
    EXPECT_EQ(TxStatus::Type::eFinalized, lLog->last().type);
    EXPECT_EQ(PythiaErrorCode::eNoError, lLog->last().dispatch);
  }
  EXPECT_EQ(3u, chain.account(alice.address()).nonce);
  EXPECT_EQ(sEndowment + 6, chain.account(bob.address()).free);
}

TEST_F(PythiaChainTest, Registry) {
  status_log_t lRegister, lAgain, lUnregister, lUnregisterAgain;

  chain.submit(Call::registerOperator(), bob, lRegister.callback());
  ASSERT_TRUE(runUntil([&]() { return lRegister.terminal(); }));
  EXPECT_EQ(PythiaErrorCode::eNoError, lRegister.last().dispatch);
  EXPECT_EQ(Registration::eRegistered, chain.registration(bob.address()));

  chain.submit(Call::registerOperator(), bob, lAgain.callback());
  ASSERT_TRUE(runUntil([&]() { return lAgain.terminal(); }));
  EXPECT_EQ(TxStatus::Type::eFinalized, lAgain.last().type);
  EXPECT_EQ(PythiaErrorCode::eAlreadyRegistered, lAgain.last().dispatch);

  chain.submit(Call::unregisterOperator(), bob, lUnregister.callback());
  ASSERT_TRUE(runUntil([&]() { return lUnregister.terminal(); }));
  EXPECT_EQ(Registration::eDisabled, chain.registration(bob.address()));

  chain.submit(Call::unregisterOperator(), bob, lUnregisterAgain.callback());
  ASSERT_TRUE(runUntil([&]() { return lUnregisterAgain.terminal(); }));
  EXPECT_EQ(PythiaErrorCode::eNotRegistered, lUnregisterAgain.last().dispatch);
}

TEST_F(PythiaChainTest, RequestLifecycle) {
  std::vector<ChainEvent> lEvents;
  chain.subscribeEvents([&lEvents](const ErrorCode &pError, const std::vector<ChainEvent> &pEvents) {
    EXPECT_FALSE(pError);
    lEvents.insert(lEvents.end(), pEvents.begin(), pEvents.end());
  });

  status_log_t lRegister, lUnaddressed;
  chain.submit(Call::registerOperator(), bob, lRegister.callback());
  // Alice is not an operator
  chain.submit(Call::initiateRequest(alice.address(), "", 1, {}, 100), alice, lUnaddressed.callback());
  ASSERT_TRUE(runUntil([&]() { return lRegister.terminal() && lUnaddressed.terminal(); }));
  EXPECT_EQ(PythiaErrorCode::eNotRegistered, lUnaddressed.last().dispatch);

  status_log_t lRequest;
  chain.submit(Call::initiateRequest(bob.address(), "spec", 1, {0xca, 0xfe}, 100), alice, lRequest.callback());
  ASSERT_TRUE(runUntil([&]() { return lRequest.terminal(); }));

  auto lPending = chain.pendingRequest(0);
  ASSERT_TRUE(lPending.has_value());
  EXPECT_EQ(bob.address(), lPending->operatorAddr);
  EXPECT_EQ(alice.address(), lPending->requester);
  EXPECT_EQ("spec", lPending->spec);
  EXPECT_EQ(100u, lPending->fee);

  const ChainEvent *lOracleRequest = nullptr;
  for (const auto &lEvent : lEvents)
    if (lEvent.is(sOracleSection, sOracleRequestMethod))
      lOracleRequest = &lEvent;
  ASSERT_NE(nullptr, lOracleRequest);
  ASSERT_EQ(8u, lOracleRequest->data.size());
  EXPECT_EQ(toHex(bob.address().view(), true), lOracleRequest->data[0]);
  EXPECT_EQ("spec", lOracleRequest->data[1]);
  EXPECT_EQ("0", lOracleRequest->data[2]);
  EXPECT_EQ("0xcafe", lOracleRequest->data[5]);
  EXPECT_EQ("100", lOracleRequest->data[7]);

  // Only the addressee answers
  status_log_t lWrongOperator;
  chain.submit(Call::callback(0, value_t(7)), alice, lWrongOperator.callback());
  ASSERT_TRUE(runUntil([&]() { return lWrongOperator.terminal(); }));
  EXPECT_EQ(PythiaErrorCode::eWrongOperator, lWrongOperator.last().dispatch);

  auto lBobBefore = chain.account(bob.address()).free;
  status_log_t lAnswer;
  chain.submit(Call::callback(0, value_t(-7)), bob, lAnswer.callback());
  ASSERT_TRUE(runUntil([&]() { return lAnswer.terminal(); }));
  EXPECT_EQ(PythiaErrorCode::eNoError, lAnswer.last().dispatch);
  EXPECT_EQ(value_t(-7), chain.currentResult());
  EXPECT_EQ(lBobBefore + 100 - chain.config().txFee, chain.account(bob.address()).free);
  EXPECT_FALSE(chain.pendingRequest(0).has_value());

  status_log_t lTwice, lUnknown;
  chain.submit(Call::callback(0, value_t(8)), bob, lTwice.callback());
  chain.submit(Call::callback(99, value_t(8)), bob, lUnknown.callback());
  ASSERT_TRUE(runUntil([&]() { return lTwice.terminal() && lUnknown.terminal(); }));
  EXPECT_EQ(PythiaErrorCode::eAlreadyAnswered, lTwice.last().dispatch);
  EXPECT_EQ(PythiaErrorCode::eUnknownRequest, lUnknown.last().dispatch);
  EXPECT_EQ(value_t(-7), chain.currentResult());

  Address lBob = bob.address();
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eCallback, &lBob));
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eCallback, &lBob, PythiaErrorCode::eAlreadyAnswered));

  size_t lFailures = 0;
  for (const auto &lEvent : lEvents)
    if (lEvent.is("system", "ExtrinsicFailed"))
      lFailures++;
  EXPECT_EQ(4u, lFailures);
}

TEST_F(PythiaChainTest, Heartbeats) {
  size_t lBatches = 0;
  size_t lSubscription = chain.subscribeEvents([&lBatches](const ErrorCode &pError, const std::vector<ChainEvent> &) {
    EXPECT_FALSE(pError);
    lBatches++;
  });
  produceBlocks(3);
  EXPECT_EQ(3u, lBatches);

  chain.unsubscribe(lSubscription);
  produceBlocks(2);
  EXPECT_EQ(3u, lBatches);
}

TEST_F(PythiaChainTest, FaultInjection) {
  status_log_t lDropped;
  chain.submit(Call::transfer(bob.address(), 1), alice, lDropped.callback());
  process();
  chain.dropPending();
  process();
  ASSERT_TRUE(lDropped.terminal());
  EXPECT_EQ(TxStatus::Type::eDropped, lDropped.last().type);

  ErrorCode lFeedError;
  chain.subscribeEvents([&lFeedError](const ErrorCode &pError, const std::vector<ChainEvent> &) {
    if (pError)
      lFeedError = pError;
  });
  chain.disconnectSubscribers();
  process();
  EXPECT_TRUE(isError(lFeedError, PythiaErrorCode::eFeedDisconnected));

  chain.stallFinality(true);
  status_log_t lStalled;
  chain.submit(Call::transfer(bob.address(), 1), alice, lStalled.callback());
  process();
  produceBlocks(5);
  EXPECT_EQ(TxStatus::Type::eInBlock, lStalled.last().type);
  chain.stallFinality(false);
  EXPECT_EQ(TxStatus::Type::eFinalized, lStalled.last().type);

  EXPECT_THROW(chain.replayBlock(0), std::out_of_range);
  EXPECT_THROW(chain.replayBlock(chain.bestNumber() + 1), std::out_of_range);
}
