#include "Chain.hpp"
#include "Submitter.hpp"

using namespace pythia;

namespace {

struct results_t {
  std::map<u64, ErrorCode> errors;

  Submitter::Callback callback(u64 pRequestId) {
    return [this, pRequestId](const ErrorCode &pError, const TxStatus &) {
      EXPECT_EQ(0u, errors.count(pRequestId));
      errors[pRequestId] = pError;
    };
  }
};

} // namespace

TEST_F(PythiaChainTest, SubmitterBurst) {
  registerOperator(bob);
  constexpr u64 lCount = 8;
  for (u64 i = 0; i < lCount; i++)
    sendRequest(bob.address());
  produceBlocks(1);

  Submitter lSubmitter(service, chain, bob);
  results_t lResults;
  for (u64 i = 0; i < lCount; i++)
    lSubmitter.submit(i, value_t(i) * 10, lResults.callback(i));
  EXPECT_FALSE(lSubmitter.idle());
  EXPECT_EQ(lCount - 1, lSubmitter.queued());

  ASSERT_TRUE(runUntil([&]() { return lResults.errors.size() == lCount; }, 200));
  for (const auto &lResult : lResults.errors)
    EXPECT_FALSE(lResult.second) << "request #" << lResult.first << ": " << lResult.second.message();

  EXPECT_TRUE(lSubmitter.idle());
  EXPECT_EQ(lCount, lSubmitter.confirmedCount());
  EXPECT_EQ(0u, lSubmitter.retryCount());
  Address lBob = bob.address();
  EXPECT_EQ(lCount, chain.countIncluded(Call::Type::eCallback, &lBob));
  EXPECT_EQ(value_t(lCount - 1) * 10, chain.currentResult());
  for (u64 i = 0; i < lCount; i++)
    EXPECT_FALSE(chain.pendingRequest(i).has_value());
}

TEST_F(PythiaChainTest, SubmitterDuplicate) {
  registerOperator(bob);
  sendRequest(bob.address());
  produceBlocks(1);

  // Someone already answered with the operator key
  bool lAnswered = false;
  chain.submit(Call::callback(0, value_t(1)), bob, [&lAnswered](const ErrorCode &, const TxStatus &pStatus) {
    lAnswered |= pStatus.type == TxStatus::Type::eFinalized;
  });
  ASSERT_TRUE(runUntil([&]() { return lAnswered; }));

  Submitter lSubmitter(service, chain, bob);
  results_t lResults;
  lSubmitter.submit(0, value_t(2), lResults.callback(0));
  ASSERT_TRUE(runUntil([&]() { return lResults.errors.size() == 1; }));
  EXPECT_TRUE(isError(lResults.errors[0], PythiaErrorCode::eSubmitDuplicate));
  EXPECT_EQ(1u, lSubmitter.duplicateCount());
  EXPECT_EQ(value_t(1), chain.currentResult());
}

TEST_F(PythiaChainTest, SubmitterRejected) {
  registerOperator(bob);

  Submitter lSubmitter(service, chain, bob);
  results_t lResults;
  lSubmitter.submit(99, value_t(2), lResults.callback(99));
  ASSERT_TRUE(runUntil([&]() { return lResults.errors.size() == 1; }));
  EXPECT_TRUE(isError(lResults.errors[99], PythiaErrorCode::eSubmitRejected));
  EXPECT_EQ(1u, lSubmitter.failedCount());
  EXPECT_EQ(0u, lSubmitter.retryCount());
}

TEST_F(PythiaChainTest, SubmitterTimeout) {
  registerOperator(bob);
  sendRequest(bob.address());
  produceBlocks(1);
  chain.stallFinality(true);

  Submitter::Options lOptions;
  lOptions.timeout = boost::posix_time::milliseconds(100);
  lOptions.attempts = 2;
  Submitter lSubmitter(service, chain, bob, lOptions);
  results_t lResults;
  lSubmitter.submit(0, value_t(5), lResults.callback(0));
  produceBlocks(2);
  process(std::chrono::milliseconds(200));

  ASSERT_EQ(1u, lResults.errors.size());
  EXPECT_TRUE(isError(lResults.errors[0], PythiaErrorCode::eSubmitTimeout));
  // The attempt landed, only its finality was missing: nothing was resubmitted
  EXPECT_EQ(0u, lSubmitter.retryCount());
  EXPECT_EQ(1u, lSubmitter.failedCount());
  EXPECT_EQ(value_t(5), chain.currentResult());
  Address lBob = bob.address();
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eCallback, &lBob));
}

TEST_F(PythiaChainTest, SubmitterWaitsOutFinalityStall) {
  registerOperator(bob);
  sendRequest(bob.address());
  produceBlocks(1);
  chain.stallFinality(true);

  Submitter::Options lOptions;
  lOptions.timeout = boost::posix_time::milliseconds(150);
  Submitter lSubmitter(service, chain, bob, lOptions);
  results_t lResults;
  lSubmitter.submit(0, value_t(5), lResults.callback(0));
  produceBlocks(3);

  // A deadline passes while the answer sits in a block
  auto lUntil = Clock::now() + std::chrono::milliseconds(250);
  while (Clock::now() < lUntil) {
    service.restart();
    service.run_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(lResults.errors.empty());

  chain.stallFinality(false);
  ASSERT_TRUE(runUntil([&]() { return lResults.errors.size() == 1; }));
  EXPECT_FALSE(lResults.errors[0]) << lResults.errors[0].message();
  EXPECT_EQ(1u, lSubmitter.confirmedCount());
  EXPECT_EQ(0u, lSubmitter.duplicateCount());
  EXPECT_EQ(0u, lSubmitter.retryCount());

  // Exactly one callback transaction for the request
  produceBlocks(5);
  Address lBob = bob.address();
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eCallback, &lBob));
  EXPECT_EQ(0u, chain.countIncluded(Call::Type::eCallback, &lBob, PythiaErrorCode::eAlreadyAnswered));
  EXPECT_EQ(value_t(5), chain.currentResult());
}

TEST_F(PythiaChainTest, SubmitterRetriesDroppedAttempt) {
  registerOperator(bob);
  sendRequest(bob.address());
  produceBlocks(1);

  Submitter lSubmitter(service, chain, bob);
  results_t lResults;
  lSubmitter.submit(0, value_t(7), lResults.callback(0));
  chain.dropPending();

  ASSERT_TRUE(runUntil([&]() { return lResults.errors.size() == 1; }));
  EXPECT_FALSE(lResults.errors[0]) << lResults.errors[0].message();
  EXPECT_EQ(1u, lSubmitter.retryCount());
  Address lBob = bob.address();
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eCallback, &lBob));
  EXPECT_EQ(value_t(7), chain.currentResult());
}

TEST_F(PythiaChainTest, SubmitterQueueFull) {
  Submitter::Options lOptions;
  lOptions.capacity = 1;
  Submitter lSubmitter(service, chain, bob, lOptions);
  results_t lResults;
  lSubmitter.submit(0, value_t(1), lResults.callback(0));
  lSubmitter.submit(1, value_t(1), lResults.callback(1));
  lSubmitter.submit(2, value_t(1), lResults.callback(2));
  EXPECT_EQ(1u, lSubmitter.queued());
  process();
  ASSERT_EQ(1u, lResults.errors.count(2));
  EXPECT_TRUE(isError(lResults.errors[2], PythiaErrorCode::eQueueFull));
}

TEST_F(PythiaChainTest, SubmitterOptions) {
  Submitter::Options lOptions;
  lOptions.attempts = 0;
  EXPECT_THROW(Submitter lSubmitter(service, chain, bob, lOptions), std::invalid_argument);
  lOptions.attempts = 1;
  lOptions.capacity = 0;
  EXPECT_THROW(Submitter lSubmitter(service, chain, bob, lOptions), std::invalid_argument);
}
