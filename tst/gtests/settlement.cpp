#include "Chain.hpp"
#include "Provisioner.hpp"
#include "Registrar.hpp"

using namespace pythia;

namespace {

struct outcome_t {
  bool called = false;
  ErrorCode error;
  TxStatus status;

  SettleCallback settleCallback() {
    return [this](const ErrorCode &pError, const TxStatus &pStatus) {
      EXPECT_FALSE(called);
      called = true;
      error = pError;
      status = pStatus;
    };
  }

  std::function<void(ErrorCode)> callback() {
    return [this](const ErrorCode &pError) {
      EXPECT_FALSE(called);
      called = true;
      error = pError;
    };
  }
};

} // namespace

TEST_F(PythiaChainTest, SettleFinalized) {
  outcome_t lOutcome;
  settle(service, chain, Call::registerOperator(), bob, PYTHIA_FINALITY_TIMEOUT, lOutcome.settleCallback());
  ASSERT_TRUE(runUntil([&]() { return lOutcome.called; }));
  EXPECT_FALSE(lOutcome.error);
  EXPECT_EQ(TxStatus::Type::eFinalized, lOutcome.status.type);
  EXPECT_EQ(1u, lOutcome.status.block);
}

TEST_F(PythiaChainTest, SettleDispatchError) {
  outcome_t lOutcome;
  settle(service, chain, Call::unregisterOperator(), bob, PYTHIA_FINALITY_TIMEOUT, lOutcome.settleCallback());
  ASSERT_TRUE(runUntil([&]() { return lOutcome.called; }));
  EXPECT_TRUE(isError(lOutcome.error, PythiaErrorCode::eNotRegistered));
  EXPECT_EQ(TxStatus::Type::eFinalized, lOutcome.status.type);
}

TEST_F(PythiaChainTest, SettleInvalid) {
  outcome_t lOutcome;
  auto lNobody = randomKeypairs();
  settle(service, chain, Call::registerOperator(), lNobody, PYTHIA_FINALITY_TIMEOUT, lOutcome.settleCallback());
  ASSERT_TRUE(runUntil([&]() { return lOutcome.called; }));
  EXPECT_TRUE(isError(lOutcome.error, PythiaErrorCode::eInsufficientBalance));
  EXPECT_EQ(TxStatus::Type::eInvalid, lOutcome.status.type);
}

TEST_F(PythiaChainTest, SettleDropped) {
  outcome_t lOutcome;
  settle(service, chain, Call::registerOperator(), bob, PYTHIA_FINALITY_TIMEOUT, lOutcome.settleCallback());
  process();
  chain.dropPending();
  process();
  ASSERT_TRUE(lOutcome.called);
  EXPECT_TRUE(isError(lOutcome.error, PythiaErrorCode::eTransactionDropped));
}

TEST_F(PythiaChainTest, SettleTimeout) {
  chain.stallFinality(true);
  outcome_t lOutcome;
  settle(service, chain, Call::registerOperator(), bob, boost::posix_time::milliseconds(200),
         lOutcome.settleCallback());
  process();
  chain.produceBlock();
  chain.produceBlock();
  chain.produceBlock();
  process(std::chrono::milliseconds(300));
  ASSERT_TRUE(lOutcome.called);
  EXPECT_TRUE(isTimeout(lOutcome.error));
  EXPECT_EQ(TxStatus::Type::eInBlock, lOutcome.status.type);

  // Late finality is ignored
  chain.stallFinality(false);
  process();
}

TEST_F(PythiaChainTest, ProvisionEmptyAccount) {
  auto lOperator = randomKeypairs();
  Provisioner lProvisioner(service, chain, alice, 777);
  outcome_t lOutcome;
  lProvisioner.ensureFunded(lOperator.address(), lOutcome.callback());
  ASSERT_TRUE(runUntil([&]() { return lOutcome.called; }));
  EXPECT_FALSE(lOutcome.error);
  EXPECT_EQ(777u, chain.account(lOperator.address()).free);

  // Funded accounts are left alone
  outcome_t lAgain;
  lProvisioner.ensureFunded(lOperator.address(), lAgain.callback());
  process();
  ASSERT_TRUE(lAgain.called);
  EXPECT_FALSE(lAgain.error);
  EXPECT_EQ(0u, chain.pendingCount());
  EXPECT_EQ(777u, chain.account(lOperator.address()).free);
}

TEST_F(PythiaChainTest, ProvisionFailures) {
  auto lOperator = randomKeypairs();

  Provisioner lUnfunded(service, chain, std::nullopt);
  EXPECT_FALSE(lUnfunded.hasFunder());
  outcome_t lNoFunder;
  lUnfunded.ensureFunded(lOperator.address(), lNoFunder.callback());
  process();
  ASSERT_TRUE(lNoFunder.called);
  EXPECT_TRUE(isError(lNoFunder.error, PythiaErrorCode::eProvisionUnfunded));

  Provisioner lPoor(service, chain, randomKeypairs());
  outcome_t lPoorFunder;
  lPoor.ensureFunded(lOperator.address(), lPoorFunder.callback());
  ASSERT_TRUE(runUntil([&]() { return lPoorFunder.called; }));
  EXPECT_TRUE(isError(lPoorFunder.error, PythiaErrorCode::eProvisionSubmissionFailed));

  chain.stallFinality(true);
  Provisioner lSlow(service, chain, alice, sDefaultProvisioningAmount, boost::posix_time::milliseconds(200));
  outcome_t lTimeout;
  lSlow.ensureFunded(lOperator.address(), lTimeout.callback());
  produceBlocks(3);
  process(std::chrono::milliseconds(300));
  ASSERT_TRUE(lTimeout.called);
  EXPECT_TRUE(isError(lTimeout.error, PythiaErrorCode::eProvisionTimeout));
}

TEST_F(PythiaChainTest, Register) {
  auto lOperator = randomKeypairs();
  chain.endow(lOperator.address(), sEndowment);
  Registrar lRegistrar(service, chain);

  outcome_t lFirst;
  lRegistrar.ensureRegistered(lOperator, lFirst.callback());
  ASSERT_TRUE(runUntil([&]() { return lFirst.called; }));
  EXPECT_FALSE(lFirst.error);
  EXPECT_EQ(Registration::eRegistered, chain.registration(lOperator.address()));

  outcome_t lSecond;
  lRegistrar.ensureRegistered(lOperator, lSecond.callback());
  process();
  ASSERT_TRUE(lSecond.called);
  EXPECT_FALSE(lSecond.error);
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eRegisterOperator));
}

TEST_F(PythiaChainTest, RegisterConcurrently) {
  auto lOperator = randomKeypairs();
  chain.endow(lOperator.address(), sEndowment);
  Registrar lRegistrar(service, chain);

  // Both see the operator absent, the second registration is dispatched as already registered
  outcome_t lFirst, lSecond;
  lRegistrar.ensureRegistered(lOperator, lFirst.callback());
  lRegistrar.ensureRegistered(lOperator, lSecond.callback());
  ASSERT_TRUE(runUntil([&]() { return lFirst.called && lSecond.called; }));
  EXPECT_FALSE(lFirst.error);
  EXPECT_FALSE(lSecond.error);
  Address lAddress = lOperator.address();
  EXPECT_EQ(1u, chain.countIncluded(Call::Type::eRegisterOperator, &lAddress, PythiaErrorCode::eAlreadyRegistered));
}

TEST_F(PythiaChainTest, ReregisterDisabled) {
  outcome_t lRegistered, lUnregistered;
  settle(service, chain, Call::registerOperator(), bob, PYTHIA_FINALITY_TIMEOUT, lRegistered.settleCallback());
  ASSERT_TRUE(runUntil([&]() { return lRegistered.called; }));
  settle(service, chain, Call::unregisterOperator(), bob, PYTHIA_FINALITY_TIMEOUT, lUnregistered.settleCallback());
  ASSERT_TRUE(runUntil([&]() { return lUnregistered.called; }));
  ASSERT_EQ(Registration::eDisabled, chain.registration(bob.address()));

  Registrar lRegistrar(service, chain);
  outcome_t lOutcome;
  lRegistrar.ensureRegistered(bob, lOutcome.callback());
  ASSERT_TRUE(runUntil([&]() { return lOutcome.called; }));
  EXPECT_FALSE(lOutcome.error);
  EXPECT_EQ(Registration::eRegistered, chain.registration(bob.address()));
}

TEST_F(PythiaChainTest, RegisterTimeout) {
  chain.stallFinality(true);
  Registrar lRegistrar(service, chain, boost::posix_time::milliseconds(200));
  outcome_t lOutcome;
  lRegistrar.ensureRegistered(bob, lOutcome.callback());
  produceBlocks(3);
  process(std::chrono::milliseconds(300));
  ASSERT_TRUE(lOutcome.called);
  EXPECT_TRUE(isError(lOutcome.error, PythiaErrorCode::eRegistrationTimeout));
}
