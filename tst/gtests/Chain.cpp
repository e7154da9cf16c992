#include "Chain.hpp"

pythia::LocalChain::Options PythiaChainTest::manualOptions() {
  pythia::LocalChain::Options lResult;
  lResult.blockTime = boost::posix_time::time_duration();
  return lResult;
}

PythiaChainTest::PythiaChainTest()
    : chain(service, manualOptions()), alice(pythia::keypairsFromSecret("//Alice")),
      bob(pythia::keypairsFromSecret("//Bob")) {
  chain.endow(alice.address(), sEndowment);
  chain.endow(bob.address(), sEndowment);
}

void PythiaChainTest::process(std::chrono::milliseconds pSlice) {
  service.restart();
  while (service.run_for(pSlice) > 0);
}

bool PythiaChainTest::runUntil(const std::function<bool()> &pDone, size_t pMaxBlocks) {
  process();
  for (size_t i = 0; i < pMaxBlocks && !pDone(); i++) {
    chain.produceBlock();
    process();
  }
  return pDone();
}

void PythiaChainTest::produceBlocks(size_t pCount) {
  for (size_t i = 0; i < pCount; i++) {
    chain.produceBlock();
    process();
  }
}

void PythiaChainTest::registerOperator(const pythia::keypairs_t &pOperator) {
  bool lDone = false;
  chain.submit(pythia::Call::registerOperator(), pOperator,
               [&lDone](const pythia::ErrorCode &pError, const pythia::TxStatus &pStatus) {
                 ASSERT_FALSE(pError);
                 if (pStatus.terminal()) {
                   EXPECT_EQ(pythia::TxStatus::Type::eFinalized, pStatus.type);
                   lDone = true;
                 }
               });
  ASSERT_TRUE(runUntil([&lDone]() { return lDone; }));
}

void PythiaChainTest::sendRequest(const pythia::Address &pOperator, pythia::Balance pFee) {
  chain.submit(pythia::Call::initiateRequest(pOperator, "", 1, {}, pFee), alice,
               [](const pythia::ErrorCode &, const pythia::TxStatus &pStatus) {
                 EXPECT_EQ(pythia::PythiaErrorCode::eNoError, pStatus.dispatch);
               });
}

std::string PythiaChainTest::memoryDb() {
  static size_t sCounter = 0;
  return "file:memdb" + std::to_string(sCounter++) + "?mode=memory";
}
