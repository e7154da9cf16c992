#include "LocalChain.hpp"
#include "Operator.hpp"
using namespace pythia;

inline void process(net::io_service &pService) {
  pService.restart();
  while (pService.run_for(std::chrono::milliseconds(1)) > 0);
}

int main(int argc, char **argv) {
  if (sodium_init() < 0)
    return EXIT_FAILURE;

  size_t lRequestsCount = argc > 1 ? std::stoul(argv[1]) : 100;
  size_t lBurst = argc > 2 ? std::stoul(argv[2]) : 10;
  constexpr size_t lMaxBlocks = 100000;

  net::io_service lService;
  LocalChain::Options lChainOptions;
  lChainOptions.blockTime = boost::posix_time::time_duration(); // blocks are produced below
  LocalChain lChain(lService, lChainOptions);

  auto lAlice = keypairsFromSecret("//Alice");
  lChain.endow(lAlice.address(), 1ull << 60);

  Database lDB("file:memdb_throughput?mode=memory");
  auto lSelf = lDB.loadProfile(passphrase_t(std::string("throughput")));

  Operator::Options lOptions;
  lOptions.funder = lAlice;
  lOptions.exitAfter = lRequestsCount;
  RandomResolver lResolver(lService);
  Operator lOperator(lService, lChain, lDB, lSelf, lResolver, lOptions);

  bool lDone = false;
  lOperator.setExitHandler([&lDone]() { lDone = true; });

  auto lStartupStart = Clock::now();
  bool lStarted = false;
  lOperator.start([&lStarted](const ErrorCode &pError) {
    if (pError) {
      std::cout << "[TST] Startup failed: " << pError.message() << std::endl;
      exit(EXIT_FAILURE);
    }
    lStarted = true;
  });
  while (!lStarted) {
    lChain.produceBlock();
    process(lService);
  }
  std::cout << "[TST] Funded and registered in " << dur_t{Clock::now() - lStartupStart} << ", block #"
            << lChain.bestNumber() << std::endl;

  auto lRequestsStart = Clock::now();
  size_t lSent = 0;
  while (!lDone && lChain.bestNumber() < lMaxBlocks) {
    for (size_t i = 0; i < lBurst && lSent < lRequestsCount; i++, lSent++) {
      Call lCall = Call::initiateRequest(lSelf.address(), "", 1, {}, sDemoRequestFee);
      lChain.submit(lCall, lAlice, [](const ErrorCode &, const TxStatus &pStatus) {
        if (pStatus.type == TxStatus::Type::eInvalid || pStatus.dispatch != PythiaErrorCode::eNoError)
          std::cout << "[TST] Request rejected: " << pStatus << std::endl;
      });
    }
    lChain.produceBlock();
    process(lService);
  }

  auto lElapsed = Clock::now() - lRequestsStart;
  std::cout << "[TST] " << lOperator.answeredCount() << "/" << lRequestsCount << " answers finalized in "
            << dur_t{lElapsed} << " over " << lChain.bestNumber() << " blocks, " << lOperator.duplicateCount()
            << " duplicate(s), " << lOperator.failedCount() << " failed, "
            << lOperator.getSubmitter().retryCount() << " retries" << std::endl;
  std::cout << "[TST] Ledger: " << lDB.countResponses(ResponseState::eFinalized) << " finalized, "
            << lChain.pendingCount() << " pending on chain" << std::endl;

  return lDone ? EXIT_SUCCESS : EXIT_FAILURE;
}
