#include <iostream>

#include "ChainServer.hpp"
#include "Config.hpp"

using namespace pythia;

void helpMsg() {
  std::cout << "usage: pythia-devnode [--port <port>] [--block-ms <ms>] [--finality-depth <n>] [--endow <secret>]...\n"
               "//Alice and //Bob are always endowed."
            << std::endl;
}

int main(int argc, char **argv) {
  DevnodeConfig lConfig;
  try {
    lConfig = parseDevnodeConfig(argc, argv);
  } catch (const std::invalid_argument &pException) {
    std::cout << pException.what() << std::endl;
    helpMsg();
    return EXIT_FAILURE;
  }
  if (lConfig.help) {
    helpMsg();
    return EXIT_SUCCESS;
  }

  if (sodium_init() < 0) {
    std::cout << "Can't initialize libsodium" << std::endl;
    return EXIT_FAILURE;
  }

  try {
    net::io_service lService;

    LocalChain::Options lOptions;
    lOptions.blockTime = boost::posix_time::milliseconds(lConfig.blockMs);
    lOptions.finalityDepth = lConfig.finalityDepth;
    LocalChain lChain(lService, lOptions);
    for (const auto &lSecret : lConfig.endow) {
      auto lAddress = keypairsFromSecret(lSecret).address();
      lChain.endow(lAddress, 1ull << 60);
      std::cout << "[DEV] Endowed " << lSecret << " (" << lAddress << ")" << std::endl;
    }

    // A fresh node key every run, operators are given it on their command line
    ChainServer lServer(lService, lChain, randomKeypairs(), net::ip::udp::endpoint(net::ip::udp::v6(), lConfig.port));
    auto lSelfContact = lServer.self();
    std::cout << "[NET] Listening on [" << lSelfContact.address.to_string() << "]:" << lSelfContact.port << std::endl;
    std::cout << "[NET] Node key " << toHex(lSelfContact.id.view()) << std::endl;

    lChain.start();

    net::signal_set lSignals(lService, SIGINT, SIGTERM);
    lSignals.async_wait([&lChain, &lService](const ErrorCode &pError, int pSignal) {
      if (pError)
        return;
      std::cout << "Caught signal " << pSignal << ", stopping at block #" << lChain.bestNumber() << std::endl;
      lChain.stop();
      lService.stop();
    });

    lService.run();
  } catch (std::exception &pException) {
    std::cout << "Caught exception: " << pException.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
