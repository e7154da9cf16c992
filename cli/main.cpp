#include <iostream>
#include <memory>

#include <termios.h>
#include <unistd.h>

#include "Config.hpp"
#include "LocalChain.hpp"
#include "Operator.hpp"
#include "RemoteChain.hpp"

using namespace pythia;

passphrase_t getPassphrase() {
  if (const char *lEnv = std::getenv("PYTHIA_PASSPHRASE"))
    return passphrase_t(std::string(lEnv));

  // https://www.gnu.org/savannah-checkouts/gnu/libc/manual/html_node/getpass.html
  passphrase_t lResult;

  /* disabling echo */
  termios lOld, lNoEcho;
  PYTHIA_CCALL(tcgetattr(fileno(stdin), &lOld));
  lNoEcho = lOld;
  lNoEcho.c_lflag &= ~ECHO;
  lNoEcho.c_lflag |= ECHONL;

  PYTHIA_CCALL(tcsetattr(fileno(stdin), TCSANOW, &lNoEcho));

  std::cout << "Passphrase: ";
  std::getline(std::cin, lResult.contained);

  /* restore terminal */
  PYTHIA_CCALL(tcsetattr(fileno(stdin), TCSANOW, &lOld));

  return lResult;
}

void helpMsg() {
  std::cout << "usage: pythia --db <dbpath> (--dev | --node-key <hex> [--node <addr:port>])\n"
               "  --funder-secret <s>      funding account secret (or PYTHIA_FUNDER_SECRET)\n"
               "  --funding-amount <n>     endowment of an empty operator account\n"
               "  --bound <n>              answers are uniform in [0, n)\n"
               "  --any-operator           answer requests addressed to any operator\n"
               "  --exit-after <n>         stop after n finalized answers\n"
               "  --finality-timeout <s>   finality deadline of every transaction\n"
               "  --attempts <n>           submissions of an answer before giving up\n"
               "  --queue <n>              answers waiting for submission\n"
               "  --demo-request           the funder sends one request once listening\n"
               "  --sql-trace              log SQL statements\n"
               "  --version\n"
               "The passphrase of the operator profile is read from PYTHIA_PASSPHRASE or prompted."
            << std::endl;
}

void versionMsg() {
  std::cout << "Boost: " << BOOST_VERSION / 100000 << "." // maj. version
            << BOOST_VERSION / 100 % 1000 << "."          // min. version
            << BOOST_VERSION % 100                        // patch version
            << "\nSQLite: " << sqlite3_version << "\nsodium: " << sodium_version_string() << std::endl;
}

int main(int argc, char **argv) {
  Config lConfig;
  try {
    lConfig = parseConfig(argc, argv);
  } catch (const std::invalid_argument &pException) {
    std::cout << pException.what() << std::endl;
    helpMsg();
    return EXIT_FAILURE;
  }

  if (lConfig.help) {
    helpMsg();
    return EXIT_SUCCESS;
  }
  versionMsg();
  if (lConfig.version)
    return EXIT_SUCCESS;
  std::cout << "database: " << lConfig.db << std::endl;

  if (sodium_init() < 0) {
    std::cout << "Can't initialize libsodium" << std::endl;
    return EXIT_FAILURE;
  }

  int lExitCode = EXIT_SUCCESS;
  try {
    passphrase_t lPassphrase = getPassphrase();
    Database lDB(lConfig.db.c_str(), lConfig.sqlTrace);
    keypairs_t lSelf = lDB.loadProfile(lPassphrase);

    net::io_service lService;
    std::unique_ptr<LocalChain> lLocalChain;
    std::unique_ptr<RemoteChain> lRemoteChain;
    ChainClient *lChain;

    std::optional<std::string> lFunderSecret = lConfig.funderSecret;
    if (lConfig.dev) {
      lLocalChain = std::make_unique<LocalChain>(lService);
      for (const char *lSecret : {"//Alice", "//Bob"})
        lLocalChain->endow(keypairsFromSecret(lSecret).address(), 1ull << 60);
      lLocalChain->start();
      lChain = lLocalChain.get();
      if (!lFunderSecret)
        lFunderSecret = "//Alice";
    } else {
      Contact lNode = Contact::resolve(*lConfig.nodeKey, lConfig.nodeHost, lConfig.nodePort);
      // Status watches outlive every finality deadline of a submission
      auto lWatchTimeout = boost::posix_time::seconds((long)(lConfig.finalityTimeout * lConfig.attempts));
      lRemoteChain = std::make_unique<RemoteChain>(lService, lSelf, lNode, PYTHIA_FEED_TIMEOUT, lWatchTimeout);
      std::cout << "[NET] Node " << lNode << ", local endpoint " << lRemoteChain->self() << std::endl;
      lChain = lRemoteChain.get();
    }

    Operator::Options lOptions;
    if (lFunderSecret)
      lOptions.funder = keypairsFromSecret(*lFunderSecret);
    lOptions.fundingAmount = lConfig.fundingAmount;
    lOptions.anyOperator = lConfig.anyOperator;
    lOptions.exitAfter = lConfig.exitAfter;
    lOptions.demoRequest = lConfig.demoRequest;
    lOptions.submit.timeout = boost::posix_time::seconds(lConfig.finalityTimeout);
    lOptions.submit.attempts = lConfig.attempts;
    lOptions.submit.capacity = lConfig.queue;

    RandomResolver lResolver(lService, lConfig.bound);
    Operator lOperator(lService, *lChain, lDB, lSelf, lResolver, lOptions);
    lOperator.setExitHandler([&lService]() { lService.stop(); });

    net::signal_set lSignals(lService, SIGINT, SIGTERM);
    lSignals.async_wait([&](const ErrorCode &pError, int pSignal) {
      if (pError)
        return;
      std::cout << "Caught signal " << pSignal << ", stopping" << std::endl;
      lOperator.stop();
      lService.stop();
    });

    lOperator.start([&](const ErrorCode &pError) {
      if (!pError)
        return;
      lExitCode = EXIT_FAILURE;
      lService.stop();
    });

    lService.run();
  } catch (std::exception &pException) {
    std::cout << "Caught exception: " << pException.what() << std::endl;
    return EXIT_FAILURE;
  }

  return lExitCode;
}
