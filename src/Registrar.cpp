#include "Registrar.hpp"

using namespace pythia;

Registrar::Registrar(net::io_service &pService, ChainClient &pChain, boost::posix_time::time_duration pTimeout)
    : service(pService), chain(pChain), timeout(pTimeout) {}

void Registrar::ensureRegistered(const keypairs_t &pOperator, const Callback &pCallback) {
  Address lAddress = pOperator.address();
  chain.queryRegistration(lAddress, [this, lAddress, pOperator, pCallback](const ErrorCode &pError,
                                                                           Registration pRegistration) {
    if (pError) {
      std::cout << "[REG] Can't query registration of " << lAddress << ": " << pError.message() << std::endl;
      pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eRegistrationQueryFailed));
      return;
    }

    if (pRegistration == Registration::eRegistered) {
      std::cout << "[REG] " << lAddress << " is already registered" << std::endl;
      pCallback(sNoError);
      return;
    }

    std::cout << "[REG] Registering " << lAddress << " (was " << pRegistration << ")" << std::endl;
    settle(service, chain, Call::registerOperator(), pOperator, timeout,
           [lAddress, pCallback](const ErrorCode &pError, const TxStatus &pStatus) {
             if (!pError) {
               std::cout << "[REG] " << lAddress << " registered in #" << pStatus.block << std::endl;
               pCallback(sNoError);
             } else if (pStatus.type == TxStatus::Type::eFinalized &&
                        isError(pError, PythiaErrorCode::eAlreadyRegistered)) {
               // Raced with another registration of the same account
               std::cout << "[REG] " << lAddress << " was registered concurrently" << std::endl;
               pCallback(sNoError);
             } else if (isTimeout(pError)) {
               std::cout << "[REG] Registration of " << lAddress << " not final in time" << std::endl;
               pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eRegistrationTimeout));
             } else {
               std::cout << "[REG] Registration of " << lAddress << " failed: " << pError.message() << std::endl;
               pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eRegistrationSubmissionFailed));
             }
           });
  });
}
