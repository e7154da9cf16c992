#include "Provisioner.hpp"

using namespace pythia;

Provisioner::Provisioner(net::io_service &pService, ChainClient &pChain, std::optional<keypairs_t> pFunder,
                         Balance pAmount, boost::posix_time::time_duration pTimeout)
    : service(pService), chain(pChain), funder(std::move(pFunder)), amount(pAmount), timeout(pTimeout) {}

bool Provisioner::hasFunder() const { return funder.has_value(); }

void Provisioner::ensureFunded(const Address &pRecipient, const Callback &pCallback) {
  chain.queryAccount(pRecipient, [this, pRecipient, pCallback](const ErrorCode &pError, const AccountInfo &pInfo) {
    if (pError) {
      std::cout << "[FUND] Can't query " << pRecipient << ": " << pError.message() << std::endl;
      pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eProvisionQueryFailed));
      return;
    }

    if (pInfo.free != 0) {
      std::cout << "[FUND] " << pRecipient << " already has " << pInfo.free << std::endl;
      pCallback(sNoError);
      return;
    }

    if (!funder) {
      std::cout << "[FUND] " << pRecipient << " is empty and no funding account is configured" << std::endl;
      pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eProvisionUnfunded));
      return;
    }

    std::cout << "[FUND] Sending " << amount << " from " << funder->address() << " to " << pRecipient << std::endl;
    settle(service, chain, Call::transfer(pRecipient, amount), *funder, timeout,
           [pRecipient, pCallback](const ErrorCode &pError, const TxStatus &pStatus) {
             if (!pError) {
               std::cout << "[FUND] " << pRecipient << " funded in #" << pStatus.block << std::endl;
               pCallback(sNoError);
             } else if (isTimeout(pError)) {
               std::cout << "[FUND] Transfer to " << pRecipient << " not final in time" << std::endl;
               pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eProvisionTimeout));
             } else {
               std::cout << "[FUND] Transfer to " << pRecipient << " failed: " << pError.message() << std::endl;
               pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eProvisionSubmissionFailed));
             }
           });
  });
}
