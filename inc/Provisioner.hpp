#pragma once

#include "Settlement.hpp"

namespace pythia {

constexpr Balance sDefaultProvisioningAmount = 123456666000;

/** Endows empty accounts from a funding account. */
class Provisioner {
public:
  using Callback = std::function<void(ErrorCode pError)>;

private:
  net::io_service &service;
  ChainClient &chain;
  std::optional<keypairs_t> funder;
  Balance amount;
  boost::posix_time::time_duration timeout;

public:
  Provisioner(net::io_service &pService, ChainClient &pChain, std::optional<keypairs_t> pFunder,
              Balance pAmount = sDefaultProvisioningAmount,
              boost::posix_time::time_duration pTimeout = PYTHIA_FINALITY_TIMEOUT);

  /** Transfers the provisioning amount to pRecipient if its balance is exactly zero and calls back once the
   * transfer is finalized, calls back right away otherwise. Errors are eProvision* codes. */
  void ensureFunded(const Address &pRecipient, const Callback &pCallback);

  bool hasFunder() const;
};

} // namespace pythia
