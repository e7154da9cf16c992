#pragma once

#include "Settlement.hpp"

namespace pythia {

class Registrar {
public:
  using Callback = std::function<void(ErrorCode pError)>;

private:
  net::io_service &service;
  ChainClient &chain;
  boost::posix_time::time_duration timeout;

public:
  Registrar(net::io_service &pService, ChainClient &pChain,
            boost::posix_time::time_duration pTimeout = PYTHIA_FINALITY_TIMEOUT);

  /** Registers pOperator unless the registry already holds it as registered, waits for finality. A finalized
   * eAlreadyRegistered counts as success. Errors are eRegistration* codes. */
  void ensureRegistered(const keypairs_t &pOperator, const Callback &pCallback);
};

} // namespace pythia
