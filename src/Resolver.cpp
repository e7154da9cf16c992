#include "Resolver.hpp"

using namespace pythia;

RandomResolver::RandomResolver(net::io_service &pService, u32 pBound) : service(pService), bound(pBound) {
  if (bound == 0)
    throw std::invalid_argument("resolver bound must be positive");
}

void RandomResolver::resolve(const Request &, const Callback &pCallback) {
  value_t lValue = randombytes_uniform(bound);
  service.post([pCallback, lValue]() { pCallback(sNoError, lValue); });
}
