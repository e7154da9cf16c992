#pragma once

#include "Listener.hpp"

namespace pythia {

/** Computes the answer of a request. */
class Resolver {
public:
  using Callback = std::function<void(ErrorCode pError, const value_t &pValue)>;

  virtual ~Resolver() = default;

  /** Calls back with the value, or with eCannotAnswer. Never from within the call. */
  virtual void resolve(const Request &pRequest, const Callback &pCallback) = 0;
};

/** Uniform value in [0, bound), whatever the request. */
class RandomResolver : public Resolver {
  net::io_service &service;
  u32 bound;

public:
  static constexpr u32 sDefaultBound = 100;

  explicit RandomResolver(net::io_service &pService, u32 pBound = sDefaultBound);

  void resolve(const Request &pRequest, const Callback &pCallback) override;
};

} // namespace pythia
