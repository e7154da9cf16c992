#pragma once

#include "Database.hpp"
#include "Listener.hpp"
#include "Provisioner.hpp"
#include "Registrar.hpp"
#include "Resolver.hpp"
#include "Submitter.hpp"

namespace pythia {

constexpr Balance sDemoRequestFee = 100;

/** Funds and registers the operator account, then answers every request addressed to it, once. */
class Operator {
public:
  struct Options {
    std::optional<keypairs_t> funder;
    Balance fundingAmount = sDefaultProvisioningAmount;
    bool anyOperator = false;
    u64 exitAfter = 0; // 0 runs until stop()
    bool demoRequest = false;
    Submitter::Options submit;
  };

  using StartCallback = std::function<void(ErrorCode pError)>;
  using ExitHandler = std::function<void()>;

private:
  net::io_service &service;
  ChainClient &chain;
  Database &db;
  keypairs_t self;
  Resolver &resolver;
  Options options;

  Provisioner provisioner;
  Registrar registrar;
  Listener listener;
  Submitter submitter;

  ExitHandler exitHandler;
  bool running = false;

  u64 observed = 0, answered = 0, duplicates = 0, failed = 0, alreadyClaimed = 0;

  void onRequest(const Request &pRequest);
  void onSubmitted(u64 pRequestId, const value_t &pValue, const ErrorCode &pError, const TxStatus &pStatus);
  void sendDemoRequest();

public:
  Operator(net::io_service &pService, ChainClient &pChain, Database &pDB, const keypairs_t &pSelf,
           Resolver &pResolver, const Options &pOptions);

  Operator(const Operator &) = delete;
  Operator &operator=(const Operator &) = delete;

  /** Provisions, registers, then starts listening. pCallback gets the stage error of the first failing step, or
   * no error once requests are being listened to. */
  void start(const StartCallback &pCallback);

  /** Cancels the subscription, submissions in flight are left to complete. */
  void stop();

  /** Invoked once exitAfter responses are confirmed. */
  void setExitHandler(const ExitHandler &pHandler);

  const Address &address() const;
  bool isRunning() const;
  const Submitter &getSubmitter() const;
  const Listener &getListener() const;

  u64 observedCount() const;
  u64 answeredCount() const;
  u64 duplicateCount() const;
  u64 failedCount() const;
  u64 alreadyClaimedCount() const;
};

} // namespace pythia
