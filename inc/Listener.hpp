#pragma once

#include "ChainClient.hpp"

namespace pythia {

/** A chainlink.OracleRequest as seen by the operator. */
struct Request {
  u64 id = 0;
  Address operatorAddr, requester;
  std::string spec;
  u64 dataVersion = 0;
  std::vector<u8> data;
  std::string callback;
  Balance fee = 0;
  u64 block = 0;

  /** Fields are [operator, specIndex, requestId, requester, dataVersion, data, callback, fee].
   * @return nothing if pEvent is not a well formed OracleRequest */
  static std::optional<Request> fromEvent(const ChainEvent &pEvent);
};
std::ostream &operator<<(std::ostream &pOS, const Request &pRequest);

class Listener {
public:
  using Callback = std::function<void(const Request &pRequest)>;

  static const boost::posix_time::time_duration sInitialBackoff;
  static const boost::posix_time::time_duration sMaxBackoff;

private:
  net::io_service &service;
  ChainClient &chain;
  Address self;
  bool anyOperator;

  Callback callback;
  bool running = false;
  std::optional<size_t> subscription;
  size_t generation = 0;
  net::deadline_timer reconnectTimer;
  boost::posix_time::time_duration backoff;

  u64 delivered = 0, skipped = 0, reconnects = 0;

  void subscribe();
  void onBatch(size_t pGeneration, const ErrorCode &pError, const std::vector<ChainEvent> &pEvents);

public:
  /** With pAnyOperator, requests addressed to other operators are delivered too. */
  Listener(net::io_service &pService, ChainClient &pChain, const Address &pSelf, bool pAnyOperator = false);
  ~Listener();

  Listener(const Listener &) = delete;
  Listener &operator=(const Listener &) = delete;

  /** Subscribes to the feed and calls pCallback for every request in delivery order. Redelivered events are not
   * filtered out. */
  void start(const Callback &pCallback);
  void stop();

  bool isRunning() const;
  u64 deliveredCount() const;
  u64 skippedCount() const;
  u64 reconnectCount() const;
};

} // namespace pythia
