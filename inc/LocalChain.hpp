#pragma once

#include <deque>
#include <map>
#include <set>
#include <unordered_map>

#include "ChainClient.hpp"

namespace pythia {

/** In-process development chain: balances, nonces and fees, the operator registry, request storage and the result
 * written by callbacks. Blocks are produced on a timer (or manually with a zero block time) and become final
 * finalityDepth blocks later. */
class LocalChain : public ChainClient {
public:
  struct Options {
    boost::posix_time::time_duration blockTime;
    u64 finalityDepth;
    Balance txFee;

    Options() : blockTime(boost::posix_time::milliseconds(100)), finalityDepth(2), txFee(1000) {}
  };

  struct PendingRequest {
    Address requester, operatorAddr;
    std::string spec;
    u64 dataVersion = 0;
    std::vector<u8> data;
    Balance fee = 0;
    u64 block = 0;
  };

private:
  struct PoolEntry {
    Extrinsic extrinsic;
    u256 hash;
    StatusCallback callback;
  };

  struct Included {
    u256 hash;
    Call::Type type;
    Address signer;
    PythiaErrorCode dispatch;
    StatusCallback callback;
  };

  struct Block {
    u64 number = 0;
    std::vector<Included> included;
    std::vector<ChainEvent> events;
  };

  net::io_service &service;
  Options options;
  net::deadline_timer blockTimer;
  bool producing = false;
  bool finalityStalled = false;

  std::unordered_map<Address, AccountInfo, array_hasher_t<32>> accounts;
  std::unordered_map<Address, bool, array_hasher_t<32>> operators;
  std::map<u64, PendingRequest> requests;
  std::set<u64> answered;
  u64 nextRequestId = 0;
  value_t result = 0;

  std::deque<PoolEntry> pool;
  std::vector<Block> blocks;
  u64 finalized = 0;

  size_t nextSubscription = 1;
  std::map<size_t, EventsCallback> subscriptions;

  void scheduleBlock();
  PythiaErrorCode validate(const Extrinsic &pExtrinsic) const;
  PythiaErrorCode dispatch(const Extrinsic &pExtrinsic, u64 pBlock, std::vector<ChainEvent> &pEvents);
  void finalize();
  void deliver(const std::vector<ChainEvent> &pEvents);
  void notify(const StatusCallback &pCallback, TxStatus::Type pType, const u256 &pHash, u64 pBlock,
              PythiaErrorCode pDispatch);

public:
  explicit LocalChain(net::io_service &pService);
  LocalChain(net::io_service &pService, const Options &pOptions);
  ~LocalChain() override;

  void endow(const Address &pAddress, Balance pAmount);

  /** Starts producing blocks every blockTime, a no-op with a zero block time. */
  void start();
  void stop();
  u64 produceBlock();

  u64 bestNumber() const;
  u64 finalizedNumber() const;
  const Options &config() const;

  AccountInfo account(const Address &pAddress) const;
  u64 nextNonce(const Address &pAddress) const;
  Registration registration(const Address &pAddress) const;
  value_t currentResult() const;
  std::optional<PendingRequest> pendingRequest(u64 pRequestId) const;
  size_t pendingCount() const;
  size_t countIncluded(Call::Type pType, const Address *pSigner = nullptr,
                       PythiaErrorCode pDispatch = PythiaErrorCode::eNoError) const;

  void submitExtrinsic(const Extrinsic &pExtrinsic, const StatusCallback &pCallback);

  void queryAccount(const Address &pAddress, const AccountCallback &pCallback) override;
  void queryRegistration(const Address &pAddress, const RegistrationCallback &pCallback) override;
  void queryResult(const ResultCallback &pCallback) override;
  void queryRequest(u64 pRequestId, const RequestCallback &pCallback) override;
  void submit(const Call &pCall, const keypairs_t &pSigner, const StatusCallback &pCallback) override;
  size_t subscribeEvents(const EventsCallback &pCallback) override;
  void unsubscribe(size_t pSubscription) override;

  // Fault injection for tests and the devnode
  void disconnectSubscribers();
  void replayBlock(u64 pNumber);
  void stallFinality(bool pStalled);
  void dropPending();
};

} // namespace pythia
