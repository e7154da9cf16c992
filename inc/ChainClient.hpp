#pragma once

#include <functional>

#include "Extrinsic.hpp"

namespace pythia {

/** Boundary to the chain node. Every callback is invoked from the io_service driving the implementation, never from
 * within the call that registered it. */
class ChainClient {
public:
  using AccountCallback = std::function<void(ErrorCode pError, const AccountInfo &pInfo)>;
  using RegistrationCallback = std::function<void(ErrorCode pError, Registration pRegistration)>;
  using ResultCallback = std::function<void(ErrorCode pError, const value_t &pResult)>;
  /** pPending is false once the request was answered, or if it never existed. */
  using RequestCallback = std::function<void(ErrorCode pError, bool pPending)>;

  /** Invoked for every status until a terminal one (TxStatus::terminal()), or once with an error if the submission
   * could not reach the node or its status stream was lost. */
  using StatusCallback = std::function<void(ErrorCode pError, const TxStatus &pStatus)>;

  /** Batches arrive in chain order. A pythia eFeedDisconnected error ends the subscription, a new one starts from the
   * current block with no replay. */
  using EventsCallback = std::function<void(ErrorCode pError, const std::vector<ChainEvent> &pEvents)>;

  virtual ~ChainClient() = default;

  virtual void queryAccount(const Address &pAddress, const AccountCallback &pCallback) = 0;
  virtual void queryRegistration(const Address &pAddress, const RegistrationCallback &pCallback) = 0;
  virtual void queryResult(const ResultCallback &pCallback) = 0;
  virtual void queryRequest(u64 pRequestId, const RequestCallback &pCallback) = 0;

  /** Signs pCall with the next nonce of pSigner and submits it. Not safe for concurrent submissions from the same
   * signer, callers serialize them. */
  virtual void submit(const Call &pCall, const keypairs_t &pSigner, const StatusCallback &pCallback) = 0;

  virtual size_t subscribeEvents(const EventsCallback &pCallback) = 0;
  virtual void unsubscribe(size_t pSubscription) = 0;
};

} // namespace pythia
