#pragma once

#include <deque>
#include <memory>

#include "ChainClient.hpp"

namespace pythia {

/** Writes answers back with chainlink.callback, one request in flight at a time for the operator account so nonces
 * are assigned in submission order.
 *
 * Every attempt of a request stays watched until it reaches a terminal status. A new attempt is only made once none
 * of the earlier ones can still land and the chain reports the request as pending, so a request gets one successful
 * callback at most. A deadline that passes while an attempt is in a block or in the pool just extends the wait. */
class Submitter {
public:
  /** Clear pError means the answer is finalized. Otherwise eSubmitDuplicate (benign), eSubmitRejected,
   * eSubmitTimeout or eQueueFull. */
  using Callback = std::function<void(ErrorCode pError, const TxStatus &pStatus)>;

  struct Options {
    /** Deadline per wait, the request fails with eSubmitTimeout after attempts of them. */
    boost::posix_time::time_duration timeout;
    u32 attempts;
    size_t capacity;

    Options() : timeout(PYTHIA_FINALITY_TIMEOUT), attempts(3), capacity(1024) {}
  };

private:
  struct job_t {
    u64 requestId;
    value_t value;
    Callback callback;
    net::deadline_timer deadline;

    u32 attempt = 0;
    u32 expired = 0;
    // Attempts without a terminal status yet
    size_t outstanding = 0;
    // One of our attempts went into a block without a dispatch error
    std::optional<TxStatus> included;
    TxStatus last;
    bool querying = false;
    bool done = false;

    job_t(net::io_service &pService, u64 pRequestId, const value_t &pValue, Callback pCallback)
        : requestId(pRequestId), value(pValue), callback(std::move(pCallback)), deadline(pService) {}
  };
  using job_ptr = std::shared_ptr<job_t>;

  net::io_service &service;
  ChainClient &chain;
  keypairs_t signer;
  Options options;

  std::deque<job_ptr> queue;
  job_ptr current;

  u64 confirmed = 0, duplicates = 0, failed = 0, retries = 0;

  void next();
  void attempt(const job_ptr &pJob);
  void armDeadline(const job_ptr &pJob);
  void onStatus(const job_ptr &pJob, const ErrorCode &pError, const TxStatus &pStatus);
  void onDeadline(const job_ptr &pJob);
  /** Nothing of ours can land anymore: resubmit if the request is still pending. */
  void retryIfPending(const job_ptr &pJob, const ErrorCode &pReason);
  void confirm(const job_ptr &pJob, const TxStatus &pStatus);
  void finish(const job_ptr &pJob, const ErrorCode &pError, const TxStatus &pStatus);

public:
  Submitter(net::io_service &pService, ChainClient &pChain, const keypairs_t &pSigner);
  Submitter(net::io_service &pService, ChainClient &pChain, const keypairs_t &pSigner, const Options &pOptions);

  ~Submitter();

  Submitter(const Submitter &) = delete;
  Submitter &operator=(const Submitter &) = delete;

  /** Queues the answer to pRequestId, fails with eQueueFull when capacity answers are already waiting. */
  void submit(u64 pRequestId, const value_t &pValue, const Callback &pCallback);

  size_t queued() const;
  bool idle() const;

  u64 confirmedCount() const;
  u64 duplicateCount() const;
  u64 failedCount() const;
  u64 retryCount() const;
};

} // namespace pythia
