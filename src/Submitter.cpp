#include "Submitter.hpp"

using namespace pythia;

Submitter::Submitter(net::io_service &pService, ChainClient &pChain, const keypairs_t &pSigner)
    : Submitter(pService, pChain, pSigner, Options()) {}

Submitter::Submitter(net::io_service &pService, ChainClient &pChain, const keypairs_t &pSigner,
                     const Options &pOptions)
    : service(pService), chain(pChain), signer(pSigner), options(pOptions) {
  if (options.attempts == 0)
    throw std::invalid_argument("at least one submit attempt is required");
  if (options.capacity == 0)
    throw std::invalid_argument("submit queue capacity must be positive");
}

Submitter::~Submitter() {
  // Statuses still owed to the job are dropped unseen
  if (current) {
    current->done = true;
    current->deadline.cancel();
  }
}

void Submitter::submit(u64 pRequestId, const value_t &pValue, const Callback &pCallback) {
  if (queue.size() >= options.capacity) {
    std::cout << "[SUB] Queue full, dropping answer to request #" << pRequestId << std::endl;
    failed++;
    service.post([pCallback]() { pCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eQueueFull), TxStatus{}); });
    return;
  }

  queue.push_back(std::make_shared<job_t>(service, pRequestId, pValue, pCallback));
  next();
}

void Submitter::next() {
  if (current || queue.empty())
    return;
  current = std::move(queue.front());
  queue.pop_front();
  attempt(current);
}

void Submitter::attempt(const job_ptr &pJob) {
  pJob->attempt++;
  pJob->outstanding++;
  std::cout << "[SUB] Answering request #" << pJob->requestId << " with " << toString(pJob->value) << " ("
            << encodeValueHex(pJob->value) << "), attempt " << pJob->attempt << '/' << options.attempts << std::endl;

  chain.submit(Call::callback(pJob->requestId, pJob->value), signer,
               [this, pJob](const ErrorCode &pError, const TxStatus &pStatus) {
                 if (!pJob->done)
                   onStatus(pJob, pError, pStatus);
               });
  armDeadline(pJob);
}

void Submitter::armDeadline(const job_ptr &pJob) {
  pJob->deadline.expires_from_now(options.timeout);
  pJob->deadline.async_wait([this, pJob](const ErrorCode &pError) {
    if (pError == net::error::operation_aborted || pJob->done)
      return;
    onDeadline(pJob);
  });
}

void Submitter::onStatus(const job_ptr &pJob, const ErrorCode &pError, const TxStatus &pStatus) {
  if (pError) {
    pJob->outstanding--;
    std::cout << "[SUB] Request #" << pJob->requestId << ": lost track of an attempt (" << pError.message() << ")"
              << std::endl;
    if (pJob->outstanding == 0)
      retryIfPending(pJob, pError);
    return;
  }

  pJob->last = pStatus;
  switch (pStatus.type) {
  case TxStatus::Type::eReady:
    break;

  case TxStatus::Type::eInBlock:
    if (pStatus.dispatch == PythiaErrorCode::eNoError && !pJob->included)
      pJob->included = pStatus;
    break;

  case TxStatus::Type::eFinalized:
    pJob->outstanding--;
    if (pStatus.dispatch == PythiaErrorCode::eNoError) {
      confirm(pJob, pStatus);
    } else if (pJob->included) {
      // A later attempt lost to our own earlier answer
      TxStatus lStatus = *pJob->included;
      lStatus.type = TxStatus::Type::eFinalized;
      confirm(pJob, lStatus);
    } else if (pJob->outstanding > 0) {
      // An earlier attempt may still be the one that answered
    } else if (pStatus.dispatch == PythiaErrorCode::eAlreadyAnswered) {
      std::cout << "[SUB] Request #" << pJob->requestId << " was already answered" << std::endl;
      finish(pJob, PythiaErrorCategory::wrap(PythiaErrorCode::eSubmitDuplicate), pStatus);
    } else {
      std::cout << "[SUB] Request #" << pJob->requestId << " rejected ("
                << PythiaErrorCategory::instance().message((int)pStatus.dispatch) << "), requires operator attention"
                << std::endl;
      finish(pJob, PythiaErrorCategory::wrap(PythiaErrorCode::eSubmitRejected), pStatus);
    }
    break;

  case TxStatus::Type::eInvalid:
  case TxStatus::Type::eDropped: {
    pJob->outstanding--;
    if (pJob->outstanding > 0)
      break;
    auto lReason = pStatus.type == TxStatus::Type::eDropped ? PythiaErrorCode::eTransactionDropped : pStatus.dispatch;
    if (pStatus.type == TxStatus::Type::eInvalid && lReason != PythiaErrorCode::eBadNonce) {
      std::cout << "[SUB] Request #" << pJob->requestId << " rejected ("
                << PythiaErrorCategory::instance().message((int)lReason) << "), requires operator attention"
                << std::endl;
      finish(pJob, PythiaErrorCategory::wrap(PythiaErrorCode::eSubmitRejected), pStatus);
      break;
    }
    retryIfPending(pJob, PythiaErrorCategory::wrap(lReason));
    break;
  }
  }
}

void Submitter::onDeadline(const job_ptr &pJob) {
  pJob->expired++;
  if (pJob->expired >= options.attempts) {
    std::cout << "[SUB] Request #" << pJob->requestId << " not final after " << pJob->expired << " deadline(s)"
              << std::endl;
    finish(pJob, PythiaErrorCategory::wrap(PythiaErrorCode::eSubmitTimeout), pJob->last);
    return;
  }

  armDeadline(pJob);
  if (pJob->outstanding > 0) {
    std::cout << "[SUB] Request #" << pJob->requestId << " still waiting for "
              << (pJob->included ? "finality" : "inclusion") << std::endl;
    return;
  }
  // The last pending check could not reach the chain
  retryIfPending(pJob, net::error::timed_out);
}

void Submitter::retryIfPending(const job_ptr &pJob, const ErrorCode &pReason) {
  if (pJob->querying)
    return;
  pJob->querying = true;
  chain.queryRequest(pJob->requestId, [this, pJob, pReason](const ErrorCode &pError, bool pPending) {
    if (pJob->done)
      return;
    pJob->querying = false;
    if (pError) {
      // The deadline asks again
      std::cout << "[SUB] Can't query request #" << pJob->requestId << ": " << pError.message() << std::endl;
      return;
    }

    if (!pPending) {
      if (pJob->included) {
        // Our answer is in, its final status never reached us
        TxStatus lStatus = *pJob->included;
        lStatus.type = TxStatus::Type::eFinalized;
        confirm(pJob, lStatus);
      } else {
        std::cout << "[SUB] Request #" << pJob->requestId << " was already answered" << std::endl;
        finish(pJob, PythiaErrorCategory::wrap(PythiaErrorCode::eSubmitDuplicate), pJob->last);
      }
      return;
    }

    if (pJob->attempt >= options.attempts) {
      bool lTimeout = isTimeout(pReason);
      std::cout << "[SUB] Request #" << pJob->requestId << " still pending after " << pJob->attempt
                << " attempt(s): " << pReason.message() << std::endl;
      finish(pJob,
             PythiaErrorCategory::wrap(lTimeout ? PythiaErrorCode::eSubmitTimeout : PythiaErrorCode::eSubmitRejected),
             pJob->last);
      return;
    }

    std::cout << "[SUB] Request #" << pJob->requestId << ": " << pReason.message() << ", retrying" << std::endl;
    retries++;
    attempt(pJob);
  });
}

void Submitter::confirm(const job_ptr &pJob, const TxStatus &pStatus) {
  std::cout << "[SUB] Request #" << pJob->requestId << " answered, finalized in #" << pStatus.block << std::endl;
  chain.queryResult([](const ErrorCode &pError, const value_t &pResult) {
    if (pError)
      std::cout << "[SUB] Can't query result: " << pError.message() << std::endl;
    else
      std::cout << "[SUB] Result is now " << toString(pResult) << std::endl;
  });
  finish(pJob, sNoError, pStatus);
}

void Submitter::finish(const job_ptr &pJob, const ErrorCode &pError, const TxStatus &pStatus) {
  // pJob may be current itself
  job_ptr lJob = pJob;
  if (!pError)
    confirmed++;
  else if (isError(pError, PythiaErrorCode::eSubmitDuplicate))
    duplicates++;
  else
    failed++;

  lJob->done = true;
  lJob->deadline.cancel();
  current.reset();
  lJob->callback(pError, pStatus);
  next();
}

size_t Submitter::queued() const { return queue.size(); }

bool Submitter::idle() const { return !current && queue.empty(); }

u64 Submitter::confirmedCount() const { return confirmed; }

u64 Submitter::duplicateCount() const { return duplicates; }

u64 Submitter::failedCount() const { return failed; }

u64 Submitter::retryCount() const { return retries; }
