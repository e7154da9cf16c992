#include "Operator.hpp"

using namespace pythia;

Operator::Operator(net::io_service &pService, ChainClient &pChain, Database &pDB, const keypairs_t &pSelf,
                   Resolver &pResolver, const Options &pOptions)
    : service(pService), chain(pChain), db(pDB), self(pSelf), resolver(pResolver), options(pOptions),
      provisioner(pService, pChain, pOptions.funder, pOptions.fundingAmount, pOptions.submit.timeout),
      registrar(pService, pChain, pOptions.submit.timeout),
      listener(pService, pChain, pSelf.address(), pOptions.anyOperator),
      submitter(pService, pChain, pSelf, pOptions.submit) {}

void Operator::start(const StartCallback &pCallback) {
  std::cout << "[ORA] Using operator " << self.address() << std::endl;

  provisioner.ensureFunded(self.address(), [this, pCallback](const ErrorCode &pError) {
    if (pError) {
      std::cout << "[ORA] Funding stage failed: " << pError.message() << std::endl;
      pCallback(pError);
      return;
    }

    chain.queryResult([this, pCallback](const ErrorCode &pQueryError, const value_t &pResult) {
      if (pQueryError)
        std::cout << "[ORA] Can't query result: " << pQueryError.message() << std::endl;
      else
        std::cout << "[ORA] Result is currently " << toString(pResult) << std::endl;

      registrar.ensureRegistered(self, [this, pCallback](const ErrorCode &pError) {
        if (pError) {
          std::cout << "[ORA] Registration stage failed: " << pError.message() << std::endl;
          pCallback(pError);
          return;
        }

        running = true;
        listener.start([this](const Request &pRequest) { onRequest(pRequest); });
        if (options.demoRequest)
          sendDemoRequest();
        pCallback(sNoError);
      });
    });
  });
}

void Operator::stop() {
  if (!running)
    return;
  running = false;
  listener.stop();
  std::cout << "[ORA] Stopped, " << observed << " observed, " << answered << " answered, " << duplicates
            << " duplicate(s), " << failed << " failed" << std::endl;
}

void Operator::onRequest(const Request &pRequest) {
  observed++;
  if (!db.claimResponse(pRequest.id)) {
    std::cout << "[ORA] Request #" << pRequest.id << " already claimed, skipping" << std::endl;
    alreadyClaimed++;
    return;
  }

  u64 lId = pRequest.id;
  resolver.resolve(pRequest, [this, lId](const ErrorCode &pError, const value_t &pValue) {
    if (pError) {
      std::cout << "[ORA] Can't answer request #" << lId << " at resolve stage: " << pError.message() << std::endl;
      // Nothing reached the chain, a redelivery may try again
      db.releaseResponse(lId);
      failed++;
      return;
    }

    std::cout << "[ORA] Operator answered to request " << lId << " with " << toString(pValue) << std::endl;
    submitter.submit(lId, pValue, [this, lId, pValue](const ErrorCode &pSubmitError, const TxStatus &pStatus) {
      onSubmitted(lId, pValue, pSubmitError, pStatus);
    });
  });
}

void Operator::onSubmitted(u64 pRequestId, const value_t &pValue, const ErrorCode &pError, const TxStatus &pStatus) {
  if (!pError) {
    db.settleResponse(pRequestId, ResponseState::eFinalized, pValue, pStatus.block);
    answered++;
    if (options.exitAfter && answered == options.exitAfter) {
      std::cout << "[ORA] " << answered << " response(s) confirmed, exiting" << std::endl;
      stop();
      if (exitHandler)
        exitHandler();
    }
  } else if (isError(pError, PythiaErrorCode::eSubmitDuplicate)) {
    db.settleResponse(pRequestId, ResponseState::eDuplicate, {}, pStatus.block);
    duplicates++;
  } else {
    std::cout << "[ORA] Request #" << pRequestId << " failed at submit stage: " << pError.message() << std::endl;
    db.settleResponse(pRequestId, ResponseState::eFailed, pValue, 0);
    failed++;
  }
}

void Operator::sendDemoRequest() {
  if (!options.funder) {
    std::cout << "[ORA] No funding account to send the demo request from" << std::endl;
    return;
  }

  Call lCall = Call::initiateRequest(self.address(), "", 1, {}, sDemoRequestFee);
  settle(service, chain, lCall, *options.funder, options.submit.timeout,
         [](const ErrorCode &pError, const TxStatus &pStatus) {
           if (pError)
             std::cout << "[ORA] Demo request failed: " << pError.message() << std::endl;
           else
             std::cout << "[ORA] Demo request finalized in #" << pStatus.block << std::endl;
         });
  std::cout << "[ORA] Request sent" << std::endl;
}

void Operator::setExitHandler(const ExitHandler &pHandler) { exitHandler = pHandler; }

const Address &Operator::address() const { return self.address(); }

bool Operator::isRunning() const { return running; }

const Submitter &Operator::getSubmitter() const { return submitter; }

const Listener &Operator::getListener() const { return listener; }

u64 Operator::observedCount() const { return observed; }

u64 Operator::answeredCount() const { return answered; }

u64 Operator::duplicateCount() const { return duplicates; }

u64 Operator::failedCount() const { return failed; }

u64 Operator::alreadyClaimedCount() const { return alreadyClaimed; }
