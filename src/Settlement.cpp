#include <memory>

#include "Settlement.hpp"

using namespace pythia;

namespace {

struct settle_context_t {
  net::deadline_timer timer;
  SettleCallback callback;
  TxStatus last;
  bool done = false;

  settle_context_t(net::io_service &pService, SettleCallback pCallback)
      : timer(pService), callback(std::move(pCallback)) {}

  void finish(const ErrorCode &pError, const TxStatus &pStatus) {
    if (done)
      return;
    done = true;
    timer.cancel();
    callback(pError, pStatus);
  }
};

} // namespace

void pythia::settle(net::io_service &pService, ChainClient &pChain, const Call &pCall, const keypairs_t &pSigner,
                    boost::posix_time::time_duration pTimeout, const SettleCallback &pCallback) {
  auto lContext = std::make_shared<settle_context_t>(pService, pCallback);

  lContext->timer.expires_from_now(pTimeout);
  lContext->timer.async_wait([lContext](const ErrorCode &pError) {
    if (pError == net::error::operation_aborted)
      return;
    lContext->finish(net::error::timed_out, lContext->last);
  });

  pChain.submit(pCall, pSigner, [lContext](const ErrorCode &pError, const TxStatus &pStatus) {
    if (lContext->done)
      return;
    if (pError) {
      lContext->finish(pError, pStatus);
      return;
    }

    lContext->last = pStatus;
    switch (pStatus.type) {
    case TxStatus::Type::eReady:
    case TxStatus::Type::eInBlock:
      break;
    case TxStatus::Type::eInvalid:
      lContext->finish(PythiaErrorCategory::wrap(pStatus.dispatch == PythiaErrorCode::eNoError
                                                     ? PythiaErrorCode::eUnspecified
                                                     : pStatus.dispatch),
                       pStatus);
      break;
    case TxStatus::Type::eDropped:
      lContext->finish(PythiaErrorCategory::wrap(PythiaErrorCode::eTransactionDropped), pStatus);
      break;
    case TxStatus::Type::eFinalized:
      if (pStatus.dispatch != PythiaErrorCode::eNoError)
        lContext->finish(PythiaErrorCategory::wrap(pStatus.dispatch), pStatus);
      else
        lContext->finish(sNoError, pStatus);
      break;
    }
  });
}
