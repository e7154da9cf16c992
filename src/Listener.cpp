#include <charconv>

#include "Listener.hpp"

using namespace pythia;

const boost::posix_time::time_duration Listener::sInitialBackoff = boost::posix_time::milliseconds(250);
const boost::posix_time::time_duration Listener::sMaxBackoff = boost::posix_time::seconds(8);

static bool parseU64(u64 &pDest, const std::string &pSource) {
  if (pSource.empty())
    return false;
  auto lEnd = pSource.data() + pSource.size();
  auto lResult = std::from_chars(pSource.data(), lEnd, pDest);
  return lResult.ec == std::errc() && lResult.ptr == lEnd;
}

std::optional<Request> Request::fromEvent(const ChainEvent &pEvent) {
  if (!pEvent.is(sOracleSection, sOracleRequestMethod) || pEvent.data.size() != 8)
    return {};

  Request lResult;
  lResult.block = pEvent.block;
  lResult.spec = pEvent.data[1];
  lResult.callback = pEvent.data[6];
  if (!parseHex(lResult.operatorAddr.view(), pEvent.data[0]) || !parseU64(lResult.id, pEvent.data[2]) ||
      !parseHex(lResult.requester.view(), pEvent.data[3]) || !parseU64(lResult.dataVersion, pEvent.data[4]) ||
      !parseU64(lResult.fee, pEvent.data[7]))
    return {};

  auto lData = parseHex(pEvent.data[5]);
  if (!lData)
    return {};
  lResult.data = std::move(*lData);
  return lResult;
}

std::ostream &pythia::operator<<(std::ostream &pOS, const Request &pRequest) {
  return pOS << "request #" << pRequest.id << " from " << pRequest.requester << " (spec \"" << pRequest.spec
             << "\", fee " << pRequest.fee << ")";
}

Listener::Listener(net::io_service &pService, ChainClient &pChain, const Address &pSelf, bool pAnyOperator)
    : service(pService), chain(pChain), self(pSelf), anyOperator(pAnyOperator), reconnectTimer(pService),
      backoff(sInitialBackoff) {}

Listener::~Listener() { stop(); }

void Listener::start(const Callback &pCallback) {
  if (running)
    throw std::logic_error("listener already started");
  callback = pCallback;
  running = true;
  backoff = sInitialBackoff;
  subscribe();
}

void Listener::stop() {
  if (!running)
    return;
  running = false;
  generation++;
  reconnectTimer.cancel();
  if (subscription) {
    chain.unsubscribe(*subscription);
    subscription.reset();
  }
}

void Listener::subscribe() {
  size_t lGeneration = ++generation;
  subscription = chain.subscribeEvents([this, lGeneration](const ErrorCode &pError,
                                                           const std::vector<ChainEvent> &pEvents) {
    onBatch(lGeneration, pError, pEvents);
  });
  std::cout << "[LSN] Listening for " << sOracleSection << '.' << sOracleRequestMethod
            << (anyOperator ? " to any operator" : "") << std::endl;
}

void Listener::onBatch(size_t pGeneration, const ErrorCode &pError, const std::vector<ChainEvent> &pEvents) {
  if (!running || pGeneration != generation)
    return;

  if (pError) {
    subscription.reset();
    generation++;
    std::cout << "[LSN] Feed lost (" << pError.message() << "), resubscribing in " << backoff.total_milliseconds()
              << "ms" << std::endl;
    reconnectTimer.expires_from_now(backoff);
    backoff = std::min(backoff * 2, sMaxBackoff);
    reconnectTimer.async_wait([this](const ErrorCode &pTimerError) {
      if (pTimerError == net::error::operation_aborted || !running)
        return;
      reconnects++;
      subscribe();
    });
    return;
  }

  backoff = sInitialBackoff;
  for (const auto &lEvent : pEvents) {
    if (!lEvent.is(sOracleSection, sOracleRequestMethod))
      continue;

    auto lRequest = Request::fromEvent(lEvent);
    if (!lRequest) {
      std::cout << "[LSN] Skipping malformed " << lEvent << std::endl;
      skipped++;
      continue;
    }
    if (!anyOperator && lRequest->operatorAddr != self) {
      skipped++;
      continue;
    }

    std::cout << "[LSN] Got " << *lRequest << " in #" << lRequest->block << std::endl;
    delivered++;
    callback(*lRequest);
    // The callback may have stopped us
    if (!running || pGeneration != generation)
      return;
  }
}

bool Listener::isRunning() const { return running; }

u64 Listener::deliveredCount() const { return delivered; }

u64 Listener::skippedCount() const { return skipped; }

u64 Listener::reconnectCount() const { return reconnects; }
