#include "LocalChain.hpp"

using namespace pythia;

static std::string addressHex(const Address &pAddress) { return toHex(pAddress.view(), true); }

LocalChain::LocalChain(net::io_service &pService) : LocalChain(pService, Options()) {}

LocalChain::LocalChain(net::io_service &pService, const Options &pOptions)
    : service(pService), options(pOptions), blockTimer(pService) {}

LocalChain::~LocalChain() { stop(); }

void LocalChain::endow(const Address &pAddress, Balance pAmount) { accounts[pAddress].free += pAmount; }

void LocalChain::start() {
  if (producing || options.blockTime <= boost::posix_time::time_duration())
    return;
  producing = true;
  blockTimer.expires_from_now(options.blockTime);
  scheduleBlock();
}

void LocalChain::stop() {
  producing = false;
  blockTimer.cancel();
}

void LocalChain::scheduleBlock() {
  blockTimer.async_wait([this](const ErrorCode &pError) {
    if (pError == net::error::operation_aborted || !producing)
      return;
    produceBlock();
    blockTimer.expires_at(blockTimer.expires_at() + options.blockTime);
    scheduleBlock();
  });
}

PythiaErrorCode LocalChain::validate(const Extrinsic &pExtrinsic) const {
  if (!pExtrinsic.signatureValid())
    return PythiaErrorCode::eInvalidSignature;
  auto lAccount = account(pExtrinsic.signer);
  if (pExtrinsic.nonce != lAccount.nonce)
    return PythiaErrorCode::eBadNonce;
  if (lAccount.free < options.txFee)
    return PythiaErrorCode::eInsufficientBalance;
  return PythiaErrorCode::eNoError;
}

PythiaErrorCode LocalChain::dispatch(const Extrinsic &pExtrinsic, u64 pBlock, std::vector<ChainEvent> &pEvents) {
  const Call &lCall = pExtrinsic.call;
  auto &lSigner = accounts[pExtrinsic.signer];

  switch (lCall.type) {
  case Call::Type::eTransfer: {
    if (lSigner.free < lCall.amount)
      return PythiaErrorCode::eInsufficientBalance;
    lSigner.free -= lCall.amount;
    accounts[lCall.dest].free += lCall.amount;
    pEvents.push_back({pBlock,
                       "balances",
                       "Transfer",
                       {addressHex(pExtrinsic.signer), addressHex(lCall.dest), std::to_string(lCall.amount)}});
    return PythiaErrorCode::eNoError;
  }

  case Call::Type::eRegisterOperator: {
    auto &lRegistered = operators[pExtrinsic.signer];
    if (lRegistered)
      return PythiaErrorCode::eAlreadyRegistered;
    lRegistered = true;
    pEvents.push_back({pBlock, sOracleSection, "OperatorRegistered", {addressHex(pExtrinsic.signer)}});
    return PythiaErrorCode::eNoError;
  }

  case Call::Type::eUnregisterOperator: {
    auto lFound = operators.find(pExtrinsic.signer);
    if (lFound == operators.end() || !lFound->second)
      return PythiaErrorCode::eNotRegistered;
    lFound->second = false;
    pEvents.push_back({pBlock, sOracleSection, "OperatorUnregistered", {addressHex(pExtrinsic.signer)}});
    return PythiaErrorCode::eNoError;
  }

  case Call::Type::eInitiateRequest: {
    if (registration(lCall.dest) != Registration::eRegistered)
      return PythiaErrorCode::eNotRegistered;
    if (lSigner.free < lCall.amount)
      return PythiaErrorCode::eInsufficientBalance;

    u64 lId = nextRequestId;
    std::string lSpec(lCall.spec.begin(), lCall.spec.end());
    ChainEvent lEvent{pBlock,
                      sOracleSection,
                      sOracleRequestMethod,
                      {addressHex(lCall.dest), lSpec, std::to_string(lId), addressHex(pExtrinsic.signer),
                       std::to_string(lCall.dataVersion), toHex({lCall.data.data(), lCall.data.size()}, true),
                       "example.callback", std::to_string(lCall.amount)}};
    // Every subscriber must be able to receive the request in a single push
    if (lEvent.serializedSize() > sMaxEventSize)
      return PythiaErrorCode::eRequestTooLarge;

    // The fee stays reserved until the operator answers
    lSigner.free -= lCall.amount;
    nextRequestId++;
    PendingRequest &lRequest = requests[lId];
    lRequest.requester = pExtrinsic.signer;
    lRequest.operatorAddr = lCall.dest;
    lRequest.spec = std::move(lSpec);
    lRequest.dataVersion = lCall.dataVersion;
    lRequest.data = lCall.data;
    lRequest.fee = lCall.amount;
    lRequest.block = pBlock;
    pEvents.push_back(std::move(lEvent));
    return PythiaErrorCode::eNoError;
  }

  case Call::Type::eCallback: {
    auto lFound = requests.find(lCall.requestId);
    if (lFound == requests.end())
      return answered.count(lCall.requestId) ? PythiaErrorCode::eAlreadyAnswered : PythiaErrorCode::eUnknownRequest;
    if (lFound->second.operatorAddr != pExtrinsic.signer)
      return PythiaErrorCode::eWrongOperator;
    if (lCall.data.empty() || lCall.data.size() > sValueSize)
      return PythiaErrorCode::eIllformed;

    result = decodeValue({lCall.data.data(), lCall.data.size()});
    lSigner.free += lFound->second.fee;
    pEvents.push_back({pBlock,
                       sOracleSection,
                       "OracleAnswer",
                       {addressHex(pExtrinsic.signer), std::to_string(lCall.requestId),
                        toHex({lCall.data.data(), lCall.data.size()}, true), std::to_string(lFound->second.fee)}});
    pEvents.push_back({pBlock, "example", "ResultUpdated", {toString(result)}});
    answered.insert(lCall.requestId);
    requests.erase(lFound);
    return PythiaErrorCode::eNoError;
  }
  }
  return PythiaErrorCode::eIllformed;
}

u64 LocalChain::produceBlock() {
  Block lBlock;
  lBlock.number = blocks.size() + 1;

  // Submissions made from the callbacks below go to the next block
  std::deque<PoolEntry> lPool;
  lPool.swap(pool);

  for (auto &lEntry : lPool) {
    auto lInvalid = validate(lEntry.extrinsic);
    if (lInvalid != PythiaErrorCode::eNoError) {
      std::cout << "[DEV] Rejected " << callName(lEntry.extrinsic.call.type) << " from "
                << lEntry.extrinsic.signer << ": " << PythiaErrorCategory::instance().message((int)lInvalid)
                << std::endl;
      notify(lEntry.callback, TxStatus::Type::eInvalid, lEntry.hash, 0, lInvalid);
      continue;
    }

    auto &lAccount = accounts[lEntry.extrinsic.signer];
    lAccount.nonce++;
    lAccount.free -= options.txFee;

    auto lDispatch = dispatch(lEntry.extrinsic, lBlock.number, lBlock.events);
    if (lDispatch != PythiaErrorCode::eNoError)
      lBlock.events.push_back({lBlock.number,
                               "system",
                               "ExtrinsicFailed",
                               {toHex(lEntry.hash.view(), true),
                                PythiaErrorCategory::instance().message((int)lDispatch)}});

    lBlock.included.push_back(
        {lEntry.hash, lEntry.extrinsic.call.type, lEntry.extrinsic.signer, lDispatch, lEntry.callback});
  }

  // lBlock stays usable below, callbacks may submit or produce more blocks
  blocks.push_back(lBlock);
  if (!lBlock.included.empty())
    std::cout << "[DEV] Block #" << lBlock.number << " with " << lBlock.included.size() << " extrinsic(s), "
              << lBlock.events.size() << " event(s)" << std::endl;

  for (const auto &lIncluded : lBlock.included)
    notify(lIncluded.callback, TxStatus::Type::eInBlock, lIncluded.hash, lBlock.number, lIncluded.dispatch);

  // Empty batches are delivered too, they double as a heartbeat for remote subscribers
  deliver(lBlock.events);
  finalize();
  return lBlock.number;
}

void LocalChain::finalize() {
  if (finalityStalled)
    return;
  while (finalized + 1 + options.finalityDepth <= blocks.size()) {
    finalized++;
    // Copied, a callback may produce blocks and grow the history
    auto lIncluded = blocks[finalized - 1].included;
    for (auto &lEntry : blocks[finalized - 1].included)
      lEntry.callback = nullptr;
    for (const auto &lEntry : lIncluded)
      notify(lEntry.callback, TxStatus::Type::eFinalized, lEntry.hash, finalized, lEntry.dispatch);
  }
}

void LocalChain::deliver(const std::vector<ChainEvent> &pEvents) {
  auto lSubscriptions = subscriptions;
  for (const auto &lSubscription : lSubscriptions) {
    if (subscriptions.count(lSubscription.first))
      lSubscription.second(sNoError, pEvents);
  }
}

void LocalChain::notify(const StatusCallback &pCallback, TxStatus::Type pType, const u256 &pHash, u64 pBlock,
                        PythiaErrorCode pDispatch) {
  if (!pCallback)
    return;
  TxStatus lStatus;
  lStatus.type = pType;
  lStatus.hash = pHash;
  lStatus.block = pBlock;
  lStatus.dispatch = pDispatch;
  pCallback(sNoError, lStatus);
}

u64 LocalChain::bestNumber() const { return blocks.size(); }

u64 LocalChain::finalizedNumber() const { return finalized; }

const LocalChain::Options &LocalChain::config() const { return options; }

AccountInfo LocalChain::account(const Address &pAddress) const {
  auto lFound = accounts.find(pAddress);
  return lFound == accounts.end() ? AccountInfo{} : lFound->second;
}

u64 LocalChain::nextNonce(const Address &pAddress) const {
  u64 lResult = account(pAddress).nonce;
  for (const auto &lEntry : pool)
    if (lEntry.extrinsic.signer == pAddress)
      lResult++;
  return lResult;
}

Registration LocalChain::registration(const Address &pAddress) const {
  auto lFound = operators.find(pAddress);
  if (lFound == operators.end())
    return Registration::eAbsent;
  return lFound->second ? Registration::eRegistered : Registration::eDisabled;
}

value_t LocalChain::currentResult() const { return result; }

std::optional<LocalChain::PendingRequest> LocalChain::pendingRequest(u64 pRequestId) const {
  auto lFound = requests.find(pRequestId);
  if (lFound == requests.end())
    return {};
  return lFound->second;
}

size_t LocalChain::pendingCount() const { return pool.size(); }

size_t LocalChain::countIncluded(Call::Type pType, const Address *pSigner, PythiaErrorCode pDispatch) const {
  size_t lResult = 0;
  for (const auto &lBlock : blocks)
    for (const auto &lIncluded : lBlock.included)
      if (lIncluded.type == pType && lIncluded.dispatch == pDispatch && (!pSigner || lIncluded.signer == *pSigner))
        lResult++;
  return lResult;
}

void LocalChain::submitExtrinsic(const Extrinsic &pExtrinsic, const StatusCallback &pCallback) {
  PoolEntry lEntry{pExtrinsic, pExtrinsic.hash(), pCallback};
  for (const auto &lPending : pool) {
    if (lPending.hash == lEntry.hash) {
      service.post([pCallback, lHash = lEntry.hash]() {
        TxStatus lStatus;
        lStatus.type = TxStatus::Type::eInvalid;
        lStatus.hash = lHash;
        lStatus.dispatch = PythiaErrorCode::eBadNonce;
        pCallback(sNoError, lStatus);
      });
      return;
    }
  }

  pool.push_back(lEntry);
  service.post([pCallback, lHash = lEntry.hash]() {
    TxStatus lStatus;
    lStatus.type = TxStatus::Type::eReady;
    lStatus.hash = lHash;
    pCallback(sNoError, lStatus);
  });
}

void LocalChain::queryAccount(const Address &pAddress, const AccountCallback &pCallback) {
  AccountInfo lInfo = account(pAddress);
  lInfo.nonce = nextNonce(pAddress);
  service.post([pCallback, lInfo]() { pCallback(sNoError, lInfo); });
}

void LocalChain::queryRegistration(const Address &pAddress, const RegistrationCallback &pCallback) {
  auto lRegistration = registration(pAddress);
  service.post([pCallback, lRegistration]() { pCallback(sNoError, lRegistration); });
}

void LocalChain::queryResult(const ResultCallback &pCallback) {
  value_t lResult = result;
  service.post([pCallback, lResult]() { pCallback(sNoError, lResult); });
}

void LocalChain::queryRequest(u64 pRequestId, const RequestCallback &pCallback) {
  bool lPending = requests.count(pRequestId) > 0;
  service.post([pCallback, lPending]() { pCallback(sNoError, lPending); });
}

void LocalChain::submit(const Call &pCall, const keypairs_t &pSigner, const StatusCallback &pCallback) {
  submitExtrinsic(signExtrinsic(pCall, nextNonce(pSigner.address()), pSigner), pCallback);
}

size_t LocalChain::subscribeEvents(const EventsCallback &pCallback) {
  size_t lId = nextSubscription++;
  subscriptions[lId] = pCallback;
  return lId;
}

void LocalChain::unsubscribe(size_t pSubscription) { subscriptions.erase(pSubscription); }

void LocalChain::disconnectSubscribers() {
  auto lSubscriptions = std::move(subscriptions);
  subscriptions.clear();
  for (const auto &lSubscription : lSubscriptions) {
    auto lCallback = lSubscription.second;
    service.post([lCallback]() {
      lCallback(PythiaErrorCategory::wrap(PythiaErrorCode::eFeedDisconnected), std::vector<ChainEvent>{});
    });
  }
}

void LocalChain::replayBlock(u64 pNumber) {
  if (pNumber == 0 || pNumber > blocks.size())
    throw std::out_of_range("no block #" + std::to_string(pNumber));
  auto lEvents = blocks[pNumber - 1].events;
  deliver(lEvents);
}

void LocalChain::stallFinality(bool pStalled) {
  finalityStalled = pStalled;
  if (!pStalled)
    finalize();
}

void LocalChain::dropPending() {
  std::deque<PoolEntry> lPool;
  lPool.swap(pool);
  for (const auto &lEntry : lPool)
    notify(lEntry.callback, TxStatus::Type::eDropped, lEntry.hash, 0, PythiaErrorCode::eNoError);
}
