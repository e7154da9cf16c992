#pragma once

#include "ChainClient.hpp"

namespace pythia {

/** Called exactly once. On a successful finalization pError is clear and pStatus the finalized status.
 * Otherwise pError is one of:
 *  - the transport error of the submission
 *  - the rejection reason of an eInvalid status, pythia category
 *  - eTransactionDropped
 *  - the dispatch error of a finalized status, pStatus tells it apart from a rejection
 *  - net::error::timed_out when pTimeout expires first */
using SettleCallback = std::function<void(ErrorCode pError, const TxStatus &pStatus)>;

void settle(net::io_service &pService, ChainClient &pChain, const Call &pCall, const keypairs_t &pSigner,
            boost::posix_time::time_duration pTimeout, const SettleCallback &pCallback);

} // namespace pythia
