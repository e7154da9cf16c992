#pragma once

#include <sqlite3.h>

#include "Codec.hpp"
#include "utils.hpp"

namespace pythia {

enum class ResponseState : int {
  eClaimed = 0,
  eFinalized = 1,
  eDuplicate = 2,
  eFailed = 3,
};
std::ostream &operator<<(std::ostream &pOS, ResponseState pState);

struct ResponseRecord {
  u64 requestId = 0;
  ResponseState state = ResponseState::eClaimed;
  std::optional<value_t> value;
  u64 block = 0;
};

/** Operator profile (keys sealed under a passphrase) and ledger of the responses issued. */
class Database {
  sqlite3 *db = nullptr;
  sqlite3_stmt *insProfileStmt = nullptr;
  sqlite3_stmt *selProfileStmt = nullptr;
  sqlite3_stmt *claimStmt = nullptr;
  sqlite3_stmt *settleStmt = nullptr;
  sqlite3_stmt *releaseStmt = nullptr;
  sqlite3_stmt *selResponseStmt = nullptr;
  sqlite3_stmt *countStmt = nullptr;

  static int sqlTrace(unsigned pMask, void *pContext, void *pParamP, void *pParamX);

  bool hasProfileEntry(const std::string_view &pKey);

  void insertProfileEntry(const std::string_view &pKey, const cbuff_view_t &pVal);
  void getProfileEntry(const std::string_view &pKey, buff_view_t pVal);

  template <typename TConainer> TConainer retreiveProfileEntry(const std::string_view &pKey) {
    TConainer lResult;
    getProfileEntry(pKey, buff_view_t{lResult.data(), lResult.size()});
    return lResult;
  }

  static sensitive_t<u256> deriveKey(const passphrase_t &pPassphrase, const u128 &pSalt);
  keypairs_t initialize(const passphrase_t &pPassphrase);

public:
  /** pPath accepts sqlite URIs ("file:name?mode=memory"), pTrace logs every statement with its duration. */
  explicit Database(const char *pPath, bool pTrace = false);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  /** Creates the operator identity on first use, decrypts it afterwards. Throws on a wrong passphrase. */
  keypairs_t loadProfile(const passphrase_t &pPassphrase);
  bool hasProfile();

  /** @return false if pRequestId was already claimed, by this process or an earlier run */
  bool claimResponse(u64 pRequestId);

  /** Forgets a claim for which nothing was submitted, so a redelivery can answer it. */
  void releaseResponse(u64 pRequestId);

  void settleResponse(u64 pRequestId, ResponseState pState, const std::optional<value_t> &pValue, u64 pBlock);
  std::optional<ResponseRecord> loadResponse(u64 pRequestId);
  size_t countResponses(ResponseState pState);

  sqlite3 *getSQLite();
};

} // namespace pythia
