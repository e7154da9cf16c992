#include <iostream>

#include "Database.hpp"

#ifdef PYTHIA_PWHASH_FAST
#define PYTHIA_PWHASH_OPSLIMIT crypto_pwhash_OPSLIMIT_MIN
#define PYTHIA_PWHASH_MEMLIMIT crypto_pwhash_MEMLIMIT_MIN
#else
#define PYTHIA_PWHASH_OPSLIMIT crypto_pwhash_OPSLIMIT_SENSITIVE
#define PYTHIA_PWHASH_MEMLIMIT crypto_pwhash_MEMLIMIT_SENSITIVE
#endif

using namespace pythia;

const char *sInitSQL = "BEGIN;"
                       "CREATE TABLE IF NOT EXISTS profile("
                       "key TEXT PRIMARY KEY,"
                       "value BLOB"
                       ");"
                       "CREATE TABLE IF NOT EXISTS responses("
                       "request_id INTEGER PRIMARY KEY,"
                       "state INT,"
                       "value BLOB,"
                       "block INT,"
                       "claimed_at INT DEFAULT CURRENT_TIMESTAMP,"
                       "settled_at INT"
                       ");"
                       "COMMIT;";

const char *sVerifyToken = "verified";

std::ostream &pythia::operator<<(std::ostream &pOS, ResponseState pState) {
  switch (pState) {
  case ResponseState::eClaimed:
    return pOS << "claimed";
  case ResponseState::eFinalized:
    return pOS << "finalized";
  case ResponseState::eDuplicate:
    return pOS << "duplicate";
  case ResponseState::eFailed:
    return pOS << "failed";
  }
  return pOS << "unknown";
}

int Database::sqlTrace(unsigned pMask, void *, void *pParamP, void *pParamX) {
  if (pMask == SQLITE_TRACE_PROFILE) {
    auto lStmt = (sqlite3_stmt *)pParamP;
    char *lSQL = sqlite3_expanded_sql(lStmt);
    std::chrono::nanoseconds lRawNS(*((int64_t *)pParamX));
    std::cout << "[SQL] " << dur_t{lRawNS} << " " << (lSQL ? lSQL : sqlite3_sql(lStmt)) << std::endl;
    sqlite3_free(lSQL);
  }
  return 0;
}

bool Database::hasProfileEntry(const std::string_view &pKey) {
  PYTHIA_CCALL(sqlite3_bind_text(selProfileStmt, 1, pKey.data(), (int)pKey.size(), nullptr));
  bool lResult = sqlite3_step(selProfileStmt) == SQLITE_ROW;
  sqlite3_reset(selProfileStmt);
  return lResult;
}

void Database::insertProfileEntry(const std::string_view &pKey, const cbuff_view_t &pVal) {
  PYTHIA_CCALL(sqlite3_bind_text(insProfileStmt, 1, pKey.data(), (int)pKey.size(), nullptr));
  PYTHIA_CCALL(sqlite3_bind_blob(insProfileStmt, 2, pVal.data, (int)pVal.size, nullptr));
  PYTHIA_CCALL(sqlite3_step(insProfileStmt) != SQLITE_DONE);
  PYTHIA_CCALL(sqlite3_reset(insProfileStmt));
}

void Database::getProfileEntry(const std::string_view &pKey, buff_view_t pVal) {
  PYTHIA_CCALL(sqlite3_bind_text(selProfileStmt, 1, pKey.data(), (int)pKey.size(), nullptr));
  if (sqlite3_step(selProfileStmt) != SQLITE_ROW) {
    sqlite3_reset(selProfileStmt);
    throw std::runtime_error("corrupted profile, missing " + std::string(pKey));
  }

  auto lSize = sqlite3_column_bytes(selProfileStmt, 0);
  if (lSize != (int)pVal.size) {
    sqlite3_reset(selProfileStmt);
    throw std::runtime_error("corrupted profile, bad size for " + std::string(pKey));
  }
  memcpy(pVal.data, sqlite3_column_blob(selProfileStmt, 0), (size_t)lSize);

  sqlite3_reset(selProfileStmt);
}

sensitive_t<u256> Database::deriveKey(const passphrase_t &pPassphrase, const u128 &pSalt) {
  sensitive_t<u256> lResult;
  static_assert(u128::sSize == crypto_pwhash_SALTBYTES);
  static_assert(u256::sSize >= crypto_pwhash_BYTES_MIN);
  static_assert(u256::sSize == crypto_secretbox_KEYBYTES);
  PYTHIA_CCALL(crypto_pwhash(lResult->data(), lResult->size(), pPassphrase->data(), pPassphrase->size(),
                             pSalt.data(), PYTHIA_PWHASH_OPSLIMIT, PYTHIA_PWHASH_MEMLIMIT,
                             crypto_pwhash_ALG_DEFAULT));
  return lResult;
}

keypairs_t Database::initialize(const passphrase_t &pPassphrase) {
  auto lPassNonce = rand<u128>();
  auto lSecretKey = deriveKey(pPassphrase, lPassNonce);

  auto lVerify = rand<u128>();
  memcpy(lVerify.data(), sVerifyToken, strlen(sVerifyToken));
  auto lVerifyNonce = rand<u192>();
  u128 lVerifyCrypt;
  u128 lVerifyMac;
  PYTHIA_CCALL(crypto_secretbox_detached(lVerifyCrypt.data(), lVerifyMac.data(), lVerify.data(), lVerify.size(),
                                         lVerifyNonce.data(), lSecretKey->data()));

  sensitive_t<u256> lSeed(rand<u256>());
  auto lResult = keypairsFromSeed(lSeed);

  auto lSeedNonce = rand<u192>();
  u128 lSeedMac;
  u256 lSeedCrypt;
  static_assert(u192::sSize == crypto_secretbox_NONCEBYTES);
  static_assert(u128::sSize == crypto_secretbox_MACBYTES);
  PYTHIA_CCALL(crypto_secretbox_detached(lSeedCrypt.data(), lSeedMac.data(), lSeed->data(), lSeed->size(),
                                         lSeedNonce.data(), lSecretKey->data()));

  PYTHIA_CCALL(sqlite3_exec(db, "BEGIN;", nullptr, nullptr, nullptr));
  insertProfileEntry("address", lResult.address().view());
  insertProfileEntry("pass_nonce", lPassNonce.view());

  insertProfileEntry("verify_mac", lVerifyMac.view());
  insertProfileEntry("verify_nonce", lVerifyNonce.view());
  insertProfileEntry("verify_crypt", lVerifyCrypt.view());

  insertProfileEntry("seed_mac", lSeedMac.view());
  insertProfileEntry("seed_nonce", lSeedNonce.view());
  insertProfileEntry("seed_crypt", lSeedCrypt.view());
  PYTHIA_CCALL(sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr));

  return lResult;
}

Database::Database(const char *pPath, bool pTrace) {
  uint32_t lFlags = SQLITE_OPEN_NOMUTEX | SQLITE_OPEN_URI | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  if (sqlite3_open_v2(pPath, &db, lFlags, nullptr) != SQLITE_OK) {
    std::string lMessage = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("can't open " + std::string(pPath) + ": " + lMessage);
  }

  if (pTrace) {
    PYTHIA_CCALL(sqlite3_trace_v2(db, SQLITE_TRACE_PROFILE, &Database::sqlTrace, this));
  }
  PYTHIA_CCALL(sqlite3_exec(db, sInitSQL, nullptr, nullptr, nullptr));

  PYTHIA_CCALL(sqlite3_prepare_v2(db, "INSERT INTO profile (key, value) VALUES (?, ?)", -1, &insProfileStmt, nullptr));
  PYTHIA_CCALL(sqlite3_prepare_v2(db, "SELECT value FROM profile WHERE key = ?;", -1, &selProfileStmt, nullptr));

  PYTHIA_CCALL(sqlite3_prepare_v2(db, "INSERT OR IGNORE INTO responses (request_id, state) VALUES (?, 0)", -1,
                                  &claimStmt, nullptr));
  PYTHIA_CCALL(sqlite3_prepare_v2(db,
                                  "UPDATE responses SET state = ?, value = ?, block = ?, "
                                  "settled_at = CURRENT_TIMESTAMP WHERE request_id = ?",
                                  -1, &settleStmt, nullptr));
  PYTHIA_CCALL(sqlite3_prepare_v2(db, "DELETE FROM responses WHERE request_id = ? AND state = 0", -1, &releaseStmt,
                                  nullptr));
  PYTHIA_CCALL(sqlite3_prepare_v2(db, "SELECT state, value, block FROM responses WHERE request_id = ?;", -1,
                                  &selResponseStmt, nullptr));
  PYTHIA_CCALL(sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM responses WHERE state = ?;", -1, &countStmt, nullptr));
}

Database::~Database() {
  sqlite3_finalize(selProfileStmt);
  sqlite3_finalize(insProfileStmt);
  sqlite3_finalize(claimStmt);
  sqlite3_finalize(settleStmt);
  sqlite3_finalize(releaseStmt);
  sqlite3_finalize(selResponseStmt);
  sqlite3_finalize(countStmt);
  sqlite3_close(db);
}

bool Database::hasProfile() { return hasProfileEntry("address"); }

keypairs_t Database::loadProfile(const passphrase_t &pPassphrase) {
  if (!hasProfile())
    return initialize(pPassphrase);

  auto lAddress = retreiveProfileEntry<u256>("address");
  auto lPassNonce = retreiveProfileEntry<u128>("pass_nonce");

  auto lVerifyMac = retreiveProfileEntry<u128>("verify_mac");
  auto lVerifyNonce = retreiveProfileEntry<u192>("verify_nonce");
  auto lVerifyCrypt = retreiveProfileEntry<u128>("verify_crypt");

  auto lSeedMac = retreiveProfileEntry<u128>("seed_mac");
  auto lSeedNonce = retreiveProfileEntry<u192>("seed_nonce");
  auto lSeedCrypt = retreiveProfileEntry<u256>("seed_crypt");

  auto lSecretKey = deriveKey(pPassphrase, lPassNonce);

  u128 lVerify;
  if (crypto_secretbox_open_detached(lVerify.data(), lVerifyCrypt.data(), lVerifyMac.data(), lVerifyCrypt.size(),
                                     lVerifyNonce.data(), lSecretKey->data()) != 0 ||
      memcmp(lVerify.data(), sVerifyToken, strlen(sVerifyToken)) != 0)
    throw std::runtime_error("wrong passphrase");

  sensitive_t<u256> lSeed;
  PYTHIA_CCALL(crypto_secretbox_open_detached(lSeed->data(), lSeedCrypt.data(), lSeedMac.data(), lSeedCrypt.size(),
                                              lSeedNonce.data(), lSecretKey->data()));

  auto lResult = keypairsFromSeed(lSeed);
  if (lResult.address() != lAddress)
    throw std::runtime_error("corrupted profile, address mismatch");
  return lResult;
}

bool Database::claimResponse(u64 pRequestId) {
  PYTHIA_CCALL(sqlite3_bind_int64(claimStmt, 1, (sqlite3_int64)pRequestId));
  PYTHIA_CCALL(sqlite3_step(claimStmt) != SQLITE_DONE);
  PYTHIA_CCALL(sqlite3_reset(claimStmt));
  return sqlite3_changes(db) == 1;
}

void Database::releaseResponse(u64 pRequestId) {
  PYTHIA_CCALL(sqlite3_bind_int64(releaseStmt, 1, (sqlite3_int64)pRequestId));
  PYTHIA_CCALL(sqlite3_step(releaseStmt) != SQLITE_DONE);
  PYTHIA_CCALL(sqlite3_reset(releaseStmt));
}

void Database::settleResponse(u64 pRequestId, ResponseState pState, const std::optional<value_t> &pValue,
                              u64 pBlock) {
  u128 lEncoded;
  PYTHIA_CCALL(sqlite3_bind_int(settleStmt, 1, (int)pState));
  if (pValue) {
    lEncoded = encodeValue(*pValue);
    PYTHIA_CCALL(sqlite3_bind_blob(settleStmt, 2, lEncoded.data(), (int)lEncoded.size(), nullptr));
  } else {
    PYTHIA_CCALL(sqlite3_bind_null(settleStmt, 2));
  }
  PYTHIA_CCALL(sqlite3_bind_int64(settleStmt, 3, (sqlite3_int64)pBlock));
  PYTHIA_CCALL(sqlite3_bind_int64(settleStmt, 4, (sqlite3_int64)pRequestId));
  PYTHIA_CCALL(sqlite3_step(settleStmt) != SQLITE_DONE);
  PYTHIA_CCALL(sqlite3_reset(settleStmt));
}

std::optional<ResponseRecord> Database::loadResponse(u64 pRequestId) {
  PYTHIA_CCALL(sqlite3_bind_int64(selResponseStmt, 1, (sqlite3_int64)pRequestId));
  if (sqlite3_step(selResponseStmt) != SQLITE_ROW) {
    PYTHIA_CCALL(sqlite3_reset(selResponseStmt));
    return {};
  }

  ResponseRecord lRecord;
  lRecord.requestId = pRequestId;
  lRecord.state = (ResponseState)sqlite3_column_int(selResponseStmt, 0);
  if (sqlite3_column_type(selResponseStmt, 1) == SQLITE_BLOB) {
    auto lSize = (size_t)sqlite3_column_bytes(selResponseStmt, 1);
    lRecord.value = decodeValue({(const u8 *)sqlite3_column_blob(selResponseStmt, 1), lSize});
  }
  lRecord.block = (u64)sqlite3_column_int64(selResponseStmt, 2);

  PYTHIA_CCALL(sqlite3_reset(selResponseStmt));
  return lRecord;
}

size_t Database::countResponses(ResponseState pState) {
  PYTHIA_CCALL(sqlite3_bind_int(countStmt, 1, (int)pState));
  PYTHIA_CCALL(sqlite3_step(countStmt) != SQLITE_ROW);
  auto lResult = (size_t)sqlite3_column_int64(countStmt, 0);
  PYTHIA_CCALL(sqlite3_reset(countStmt));
  return lResult;
}

sqlite3 *Database::getSQLite() { return db; }
