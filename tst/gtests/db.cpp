#include <gtest/gtest.h>

#include "Database.hpp"
#include "Extrinsic.hpp"

using namespace pythia;

TEST(Database, Profile) {
  Database lDb("file:memdb_profile?mode=memory");
  EXPECT_FALSE(lDb.hasProfile());

  auto lCreated = lDb.loadProfile(passphrase_t(std::string("test")));
  EXPECT_TRUE(lDb.hasProfile());

  auto lLoaded = lDb.loadProfile(passphrase_t(std::string("test")));
  EXPECT_EQ(lCreated.address(), lLoaded.address());
  EXPECT_EQ(lCreated.msgPK, lLoaded.msgPK);
  EXPECT_EQ(0, memcmp(lCreated.signSK->data(), lLoaded.signSK->data(), lCreated.signSK->size()));

  EXPECT_THROW(lDb.loadProfile(passphrase_t(std::string("not the passphrase"))), std::runtime_error);
}

TEST(Database, ProfilesAreDistinct) {
  Database lFirst("file:memdb_profile_a?mode=memory");
  Database lSecond("file:memdb_profile_b?mode=memory");
  passphrase_t lPassphrase(std::string("test"));
  EXPECT_NE(lFirst.loadProfile(lPassphrase).address(), lSecond.loadProfile(lPassphrase).address());
}

TEST(Database, ClaimOnce) {
  Database lDb("file:memdb_claims?mode=memory");

  EXPECT_TRUE(lDb.claimResponse(7));
  EXPECT_FALSE(lDb.claimResponse(7));
  EXPECT_TRUE(lDb.claimResponse(8));

  auto lRecord = lDb.loadResponse(7);
  ASSERT_TRUE(lRecord.has_value());
  EXPECT_EQ(ResponseState::eClaimed, lRecord->state);
  EXPECT_FALSE(lRecord->value.has_value());
  EXPECT_FALSE(lDb.loadResponse(9).has_value());
}

TEST(Database, SettleAndRelease) {
  Database lDb("file:memdb_settle?mode=memory");

  ASSERT_TRUE(lDb.claimResponse(1));
  lDb.settleResponse(1, ResponseState::eFinalized, value_t(-42), 12);
  auto lRecord = lDb.loadResponse(1);
  ASSERT_TRUE(lRecord.has_value());
  EXPECT_EQ(ResponseState::eFinalized, lRecord->state);
  ASSERT_TRUE(lRecord->value.has_value());
  EXPECT_EQ(value_t(-42), *lRecord->value);
  EXPECT_EQ(12u, lRecord->block);

  // Only unsettled claims are released
  lDb.releaseResponse(1);
  EXPECT_FALSE(lDb.claimResponse(1));

  ASSERT_TRUE(lDb.claimResponse(2));
  lDb.releaseResponse(2);
  EXPECT_FALSE(lDb.loadResponse(2).has_value());
  EXPECT_TRUE(lDb.claimResponse(2));

  ASSERT_TRUE(lDb.claimResponse(3));
  lDb.settleResponse(3, ResponseState::eDuplicate, {}, 4);

  EXPECT_EQ(1u, lDb.countResponses(ResponseState::eFinalized));
  EXPECT_EQ(1u, lDb.countResponses(ResponseState::eDuplicate));
  EXPECT_EQ(1u, lDb.countResponses(ResponseState::eClaimed));
  EXPECT_EQ(0u, lDb.countResponses(ResponseState::eFailed));
}

TEST(Database, ManyClaims) {
  Database lDb("file:memdb_many?mode=memory");

  PYTHIA_CCALL(sqlite3_exec(lDb.getSQLite(), "BEGIN;", nullptr, nullptr, nullptr));
  for (u64 i = 0; i < 10000; i++)
    EXPECT_TRUE(lDb.claimResponse(i));
  PYTHIA_CCALL(sqlite3_exec(lDb.getSQLite(), "COMMIT;", nullptr, nullptr, nullptr));

  EXPECT_EQ(10000u, lDb.countResponses(ResponseState::eClaimed));
  EXPECT_FALSE(lDb.claimResponse(4242));
}

TEST(Crypto, ExtrinsicSignature) {
  auto lSigner = randomKeypairs();
  Extrinsic lExtrinsic = signExtrinsic(Call::callback(3, value_t(17)), 5, lSigner);
  EXPECT_EQ(lSigner.address(), lExtrinsic.signer);
  EXPECT_EQ(5u, lExtrinsic.nonce);
  EXPECT_TRUE(lExtrinsic.signatureValid());

  auto lHash = lExtrinsic.hash();
  lExtrinsic.call.requestId = 4;
  EXPECT_FALSE(lExtrinsic.signatureValid());
  EXPECT_NE(lHash, lExtrinsic.hash());
}

TEST(Crypto, SecretKeypairs) {
  auto lAlice = keypairsFromSecret("//Alice");
  EXPECT_EQ(lAlice.address(), keypairsFromSecret("//Alice").address());
  EXPECT_EQ(lAlice.msgPK, keypairsFromSecret("//Alice").msgPK);
  EXPECT_NE(lAlice.address(), keypairsFromSecret("//Bob").address());
}
