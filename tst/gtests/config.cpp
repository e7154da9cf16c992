#include <cstdlib>

#include "gtest/gtest.h"

#include "Config.hpp"

using namespace pythia;

namespace {

Config parse(std::vector<const char *> pArgs) {
  pArgs.insert(pArgs.begin(), "pythia-operator");
  return parseConfig((int)pArgs.size(), pArgs.data());
}

DevnodeConfig parseDevnode(std::vector<const char *> pArgs) {
  pArgs.insert(pArgs.begin(), "pythia-devnode");
  return parseDevnodeConfig((int)pArgs.size(), pArgs.data());
}

const char *sNodeKey = "0x8eaf04151687736326c9fea17e25fc5287613693c912909cb226aa4794f26a48";

} // namespace

class PythiaConfigTest : public ::testing::Test {
protected:
  void SetUp() override { unsetenv("PYTHIA_FUNDER_SECRET"); }
  void TearDown() override { unsetenv("PYTHIA_FUNDER_SECRET"); }
};

TEST_F(PythiaConfigTest, Defaults) {
  auto lConfig = parse({"--db", "operator.db", "--dev"});
  EXPECT_EQ("operator.db", lConfig.db);
  EXPECT_TRUE(lConfig.dev);
  EXPECT_FALSE(lConfig.funderSecret.has_value());
  EXPECT_EQ(sDefaultProvisioningAmount, lConfig.fundingAmount);
  EXPECT_EQ(RandomResolver::sDefaultBound, lConfig.bound);
  EXPECT_FALSE(lConfig.anyOperator);
  EXPECT_EQ(0u, lConfig.exitAfter);
  EXPECT_EQ(60u, lConfig.finalityTimeout);
  EXPECT_EQ(3u, lConfig.attempts);
  EXPECT_EQ(1024u, lConfig.queue);
  EXPECT_FALSE(lConfig.demoRequest);
  EXPECT_FALSE(lConfig.sqlTrace);
}

TEST_F(PythiaConfigTest, AllFlags) {
  auto lConfig = parse({"--db", "a.db", "--node", "10.0.0.2:9000", "--node-key", sNodeKey, "--funder-secret",
                        "//Charlie", "--funding-amount", "5000", "--bound", "7", "--any-operator", "--exit-after",
                        "3", "--finality-timeout", "10", "--attempts", "5", "--queue", "16", "--demo-request",
                        "--sql-trace"});
  EXPECT_FALSE(lConfig.dev);
  EXPECT_EQ("10.0.0.2", lConfig.nodeHost);
  EXPECT_EQ(9000, lConfig.nodePort);
  ASSERT_TRUE(lConfig.nodeKey.has_value());
  EXPECT_EQ(sNodeKey, toHex(lConfig.nodeKey->view(), true));
  EXPECT_EQ("//Charlie", *lConfig.funderSecret);
  EXPECT_EQ(5000u, lConfig.fundingAmount);
  EXPECT_EQ(7u, lConfig.bound);
  EXPECT_TRUE(lConfig.anyOperator);
  EXPECT_EQ(3u, lConfig.exitAfter);
  EXPECT_EQ(10u, lConfig.finalityTimeout);
  EXPECT_EQ(5u, lConfig.attempts);
  EXPECT_EQ(16u, lConfig.queue);
  EXPECT_TRUE(lConfig.demoRequest);
  EXPECT_TRUE(lConfig.sqlTrace);
}

TEST_F(PythiaConfigTest, BracketedIPv6) {
  auto lConfig = parse({"--db", "a.db", "--node", "[::1]:9944", "--node-key", sNodeKey});
  EXPECT_EQ("::1", lConfig.nodeHost);
  EXPECT_EQ(9944, lConfig.nodePort);
}

TEST_F(PythiaConfigTest, FunderFromEnvironment) {
  setenv("PYTHIA_FUNDER_SECRET", "//Dave", 1);
  auto lConfig = parse({"--db", "a.db", "--dev"});
  ASSERT_TRUE(lConfig.funderSecret.has_value());
  EXPECT_EQ("//Dave", *lConfig.funderSecret);

  // The flag wins
  lConfig = parse({"--db", "a.db", "--dev", "--funder-secret", "//Eve"});
  EXPECT_EQ("//Eve", *lConfig.funderSecret);

  setenv("PYTHIA_FUNDER_SECRET", "", 1);
  lConfig = parse({"--db", "a.db", "--dev"});
  EXPECT_FALSE(lConfig.funderSecret.has_value());
}

TEST_F(PythiaConfigTest, Errors) {
  EXPECT_THROW(parse({"--dev"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db", "a.db"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db", "a.db", "--dev", "--verbose"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db", "a.db", "--dev", "--bound", "0"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db", "a.db", "--dev", "--bound", "-1"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db", "a.db", "--dev", "--attempts", "3x"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db", "a.db", "--dev", "--node", "localhost"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db", "a.db", "--dev", "--node", "127.0.0.1:70000"}), std::invalid_argument);
  EXPECT_THROW(parse({"--db", "a.db", "--node-key", "0x1234"}), std::invalid_argument);
}

TEST_F(PythiaConfigTest, HelpSkipsValidation) {
  EXPECT_TRUE(parse({"--help"}).help);
  EXPECT_TRUE(parse({"--version"}).version);
}

TEST(Devnode, Flags) {
  auto lDefaults = parseDevnode({});
  EXPECT_EQ(sDefaultNodePort, lDefaults.port);
  EXPECT_EQ(100u, lDefaults.blockMs);
  EXPECT_EQ(2u, lDefaults.finalityDepth);
  EXPECT_EQ((std::vector<std::string>{"//Alice", "//Bob"}), lDefaults.endow);

  auto lConfig = parseDevnode({"--port", "0", "--block-ms", "20", "--finality-depth", "0", "--endow", "//Ferdie"});
  EXPECT_EQ(0, lConfig.port);
  EXPECT_EQ(20u, lConfig.blockMs);
  EXPECT_EQ(0u, lConfig.finalityDepth);
  EXPECT_EQ((std::vector<std::string>{"//Alice", "//Bob", "//Ferdie"}), lConfig.endow);

  EXPECT_THROW(parseDevnode({"--block-ms", "0"}), std::invalid_argument);
  EXPECT_THROW(parseDevnode({"--port"}), std::invalid_argument);
  EXPECT_THROW(parseDevnode({"--dev"}), std::invalid_argument);
}
