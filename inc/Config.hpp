#pragma once

#include "Provisioner.hpp"
#include "Resolver.hpp"

namespace pythia {

constexpr u16 sDefaultNodePort = 9944;

struct Config {
  std::string db;
  bool dev = false;
  std::string nodeHost = "127.0.0.1";
  u16 nodePort = sDefaultNodePort;
  std::optional<u256> nodeKey;
  std::optional<std::string> funderSecret;
  Balance fundingAmount = sDefaultProvisioningAmount;
  u32 bound = RandomResolver::sDefaultBound;
  bool anyOperator = false;
  u64 exitAfter = 0;
  u32 finalityTimeout = 60; // seconds
  u32 attempts = 3;
  size_t queue = 1024;
  bool demoRequest = false;
  bool sqlTrace = false;

  bool help = false;
  bool version = false;
};

/** Parses the operator command line, PYTHIA_FUNDER_SECRET stands in for a missing --funder-secret.
 * Throws std::invalid_argument on unknown flags, missing or malformed values. */
Config parseConfig(int argc, const char *const *argv);

struct DevnodeConfig {
  u16 port = sDefaultNodePort;
  u32 blockMs = 100;
  u64 finalityDepth = 2;
  std::vector<std::string> endow{"//Alice", "//Bob"};

  bool help = false;
};

DevnodeConfig parseDevnodeConfig(int argc, const char *const *argv);

} // namespace pythia
