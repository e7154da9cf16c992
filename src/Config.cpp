#include <charconv>
#include <cstdlib>
#include <limits>

#include "Config.hpp"

using namespace pythia;

namespace {

const char *nextArg(int argc, const char *const *argv, int &i) {
  if (i + 1 >= argc)
    throw std::invalid_argument(std::string("missing value for ") + argv[i]);
  return argv[++i];
}

template <typename T> T parseNumber(const char *pFlag, std::string_view pValue, T pMin = 0) {
  T lResult = 0;
  auto lEnd = pValue.data() + pValue.size();
  auto lParsed = std::from_chars(pValue.data(), lEnd, lResult);
  if (pValue.empty() || lParsed.ec != std::errc() || lParsed.ptr != lEnd || lResult < pMin)
    throw std::invalid_argument(std::string("bad value for ") + pFlag + ": " + std::string(pValue));
  return lResult;
}

} // namespace

Config pythia::parseConfig(int argc, const char *const *argv) {
  Config lResult;

  for (int i = 1; i < argc; i++) {
    const char *lArg = argv[i];
    if (strcmp("--help", lArg) == 0) {
      lResult.help = true;
    } else if (strcmp("--version", lArg) == 0) {
      lResult.version = true;
    } else if (strcmp("--db", lArg) == 0) {
      lResult.db = nextArg(argc, argv, i);
    } else if (strcmp("--dev", lArg) == 0) {
      lResult.dev = true;
    } else if (strcmp("--node", lArg) == 0) {
      std::string_view lNode = nextArg(argc, argv, i);
      auto lColon = lNode.rfind(':');
      if (lColon == std::string_view::npos || lColon == 0)
        throw std::invalid_argument("--node expects <addr:port>, got " + std::string(lNode));
      lResult.nodeHost = std::string(lNode.substr(0, lColon));
      // [::1]:9944
      if (lResult.nodeHost.size() > 2 && lResult.nodeHost.front() == '[' && lResult.nodeHost.back() == ']')
        lResult.nodeHost = lResult.nodeHost.substr(1, lResult.nodeHost.size() - 2);
      lResult.nodePort = parseNumber<u16>("--node", lNode.substr(lColon + 1), 1);
    } else if (strcmp("--node-key", lArg) == 0) {
      u256 lKey;
      const char *lHex = nextArg(argc, argv, i);
      if (!parseHex(lKey.view(), lHex))
        throw std::invalid_argument("--node-key expects 32 bytes of hex, got " + std::string(lHex));
      lResult.nodeKey = lKey;
    } else if (strcmp("--funder-secret", lArg) == 0) {
      lResult.funderSecret = nextArg(argc, argv, i);
    } else if (strcmp("--funding-amount", lArg) == 0) {
      lResult.fundingAmount = parseNumber<Balance>(lArg, nextArg(argc, argv, i), 1);
    } else if (strcmp("--bound", lArg) == 0) {
      lResult.bound = parseNumber<u32>(lArg, nextArg(argc, argv, i), 1);
    } else if (strcmp("--any-operator", lArg) == 0) {
      lResult.anyOperator = true;
    } else if (strcmp("--exit-after", lArg) == 0) {
      lResult.exitAfter = parseNumber<u64>(lArg, nextArg(argc, argv, i));
    } else if (strcmp("--finality-timeout", lArg) == 0) {
      lResult.finalityTimeout = parseNumber<u32>(lArg, nextArg(argc, argv, i), 1);
    } else if (strcmp("--attempts", lArg) == 0) {
      lResult.attempts = parseNumber<u32>(lArg, nextArg(argc, argv, i), 1);
    } else if (strcmp("--queue", lArg) == 0) {
      lResult.queue = parseNumber<size_t>(lArg, nextArg(argc, argv, i), 1);
    } else if (strcmp("--demo-request", lArg) == 0) {
      lResult.demoRequest = true;
    } else if (strcmp("--sql-trace", lArg) == 0) {
      lResult.sqlTrace = true;
    } else {
      throw std::invalid_argument(std::string("unknown argument: ") + lArg);
    }
  }

  if (lResult.help || lResult.version)
    return lResult;

  if (!lResult.funderSecret) {
    const char *lEnv = std::getenv("PYTHIA_FUNDER_SECRET");
    if (lEnv && *lEnv)
      lResult.funderSecret = std::string(lEnv);
  }

  if (lResult.db.empty())
    throw std::invalid_argument("--db is required");
  if (!lResult.dev && !lResult.nodeKey)
    throw std::invalid_argument("--node-key is required unless --dev is given");
  return lResult;
}

DevnodeConfig pythia::parseDevnodeConfig(int argc, const char *const *argv) {
  DevnodeConfig lResult;

  for (int i = 1; i < argc; i++) {
    const char *lArg = argv[i];
    if (strcmp("--help", lArg) == 0) {
      lResult.help = true;
    } else if (strcmp("--port", lArg) == 0) {
      lResult.port = parseNumber<u16>(lArg, nextArg(argc, argv, i));
    } else if (strcmp("--block-ms", lArg) == 0) {
      lResult.blockMs = parseNumber<u32>(lArg, nextArg(argc, argv, i), 1);
    } else if (strcmp("--finality-depth", lArg) == 0) {
      lResult.finalityDepth = parseNumber<u64>(lArg, nextArg(argc, argv, i));
    } else if (strcmp("--endow", lArg) == 0) {
      lResult.endow.emplace_back(nextArg(argc, argv, i));
    } else {
      throw std::invalid_argument(std::string("unknown argument: ") + lArg);
    }
  }
  return lResult;
}
