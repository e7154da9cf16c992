#pragma once

#include <functional>

#include "gtest/gtest.h"

#include "LocalChain.hpp"

/** Manual development chain (blocks are produced by the test) driven by a shared io_service. */
class PythiaChainTest : public ::testing::Test {
protected:
  pythia::net::io_service service;
  pythia::LocalChain chain;
  pythia::keypairs_t alice, bob;

  static constexpr pythia::Balance sEndowment = 1000000000000;

  static pythia::LocalChain::Options manualOptions();

  /** Runs handlers until a slice of pSlice handles nothing. */
  void process(std::chrono::milliseconds pSlice = std::chrono::milliseconds(10));

  /** Produces blocks until pDone holds, processing handlers in between. @return pDone() */
  bool runUntil(const std::function<bool()> &pDone, size_t pMaxBlocks = 50);
  void produceBlocks(size_t pCount);

  /** Registers pOperator, waits for finality. */
  void registerOperator(const pythia::keypairs_t &pOperator);

  /** Alice asks pOperator, the request is in the next block. */
  void sendRequest(const pythia::Address &pOperator, pythia::Balance pFee = 100);

  /** Unique in-memory database URI */
  static std::string memoryDb();

public:
  PythiaChainTest();
  ~PythiaChainTest() override = default;
};
