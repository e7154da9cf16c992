#pragma once

#include <string>

#include <boost/system/error_code.hpp>

namespace pythia {

enum class PythiaErrorCode {
  eNoError = 0x0,
  eUnspecified = 0x1,
  eIllformed = 0x2,

  eUnknownCommand = 0x1000,
  eNotSubscribed = 0x1001,

  eInvalidSignature = 0x2000,
  eBadNonce = 0x2001,
  eInsufficientBalance = 0x2002,
  eAlreadyRegistered = 0x2003,
  eNotRegistered = 0x2004,
  eUnknownRequest = 0x2005,
  eWrongOperator = 0x2006,
  eAlreadyAnswered = 0x2007,
  eTransactionDropped = 0x2008,
  eRequestTooLarge = 0x2009,

  eProvisionQueryFailed = 0x3000,
  eProvisionSubmissionFailed = 0x3001,
  eProvisionTimeout = 0x3002,
  eProvisionUnfunded = 0x3003,

  eRegistrationQueryFailed = 0x4000,
  eRegistrationSubmissionFailed = 0x4001,
  eRegistrationTimeout = 0x4002,

  eFeedDisconnected = 0x5000,

  eSubmitRejected = 0x6000,
  eSubmitTimeout = 0x6001,
  eSubmitDuplicate = 0x6002,
  eQueueFull = 0x6003,

  eCannotAnswer = 0x7000,
};

struct PythiaErrorCategory : boost::system::error_category {
  const char *name() const noexcept override;
  std::string message(int ev) const override;
  static const PythiaErrorCategory &instance();
  static boost::system::error_code wrap(PythiaErrorCode pCode);
};

/** @return true if pError is pCode of the pythia category */
bool isError(const boost::system::error_code &pError, PythiaErrorCode pCode);

/** Deadline expiry from a reply or finality wait, callers may retry. */
bool isTimeout(const boost::system::error_code &pError);

} // namespace pythia
