#include <boost/asio/error.hpp>

#include "Errors.hpp"

using namespace pythia;

const char *PythiaErrorCategory::name() const noexcept { return "pythia error"; }

std::string PythiaErrorCategory::message(int ev) const {
  switch ((PythiaErrorCode)ev) {
  case PythiaErrorCode::eNoError:
    return "0x0000: eNoError";
  case PythiaErrorCode::eUnspecified:
    return "0x0001: eUnspecified";
  case PythiaErrorCode::eIllformed:
    return "0x0002: eIllformed";
  case PythiaErrorCode::eUnknownCommand:
    return "0x1000: eUnknownCommand";
  case PythiaErrorCode::eNotSubscribed:
    return "0x1001: eNotSubscribed";
  case PythiaErrorCode::eInvalidSignature:
    return "0x2000: eInvalidSignature";
  case PythiaErrorCode::eBadNonce:
    return "0x2001: eBadNonce";
  case PythiaErrorCode::eInsufficientBalance:
    return "0x2002: eInsufficientBalance";
  case PythiaErrorCode::eAlreadyRegistered:
    return "0x2003: eAlreadyRegistered";
  case PythiaErrorCode::eNotRegistered:
    return "0x2004: eNotRegistered";
  case PythiaErrorCode::eUnknownRequest:
    return "0x2005: eUnknownRequest";
  case PythiaErrorCode::eWrongOperator:
    return "0x2006: eWrongOperator";
  case PythiaErrorCode::eAlreadyAnswered:
    return "0x2007: eAlreadyAnswered";
  case PythiaErrorCode::eTransactionDropped:
    return "0x2008: eTransactionDropped";
  case PythiaErrorCode::eRequestTooLarge:
    return "0x2009: eRequestTooLarge";
  case PythiaErrorCode::eProvisionQueryFailed:
    return "0x3000: eProvisionQueryFailed";
  case PythiaErrorCode::eProvisionSubmissionFailed:
    return "0x3001: eProvisionSubmissionFailed";
  case PythiaErrorCode::eProvisionTimeout:
    return "0x3002: eProvisionTimeout";
  case PythiaErrorCode::eProvisionUnfunded:
    return "0x3003: eProvisionUnfunded";
  case PythiaErrorCode::eRegistrationQueryFailed:
    return "0x4000: eRegistrationQueryFailed";
  case PythiaErrorCode::eRegistrationSubmissionFailed:
    return "0x4001: eRegistrationSubmissionFailed";
  case PythiaErrorCode::eRegistrationTimeout:
    return "0x4002: eRegistrationTimeout";
  case PythiaErrorCode::eFeedDisconnected:
    return "0x5000: eFeedDisconnected";
  case PythiaErrorCode::eSubmitRejected:
    return "0x6000: eSubmitRejected";
  case PythiaErrorCode::eSubmitTimeout:
    return "0x6001: eSubmitTimeout";
  case PythiaErrorCode::eSubmitDuplicate:
    return "0x6002: eSubmitDuplicate";
  case PythiaErrorCode::eQueueFull:
    return "0x6003: eQueueFull";
  case PythiaErrorCode::eCannotAnswer:
    return "0x7000: eCannotAnswer";
  }
  return std::string();
}

const PythiaErrorCategory &PythiaErrorCategory::instance() {
  static PythiaErrorCategory sCategory;
  return sCategory;
}

boost::system::error_code PythiaErrorCategory::wrap(PythiaErrorCode pCode) {
  return boost::system::error_code((int)pCode, instance());
}

bool pythia::isError(const boost::system::error_code &pError, PythiaErrorCode pCode) {
  return pError.category() == PythiaErrorCategory::instance() && pError.value() == (int)pCode;
}

bool pythia::isTimeout(const boost::system::error_code &pError) {
  return pError == boost::asio::error::timed_out || pError == boost::system::errc::timed_out;
}
