#include "pati/utils/ErrorHandling.hh"
#include "pati/core/Log.hh"

namespace pati {

PatiException::PatiException(const std::string &message, ErrorCode code)
    : message(message), code_(code) {}

const char *PatiException::what() const noexcept { return message.c_str(); }

ErrorCode PatiException::code() const noexcept { return code_; }

void throwError(const std::string &message) {
  throwError(ErrorCode::Internal, message);
}

void throwError(ErrorCode code, const std::string &message) {
  PATI_LOG_ERROR("PatiException ({}): {}", errorCodeToString(code), message);
  throw PatiException(message, code);
}

std::string describeError(const std::exception_ptr &error) {
  if (!error) {
    return "no error";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::UnhandledError:
    return "UnhandledError";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace pati
