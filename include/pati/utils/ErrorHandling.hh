#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

namespace pati {

enum class ErrorCode : uint16_t {
  Ok = 0,
  InvalidArgument,
  InvalidState,
  Cancelled,
  Timeout,
  UnhandledError,
  Internal
};

std::string_view errorCodeToString(ErrorCode code);

/**
 * @brief Exception type raised by Pati for contract violations and for
 * failures synthesized on behalf of the caller (e.g. an empty cancel).
 */
class PatiException : public std::exception {
public:
  explicit PatiException(const std::string &message,
                         ErrorCode code = ErrorCode::Internal);
  const char *what() const noexcept override;
  ErrorCode code() const noexcept;

private:
  std::string message;
  ErrorCode code_;
};

[[noreturn]] void throwError(const std::string &message);
[[noreturn]] void throwError(ErrorCode code, const std::string &message);

// Best-effort description of a stored exception, for logging.
std::string describeError(const std::exception_ptr &error);

} // namespace pati
