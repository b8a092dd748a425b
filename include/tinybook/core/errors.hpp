#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tinybook::core {

// Protocol-contract violations. None of these are transient; callers decide
// whether to request fresh material and start over.
enum class ErrorCode : uint8_t {
  DomainMismatch = 0,
  TokenAlreadyConsumed = 1,
  UnknownToken = 2,
  ExhaustedBatch = 3,
  RoleMismatch = 4,
  UnpairedTokens = 5,
  InstanceAlreadyUsed = 6,
  InstanceRetired = 7,
  InconsistentMaskSets = 8,
  IncompleteShares = 9,
  MalformedShares = 10,
  PriceOutOfRange = 11,
};

const char* error_code_name(ErrorCode code);

class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(ErrorCode code, const std::string& what)
      : std::runtime_error(std::string(error_code_name(code)) + ": " + what), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace tinybook::core
