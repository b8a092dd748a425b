#include "tinybook/core/errors.hpp"

namespace tinybook::core {

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::DomainMismatch: return "DomainMismatch";
    case ErrorCode::TokenAlreadyConsumed: return "TokenAlreadyConsumed";
    case ErrorCode::UnknownToken: return "UnknownToken";
    case ErrorCode::ExhaustedBatch: return "ExhaustedBatch";
    case ErrorCode::RoleMismatch: return "RoleMismatch";
    case ErrorCode::UnpairedTokens: return "UnpairedTokens";
    case ErrorCode::InstanceAlreadyUsed: return "InstanceAlreadyUsed";
    case ErrorCode::InstanceRetired: return "InstanceRetired";
    case ErrorCode::InconsistentMaskSets: return "InconsistentMaskSets";
    case ErrorCode::IncompleteShares: return "IncompleteShares";
    case ErrorCode::MalformedShares: return "MalformedShares";
    case ErrorCode::PriceOutOfRange: return "PriceOutOfRange";
  }
  return "Unknown";
}

}  // namespace tinybook::core
