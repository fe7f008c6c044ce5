#pragma once

#include <optional>
#include <string>

namespace autopay::agent {

enum class ErrorKind {
  kParseFailure,
  kWalletLocked,
  kIncorrectPassphrase,
  kInvalidSecret,
  kSigningFailure,
  kSettlementParseFailure,
  kExpiredChallenge,
  kInvalidRequest,
  kStorageFailure,
};

inline const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kParseFailure:
      return "parse_failure";
    case ErrorKind::kWalletLocked:
      return "wallet_locked";
    case ErrorKind::kIncorrectPassphrase:
      return "incorrect_passphrase";
    case ErrorKind::kInvalidSecret:
      return "invalid_secret";
    case ErrorKind::kSigningFailure:
      return "signing_failure";
    case ErrorKind::kSettlementParseFailure:
      return "settlement_parse_failure";
    case ErrorKind::kExpiredChallenge:
      return "expired_challenge";
    case ErrorKind::kInvalidRequest:
      return "invalid_request";
    case ErrorKind::kStorageFailure:
      return "storage_failure";
  }
  return "unknown";
}

}  // namespace autopay::agent
