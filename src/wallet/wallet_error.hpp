#pragma once

#include <string>

namespace rootsave::wallet {

enum class WalletErrorCode {
  kNone = 0,
  kVaultUnavailable,
  kAuthenticationCancelled,
  kAuthenticationFailed,
  kNotFound,
  kInvalidPhrase,
  kEntropyError,
  kInvalidKeyMaterial,
  kNotUnlocked,
  kOperationInProgress,
  kInvalidAmount,
  kNothingToWithdraw,
  kChainTransportError,
  kChainRevertError,
  kEntryNotFound,
  kInvalidStatusTransition,
  kStorageError,
  kWalletExists,
};

// `message` holds detail for logs; user-facing text comes from DescribeError.
struct WalletError {
  WalletErrorCode code{WalletErrorCode::kNone};
  std::string message;
};

inline constexpr char kVaultUnavailableGuidance[] =
    "Unable to securely store your wallet. Please ensure your device has screen lock, PIN, "
    "or biometric authentication enabled in settings.";

// Stable identifier, e.g. "ChainTransportError".
const char* WalletErrorCodeName(WalletErrorCode code);

// Short human-readable classification suitable for display.
std::string DescribeError(const WalletError& error);

// Writes {code, message} into `out` when it is non-null; returns false so
// call sites can `return Fail(...)`.
bool SetWalletError(WalletError* out, WalletErrorCode code, std::string message);

}  // namespace rootsave::wallet
