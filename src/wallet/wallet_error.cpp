#include "wallet/wallet_error.hpp"

#include <utility>

namespace rootsave::wallet {

const char* WalletErrorCodeName(WalletErrorCode code) {
  switch (code) {
    case WalletErrorCode::kNone:
      return "None";
    case WalletErrorCode::kVaultUnavailable:
      return "VaultUnavailable";
    case WalletErrorCode::kAuthenticationCancelled:
      return "AuthenticationCancelled";
    case WalletErrorCode::kAuthenticationFailed:
      return "AuthenticationFailed";
    case WalletErrorCode::kNotFound:
      return "NotFound";
    case WalletErrorCode::kInvalidPhrase:
      return "InvalidPhrase";
    case WalletErrorCode::kEntropyError:
      return "EntropyError";
    case WalletErrorCode::kInvalidKeyMaterial:
      return "InvalidKeyMaterial";
    case WalletErrorCode::kNotUnlocked:
      return "NotUnlocked";
    case WalletErrorCode::kOperationInProgress:
      return "OperationInProgress";
    case WalletErrorCode::kInvalidAmount:
      return "InvalidAmount";
    case WalletErrorCode::kNothingToWithdraw:
      return "NothingToWithdraw";
    case WalletErrorCode::kChainTransportError:
      return "ChainTransportError";
    case WalletErrorCode::kChainRevertError:
      return "ChainRevertError";
    case WalletErrorCode::kEntryNotFound:
      return "EntryNotFound";
    case WalletErrorCode::kInvalidStatusTransition:
      return "InvalidStatusTransition";
    case WalletErrorCode::kStorageError:
      return "StorageError";
    case WalletErrorCode::kWalletExists:
      return "WalletExists";
  }
  return "Unknown";
}

std::string DescribeError(const WalletError& error) {
  switch (error.code) {
    case WalletErrorCode::kNone:
      return "No error";
    case WalletErrorCode::kVaultUnavailable:
      return kVaultUnavailableGuidance;
    case WalletErrorCode::kAuthenticationCancelled:
      return "Authentication was cancelled";
    case WalletErrorCode::kAuthenticationFailed:
      return "Authentication failed. Please try again";
    case WalletErrorCode::kNotFound:
      return "No wallet found on this device";
    case WalletErrorCode::kInvalidPhrase:
      return "Invalid recovery phrase. Please check the words and try again";
    case WalletErrorCode::kEntropyError:
      return "Secure random number generation is unavailable on this device";
    case WalletErrorCode::kInvalidKeyMaterial:
      return "Stored wallet data is invalid";
    case WalletErrorCode::kNotUnlocked:
      return "Wallet is locked. Unlock it to continue";
    case WalletErrorCode::kOperationInProgress:
      return "Another transaction is already in progress";
    case WalletErrorCode::kInvalidAmount:
      return error.message.empty() ? "Invalid amount" : "Invalid amount: " + error.message;
    case WalletErrorCode::kNothingToWithdraw:
      return "There is nothing to withdraw";
    case WalletErrorCode::kChainTransportError:
      return "Network error. Please check your connection and try again";
    case WalletErrorCode::kChainRevertError:
      return error.message.empty() ? "The savings contract rejected the transaction"
                                   : "Transaction rejected: " + error.message;
    case WalletErrorCode::kEntryNotFound:
      return "Transaction record not found";
    case WalletErrorCode::kInvalidStatusTransition:
      return "Transaction record is already final";
    case WalletErrorCode::kStorageError:
      return "Unable to save wallet data on this device";
    case WalletErrorCode::kWalletExists:
      return "A wallet already exists on this device";
  }
  return "Unknown error";
}

bool SetWalletError(WalletError* out, WalletErrorCode code, std::string message) {
  if (out) {
    out->code = code;
    out->message = std::move(message);
  }
  return false;
}

}  // namespace rootsave::wallet
