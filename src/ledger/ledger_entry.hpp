#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

#include "primitives/amount.hpp"

namespace rootsave::ledger {

enum class EntryKind {
  kDeposit,
  kWithdraw,
  kYieldCredit,
};

enum class EntryStatus {
  kPending,
  kCompleted,
  kFailed,
};

// Which entries a stats fold counts. kAll matches what the wallet has
// always reported: failed deposits still count toward the totals.
enum class StatusFilter {
  kAll,
  kExcludeFailed,
  kCompletedOnly,
};

const char* EntryKindName(EntryKind kind);
std::optional<EntryKind> ParseEntryKind(std::string_view name);
const char* EntryStatusName(EntryStatus status);
std::optional<EntryStatus> ParseEntryStatus(std::string_view name);
std::optional<StatusFilter> ParseStatusFilter(std::string_view name);

inline bool IsTerminal(EntryStatus status) { return status != EntryStatus::kPending; }
bool PassesFilter(EntryStatus status, StatusFilter filter);

struct LedgerEntry {
  std::string id;
  std::string address;
  EntryKind kind{EntryKind::kDeposit};
  primitives::Amount amount{0};
  std::uint64_t usd_cents{0};  // USD value at recording time
  std::int64_t created_at_ms{0};
  EntryStatus status{EntryStatus::kPending};
  std::optional<std::string> tx_hash;
  std::optional<std::uint64_t> block_number;
  std::optional<std::uint64_t> gas_used;
  std::string notes;
  // Authoritative contract yield when a yield credit was recorded; the next
  // credit is measured against it.
  std::optional<primitives::Amount> observed_yield;
};

struct LedgerStats {
  primitives::Amount total_deposits{0};
  primitives::Amount total_withdrawals{0};
  primitives::Amount total_yield_earned{0};
  std::size_t count{0};
};

// Amounts are stored as RBTC decimal strings, the USD value as "1234.56".
nlohmann::json EntryToJson(const LedgerEntry& entry);
bool EntryFromJson(const nlohmann::json& j, LedgerEntry* out, std::string* error = nullptr);
nlohmann::json StatsToJson(const LedgerStats& stats);

}  // namespace rootsave::ledger
