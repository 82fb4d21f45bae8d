#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rootsave::config {

enum class NetworkType {
  kMainnet,
  kTestnet,
  kRegtest,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kTestnet};
  std::string network_id{"testnet"};
  std::string display_name{"Rootstock Testnet"};
  std::uint64_t chain_id{31};
  std::string rpc_url{"https://public-node.testnet.rsk.co"};
  // Empty when the network has no public explorer.
  std::string explorer_url{"https://rootstock-testnet.blockscout.com"};
  std::string currency_symbol{"RBTC"};
  unsigned currency_decimals{18};
  // Fixed gas price in wei used for every intent.
  std::uint64_t gas_price{65'000'000};
};

const NetworkConfig& NetworkConfigFor(NetworkType type);

// Accepts mainnet/main, testnet/test, regtest/reg. Throws std::runtime_error
// for anything else.
NetworkType NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

// Explorer link for a transaction, or empty when the network has none.
std::string ExplorerTxUrl(const NetworkConfig& config, std::string_view tx_hash);

}  // namespace rootsave::config
