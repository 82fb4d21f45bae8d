#include "config/network.hpp"

#include <stdexcept>

namespace rootsave::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::string display_name,
                          std::uint64_t chain_id, std::string rpc_url, std::string explorer_url) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.display_name = std::move(display_name);
  cfg.chain_id = chain_id;
  cfg.rpc_url = std::move(rpc_url);
  cfg.explorer_url = std::move(explorer_url);
  return cfg;
}

}  // namespace

const NetworkConfig& NetworkConfigFor(NetworkType type) {
  static const NetworkConfig mainnet =
      BuildConfig(NetworkType::kMainnet, "mainnet", "Rootstock Mainnet", 30,
                  "https://public-node.rsk.co", "https://rootstock.blockscout.com");
  static const NetworkConfig testnet =
      BuildConfig(NetworkType::kTestnet, "testnet", "Rootstock Testnet", 31,
                  "https://public-node.testnet.rsk.co", "https://rootstock-testnet.blockscout.com");
  static const NetworkConfig regtest = BuildConfig(NetworkType::kRegtest, "regtest",
                                                   "Rootstock Regtest", 33,
                                                   "http://127.0.0.1:4444", "");
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kRegtest:
      return regtest;
  }
  return testnet;
}

NetworkType NetworkFromString(std::string_view name) {
  if (name == "mainnet" || name == "main") return NetworkType::kMainnet;
  if (name == "testnet" || name == "test") return NetworkType::kTestnet;
  if (name == "regtest" || name == "reg") return NetworkType::kRegtest;
  throw std::runtime_error("unknown network: " + std::string(name));
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kRegtest:
      return "regtest";
  }
  return "unknown";
}

std::string ExplorerTxUrl(const NetworkConfig& config, std::string_view tx_hash) {
  if (config.explorer_url.empty()) {
    return {};
  }
  return config.explorer_url + "/tx/" + std::string(tx_hash);
}

}  // namespace rootsave::config
