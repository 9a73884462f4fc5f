#include <csignal>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "app/mine_orchestrator.h"
#include "core/config.h"
#include "core/log.h"
#include "crypto/eos_key.h"
#include "ledger/eos_ledger_client.h"
#include "ledger/eos_rpc_client.h"
#include "ledger/mock_ledger_client.h"
#include "pool/endpoint_pool.h"

namespace {

struct RuntimeOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> account;
  std::optional<std::string> mine_type;
  std::optional<int> num_actions;
  std::optional<std::string> ledger;
  std::optional<std::string> private_key_env;
};

bool ParseNonNegativeInt(const std::string& raw, int* out_value) {
  if (out_value == nullptr || raw.empty()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(raw, &consumed);
    if (consumed != raw.size() || parsed < 0) {
      return false;
    }
    *out_value = parsed;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

// 同时支持 `--key=value` 与 `--key value` 两种写法。
bool MatchOption(const std::string& name, int argc, char** argv, int* index,
                 std::string* out_value) {
  const std::string arg = argv[*index];
  const std::string prefix = "--" + name + "=";
  if (arg.rfind(prefix, 0) == 0) {
    *out_value = arg.substr(prefix.size());
    return true;
  }
  if (arg == "--" + name && *index + 1 < argc) {
    ++(*index);
    *out_value = argv[*index];
    return true;
  }
  return false;
}

bool ParseOptions(int argc, char** argv, RuntimeOptions* out_options,
                  std::string* out_error) {
  RuntimeOptions options;
  for (int i = 1; i < argc; ++i) {
    std::string value;
    if (MatchOption("config", argc, argv, &i, &value)) {
      options.config_path = value;
    } else if (MatchOption("account", argc, argv, &i, &value)) {
      options.account = value;
    } else if (MatchOption("mine_type", argc, argv, &i, &value)) {
      options.mine_type = value;
    } else if (MatchOption("num_actions", argc, argv, &i, &value)) {
      int parsed = 0;
      if (!ParseNonNegativeInt(value, &parsed)) {
        *out_error = "--num_actions 参数非法: " + value;
        return false;
      }
      options.num_actions = parsed;
    } else if (MatchOption("ledger", argc, argv, &i, &value)) {
      options.ledger = value;
    } else if (MatchOption("private_key_env", argc, argv, &i, &value)) {
      options.private_key_env = value;
    } else {
      eos_miner::LogInfo(std::string("未知参数，已忽略: ") + argv[i]);
    }
  }
  *out_options = std::move(options);
  return true;
}

std::unique_ptr<eos_miner::EndpointPool> BuildPool(
    const eos_miner::MinerConfig& config,
    eos_miner::MineToken token,
    std::shared_ptr<const eos_miner::EosSigner> signer) {
  std::vector<std::unique_ptr<eos_miner::LedgerClient>> endpoints;
  if (config.ledger == "mock") {
    auto mock = std::make_unique<eos_miner::MockLedgerClient>("mock");
    mock->SetBalance(eos_miner::BaseToken().symbol, 10.0);
    mock->SetBalance(eos_miner::MineTokenIdentity(token).symbol, 0.0);
    endpoints.push_back(std::move(mock));
  } else {
    endpoints.reserve(config.endpoints.size());
    for (const auto& url : config.endpoints) {
      auto rpc = std::make_unique<eos_miner::EosRpcClient>(
          url, std::make_unique<eos_miner::CurlEosHttpTransport>(config.http));
      endpoints.push_back(
          std::make_unique<eos_miner::EosLedgerClient>(std::move(rpc), signer));
    }
  }
  return std::make_unique<eos_miner::EndpointPool>(std::move(endpoints));
}

}  // namespace

int main(int argc, char** argv) {
  RuntimeOptions options;
  std::string error;
  if (!ParseOptions(argc, argv, &options, &error)) {
    eos_miner::LogError(error);
    return 1;
  }

  eos_miner::MinerConfig config;
  if (options.config_path.has_value() &&
      !eos_miner::LoadMinerConfigFromYaml(*options.config_path, &config,
                                          &error)) {
    eos_miner::LogError("配置加载失败: " + error);
    return 1;
  }
  if (options.account.has_value()) {
    config.account = *options.account;
  }
  if (options.mine_type.has_value()) {
    config.mine_type = *options.mine_type;
  }
  if (options.num_actions.has_value()) {
    config.num_actions = *options.num_actions;
  }
  if (options.ledger.has_value()) {
    config.ledger = *options.ledger;
  }
  if (options.private_key_env.has_value()) {
    config.private_key_env = *options.private_key_env;
  }

  if (config.ledger != "mock" &&
      !eos_miner::ResolvePrivateKeyFromEnv(&config, &error)) {
    eos_miner::LogError("配置错误: " + error);
    return 1;
  }
  if (!eos_miner::ValidateMinerConfig(config, &error)) {
    eos_miner::LogError("配置错误: " + error);
    return 1;
  }
  eos_miner::MineToken token = eos_miner::MineToken::kEidos;
  if (!eos_miner::ParseMineToken(config.mine_type, &token)) {
    eos_miner::LogError("配置错误: mine_type 非法");
    return 1;
  }

  std::shared_ptr<const eos_miner::EosSigner> signer;
  if (config.ledger != "mock") {
    auto loaded = std::make_shared<eos_miner::EosSigner>();
    if (!eos_miner::EosSigner::FromPrivateKey(config.private_key, loaded.get(),
                                              &error)) {
      eos_miner::LogError("私钥加载失败: " + error);
      return 1;
    }
    eos_miner::LogInfo("签名公钥: " + loaded->public_key());
    signer = std::move(loaded);
  }

  eos_miner::LogInfo(std::string(eos_miner::ToString(token)) +
                     " Miner 启动: account=" + config.account +
                     ", ledger=" + config.ledger +
                     ", num_actions=" + std::to_string(config.num_actions) +
                     ", controller={target:" +
                     std::to_string(config.controller.target_rate) +
                     ", red:" + std::to_string(config.controller.red_rate) +
                     ", batch:[" + std::to_string(config.controller.min_batch) +
                     "," + std::to_string(config.controller.max_batch) + "]}" +
                     ", endpoints=" + std::to_string(config.endpoints.size()));

  std::unique_ptr<eos_miner::EndpointPool> pool = BuildPool(config, token, signer);
  boost::asio::io_context io;
  eos_miner::MineOrchestrator orchestrator(config, token, pool.get());
  if (!orchestrator.Start(&io)) {
    return 0;
  }

  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    eos_miner::LogInfo("收到信号 " + std::to_string(signal_number) + "，停止挖矿");
    orchestrator.Stop();
    io.stop();
  });

  io.run();
  return 0;
}
