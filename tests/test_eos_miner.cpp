#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "app/mine_orchestrator.h"
#include "control/batch_size_controller.h"
#include "control/dual_ema_estimator.h"
#include "control/utilization_sampler.h"
#include "core/config.h"
#include "core/json_utils.h"
#include "crypto/eos_key.h"
#include "execution/batch_builder.h"
#include "execution/submission_gate.h"
#include "ledger/eos_ledger_client.h"
#include "ledger/eos_rpc_client.h"
#include "ledger/mock_ledger_client.h"
#include "ledger/transaction_packer.h"
#include "pool/endpoint_pool.h"

namespace {

// 覆盖挖矿闭环关键链路：
// - 配置解析、私钥与签名；
// - 交易打包与 nodeos RPC 解析；
// - 双 EMA、批大小控制器、背压闸门与周期编排。
constexpr char kDevPrivateKey[] =
    "5KQwrPbwdL6PhXujxW37FSSQZ1JiwsST4cqQzDeyXtP79zkvFD3";
constexpr char kDevPublicKey[] =
    "EOS6MRyAjQq8ud7hVNYcfnVPJqcVpscN5So8BhtHuGYqET5GDW5CV";
constexpr char kMainnetChainId[] =
    "aca376f206b8fc25a6ed44dbdc66547c36c6c33e3a119ffbeaef943642f0e906";

bool NearlyEqual(double lhs, double rhs, double eps = 1e-9) {
  return std::fabs(lhs - rhs) < eps;
}

class ScopedEnvVar {
 public:
  ScopedEnvVar(std::string key, std::string value) : key_(std::move(key)) {
    const char* existing = std::getenv(key_.c_str());
    if (existing != nullptr) {
      had_old_value_ = true;
      old_value_ = existing;
    }
    setenv(key_.c_str(), value.c_str(), 1);
  }

  ~ScopedEnvVar() {
    if (had_old_value_) {
      setenv(key_.c_str(), old_value_.c_str(), 1);
      return;
    }
    unsetenv(key_.c_str());
  }

 private:
  std::string key_;
  bool had_old_value_{false};
  std::string old_value_;
};

class MockEosHttpTransport final : public eos_miner::EosHttpTransport {
 public:
  void AddRoute(const std::string& path, eos_miner::EosHttpResponse response) {
    routes_[path] = std::move(response);
  }

  eos_miner::EosHttpResponse Post(const std::string& url,
                                  const std::string& body) const override {
    for (const auto& [path, response] : routes_) {
      if (url.size() >= path.size() &&
          url.compare(url.size() - path.size(), path.size(), path) == 0) {
        bodies_[path] = body;
        return response;
      }
    }
    eos_miner::EosHttpResponse miss;
    miss.status_code = 404;
    miss.body = "{}";
    return miss;
  }

  std::string BodyFor(const std::string& path) const {
    const auto it = bodies_.find(path);
    return it == bodies_.end() ? std::string() : it->second;
  }

 private:
  std::map<std::string, eos_miner::EosHttpResponse> routes_;
  mutable std::map<std::string, std::string> bodies_;
};

eos_miner::EosHttpResponse Ok(std::string body) {
  eos_miner::EosHttpResponse response;
  response.status_code = 200;
  response.body = std::move(body);
  return response;
}

// 指定下标的选择策略（允许越界，用于验证池的回绕）。
class FixedSelector final : public eos_miner::EndpointSelector {
 public:
  explicit FixedSelector(std::size_t index) : index_(index) {}
  std::size_t Pick(std::size_t size) override {
    (void)size;
    return index_;
  }

 private:
  std::size_t index_;
};

// 第一次资源查询正常，之后每次都抛异常。
class ThrowingLedgerClient final : public eos_miner::MockLedgerClient {
 public:
  bool GetAccountLimits(const std::string& account,
                        eos_miner::AccountLimits* out_limits,
                        std::string* out_error) override {
    if (limit_queries() > 0) {
      throw std::runtime_error("scripted limits failure");
    }
    return MockLedgerClient::GetAccountLimits(account, out_limits, out_error);
  }
};

// 指定代币的余额查询固定失败，其余行为与 MockLedgerClient 一致。
class BalanceOutageLedgerClient final : public eos_miner::MockLedgerClient {
 public:
  explicit BalanceOutageLedgerClient(std::string failing_symbol)
      : failing_symbol_(std::move(failing_symbol)) {}

  bool GetBalance(const std::string& account,
                  const eos_miner::TokenIdentity& token,
                  double* out_balance,
                  std::string* out_error) override {
    if (token.symbol == failing_symbol_) {
      if (out_error != nullptr) {
        *out_error = "scripted balance outage";
      }
      return false;
    }
    return MockLedgerClient::GetBalance(account, token, out_balance, out_error);
  }

 private:
  std::string failing_symbol_;
};

std::unique_ptr<eos_miner::EndpointPool> MakeSinglePool(
    std::unique_ptr<eos_miner::MockLedgerClient> client,
    eos_miner::MockLedgerClient** out_client) {
  *out_client = client.get();
  std::vector<std::unique_ptr<eos_miner::LedgerClient>> endpoints;
  endpoints.push_back(std::move(client));
  return std::make_unique<eos_miner::EndpointPool>(std::move(endpoints));
}

eos_miner::MinerConfig TestMinerConfig() {
  eos_miner::MinerConfig config;
  config.account = "miner1";
  config.mine_type = "EIDOS";
  config.ledger = "mock";
  config.schedule.funding_wait_ms = 0;
  return config;
}

}  // namespace

int main() {
  {
    eos_miner::JsonValue root;
    std::string error;
    const std::string body =
        R"({"code":500,"error":{"code":3080004,"name":"tx_cpu_usage_exceeded",)"
        R"("what":"Transaction exceeded the current CPU usage limit",)"
        R"("details":[{"message":"billed \u0041"}]},"big":"18446744073709551615"})";
    if (!eos_miner::ParseJson(body, &root, &error)) {
      std::cerr << "预期 nodeos 错误体解析成功: " << error << "\n";
      return 1;
    }
    const auto code =
        eos_miner::JsonAsNumber(eos_miner::JsonFindPath(&root, {"error", "code"}));
    if (!code.has_value() || !NearlyEqual(*code, 3080004.0)) {
      std::cerr << "预期 error.code=3080004\n";
      return 1;
    }
    const auto* detail = eos_miner::JsonArrayAt(
        eos_miner::JsonFindPath(&root, {"error", "details"}), 0);
    const auto message =
        eos_miner::JsonAsString(eos_miner::JsonObjectField(detail, "message"));
    if (!message.has_value() || *message != "billed A") {
      std::cerr << "预期 \\u 转义被解码\n";
      return 1;
    }
    if (!eos_miner::JsonAsNumber(eos_miner::JsonObjectField(&root, "big"))
             .has_value()) {
      std::cerr << "预期字符串形式的大整数可按数值读取\n";
      return 1;
    }
    if (eos_miner::JsonFindPath(&root, {"error", "missing"}) != nullptr) {
      std::cerr << "缺失路径应返回 nullptr\n";
      return 1;
    }
    if (eos_miner::ParseJson("{\"a\":1,}", &root, &error)) {
      std::cerr << "非法 JSON 应解析失败\n";
      return 1;
    }
    if (eos_miner::JsonQuote("a\"b\n") != "\"a\\\"b\\n\"") {
      std::cerr << "JsonQuote 转义结果不符合预期\n";
      return 1;
    }
  }

  {
    const auto config_path =
        std::filesystem::temp_directory_path() / "eos_miner_test_config.yaml";
    {
      std::ofstream out(config_path);
      out << "# 测试配置\n"
          << "miner:\n"
          << "  account: miner1\n"
          << "  mine_type: POW\n"
          << "  num_actions: 64\n"
          << "  ledger: mock\n"
          << "controller:\n"
          << "  max_batch: 128   # 收紧上限\n"
          << "schedule:\n"
          << "  submit_interval_ms: 500\n"
          << "transaction:\n"
          << "  memo: \"hello\"\n"
          << "funding:\n"
          << "  min_base_balance: 0.5\n"
          << "endpoints:\n"
          << "  - https://a.example\n"
          << "  - \"https://b.example\"\n";
    }
    eos_miner::MinerConfig config;
    std::string error;
    if (!eos_miner::LoadMinerConfigFromYaml(config_path.string(), &config,
                                            &error)) {
      std::cerr << "预期 YAML 配置加载成功: " << error << "\n";
      return 1;
    }
    if (config.account != "miner1" || config.mine_type != "POW" ||
        config.num_actions != 64 || config.ledger != "mock") {
      std::cerr << "miner 段解析结果不符合预期\n";
      return 1;
    }
    if (config.controller.max_batch != 128 || config.controller.min_batch != 32 ||
        !NearlyEqual(config.controller.target_rate, 0.95)) {
      std::cerr << "controller 段应覆盖 max_batch 并保留其余默认值\n";
      return 1;
    }
    if (config.schedule.submit_interval_ms != 500 ||
        config.schedule.retune_interval_ms != 30000) {
      std::cerr << "schedule 段解析结果不符合预期\n";
      return 1;
    }
    if (config.transaction.memo != "hello" ||
        !NearlyEqual(config.min_base_balance, 0.5)) {
      std::cerr << "transaction/funding 段解析结果不符合预期\n";
      return 1;
    }
    if (config.endpoints.size() != 2U || config.endpoints[0] != "https://a.example" ||
        config.endpoints[1] != "https://b.example") {
      std::cerr << "endpoints 列表应整体替换默认节点，实际数量 "
                << config.endpoints.size() << "\n";
      return 1;
    }
    if (!eos_miner::ValidateMinerConfig(config, &error)) {
      std::cerr << "mock 账本配置应通过校验: " << error << "\n";
      return 1;
    }

    {
      std::ofstream out(config_path);
      out << "endpoints: [https://x.example, 'https://y.example']\n"
          << "miner:\n"
          << "  num_actions: abc\n";
    }
    eos_miner::MinerConfig broken;
    error.clear();
    if (eos_miner::LoadMinerConfigFromYaml(config_path.string(), &broken,
                                           &error)) {
      std::cerr << "非法整数应导致配置加载失败\n";
      return 1;
    }
    if (error.find("miner.num_actions") == std::string::npos) {
      std::cerr << "错误信息应包含字段路径，实际: " << error << "\n";
      return 1;
    }

    {
      std::ofstream out(config_path);
      out << "endpoints: [https://x.example, 'https://y.example']\n";
    }
    eos_miner::MinerConfig inline_list;
    if (!eos_miner::LoadMinerConfigFromYaml(config_path.string(), &inline_list,
                                            &error) ||
        inline_list.endpoints.size() != 2U ||
        inline_list.endpoints[1] != "https://y.example") {
      std::cerr << "行内 endpoints 列表解析结果不符合预期\n";
      return 1;
    }
    std::filesystem::remove(config_path);

    eos_miner::MinerConfig missing;
    if (eos_miner::LoadMinerConfigFromYaml("/nonexistent/eos_miner.yaml",
                                           &missing, &error)) {
      std::cerr << "不存在的配置文件应加载失败\n";
      return 1;
    }
    if (missing.endpoints.size() != eos_miner::DefaultEndpoints().size()) {
      std::cerr << "默认节点列表应保留\n";
      return 1;
    }
  }

  {
    eos_miner::MinerConfig config;
    config.account = "miner1";
    config.mine_type = "EIDOS";
    std::string error;
    if (eos_miner::ValidateMinerConfig(config, &error)) {
      std::cerr << "eos 账本缺少私钥时应校验失败\n";
      return 1;
    }

    config.private_key_env = "EOS_MINER_TEST_PRIVATE_KEY";
    {
      ScopedEnvVar key_env("EOS_MINER_TEST_PRIVATE_KEY",
                           std::string(kDevPrivateKey) + "\n");
      if (!eos_miner::ResolvePrivateKeyFromEnv(&config, &error)) {
        std::cerr << "预期从环境变量读取私钥成功: " << error << "\n";
        return 1;
      }
    }
    if (config.private_key != kDevPrivateKey) {
      std::cerr << "私钥应去除首尾空白\n";
      return 1;
    }
    if (!eos_miner::ValidateMinerConfig(config, &error)) {
      std::cerr << "合法配置应通过校验: " << error << "\n";
      return 1;
    }

    eos_miner::MinerConfig unset = config;
    unset.private_key_env = "EOS_MINER_TEST_UNSET_KEY";
    if (eos_miner::ResolvePrivateKeyFromEnv(&unset, &error)) {
      std::cerr << "环境变量缺失时应返回失败\n";
      return 1;
    }

    eos_miner::MinerConfig bad_token = config;
    bad_token.mine_type = "BTC";
    if (eos_miner::ValidateMinerConfig(bad_token, &error) ||
        error.find("mine_type") == std::string::npos) {
      std::cerr << "未知矿币应校验失败\n";
      return 1;
    }

    eos_miner::MinerConfig bad_account = config;
    bad_account.account = "Miner1";
    if (eos_miner::ValidateMinerConfig(bad_account, &error)) {
      std::cerr << "大写账户名应校验失败\n";
      return 1;
    }

    eos_miner::MinerConfig no_endpoints = config;
    no_endpoints.endpoints.clear();
    if (eos_miner::ValidateMinerConfig(no_endpoints, &error)) {
      std::cerr << "空节点列表应校验失败\n";
      return 1;
    }

    eos_miner::MinerConfig bad_bounds = config;
    bad_bounds.controller.max_batch = 16;
    if (eos_miner::ValidateMinerConfig(bad_bounds, &error)) {
      std::cerr << "max_batch < min_batch 应校验失败\n";
      return 1;
    }

    eos_miner::MineToken token = eos_miner::MineToken::kEidos;
    if (!eos_miner::ParseMineToken("POW", &token) ||
        token != eos_miner::MineToken::kPow ||
        eos_miner::MineTokenIdentity(token).contract != "eosiopowcoin") {
      std::cerr << "POW 应映射到 eosiopowcoin\n";
      return 1;
    }
    for (const char* text : {"pow", "Pow", "eidos", "Eidos", "EOS"}) {
      token = eos_miner::MineToken::kEidos;
      if (eos_miner::ParseMineToken(text, &token)) {
        std::cerr << "矿币选择应区分大小写，不应接受: " << text << "\n";
        return 1;
      }
    }
    eos_miner::MinerConfig lowercase_token = config;
    lowercase_token.ledger = "mock";
    lowercase_token.mine_type = "POW";
    if (!eos_miner::ValidateMinerConfig(lowercase_token, &error)) {
      std::cerr << "mock 账本下 mine_type=POW 应校验通过: " << error << "\n";
      return 1;
    }
    lowercase_token.mine_type = "pow";
    if (eos_miner::ValidateMinerConfig(lowercase_token, &error)) {
      std::cerr << "小写 mine_type 应校验失败\n";
      return 1;
    }
    if (!eos_miner::IsValidAccountName("eosio.token") ||
        eos_miner::IsValidAccountName("abcdefghijklm") ||
        eos_miner::IsValidAccountName("abc.") ||
        eos_miner::IsValidAccountName("abc6")) {
      std::cerr << "账户名规则判断不符合预期\n";
      return 1;
    }
  }

  {
    std::vector<unsigned char> decoded;
    if (eos_miner::Base58Encode({0, 0, 1}) != "112" ||
        !eos_miner::Base58Decode("112", &decoded) ||
        decoded != std::vector<unsigned char>{0, 0, 1}) {
      std::cerr << "Base58 前导零处理不符合预期\n";
      return 1;
    }
    if (eos_miner::Base58Decode("0OIl", &decoded)) {
      std::cerr << "字母表外字符应解码失败\n";
      return 1;
    }

    if (!eos_miner::IsValidWifPrivateKey(kDevPrivateKey)) {
      std::cerr << "开发私钥应通过 WIF 校验\n";
      return 1;
    }
    if (eos_miner::IsValidWifPrivateKey(
            "5KQwrPbwdL6PhXujxW37FSSQZ1JiwsST4cqQzDeyXtP79zkvFD4")) {
      std::cerr << "校验和错误的私钥应被拒绝\n";
      return 1;
    }
    if (eos_miner::IsValidWifPrivateKey("") ||
        eos_miner::IsValidWifPrivateKey("not-a-key")) {
      std::cerr << "空或非法私钥应被拒绝\n";
      return 1;
    }

    eos_miner::EosSigner signer;
    std::string error;
    if (!eos_miner::EosSigner::FromPrivateKey(kDevPrivateKey, &signer, &error)) {
      std::cerr << "签名器构造失败: " << error << "\n";
      return 1;
    }
    if (signer.public_key() != kDevPublicKey) {
      std::cerr << "公钥派生不符合预期，实际 " << signer.public_key() << "\n";
      return 1;
    }

    eos_miner::Sha256Digest digest{};
    if (!eos_miner::Sha256("eos-miner", &digest)) {
      std::cerr << "SHA-256 计算失败\n";
      return 1;
    }
    for (int round = 0; round < 3; ++round) {
      std::string signature;
      if (!signer.SignDigest(digest, &signature, &error)) {
        std::cerr << "签名失败: " << error << "\n";
        return 1;
      }
      if (signature.rfind("SIG_K1_", 0) != 0) {
        std::cerr << "签名应以 SIG_K1_ 开头: " << signature << "\n";
        return 1;
      }
      std::vector<unsigned char> raw;
      if (!eos_miner::Base58Decode(signature.substr(7), &raw) ||
          raw.size() != 69U) {
        std::cerr << "签名应解码为 65 字节 + 4 字节校验\n";
        return 1;
      }
      if (raw[0] < 31U || raw[0] > 34U) {
        std::cerr << "签名头字节应为 27+4+recid\n";
        return 1;
      }
      // canonical：r/s 首字节不得置最高位，且不得有冗余零字节。
      const bool canonical = (raw[1] & 0x80U) == 0U &&
                             !(raw[1] == 0U && (raw[2] & 0x80U) == 0U) &&
                             (raw[33] & 0x80U) == 0U &&
                             !(raw[33] == 0U && (raw[34] & 0x80U) == 0U);
      if (!canonical) {
        std::cerr << "签名不满足 canonical 约束\n";
        return 1;
      }
    }
  }

  {
    std::uint64_t value = 0;
    if (!eos_miner::EncodeName("eosio.token", &value) ||
        value != 6138663591592764928ULL) {
      std::cerr << "eosio.token 名称编码不符合预期\n";
      return 1;
    }
    if (!eos_miner::EncodeName("eosio", &value) ||
        value != 6138663577826885632ULL) {
      std::cerr << "eosio 名称编码不符合预期\n";
      return 1;
    }
    if (eos_miner::EncodeName("EOSIO", &value) ||
        eos_miner::EncodeName("toolongname12345", &value)) {
      std::cerr << "非法名称应编码失败\n";
      return 1;
    }

    std::string bytes;
    std::string error;
    if (!eos_miner::EncodeAsset("0.0001 EOS", &bytes, &error) ||
        eos_miner::ToHex(bytes) != "010000000000000004454f5300000000") {
      std::cerr << "资产编码不符合预期: " << eos_miner::ToHex(bytes) << "\n";
      return 1;
    }
    if (eos_miner::EncodeAsset("0.0001", &bytes, &error) ||
        eos_miner::EncodeAsset("1.x EOS", &bytes, &error)) {
      std::cerr << "非法资产应编码失败\n";
      return 1;
    }

    std::string roundtrip;
    if (!eos_miner::FromHex("00ff10", &roundtrip) ||
        eos_miner::ToHex(roundtrip) != "00ff10" ||
        eos_miner::FromHex("abc", &roundtrip)) {
      std::cerr << "十六进制编解码不符合预期\n";
      return 1;
    }

    std::int64_t seconds = 0;
    if (!eos_miner::ParseBlockTimestamp("2018-06-01T12:00:00.500", &seconds) ||
        seconds != 1527854400) {
      std::cerr << "区块时间戳解析不符合预期: " << seconds << "\n";
      return 1;
    }
    if (eos_miner::ParseBlockTimestamp("yesterday", &seconds)) {
      std::cerr << "非法时间戳应解析失败\n";
      return 1;
    }

    if (eos_miner::ComputeMaxCpuUsageMs(32, 5, 3) != 10 ||
        eos_miner::ComputeMaxCpuUsageMs(256, 5, 3) != 55 ||
        eos_miner::ComputeMaxCpuUsageMs(5000, 5, 3) != 255) {
      std::cerr << "max_cpu_usage_ms 计算不符合预期\n";
      return 1;
    }

    eos_miner::TransactionHeader header;
    header.expiration = 1527854700;
    header.ref_block_num = 997;
    header.ref_block_prefix = 123456789;
    const std::vector<eos_miner::TransferAction> actions =
        eos_miner::BuildTransferBatch(
            1, "miner1",
            eos_miner::MineTokenIdentity(eos_miner::MineToken::kEidos),
            eos_miner::TransactionConfig{});
    std::string packed;
    if (!eos_miner::PackTransaction(header, actions, &packed, &error)) {
      std::cerr << "交易打包失败: " << error << "\n";
      return 1;
    }
    // 头 13 字节 + cfa 计数 + 动作计数 + 单个动作 67 字节 + 扩展计数。
    if (packed.size() != 83U) {
      std::cerr << "打包长度不符合预期，实际 " << packed.size() << "\n";
      return 1;
    }
    if (eos_miner::ToHex(packed).rfind("6c36115be50315cd5b07", 0) != 0) {
      std::cerr << "交易头字节序不符合预期\n";
      return 1;
    }
  }

  {
    const eos_miner::TransactionConfig config{};
    const auto batch = eos_miner::BuildTransferBatch(
        3, "miner1", eos_miner::MineTokenIdentity(eos_miner::MineToken::kPow),
        config);
    if (batch.size() != 3U || batch[0].contract != "eosio.token" ||
        batch[0].from != "miner1" || batch[0].to != "eosiopowcoin" ||
        batch[0].quantity != "0.0001 EOS") {
      std::cerr << "微转账批构造不符合预期\n";
      return 1;
    }
    if (!eos_miner::BuildTransferBatch(0, "miner1",
                                       eos_miner::BaseToken(), config)
             .empty()) {
      std::cerr << "批大小为 0 时应返回空批\n";
      return 1;
    }
    const eos_miner::SubmitPolicy policy = eos_miner::BuildSubmitPolicy(256, config);
    if (policy.blocks_behind != 3 || policy.expire_seconds != 300 ||
        policy.max_cpu_usage_ms != 55) {
      std::cerr << "提交策略不符合预期\n";
      return 1;
    }
  }

  {
    auto transport = std::make_unique<MockEosHttpTransport>();
    transport->AddRoute(
        "/v1/chain/get_account",
        Ok(R"({"account_name":"miner1","cpu_limit":{"used":250,"available":750,"max":1000}})"));
    transport->AddRoute("/v1/chain/get_currency_balance", Ok("[]"));
    eos_miner::EosHttpResponse rejected;
    rejected.status_code = 500;
    rejected.body =
        R"({"code":500,"message":"Internal Service Error","error":{"code":3080004,)"
        R"("name":"tx_cpu_usage_exceeded","what":"Transaction exceeded the current CPU usage limit imposed on the transaction","details":[]}})";
    transport->AddRoute("/v1/chain/push_transaction", rejected);
    const MockEosHttpTransport* transport_ptr = transport.get();
    eos_miner::EosRpcClient rpc("https://node.example/", std::move(transport));
    if (rpc.base_url() != "https://node.example") {
      std::cerr << "节点地址应去掉结尾斜杠\n";
      return 1;
    }

    eos_miner::AccountLimits limits;
    std::string error;
    if (!rpc.GetAccountLimits("miner1", &limits, &error) ||
        !NearlyEqual(limits.used, 250.0) || !NearlyEqual(limits.max, 1000.0)) {
      std::cerr << "get_account 解析不符合预期: " << error << "\n";
      return 1;
    }
    if (transport_ptr->BodyFor("/v1/chain/get_account") !=
        "{\"account_name\":\"miner1\"}") {
      std::cerr << "get_account 请求体不符合预期\n";
      return 1;
    }

    double balance = -1.0;
    if (!rpc.GetCurrencyBalance("eidosonecoin", "miner1", "EIDOS", &balance,
                                &error) ||
        !NearlyEqual(balance, 0.0)) {
      std::cerr << "空余额数组应视为 0\n";
      return 1;
    }

    eos_miner::SubmitReceipt receipt;
    eos_miner::LedgerError ledger_error;
    if (rpc.PushTransaction("SIG_K1_x", "00", &receipt, &ledger_error)) {
      std::cerr << "500 响应应推送失败\n";
      return 1;
    }
    if (ledger_error.code != 3080004 ||
        ledger_error.name != "tx_cpu_usage_exceeded" ||
        ledger_error.ToString().rfind("3080004-tx_cpu_usage_exceeded-", 0) != 0) {
      std::cerr << "链端错误应按 code-name-what 提取，实际 "
                << ledger_error.ToString() << "\n";
      return 1;
    }

    if (rpc.GetInfo(nullptr, &error)) {
      std::cerr << "GetInfo 空输出指针应失败\n";
      return 1;
    }
    eos_miner::ChainInfo info;
    if (rpc.GetInfo(&info, &error) || error.find("404") == std::string::npos) {
      std::cerr << "未知路由应以 http_error 失败，实际: " << error << "\n";
      return 1;
    }
  }

  {
    auto transport = std::make_unique<MockEosHttpTransport>();
    transport->AddRoute("/v1/chain/get_currency_balance",
                        Ok(R"(["12.3456 EIDOS"])"));
    eos_miner::EosRpcClient rpc("https://node.example", std::move(transport));
    double balance = 0.0;
    std::string error;
    if (!rpc.GetCurrencyBalance("eidosonecoin", "miner1", "EIDOS", &balance,
                                &error) ||
        !NearlyEqual(balance, 12.3456)) {
      std::cerr << "余额解析不符合预期: " << balance << "\n";
      return 1;
    }

    eos_miner::LedgerError parsed;
    if (eos_miner::EosRpcClient::ParseErrorBody("<html>bad gateway</html>",
                                                &parsed)) {
      std::cerr << "非 JSON 错误体应解析失败\n";
      return 1;
    }
  }

  {
    auto transport = std::make_unique<MockEosHttpTransport>();
    eos_miner::EosHttpResponse timeout;
    timeout.error = "curl_easy_perform 失败: Timeout was reached";
    transport->AddRoute("/v1/chain/get_account", timeout);
    eos_miner::EosRpcClient rpc("https://node.example", std::move(transport));
    eos_miner::AccountLimits limits;
    std::string error;
    if (rpc.GetAccountLimits("miner1", &limits, &error) ||
        error.find("transport_error") == std::string::npos) {
      std::cerr << "传输层失败应返回 transport_error，实际: " << error << "\n";
      return 1;
    }
  }

  {
    auto transport = std::make_unique<MockEosHttpTransport>();
    transport->AddRoute(
        "/v1/chain/get_info",
        Ok(std::string(R"({"server_version":"v2","chain_id":")") +
           kMainnetChainId + R"(","head_block_num":1000})"));
    transport->AddRoute(
        "/v1/chain/get_block",
        Ok(R"({"timestamp":"2018-06-01T12:00:00.000","block_num":997,"ref_block_prefix":123456789})"));
    transport->AddRoute(
        "/v1/chain/push_transaction",
        Ok(R"({"transaction_id":"f00d","processed":{"block_num":1001,"receipt":{"status":"executed","cpu_usage_us":420}}})"));
    const MockEosHttpTransport* transport_ptr = transport.get();

    auto signer = std::make_shared<eos_miner::EosSigner>();
    std::string error;
    if (!eos_miner::EosSigner::FromPrivateKey(kDevPrivateKey, signer.get(),
                                              &error)) {
      std::cerr << "签名器构造失败: " << error << "\n";
      return 1;
    }
    eos_miner::EosLedgerClient client(
        std::make_unique<eos_miner::EosRpcClient>("https://node.example",
                                                  std::move(transport)),
        signer);
    if (client.Name() != "https://node.example") {
      std::cerr << "客户端名称应为节点地址\n";
      return 1;
    }

    const auto actions = eos_miner::BuildTransferBatch(
        2, "miner1", eos_miner::MineTokenIdentity(eos_miner::MineToken::kEidos),
        eos_miner::TransactionConfig{});
    const eos_miner::SubmitPolicy policy =
        eos_miner::BuildSubmitPolicy(2, eos_miner::TransactionConfig{});
    eos_miner::SubmitReceipt receipt;
    eos_miner::LedgerError ledger_error;
    if (!client.SubmitBatch(actions, policy, &receipt, &ledger_error)) {
      std::cerr << "预期提交成功: " << ledger_error.ToString() << "\n";
      return 1;
    }
    if (receipt.transaction_id != "f00d" || receipt.block_num != 1001 ||
        receipt.cpu_usage_us != 420) {
      std::cerr << "提交回执解析不符合预期\n";
      return 1;
    }
    if (transport_ptr->BodyFor("/v1/chain/get_block") !=
        "{\"block_num_or_id\":997}") {
      std::cerr << "引用块应回溯 blocks_behind=3 个块\n";
      return 1;
    }
    const std::string push_body =
        transport_ptr->BodyFor("/v1/chain/push_transaction");
    if (push_body.find("\"SIG_K1_") == std::string::npos ||
        push_body.find("\"compression\":\"none\"") == std::string::npos) {
      std::cerr << "推送请求体缺少签名或压缩字段\n";
      return 1;
    }
    const std::string marker = "\"packed_trx\":\"";
    const std::size_t begin = push_body.find(marker);
    if (begin == std::string::npos ||
        push_body.compare(begin + marker.size(), 20, "6c36115be50315cd5b07") != 0) {
      std::cerr << "打包交易头应为 过期时间/引用块号/引用块前缀\n";
      return 1;
    }

    eos_miner::Sha256Digest digest{};
    if (eos_miner::EosLedgerClient::BuildSigningDigest("zz", "", &digest) ||
        !eos_miner::EosLedgerClient::BuildSigningDigest(kMainnetChainId, "",
                                                        &digest)) {
      std::cerr << "签名摘要应校验 chain_id 格式\n";
      return 1;
    }

    if (client.SubmitBatch({}, policy, &receipt, &ledger_error) ||
        ledger_error.name != "empty_batch") {
      std::cerr << "空批应在本地拒绝\n";
      return 1;
    }
  }

  {
    std::vector<std::unique_ptr<eos_miner::LedgerClient>> endpoints;
    for (int i = 0; i < 4; ++i) {
      endpoints.push_back(
          std::make_unique<eos_miner::MockLedgerClient>("n" + std::to_string(i)));
    }
    eos_miner::EndpointPool pool(
        std::move(endpoints),
        std::make_unique<eos_miner::UniformRandomSelector>(42));
    std::map<std::string, int> hits;
    for (int i = 0; i < 4000; ++i) {
      eos_miner::LedgerClient* endpoint = pool.Select();
      if (endpoint == nullptr) {
        std::cerr << "非空池不应返回 nullptr\n";
        return 1;
      }
      ++hits[endpoint->Name()];
    }
    if (hits.size() != 4U) {
      std::cerr << "均匀随机应覆盖所有节点\n";
      return 1;
    }
    for (const auto& [name, count] : hits) {
      if (count < 800 || count > 1200) {
        std::cerr << "节点 " << name << " 命中次数偏离均匀分布: " << count << "\n";
        return 1;
      }
    }
  }

  {
    auto make_names = [](std::uint64_t seed) {
      std::vector<std::unique_ptr<eos_miner::LedgerClient>> endpoints;
      for (int i = 0; i < 5; ++i) {
        endpoints.push_back(
            std::make_unique<eos_miner::MockLedgerClient>("n" + std::to_string(i)));
      }
      eos_miner::EndpointPool pool(
          std::move(endpoints),
          std::make_unique<eos_miner::UniformRandomSelector>(seed));
      std::vector<std::string> names;
      for (int i = 0; i < 32; ++i) {
        names.push_back(pool.Select()->Name());
      }
      return names;
    };
    if (make_names(7) != make_names(7)) {
      std::cerr << "相同种子应得到相同选择序列\n";
      return 1;
    }

    std::vector<std::unique_ptr<eos_miner::LedgerClient>> endpoints;
    for (int i = 0; i < 3; ++i) {
      endpoints.push_back(
          std::make_unique<eos_miner::MockLedgerClient>("n" + std::to_string(i)));
    }
    eos_miner::EndpointPool pool(std::move(endpoints),
                                 std::make_unique<FixedSelector>(7));
    if (pool.Select() != pool.At(1) || pool.At(3) != nullptr) {
      std::cerr << "越界下标应回绕到池内\n";
      return 1;
    }

    eos_miner::EndpointPool empty_pool(
        std::vector<std::unique_ptr<eos_miner::LedgerClient>>{});
    if (!empty_pool.empty() || empty_pool.Select() != nullptr) {
      std::cerr << "空池 Select 应返回 nullptr\n";
      return 1;
    }
    eos_miner::UtilizationSampler sampler("miner1");
    eos_miner::UtilizationReading reading;
    std::string error;
    if (sampler.Sample(&empty_pool, &reading, &error)) {
      std::cerr << "空池采样应失败\n";
      return 1;
    }
  }

  {
    eos_miner::MockLedgerClient* mock = nullptr;
    auto pool = MakeSinglePool(std::make_unique<eos_miner::MockLedgerClient>(),
                               &mock);
    mock->QueueUtilization(0.25);
    eos_miner::UtilizationSampler sampler("miner1");
    eos_miner::UtilizationReading reading;
    std::string error;
    if (!sampler.Sample(pool.get(), &reading, &error) ||
        !NearlyEqual(reading.ratio, 0.25) || reading.endpoint != mock) {
      std::cerr << "采样应返回 used/max 并记录节点\n";
      return 1;
    }
    mock->FailNextLimitQueries(1);
    if (sampler.Sample(pool.get(), &reading, &error) || error.empty()) {
      std::cerr << "资源查询失败时采样应失败\n";
      return 1;
    }

    eos_miner::MockLedgerOptions zero_max;
    zero_max.cpu_max_us = 0.0;
    eos_miner::MockLedgerClient* zero_mock = nullptr;
    auto zero_pool = MakeSinglePool(
        std::make_unique<eos_miner::MockLedgerClient>("zero", zero_max),
        &zero_mock);
    if (sampler.Sample(zero_pool.get(), &reading, &error) ||
        zero_mock->limit_queries() != 1U) {
      std::cerr << "cpu_limit.max <= 0 时采样应失败\n";
      return 1;
    }
  }

  {
    eos_miner::DualEmaEstimator estimator;
    estimator.Seed(0.9);
    const eos_miner::EmaPair ema = estimator.Update(1.0);
    if (!NearlyEqual(ema.fast, 0.95) || !NearlyEqual(ema.slow, 0.9001)) {
      std::cerr << "EMA 更新不符合预期: fast=" << ema.fast
                << ", slow=" << ema.slow << "\n";
      return 1;
    }

    eos_miner::DualEmaEstimator cold;
    if (cold.seeded()) {
      std::cerr << "新估计器不应处于已播种状态\n";
      return 1;
    }
    const eos_miner::EmaPair first = cold.Update(0.6);
    if (!cold.seeded() || !NearlyEqual(first.fast, 0.6) ||
        !NearlyEqual(first.slow, 0.6)) {
      std::cerr << "未播种时首个样本应直接播种而不是与 0 混合\n";
      return 1;
    }
  }

  {
    eos_miner::BatchSizeController controller;
    if (controller.batch_size() != 32) {
      std::cerr << "初始批大小应为最小值 32\n";
      return 1;
    }
    auto adjustment = controller.Retune({0.5, 0.5});
    if (adjustment.decision != eos_miner::BatchDecision::kDoubled ||
        controller.batch_size() != 64) {
      std::cerr << "fast < target 时应翻倍\n";
      return 1;
    }
    controller.Retune({0.5, 0.5});
    controller.Retune({0.5, 0.5});
    controller.Retune({0.5, 0.5});
    if (controller.batch_size() != 256) {
      std::cerr << "翻倍应封顶于 256，实际 " << controller.batch_size() << "\n";
      return 1;
    }

    adjustment = controller.Retune({0.995, 0.97});
    if (adjustment.decision != eos_miner::BatchDecision::kHalved ||
        controller.batch_size() != 128) {
      std::cerr << "fast > red 时应减半\n";
      return 1;
    }

    for (int i = 0; i < 10; ++i) {
      adjustment = controller.Retune({0.97, 0.97});
      if (adjustment.decision != eos_miner::BatchDecision::kUnchanged ||
          controller.batch_size() != 128) {
        std::cerr << "稳定区内快慢 EMA 一致时应保持不变\n";
        return 1;
      }
    }

    adjustment = controller.Retune({0.97, 0.96});
    if (adjustment.decision != eos_miner::BatchDecision::kDecremented ||
        controller.batch_size() != 127) {
      std::cerr << "稳定区内 fast > slow 时应减 1\n";
      return 1;
    }
    adjustment = controller.Retune({0.96, 0.97});
    adjustment = controller.Retune({0.96, 0.97});
    if (adjustment.decision != eos_miner::BatchDecision::kIncremented ||
        controller.batch_size() != 129) {
      std::cerr << "稳定区内 fast < slow 时应加 1\n";
      return 1;
    }
    adjustment = controller.Retune({0.9705, 0.97});
    if (adjustment.decision != eos_miner::BatchDecision::kUnchanged) {
      std::cerr << "偏离未超过 0.1% 时应保持不变\n";
      return 1;
    }

    // 129 -> 65 -> 33 -> 32：向上取整减半并以最小值为下限。
    controller.Retune({0.995, 0.995});
    if (controller.batch_size() != 65) {
      std::cerr << "奇数批减半应向上取整，实际 " << controller.batch_size() << "\n";
      return 1;
    }
    controller.Retune({0.995, 0.995});
    controller.Retune({0.995, 0.995});
    if (controller.batch_size() != 32) {
      std::cerr << "减半应以 32 为下限\n";
      return 1;
    }
    adjustment = controller.Retune({0.97, 0.96});
    if (adjustment.decision != eos_miner::BatchDecision::kUnchanged ||
        controller.batch_size() != 32) {
      std::cerr << "最小批时不应再减 1\n";
      return 1;
    }
  }

  {
    eos_miner::BatchSizeController controller;
    controller.Retune({0.5, 0.5});
    controller.Retune({0.5, 0.5});
    controller.Retune({0.5, 0.5});
    const auto clamp = controller.EmergencyClamp(0.995, {0.7475, 0.5});
    if (clamp.decision != eos_miner::BatchDecision::kClamped ||
        clamp.previous != 256 || controller.batch_size() != 32) {
      std::cerr << "瞬时样本 0.995 应钳制到 32\n";
      return 1;
    }
    controller.Retune({0.5, 0.5});
    if (controller.EmergencyClamp(0.5, {0.5, 0.992}).decision !=
            eos_miner::BatchDecision::kClamped ||
        controller.batch_size() != 32) {
      std::cerr << "slow EMA 越过红线也应钳制\n";
      return 1;
    }
    if (controller.EmergencyClamp(0.98, {0.98, 0.98}).decision !=
        eos_miner::BatchDecision::kUnchanged) {
      std::cerr << "未越过红线时不应钳制\n";
      return 1;
    }
  }

  {
    eos_miner::BatchSizeController controller;
    std::mt19937 rng(20240601);
    std::uniform_real_distribution<double> sample_dist(0.0, 1.2);
    eos_miner::DualEmaEstimator estimator;
    estimator.Seed(sample_dist(rng));
    for (int i = 0; i < 20000; ++i) {
      const double sample = sample_dist(rng);
      const eos_miner::EmaPair ema = estimator.Update(sample);
      controller.EmergencyClamp(sample, ema);
      if (i % 15 == 0) {
        controller.Retune(ema);
      }
      if (i % 97 == 0) {
        controller.Retune({sample_dist(rng), sample_dist(rng)});
      }
      if (controller.batch_size() < 32 || controller.batch_size() > 256) {
        std::cerr << "批大小越界: " << controller.batch_size() << "\n";
        return 1;
      }
    }
  }

  {
    eos_miner::BatchSizeController controller;
    controller.Pin(100);
    if (!controller.pinned() || controller.batch_size() != 100) {
      std::cerr << "固定批大小应生效\n";
      return 1;
    }
    if (controller.Retune({0.5, 0.5}).decision !=
            eos_miner::BatchDecision::kUnchanged ||
        controller.batch_size() != 100) {
      std::cerr << "固定批模式下调参不应改变批大小\n";
      return 1;
    }
    controller.EmergencyClamp(0.995, {0.9, 0.9});
    if (controller.batch_size() != 32) {
      std::cerr << "固定批模式下紧急钳制仍应生效\n";
      return 1;
    }
    if (controller.EmergencyClamp(0.5, {0.7, 0.9}).decision !=
            eos_miner::BatchDecision::kUnchanged ||
        controller.batch_size() != 32 ||
        controller.Retune({0.5, 0.5}).decision !=
            eos_miner::BatchDecision::kUnchanged ||
        controller.batch_size() != 32) {
      std::cerr << "固定批模式下钳制后应保持最小批\n";
      return 1;
    }

    std::ostringstream captured;
    std::streambuf* const original = std::cout.rdbuf(captured.rdbuf());
    eos_miner::BatchSizeController in_range;
    in_range.Pin(64);
    const std::string quiet_log = captured.str();
    eos_miner::BatchSizeController oversized;
    oversized.Pin(1000);
    std::cout.rdbuf(original);
    const std::string clamp_log = captured.str().substr(quiet_log.size());
    if (oversized.batch_size() != 256) {
      std::cerr << "固定批大小应裁剪到上限\n";
      return 1;
    }
    if (!quiet_log.empty()) {
      std::cerr << "区间内的固定批大小不应告警\n";
      return 1;
    }
    if (clamp_log.find("[WARN]") == std::string::npos ||
        clamp_log.find("1000") == std::string::npos ||
        clamp_log.find("256") == std::string::npos) {
      std::cerr << "固定批大小被裁剪时应记录告警: " << clamp_log << "\n";
      return 1;
    }
  }

  {
    eos_miner::MockLedgerClient mock;
    mock.QueueSubmitFailure({3080004, "tx_cpu_usage_exceeded", "billed too much"});
    eos_miner::SubmissionGate gate;
    const auto batch = eos_miner::BuildTransferBatch(
        32, "miner1", eos_miner::MineTokenIdentity(eos_miner::MineToken::kEidos),
        eos_miner::TransactionConfig{});
    const auto policy =
        eos_miner::BuildSubmitPolicy(32, eos_miner::TransactionConfig{});

    auto result = gate.Submit(batch, &mock, policy);
    if (result.outcome != eos_miner::SubmitOutcome::kFailed || !gate.paused() ||
        result.error.code != 3080004 || mock.submit_calls() != 1U) {
      std::cerr << "失败提交应置位暂停标志\n";
      return 1;
    }
    result = gate.Submit(batch, &mock, policy);
    if (result.outcome != eos_miner::SubmitOutcome::kSkipped || gate.paused() ||
        mock.submit_calls() != 1U) {
      std::cerr << "暂停期间应跳过一轮且不发起网络调用\n";
      return 1;
    }
    result = gate.Submit(batch, &mock, policy);
    if (result.outcome != eos_miner::SubmitOutcome::kSubmitted ||
        gate.paused() || mock.submit_calls() != 2U ||
        result.receipt.transaction_id.empty()) {
      std::cerr << "跳过一轮后应恢复提交\n";
      return 1;
    }

    result = gate.Submit(batch, nullptr, policy);
    if (result.outcome != eos_miner::SubmitOutcome::kFailed ||
        result.error.name != "no_endpoint" || !gate.paused()) {
      std::cerr << "无可用节点应视为提交失败\n";
      return 1;
    }
  }

  {
    eos_miner::MockLedgerClient* mock = nullptr;
    auto pool = MakeSinglePool(std::make_unique<eos_miner::MockLedgerClient>(),
                               &mock);
    mock->SetBalance("EOS", 10.0);
    mock->SetBalance("EIDOS", 0.0);
    mock->QueueUtilization(0.5);

    eos_miner::MineOrchestrator orchestrator(
        TestMinerConfig(), eos_miner::MineToken::kEidos, pool.get());
    if (orchestrator.Prime() != eos_miner::StartupStatus::kReady) {
      std::cerr << "余额充足时预热应就绪\n";
      return 1;
    }
    if (!orchestrator.estimator().seeded() ||
        !NearlyEqual(orchestrator.estimator().value().fast, 0.5) ||
        !NearlyEqual(orchestrator.estimator().value().slow, 0.5)) {
      std::cerr << "预热应以首个样本同时播种快慢 EMA\n";
      return 1;
    }

    mock->QueueUtilization(0.5);
    mock->QueueSubmitFailure({3080004, "tx_cpu_usage_exceeded", "billed"});
    if (orchestrator.RunSubmissionTick() != eos_miner::CycleOutcome::kFailed ||
        mock->submit_calls() != 1U) {
      std::cerr << "第一轮应提交失败\n";
      return 1;
    }
    mock->QueueUtilization(0.5);
    if (orchestrator.RunSubmissionTick() != eos_miner::CycleOutcome::kSkipped ||
        mock->submit_calls() != 1U) {
      std::cerr << "失败后的下一轮应跳过\n";
      return 1;
    }
    mock->QueueUtilization(0.5);
    if (orchestrator.RunSubmissionTick() != eos_miner::CycleOutcome::kSubmitted ||
        mock->submit_calls() != 2U) {
      std::cerr << "跳过后的下一轮应恢复提交\n";
      return 1;
    }
    if (mock->last_batch_size() != 32U ||
        mock->last_policy().max_cpu_usage_ms != 10 ||
        mock->last_policy().blocks_behind != 3 ||
        mock->last_policy().expire_seconds != 300 ||
        mock->last_actions().front().to != "eidosonecoin") {
      std::cerr << "提交批与策略不符合预期\n";
      return 1;
    }

    const eos_miner::MineStats& stats = orchestrator.total_stats();
    if (stats.cycles != 3U || stats.submitted != 1U || stats.skipped != 1U ||
        stats.failed != 1U || stats.aborted != 0U) {
      std::cerr << "统计计数不符合预期\n";
      return 1;
    }
    if (!NearlyEqual(stats.mined_total, 0.0032, 1e-9)) {
      std::cerr << "收益统计不符合预期: " << stats.mined_total << "\n";
      return 1;
    }

    const auto adjustment = orchestrator.RunRetuneTick();
    if (adjustment.decision != eos_miner::BatchDecision::kDoubled ||
        orchestrator.controller().batch_size() != 64) {
      std::cerr << "低利用率时调参节拍应翻倍\n";
      return 1;
    }
    const eos_miner::MineStats window = orchestrator.ConsumeWindowStats();
    if (window.cycles != 0U || orchestrator.total_stats().cycles != 3U) {
      std::cerr << "调参节拍应消费窗口统计且保留累计统计\n";
      return 1;
    }

    mock->FailNextLimitQueries(1);
    if (orchestrator.RunSubmissionTick() != eos_miner::CycleOutcome::kAborted ||
        mock->submit_calls() != 2U) {
      std::cerr << "采样失败时应放弃本轮\n";
      return 1;
    }
    mock->QueueUtilization(0.5);
    mock->FailNextBalanceQueries(1);
    if (orchestrator.RunSubmissionTick() != eos_miner::CycleOutcome::kAborted ||
        mock->submit_calls() != 2U ||
        orchestrator.total_stats().aborted != 2U) {
      std::cerr << "提交前余额查询失败时应放弃本轮\n";
      return 1;
    }

    mock->QueueUtilization(0.995);
    if (orchestrator.RunSubmissionTick() != eos_miner::CycleOutcome::kSubmitted ||
        mock->last_batch_size() != 32U ||
        orchestrator.controller().batch_size() != 32 ||
        orchestrator.total_stats().clamps != 1U) {
      std::cerr << "瞬时样本 0.995 应在本轮把批大小钳制到 32\n";
      return 1;
    }
  }

  {
    eos_miner::MockLedgerClient* mock = nullptr;
    auto pool = MakeSinglePool(std::make_unique<eos_miner::MockLedgerClient>(),
                               &mock);
    mock->SetBalance("EOS", 0.0005);
    mock->QueueUtilization(0.3);
    boost::asio::io_context io;
    eos_miner::MineOrchestrator orchestrator(
        TestMinerConfig(), eos_miner::MineToken::kEidos, pool.get());
    if (orchestrator.Start(&io)) {
      std::cerr << "基础币不足时启动应失败\n";
      return 1;
    }
    if (orchestrator.ticks_scheduled() || orchestrator.retune_scheduled() ||
        mock->submit_calls() != 0U) {
      std::cerr << "基础币不足时不应挂载任何节拍\n";
      return 1;
    }

    mock->FailNextBalanceQueries(1);
    if (orchestrator.Prime() != eos_miner::StartupStatus::kQueryFailed) {
      std::cerr << "预热查询失败应返回 kQueryFailed\n";
      return 1;
    }
  }

  {
    eos_miner::MockLedgerClient* mock = nullptr;
    auto pool = MakeSinglePool(std::make_unique<eos_miner::MockLedgerClient>(),
                               &mock);
    mock->SetBalance("EOS", 10.0);
    mock->QueueUtilization(0.3);
    eos_miner::MinerConfig config = TestMinerConfig();
    config.num_actions = 100;
    boost::asio::io_context io;
    eos_miner::MineOrchestrator orchestrator(
        config, eos_miner::MineToken::kPow, pool.get());
    if (!orchestrator.Start(&io)) {
      std::cerr << "固定批模式下启动应成功\n";
      return 1;
    }
    if (!orchestrator.ticks_scheduled() || orchestrator.retune_scheduled()) {
      std::cerr << "固定批模式下不应启用调参节拍\n";
      return 1;
    }
    orchestrator.Stop();

    mock->QueueUtilization(0.3);
    if (orchestrator.RunSubmissionTick() != eos_miner::CycleOutcome::kSubmitted ||
        mock->last_batch_size() != 100U ||
        mock->last_actions().front().to != "eosiopowcoin") {
      std::cerr << "固定批模式应按固定值提交\n";
      return 1;
    }
    mock->QueueUtilization(0.995);
    orchestrator.RunSubmissionTick();
    if (mock->last_batch_size() != 32U) {
      std::cerr << "固定批模式下越过红线仍应钳制\n";
      return 1;
    }
    mock->QueueUtilization(0.3);
    orchestrator.RunSubmissionTick();
    if (mock->last_batch_size() != 32U ||
        orchestrator.controller().batch_size() != 32) {
      std::cerr << "固定批模式下钳制后应保持最小批\n";
      return 1;
    }
  }

  {
    auto outage = std::make_unique<BalanceOutageLedgerClient>("EIDOS");
    outage->SetBalance("EOS", 10.0);
    outage->QueueUtilization(0.4);
    eos_miner::MockLedgerClient* mock = nullptr;
    auto pool = MakeSinglePool(std::move(outage), &mock);
    boost::asio::io_context io;
    eos_miner::MineOrchestrator orchestrator(
        TestMinerConfig(), eos_miner::MineToken::kEidos, pool.get());
    if (!orchestrator.Start(&io)) {
      std::cerr << "矿币余额查询失败不应阻止启动\n";
      return 1;
    }
    if (!orchestrator.ticks_scheduled() || !orchestrator.retune_scheduled()) {
      std::cerr << "矿币余额查询失败时仍应挂载节拍\n";
      return 1;
    }
    if (!orchestrator.estimator().seeded() ||
        !NearlyEqual(orchestrator.estimator().value().fast, 0.4) ||
        !NearlyEqual(orchestrator.estimator().value().slow, 0.4)) {
      std::cerr << "矿币余额查询失败时仍应用首个样本初始化 EMA\n";
      return 1;
    }
    orchestrator.Stop();
  }

  {
    // 配额足够大，利用率始终远低于目标，调参只会翻倍。
    eos_miner::MockLedgerOptions roomy;
    roomy.cpu_max_us = 1e9;
    eos_miner::MockLedgerClient* mock = nullptr;
    auto pool = MakeSinglePool(
        std::make_unique<eos_miner::MockLedgerClient>("mock", roomy), &mock);
    mock->SetBalance("EOS", 10.0);
    mock->SetBalance("EIDOS", 0.0);
    eos_miner::MinerConfig config = TestMinerConfig();
    config.schedule.submit_interval_ms = 10;
    config.schedule.retune_interval_ms = 25;
    boost::asio::io_context io;
    eos_miner::MineOrchestrator orchestrator(
        config, eos_miner::MineToken::kEidos, pool.get());
    if (!orchestrator.Start(&io) || !orchestrator.retune_scheduled()) {
      std::cerr << "定时器驱动场景启动失败\n";
      return 1;
    }
    io.run_for(std::chrono::milliseconds(200));
    orchestrator.Stop();
    if (orchestrator.total_stats().cycles < 2U || mock->submit_calls() < 2U) {
      std::cerr << "定时器应周期驱动提交节拍，实际 cycles="
                << orchestrator.total_stats().cycles << "\n";
      return 1;
    }
    if (orchestrator.controller().batch_size() <= 32) {
      std::cerr << "低利用率下调参节拍应放大批大小\n";
      return 1;
    }
    if (orchestrator.total_stats().mined_total <= 0.0) {
      std::cerr << "成功提交后应统计到收益\n";
      return 1;
    }
  }

  {
    auto client = std::make_unique<ThrowingLedgerClient>();
    client->SetBalance("EOS", 10.0);
    ThrowingLedgerClient* client_ptr = client.get();
    std::vector<std::unique_ptr<eos_miner::LedgerClient>> endpoints;
    endpoints.push_back(std::move(client));
    eos_miner::EndpointPool pool(std::move(endpoints));

    eos_miner::MinerConfig config = TestMinerConfig();
    config.schedule.submit_interval_ms = 10;
    boost::asio::io_context io;
    eos_miner::MineOrchestrator orchestrator(
        config, eos_miner::MineToken::kEidos, &pool);
    if (!orchestrator.Start(&io)) {
      std::cerr << "异常隔离场景启动失败\n";
      return 1;
    }
    io.run_for(std::chrono::milliseconds(150));
    orchestrator.Stop();
    if (orchestrator.total_stats().cycles < 2U ||
        client_ptr->submit_calls() != 0U) {
      std::cerr << "节拍内异常应被捕获且不影响后续节拍\n";
      return 1;
    }
  }

  std::cout << "test_eos_miner: all checks passed\n";
  return 0;
}
