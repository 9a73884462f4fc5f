#pragma once

#include <cstdint>
#include <string>

namespace eos_miner {

/// 可挖矿代币选择（命令行 `--mine_type`）。
enum class MineToken {
  kEidos,
  kPow,
};

/// 链上代币身份：合约账户 + 代币符号。
struct TokenIdentity {
  std::string contract;
  std::string symbol;
};

/// 基础币（EOS）的代币身份。
inline TokenIdentity BaseToken() {
  return TokenIdentity{"eosio.token", "EOS"};
}

/// 矿币代币身份：EIDOS -> eidosonecoin，POW -> eosiopowcoin。
inline TokenIdentity MineTokenIdentity(MineToken token) {
  switch (token) {
    case MineToken::kEidos:
      return TokenIdentity{"eidosonecoin", "EIDOS"};
    case MineToken::kPow:
      return TokenIdentity{"eosiopowcoin", "POW"};
  }
  return TokenIdentity{"eidosonecoin", "EIDOS"};
}

inline const char* ToString(MineToken token) {
  switch (token) {
    case MineToken::kEidos:
      return "EIDOS";
    case MineToken::kPow:
      return "POW";
  }
  return "UNKNOWN";
}

/// 账户 CPU 资源快照（单位：微秒）。
struct AccountLimits {
  double used{0.0};
  double max{0.0};
};

/**
 * @brief 单笔微转账动作
 *
 * 对应 `eosio.token::transfer`，授权固定为 `from@active`。
 */
struct TransferAction {
  std::string contract{"eosio.token"};
  std::string from;
  std::string to;
  std::string quantity{"0.0001 EOS"};
  std::string memo;
};

/// 提交策略：引用块回溯、过期窗口与 CPU 上限。
struct SubmitPolicy {
  int blocks_behind{3};
  int expire_seconds{300};
  int max_cpu_usage_ms{0};  // 0 表示不显式限制。
};

/// 提交成功后的回执。
struct SubmitReceipt {
  std::string transaction_id;
  std::int64_t block_num{0};
  std::int64_t cpu_usage_us{0};
};

/// 链端结构化错误：`code-name-what` 三元组。
struct LedgerError {
  std::int64_t code{0};
  std::string name;
  std::string what;

  std::string ToString() const {
    return std::to_string(code) + "-" + name + "-" + what;
  }
};

}  // namespace eos_miner
