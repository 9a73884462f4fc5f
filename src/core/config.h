#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace eos_miner {

/// 批大小控制器参数：阈值、边界与双 EMA 衰减系数。
struct ControllerConfig {
  double target_rate{0.95};  ///< 期望 CPU 利用率，低于该值翻倍。
  double red_rate{0.99};  ///< 红线利用率，高于该值减半/紧急钳制。
  int min_batch{32};
  int max_batch{256};
  double fast_decay{0.5};  ///< 快 EMA 衰减，约 2 个样本半衰。
  double slow_decay{0.999};  ///< 慢 EMA 衰减，约 693 个样本半衰。
  // 稳定区内快慢 EMA 相对偏离超过该值才做 ±1 微调。
  double trend_threshold{0.001};
};

/// 两个周期驱动的节拍参数。
struct ScheduleConfig {
  int submit_interval_ms{2000};
  int retune_interval_ms{30000};
  // 启动资金不足时的等待时长，留给运营方充值。
  int funding_wait_ms{60000};
};

/// 交易构造参数。
struct TransactionConfig {
  int blocks_behind{3};
  int expire_seconds{300};
  // max_cpu_usage_ms = ceil(batch / cpu_ms_actions_per_ms) + cpu_ms_base。
  int cpu_ms_actions_per_ms{5};
  int cpu_ms_base{3};
  std::string quantity{"0.0001"};
  std::string memo;
};

/// HTTP 传输超时（libcurl）。
struct HttpConfig {
  int connect_timeout_ms{5000};
  int request_timeout_ms{10000};
};

/// 默认公共节点列表。
std::vector<std::string> DefaultEndpoints();

struct MinerConfig {
  std::string account;
  std::string mine_type;  ///< EIDOS | POW。
  int num_actions{0};  ///< 固定批大小，0 表示自动调节。
  std::string ledger{"eos"};  ///< eos | mock。
  std::string private_key_env{"EOS_MINER_PRIVATE_KEY"};
  // 私钥只从环境变量读取，不落盘到 YAML。
  std::string private_key;
  double min_base_balance{0.001};
  std::vector<std::string> endpoints{DefaultEndpoints()};
  ControllerConfig controller{};
  ScheduleConfig schedule{};
  TransactionConfig transaction{};
  HttpConfig http{};
};

/**
 * @brief 轻量 YAML 配置加载器
 *
 * 仅解析本项目需要的字段；`out_config` 中已有值作为默认值保留。
 * 解析失败返回 `false` 并写入 `out_error`（含行号）。
 */
bool LoadMinerConfigFromYaml(const std::string& file_path,
                             MinerConfig* out_config,
                             std::string* out_error);

/// 从 `private_key_env` 指定的环境变量读取私钥；变量缺失返回 false。
bool ResolvePrivateKeyFromEnv(MinerConfig* config, std::string* out_error);

/// 解析矿币选择，只接受 `EIDOS` 或 `POW`（区分大小写）；其他值返回 false。
bool ParseMineToken(const std::string& text, MineToken* out_token);

/// 校验 EOS 账户名：1~12 位，字符集 `a-z1-5.`，不以 `.` 结尾。
bool IsValidAccountName(const std::string& name);

/**
 * @brief 启动前配置校验
 *
 * 覆盖：账户名、矿币选择、私钥格式（WIF 校验和）、节点列表、
 * 控制器边界与节拍参数。任一失败即视为配置错误，进程不应继续。
 */
bool ValidateMinerConfig(const MinerConfig& config, std::string* out_error);

}  // namespace eos_miner
