#pragma once

#include <string>
#include <utility>

#include "core/types.h"
#include "ledger/ledger_client.h"
#include "pool/endpoint_pool.h"

namespace eos_miner {

/// 单次利用率采样结果。
struct UtilizationReading {
  double ratio{0.0};  ///< used / max，通常位于 [0, ~1.2]。
  AccountLimits limits{};
  LedgerClient* endpoint{nullptr};  ///< 本次采样使用的节点（同轮提交复用）。
};

/**
 * @brief 账户 CPU 利用率采样器
 *
 * 每次从节点池随机挑选一个节点查询 `cpu_limit`，返回 `used/max`。
 * 查询失败不重试：调用方应放弃本轮，等待下一轮节拍。
 */
class UtilizationSampler {
 public:
  explicit UtilizationSampler(std::string account) : account_(std::move(account)) {}

  bool Sample(EndpointPool* pool,
              UtilizationReading* out_reading,
              std::string* out_error) const;

 private:
  std::string account_;
};

}  // namespace eos_miner
