#pragma once

#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace eos_miner {

/**
 * @brief 构造一批相同的微转账动作
 *
 * 每个动作都是 `from=account, to=矿币合约, quantity=<quantity> EOS`。
 * `batch_size <= 0` 时返回空批。
 */
std::vector<TransferAction> BuildTransferBatch(int batch_size,
                                               const std::string& account,
                                               const TokenIdentity& mine_token,
                                               const TransactionConfig& config);

/// 按批大小生成提交策略：`max_cpu_usage_ms = ceil(batch/5) + 3`（默认参数）。
SubmitPolicy BuildSubmitPolicy(int batch_size, const TransactionConfig& config);

}  // namespace eos_miner
