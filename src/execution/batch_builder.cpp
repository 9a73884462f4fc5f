#include "execution/batch_builder.h"

#include "ledger/transaction_packer.h"

namespace eos_miner {

std::vector<TransferAction> BuildTransferBatch(int batch_size,
                                               const std::string& account,
                                               const TokenIdentity& mine_token,
                                               const TransactionConfig& config) {
  std::vector<TransferAction> batch;
  if (batch_size <= 0) {
    return batch;
  }
  const TokenIdentity base = BaseToken();
  TransferAction action;
  action.contract = base.contract;
  action.from = account;
  action.to = mine_token.contract;
  action.quantity = config.quantity + " " + base.symbol;
  action.memo = config.memo;
  batch.assign(static_cast<std::size_t>(batch_size), action);
  return batch;
}

SubmitPolicy BuildSubmitPolicy(int batch_size, const TransactionConfig& config) {
  SubmitPolicy policy;
  policy.blocks_behind = config.blocks_behind;
  policy.expire_seconds = config.expire_seconds;
  policy.max_cpu_usage_ms = ComputeMaxCpuUsageMs(
      batch_size, config.cpu_ms_actions_per_ms, config.cpu_ms_base);
  return policy;
}

}  // namespace eos_miner
