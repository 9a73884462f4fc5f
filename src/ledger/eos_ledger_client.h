#pragma once

#include <memory>
#include <string>
#include <vector>

#include "crypto/eos_key.h"
#include "ledger/eos_rpc_client.h"
#include "ledger/ledger_client.h"

namespace eos_miner {

/**
 * @brief 基于 nodeos HTTP 的账本客户端
 *
 * 提交流程：
 * 1. `get_info` 取链 ID 与头块高度；
 * 2. 回溯 `blocks_behind` 个块取 TaPoS 引用块；
 * 3. 以引用块时间 + `expire_seconds` 作为过期时间打包交易；
 * 4. 对 `sha256(chain_id || packed_trx || 32 字节零)` 签名并推送。
 *
 * 签名器在整个节点池内共享。
 */
class EosLedgerClient final : public LedgerClient {
 public:
  EosLedgerClient(std::unique_ptr<EosRpcClient> rpc,
                  std::shared_ptr<const EosSigner> signer);

  std::string Name() const override { return rpc_->base_url(); }
  bool GetBalance(const std::string& account,
                  const TokenIdentity& token,
                  double* out_balance,
                  std::string* out_error) override;
  bool GetAccountLimits(const std::string& account,
                        AccountLimits* out_limits,
                        std::string* out_error) override;
  bool SubmitBatch(const std::vector<TransferAction>& actions,
                   const SubmitPolicy& policy,
                   SubmitReceipt* out_receipt,
                   LedgerError* out_error) override;

  /// 计算待签名摘要；链 ID 非法十六进制返回 false。
  static bool BuildSigningDigest(const std::string& chain_id_hex,
                                 const std::string& packed_trx,
                                 Sha256Digest* out_digest);

 private:
  std::unique_ptr<EosRpcClient> rpc_;
  std::shared_ptr<const EosSigner> signer_;
};

}  // namespace eos_miner
