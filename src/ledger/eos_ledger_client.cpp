#include "ledger/eos_ledger_client.h"

#include <algorithm>
#include <utility>

#include "ledger/transaction_packer.h"

namespace eos_miner {

namespace {

LedgerError ClientError(const std::string& name, const std::string& what) {
  return LedgerError{0, name, what};
}

}  // namespace

EosLedgerClient::EosLedgerClient(std::unique_ptr<EosRpcClient> rpc,
                                 std::shared_ptr<const EosSigner> signer)
    : rpc_(std::move(rpc)), signer_(std::move(signer)) {}

bool EosLedgerClient::GetBalance(const std::string& account,
                                 const TokenIdentity& token,
                                 double* out_balance,
                                 std::string* out_error) {
  return rpc_->GetCurrencyBalance(token.contract, account, token.symbol,
                                  out_balance, out_error);
}

bool EosLedgerClient::GetAccountLimits(const std::string& account,
                                       AccountLimits* out_limits,
                                       std::string* out_error) {
  return rpc_->GetAccountLimits(account, out_limits, out_error);
}

bool EosLedgerClient::BuildSigningDigest(const std::string& chain_id_hex,
                                         const std::string& packed_trx,
                                         Sha256Digest* out_digest) {
  std::string chain_id;
  if (!FromHex(chain_id_hex, &chain_id) || chain_id.size() != 32U) {
    return false;
  }
  // 无 context-free data 时其摘要位置填 32 字节零。
  return Sha256(chain_id + packed_trx + std::string(32, '\0'), out_digest);
}

bool EosLedgerClient::SubmitBatch(const std::vector<TransferAction>& actions,
                                  const SubmitPolicy& policy,
                                  SubmitReceipt* out_receipt,
                                  LedgerError* out_error) {
  auto fail = [out_error](LedgerError error) {
    if (out_error != nullptr) {
      *out_error = std::move(error);
    }
    return false;
  };
  if (signer_ == nullptr) {
    return fail(ClientError("signer_missing", "未配置签名器"));
  }
  if (actions.empty()) {
    return fail(ClientError("empty_batch", "动作列表为空"));
  }

  std::string error;
  ChainInfo info;
  if (!rpc_->GetInfo(&info, &error)) {
    return fail(ClientError("get_info_failed", error));
  }
  const std::int64_t ref_num =
      std::max<std::int64_t>(1, info.head_block_num - policy.blocks_behind);
  BlockRef block;
  if (!rpc_->GetBlock(ref_num, &block, &error)) {
    return fail(ClientError("get_block_failed", error));
  }
  std::int64_t block_time = 0;
  if (!ParseBlockTimestamp(block.timestamp, &block_time)) {
    return fail(ClientError("bad_block_timestamp", block.timestamp));
  }

  TransactionHeader header;
  header.expiration =
      static_cast<std::uint32_t>(block_time + policy.expire_seconds);
  header.ref_block_num = static_cast<std::uint16_t>(block.block_num & 0xFFFF);
  header.ref_block_prefix = block.ref_block_prefix;
  header.max_cpu_usage_ms =
      static_cast<std::uint8_t>(std::clamp(policy.max_cpu_usage_ms, 0, 255));

  std::string packed;
  if (!PackTransaction(header, actions, &packed, &error)) {
    return fail(ClientError("pack_failed", error));
  }
  Sha256Digest digest{};
  if (!BuildSigningDigest(info.chain_id, packed, &digest)) {
    return fail(ClientError("digest_failed", "chain_id 非法: " + info.chain_id));
  }
  std::string signature;
  if (!signer_->SignDigest(digest, &signature, &error)) {
    return fail(ClientError("sign_failed", error));
  }
  return rpc_->PushTransaction(signature, ToHex(packed), out_receipt,
                               out_error);
}

}  // namespace eos_miner
