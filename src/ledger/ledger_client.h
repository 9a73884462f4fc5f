#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace eos_miner {

/**
 * @brief 账本服务统一接口
 *
 * 屏蔽真实节点（nodeos HTTP）与 mock 的差异，上层只依赖三类语义：
 * - 余额查询（GetBalance）
 * - 账户 CPU 资源查询（GetAccountLimits）
 * - 批量动作原子提交（SubmitBatch）
 *
 * 每个实例对应一个远端节点；实例本身对调度器而言是无状态的。
 */
class LedgerClient {
 public:
  virtual ~LedgerClient() = default;

  /// @brief 客户端名称（通常为节点 URL，用于日志）。
  virtual std::string Name() const = 0;

  /**
   * @brief 查询账户某代币余额
   *
   * 账户从未持有该代币时返回 true 且余额为 0；网络或解析失败返回 false。
   */
  virtual bool GetBalance(const std::string& account,
                          const TokenIdentity& token,
                          double* out_balance,
                          std::string* out_error) = 0;

  /// @brief 查询账户 CPU 资源使用量与上限。
  virtual bool GetAccountLimits(const std::string& account,
                                AccountLimits* out_limits,
                                std::string* out_error) = 0;

  /**
   * @brief 把一组动作作为一笔交易原子提交
   *
   * 失败时 `out_error` 携带链端 `{code, name, what}`；传输层失败时 code 为 0。
   */
  virtual bool SubmitBatch(const std::vector<TransferAction>& actions,
                           const SubmitPolicy& policy,
                           SubmitReceipt* out_receipt,
                           LedgerError* out_error) = 0;
};

}  // namespace eos_miner
