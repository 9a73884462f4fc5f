#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

#include "ledger/ledger_client.h"

namespace eos_miner {

/// mock 账本的资源模型参数。
struct MockLedgerOptions {
  double cpu_max_us{1000000.0};
  double cpu_used_us{0.0};
  // 每个成功提交的动作消耗的 CPU 微秒数。
  double cpu_us_per_action{3000.0};
  // 每次查询资源时已用量按该比例回落，模拟配额随时间恢复。
  double cpu_recovery_ratio{0.10};
  // 每个成功提交的动作带来的矿币奖励。
  double reward_per_action{0.0001};
};

/**
 * @brief 本地模拟账本
 *
 * 特性：
 * 1. 可脚本化 CPU 利用率序列、余额与提交结果；
 * 2. 未脚本化时使用简单的资源消耗/恢复模型；
 * 3. 记录调用次数与最近一次提交的批大小，供测试断言。
 *
 * 场景：
 * - 单元测试、`--ledger=mock` 本地演练。
 */
class MockLedgerClient : public LedgerClient {
 public:
  explicit MockLedgerClient(std::string name = "mock",
                            MockLedgerOptions options = {});

  std::string Name() const override { return name_; }
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

  /// 设置某代币余额（按符号区分）。
  void SetBalance(const std::string& symbol, double balance);
  /// 追加脚本化利用率样本（used/max）；队列非空时优先使用。
  void QueueUtilization(double ratio);
  /// 追加脚本化提交失败；队列为空时提交成功。
  void QueueSubmitFailure(LedgerError error);
  /// 接下来 n 次资源查询失败。
  void FailNextLimitQueries(int count) { failing_limit_queries_ = count; }
  /// 接下来 n 次余额查询失败。
  void FailNextBalanceQueries(int count) { failing_balance_queries_ = count; }

  std::size_t submit_calls() const { return submit_calls_; }
  std::size_t limit_queries() const { return limit_queries_; }
  std::size_t balance_queries() const { return balance_queries_; }
  std::size_t last_batch_size() const { return last_batch_size_; }
  const SubmitPolicy& last_policy() const { return last_policy_; }
  const std::vector<TransferAction>& last_actions() const { return last_actions_; }

 private:
  std::string name_;
  MockLedgerOptions options_;
  std::unordered_map<std::string, double> balance_by_symbol_;
  std::deque<double> scripted_utilization_;
  std::deque<LedgerError> scripted_failures_;
  int failing_limit_queries_{0};
  int failing_balance_queries_{0};
  std::size_t submit_calls_{0};
  std::size_t limit_queries_{0};
  std::size_t balance_queries_{0};
  std::size_t last_batch_size_{0};
  SubmitPolicy last_policy_{};
  std::vector<TransferAction> last_actions_;
  std::uint64_t tx_seq_{0};
};

}  // namespace eos_miner
