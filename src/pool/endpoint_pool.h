#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "ledger/ledger_client.h"

namespace eos_miner {

/**
 * @brief 节点选择策略
 *
 * 给定池大小返回下标，结果必须落在 `[0, size)`。
 * 默认实现为均匀随机；按健康度加权等策略可在此处扩展。
 */
class EndpointSelector {
 public:
  virtual ~EndpointSelector() = default;
  virtual std::size_t Pick(std::size_t size) = 0;
};

/// 均匀随机选择；每次调用相互独立，无会话粘滞。
class UniformRandomSelector final : public EndpointSelector {
 public:
  UniformRandomSelector() : rng_(std::random_device{}()) {}
  explicit UniformRandomSelector(std::uint64_t seed) : rng_(seed) {}

  std::size_t Pick(std::size_t size) override;

 private:
  std::mt19937_64 rng_;
};

/**
 * @brief 多节点负载分摊池
 *
 * 持有一组可互换的账本客户端，每次查询独立挑选一个节点：
 * 1. 把读写压力分散到多个第三方节点；
 * 2. 单个节点变慢、限流或宕机只影响被选中的那一次调用。
 *
 * 同一轮中先后两次 `Select()` 可能拿到不同节点，节点间无一致性保证。
 */
class EndpointPool {
 public:
  explicit EndpointPool(std::vector<std::unique_ptr<LedgerClient>> endpoints,
                        std::unique_ptr<EndpointSelector> selector =
                            std::make_unique<UniformRandomSelector>());

  /// 挑选一个节点；池为空时返回 `nullptr`。
  LedgerClient* Select();

  std::size_t size() const { return endpoints_.size(); }
  bool empty() const { return endpoints_.empty(); }
  /// 按下标访问节点（测试与诊断用）；越界返回 `nullptr`。
  LedgerClient* At(std::size_t index) const;

 private:
  std::vector<std::unique_ptr<LedgerClient>> endpoints_;  ///< 池内节点（拥有所有权）。
  std::unique_ptr<EndpointSelector> selector_;  ///< 选择策略。
};

}  // namespace eos_miner
