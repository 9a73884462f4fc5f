#pragma once

namespace eos_miner {

/// 快慢两条 EMA 的当前值。
struct EmaPair {
  double fast{0.0};
  double slow{0.0};
};

/**
 * @brief 双 EMA 利用率估计器
 *
 * - fast（衰减 0.5，约 2 个样本半衰）：回答“现在发生了什么”；
 * - slow（衰减 0.999，约 693 个样本半衰）：回答“平常是什么水平”。
 *
 * 两条 EMA 必须用同一个真实样本同时播种，不能从 0 起步，
 * 否则冷启动阶段会出现虚假的低利用率读数。
 */
class DualEmaEstimator {
 public:
  DualEmaEstimator(double fast_decay = 0.5, double slow_decay = 0.999)
      : fast_decay_(fast_decay), slow_decay_(slow_decay) {}

  /// 用首个真实样本同时播种 fast/slow。
  void Seed(double sample);

  /**
   * @brief 输入一个新样本并返回更新后的 EMA
   *
   * 尚未播种时以该样本播种，而不是与 0 混合。
   */
  EmaPair Update(double sample);

  bool seeded() const { return seeded_; }
  const EmaPair& value() const { return value_; }

 private:
  double fast_decay_;
  double slow_decay_;
  bool seeded_{false};
  EmaPair value_{};
};

}  // namespace eos_miner
