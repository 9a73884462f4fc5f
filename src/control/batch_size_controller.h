#pragma once

#include "control/dual_ema_estimator.h"
#include "core/config.h"

namespace eos_miner {

/// 一次调整的决策类型（用于日志与测试断言）。
enum class BatchDecision {
  kDoubled,  ///< fast < target：翻倍。
  kHalved,  ///< fast > red：减半。
  kDecremented,  ///< 稳定区内 fast > slow：-1。
  kIncremented,  ///< 稳定区内 fast < slow：+1。
  kUnchanged,  ///< 稳定区内快慢 EMA 无明显偏离，或已到边界。
  kClamped,  ///< 紧急钳制到最小批。
};

const char* ToString(BatchDecision decision);

/// 一次调整的前后值。
struct BatchAdjustment {
  BatchDecision decision{BatchDecision::kUnchanged};
  int previous{0};
  int current{0};
};

/**
 * @brief 自适应批大小控制器
 *
 * 两条独立路径：
 * 1. `Retune`：在较慢的调参节拍上执行“远离目标时乘法、接近目标时加法”
 *    的调整，稳定区内带死区；
 * 2. `EmergencyClamp`：在每个提交节拍上执行的安全联锁，瞬时样本或任一
 *    EMA 超过红线即把批大小压到最小值。
 *
 * 不变量：`min_batch <= batch_size() <= max_batch` 始终成立。
 */
class BatchSizeController {
 public:
  explicit BatchSizeController(ControllerConfig config = {});

  /// 调参节拍：根据快慢 EMA 调整批大小。固定批模式下不做调整。
  BatchAdjustment Retune(const EmaPair& ema);

  /**
   * @brief 提交节拍上的安全联锁
   *
   * `sample`、`ema.fast`、`ema.slow` 任一超过红线即钳制到最小批。
   * 固定批模式没有调参节拍，钳制后保持最小批直到进程退出。
   */
  BatchAdjustment EmergencyClamp(double sample, const EmaPair& ema);

  /// 固定批大小（外部覆盖），取值会被裁剪到 [min_batch, max_batch]，裁剪时记录告警。
  void Pin(int batch_size);

  int batch_size() const { return batch_size_; }
  bool pinned() const { return pinned_; }
  const ControllerConfig& config() const { return config_; }

 private:
  int Clamp(int value) const;

  ControllerConfig config_;
  int batch_size_{0};
  bool pinned_{false};
};

}  // namespace eos_miner
