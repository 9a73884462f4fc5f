#include "control/batch_size_controller.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "core/log.h"

namespace eos_miner {

const char* ToString(BatchDecision decision) {
  switch (decision) {
    case BatchDecision::kDoubled:
      return "doubled";
    case BatchDecision::kHalved:
      return "halved";
    case BatchDecision::kDecremented:
      return "decremented";
    case BatchDecision::kIncremented:
      return "incremented";
    case BatchDecision::kUnchanged:
      return "unchanged";
    case BatchDecision::kClamped:
      return "clamped";
  }
  return "unknown";
}

BatchSizeController::BatchSizeController(ControllerConfig config)
    : config_(config) {
  if (config_.min_batch < 1) {
    config_.min_batch = 1;
  }
  if (config_.max_batch < config_.min_batch) {
    config_.max_batch = config_.min_batch;
  }
  batch_size_ = config_.min_batch;
}

int BatchSizeController::Clamp(int value) const {
  return std::clamp(value, config_.min_batch, config_.max_batch);
}

void BatchSizeController::Pin(int batch_size) {
  pinned_ = true;
  batch_size_ = Clamp(batch_size);
  if (batch_size_ != batch_size) {
    LogWarn("固定 num_actions=" + std::to_string(batch_size) + " 超出 [" +
            std::to_string(config_.min_batch) + ", " +
            std::to_string(config_.max_batch) + "]，已调整为 " +
            std::to_string(batch_size_));
  }
}

BatchAdjustment BatchSizeController::Retune(const EmaPair& ema) {
  BatchAdjustment adjustment;
  adjustment.previous = batch_size_;
  if (pinned_) {
    adjustment.current = batch_size_;
    return adjustment;
  }

  if (ema.fast < config_.target_rate) {
    // 远低于目标：翻倍，快速吃掉闲置配额。
    batch_size_ = std::min(batch_size_ * 2, config_.max_batch);
    adjustment.decision = BatchDecision::kDoubled;
  } else if (ema.fast > config_.red_rate) {
    // 越过红线：向上取整减半。
    batch_size_ = std::max((batch_size_ + 1) / 2, config_.min_batch);
    adjustment.decision = BatchDecision::kHalved;
  } else {
    // 稳定区 [target, red]：只看快慢 EMA 的相对偏离，避免振荡。
    const double gap = std::fabs(ema.fast - ema.slow);
    const bool trending = ema.slow > 0.0
                              ? gap / ema.slow > config_.trend_threshold
                              : gap > 0.0;
    if (trending) {
      if (ema.fast > ema.slow) {
        if (batch_size_ > config_.min_batch) {
          --batch_size_;
          adjustment.decision = BatchDecision::kDecremented;
        }
      } else if (batch_size_ < config_.max_batch) {
        ++batch_size_;
        adjustment.decision = BatchDecision::kIncremented;
      }
    }
  }
  batch_size_ = Clamp(batch_size_);
  adjustment.current = batch_size_;
  return adjustment;
}

BatchAdjustment BatchSizeController::EmergencyClamp(double sample,
                                                    const EmaPair& ema) {
  BatchAdjustment adjustment;
  adjustment.previous = batch_size_;
  const double red = config_.red_rate;
  if (sample > red || ema.fast > red || ema.slow > red) {
    batch_size_ = config_.min_batch;
    adjustment.decision = BatchDecision::kClamped;
  }
  adjustment.current = batch_size_;
  return adjustment;
}

}  // namespace eos_miner
