#include "control/dual_ema_estimator.h"

namespace eos_miner {

void DualEmaEstimator::Seed(double sample) {
  value_.fast = sample;
  value_.slow = sample;
  seeded_ = true;
}

EmaPair DualEmaEstimator::Update(double sample) {
  if (!seeded_) {
    Seed(sample);
    return value_;
  }
  value_.fast = fast_decay_ * value_.fast + (1.0 - fast_decay_) * sample;
  value_.slow = slow_decay_ * value_.slow + (1.0 - slow_decay_) * sample;
  return value_;
}

}  // namespace eos_miner
