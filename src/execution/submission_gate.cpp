#include "execution/submission_gate.h"

#include <string>

#include "core/log.h"

namespace eos_miner {

const char* ToString(SubmitOutcome outcome) {
  switch (outcome) {
    case SubmitOutcome::kSubmitted:
      return "submitted";
    case SubmitOutcome::kSkipped:
      return "skipped";
    case SubmitOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

SubmitResult SubmissionGate::Submit(const std::vector<TransferAction>& batch,
                                    LedgerClient* endpoint,
                                    const SubmitPolicy& policy) {
  SubmitResult result;
  if (paused_) {
    LogWarn("pause mine once: num_actions=" + std::to_string(batch.size()) +
            ", max_cpu_usage_ms=" + std::to_string(policy.max_cpu_usage_ms));
    paused_ = false;
    result.outcome = SubmitOutcome::kSkipped;
    return result;
  }

  bool ok = false;
  if (endpoint == nullptr) {
    result.error = LedgerError{0, "no_endpoint", "没有可用节点"};
  } else {
    ok = endpoint->SubmitBatch(batch, policy, &result.receipt, &result.error);
  }
  if (!ok) {
    paused_ = true;
    result.outcome = SubmitOutcome::kFailed;
    LogError(result.error.ToString());
    return result;
  }

  paused_ = false;
  result.outcome = SubmitOutcome::kSubmitted;
  return result;
}

}  // namespace eos_miner
