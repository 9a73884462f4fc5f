#pragma once

#include <vector>

#include "core/types.h"
#include "ledger/ledger_client.h"

namespace eos_miner {

enum class SubmitOutcome {
  kSubmitted,
  kSkipped,  ///< 暂停标志生效，本轮未发起网络提交。
  kFailed,
};

const char* ToString(SubmitOutcome outcome);

struct SubmitResult {
  SubmitOutcome outcome{SubmitOutcome::kSkipped};
  SubmitReceipt receipt{};
  LedgerError error{};
};

/**
 * @brief 提交与背压闸门
 *
 * 最小背压原语（不是队列）：
 * 1. 任意一次提交失败都会置位暂停标志，不区分失败原因；
 * 2. 下一轮提交看到标志后直接跳过并清除标志；
 * 3. 再下一轮恢复正常提交。
 *
 * 即“一次失败换一整轮冷却”，避免失败后立即重试形成风暴。
 */
class SubmissionGate {
 public:
  SubmitResult Submit(const std::vector<TransferAction>& batch,
                      LedgerClient* endpoint,
                      const SubmitPolicy& policy);

  bool paused() const { return paused_; }

 private:
  bool paused_{false};
};

}  // namespace eos_miner
