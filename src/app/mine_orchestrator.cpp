#include "app/mine_orchestrator.h"

#include <cmath>
#include <cstdio>
#include <exception>
#include <thread>
#include <utility>

#include <boost/asio/error.hpp>

#include "core/log.h"
#include "execution/batch_builder.h"

namespace eos_miner {

namespace {

// 利用率按百分比向下截断到两位小数，例如 0.956789 -> "95.67"。
std::string FormatPercent(double ratio) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f",
                std::floor(ratio * 10000.0) / 100.0);
  return buffer;
}

std::string FormatAmount(double amount) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.4f", amount);
  return buffer;
}

}  // namespace

const char* ToString(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::kSubmitted:
      return "submitted";
    case CycleOutcome::kSkipped:
      return "skipped";
    case CycleOutcome::kFailed:
      return "failed";
    case CycleOutcome::kAborted:
      return "aborted";
  }
  return "unknown";
}

MineOrchestrator::MineOrchestrator(MinerConfig config, MineToken token,
                                   EndpointPool* pool)
    : config_(std::move(config)),
      mine_token_(MineTokenIdentity(token)),
      pool_(pool),
      sampler_(config_.account),
      estimator_(config_.controller.fast_decay, config_.controller.slow_decay),
      controller_(config_.controller) {
  if (config_.num_actions > 0) {
    controller_.Pin(config_.num_actions);
  }
}

MineOrchestrator::~MineOrchestrator() {
  Stop();
}

void MineOrchestrator::Count(std::uint64_t MineStats::*counter) {
  ++(total_stats_.*counter);
  ++(window_stats_.*counter);
}

MineStats MineOrchestrator::ConsumeWindowStats() {
  const MineStats snapshot = window_stats_;
  window_stats_ = MineStats{};
  return snapshot;
}

bool MineOrchestrator::QueryBalance(const TokenIdentity& token,
                                    double* out_balance,
                                    std::string* out_error) {
  // 每次余额查询独立挑选节点，与采样节点无关。
  LedgerClient* endpoint = pool_ == nullptr ? nullptr : pool_->Select();
  if (endpoint == nullptr) {
    if (out_error != nullptr) {
      *out_error = "节点池为空";
    }
    return false;
  }
  std::string error;
  if (!endpoint->GetBalance(config_.account, token, out_balance, &error)) {
    if (out_error != nullptr) {
      *out_error = endpoint->Name() + " " + token.symbol + " 余额查询失败: " +
                   error;
    }
    return false;
  }
  return true;
}

StartupStatus MineOrchestrator::Prime() {
  const TokenIdentity base = BaseToken();
  std::string error;
  double base_balance = 0.0;
  if (!QueryBalance(base, &base_balance, &error)) {
    LogError("启动预热失败: " + error);
    return StartupStatus::kQueryFailed;
  }
  LogInfo(base.symbol + " balance: " + FormatAmount(base_balance));

  double mine_balance = 0.0;
  if (QueryBalance(mine_token_, &mine_balance, &error)) {
    LogInfo(mine_token_.symbol + " balance: " + FormatAmount(mine_balance));
  } else {
    // 矿币余额只用于展示，查询失败按 0 继续。
    mine_balance = 0.0;
    LogWarn(mine_token_.symbol + " 余额查询失败，按 0 继续: " + error);
  }

  UtilizationReading reading;
  if (!sampler_.Sample(pool_, &reading, &error)) {
    LogError("启动预热失败: " + error);
    return StartupStatus::kQueryFailed;
  }
  estimator_.Seed(reading.ratio);
  LogInfo("初始 CPU 利用率=" + FormatPercent(reading.ratio) + "%");

  if (base_balance < config_.min_base_balance) {
    LogError(base.symbol + " 余额过低，必须不少于 " +
             FormatAmount(config_.min_base_balance) + " " + base.symbol +
             "，请先充值；" + std::to_string(config_.schedule.funding_wait_ms) +
             "ms 后退出启动流程");
    std::this_thread::sleep_for(
        std::chrono::milliseconds(config_.schedule.funding_wait_ms));
    return StartupStatus::kInsufficientFunds;
  }
  return StartupStatus::kReady;
}

void MineOrchestrator::ReportMined(double previous, double current) {
  const double increase = current - previous;
  const std::string text = FormatAmount(increase);
  if (text == "0.0000" || text.front() == '-') {
    return;
  }
  total_stats_.mined_total += increase;
  window_stats_.mined_total += increase;
  LogInfo("Mined " + text + " " + mine_token_.symbol + "!");
}

CycleOutcome MineOrchestrator::RunSubmissionTick() {
  Count(&MineStats::cycles);

  std::string error;
  UtilizationReading reading;
  if (!sampler_.Sample(pool_, &reading, &error)) {
    Count(&MineStats::aborted);
    LogError("本轮放弃: " + error);
    return CycleOutcome::kAborted;
  }

  const EmaPair ema = estimator_.Update(reading.ratio);
  const BatchAdjustment clamp = controller_.EmergencyClamp(reading.ratio, ema);
  if (clamp.decision == BatchDecision::kClamped) {
    Count(&MineStats::clamps);
    if (clamp.previous != clamp.current) {
      LogWarn("CPU 利用率越过红线: rate=" + FormatPercent(reading.ratio) +
              "%, fast=" + FormatPercent(ema.fast) +
              "%, slow=" + FormatPercent(ema.slow) +
              "%, num_actions=" + std::to_string(clamp.current));
    }
  }

  double previous_balance = 0.0;
  if (!QueryBalance(mine_token_, &previous_balance, &error)) {
    Count(&MineStats::aborted);
    LogError("本轮放弃: " + error);
    return CycleOutcome::kAborted;
  }

  const int batch_size = controller_.batch_size();
  const std::vector<TransferAction> batch = BuildTransferBatch(
      batch_size, config_.account, mine_token_, config_.transaction);
  const SubmitPolicy policy = BuildSubmitPolicy(batch_size, config_.transaction);
  const SubmitResult result = gate_.Submit(batch, reading.endpoint, policy);

  CycleOutcome outcome = CycleOutcome::kSubmitted;
  switch (result.outcome) {
    case SubmitOutcome::kSubmitted:
      Count(&MineStats::submitted);
      break;
    case SubmitOutcome::kSkipped:
      Count(&MineStats::skipped);
      outcome = CycleOutcome::kSkipped;
      break;
    case SubmitOutcome::kFailed:
      Count(&MineStats::failed);
      outcome = CycleOutcome::kFailed;
      break;
  }

  // 跳过或失败的轮次也查询一次余额：更早的交易可能刚刚到账。
  double current_balance = 0.0;
  if (!QueryBalance(mine_token_, &current_balance, &error)) {
    LogError("收益统计跳过: " + error);
    return outcome;
  }
  ReportMined(previous_balance, current_balance);
  return outcome;
}

BatchAdjustment MineOrchestrator::RunRetuneTick() {
  const EmaPair& ema = estimator_.value();
  LogInfo("cpu_rate_ema_fast=" + FormatPercent(ema.fast) +
          "%, cpu_rate_ema_slow=" + FormatPercent(ema.slow) +
          "%, num_actions=" + std::to_string(controller_.batch_size()));

  const BatchAdjustment adjustment = controller_.Retune(ema);
  switch (adjustment.decision) {
    case BatchDecision::kDoubled:
      LogInfo("num_actions 翻倍，当前 num_actions=" +
              std::to_string(adjustment.current));
      break;
    case BatchDecision::kHalved:
      LogInfo("num_actions 减半，当前 num_actions=" +
              std::to_string(adjustment.current));
      break;
    case BatchDecision::kDecremented:
      LogInfo("num_actions 减 1，当前 num_actions=" +
              std::to_string(adjustment.current));
      break;
    case BatchDecision::kIncremented:
      LogInfo("num_actions 加 1，当前 num_actions=" +
              std::to_string(adjustment.current));
      break;
    case BatchDecision::kUnchanged:
    case BatchDecision::kClamped:
      LogInfo("num_actions 无需调整");
      break;
  }
  LogWindowStatus();
  return adjustment;
}

void MineOrchestrator::LogWindowStatus() {
  const MineStats window = ConsumeWindowStats();
  LogInfo("MINE_STATUS: cycles=" + std::to_string(window.cycles) +
          ", submitted=" + std::to_string(window.submitted) +
          ", skipped=" + std::to_string(window.skipped) +
          ", failed=" + std::to_string(window.failed) +
          ", aborted=" + std::to_string(window.aborted) +
          ", clamps=" + std::to_string(window.clamps) +
          ", mined=" + FormatAmount(window.mined_total) + " " +
          mine_token_.symbol +
          ", mined_total=" + FormatAmount(total_stats_.mined_total));
}

bool MineOrchestrator::Start(boost::asio::io_context* io) {
  if (io == nullptr) {
    LogError("io_context 为空，无法挂载定时器");
    return false;
  }
  const StartupStatus status = Prime();
  if (status != StartupStatus::kReady) {
    return false;
  }

  stopped_ = false;
  const auto now = Clock::now();
  submit_timer_ = std::make_unique<boost::asio::steady_timer>(*io);
  submit_deadline_ = now;
  ArmSubmitTimer();

  if (controller_.pinned()) {
    LogInfo("固定 num_actions=" + std::to_string(controller_.batch_size()) +
            "，不启用自动调参");
  } else {
    retune_timer_ = std::make_unique<boost::asio::steady_timer>(*io);
    retune_deadline_ = now;
    ArmRetuneTimer();
  }
  LogInfo("挖矿节拍已启动: submit_interval_ms=" +
          std::to_string(config_.schedule.submit_interval_ms) +
          ", retune_interval_ms=" +
          std::to_string(config_.schedule.retune_interval_ms) +
          ", endpoints=" + std::to_string(pool_ == nullptr ? 0 : pool_->size()));
  return true;
}

void MineOrchestrator::Stop() {
  stopped_ = true;
  if (submit_timer_ != nullptr) {
    submit_timer_->cancel();
  }
  if (retune_timer_ != nullptr) {
    retune_timer_->cancel();
  }
}

void MineOrchestrator::ArmSubmitTimer() {
  // 按绝对截止时间推进；节拍超时后下一次立即触发，但不补发积压节拍。
  submit_deadline_ +=
      std::chrono::milliseconds(config_.schedule.submit_interval_ms);
  const auto now = Clock::now();
  if (submit_deadline_ < now) {
    submit_deadline_ = now;
  }
  submit_timer_->expires_at(submit_deadline_);
  submit_timer_->async_wait(
      [this](const boost::system::error_code& ec) { OnSubmitTimer(ec); });
}

void MineOrchestrator::ArmRetuneTimer() {
  retune_deadline_ +=
      std::chrono::milliseconds(config_.schedule.retune_interval_ms);
  const auto now = Clock::now();
  if (retune_deadline_ < now) {
    retune_deadline_ = now;
  }
  retune_timer_->expires_at(retune_deadline_);
  retune_timer_->async_wait(
      [this](const boost::system::error_code& ec) { OnRetuneTimer(ec); });
}

void MineOrchestrator::OnSubmitTimer(const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted || stopped_) {
    return;
  }
  try {
    RunSubmissionTick();
  } catch (const std::exception& e) {
    LogError(std::string("提交节拍异常: ") + e.what());
  }
  ArmSubmitTimer();
}

void MineOrchestrator::OnRetuneTimer(const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted || stopped_) {
    return;
  }
  try {
    RunRetuneTick();
  } catch (const std::exception& e) {
    LogError(std::string("调参节拍异常: ") + e.what());
  }
  ArmRetuneTimer();
}

}  // namespace eos_miner
