#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "control/batch_size_controller.h"
#include "control/dual_ema_estimator.h"
#include "control/utilization_sampler.h"
#include "core/config.h"
#include "core/types.h"
#include "execution/submission_gate.h"
#include "pool/endpoint_pool.h"

namespace eos_miner {

/// 挖矿统计快照：用于周期状态日志。
struct MineStats {
  std::uint64_t cycles{0};  // 提交节拍总次数。
  std::uint64_t submitted{0};  // 成功提交次数。
  std::uint64_t skipped{0};  // 背压跳过次数。
  std::uint64_t failed{0};  // 提交失败次数。
  std::uint64_t aborted{0};  // 查询失败导致放弃的轮次。
  std::uint64_t clamps{0};  // 紧急钳制触发次数。
  double mined_total{0.0};  // 累计挖到的矿币数量。
};

enum class StartupStatus {
  kReady,
  kInsufficientFunds,  ///< 基础币余额低于启动门槛。
  kQueryFailed,  ///< 启动阶段的余额/资源查询失败。
};

enum class CycleOutcome {
  kSubmitted,
  kSkipped,
  kFailed,
  kAborted,  ///< 查询失败，本轮在提交前放弃。
};

const char* ToString(CycleOutcome outcome);

/**
 * @brief 挖矿周期编排器
 *
 * 持有全部跨节拍共享状态（双 EMA、批大小、暂停标志），
 * 由单线程 `io_context` 上的两个定时器驱动：
 * - 提交节拍（默认 2s）：采样 -> 更新 EMA -> 紧急钳制 -> 查余额 ->
 *   构造批 -> 过闸提交 -> 查余额并报告收益；
 * - 调参节拍（默认 30s，固定批模式下不启用）：执行批大小调整。
 *
 * 两个节拍的处理函数不会重叠执行，因此共享状态无需加锁。
 * 节拍内任何异常都在节拍边界被捕获并记录，不影响下一次节拍。
 */
class MineOrchestrator {
 public:
  /**
   * @param pool 节点池，生命周期由外部管理（不持有所有权）
   */
  MineOrchestrator(MinerConfig config, MineToken token, EndpointPool* pool);
  ~MineOrchestrator();

  MineOrchestrator(const MineOrchestrator&) = delete;
  MineOrchestrator& operator=(const MineOrchestrator&) = delete;

  /**
   * @brief 启动前同步预热
   *
   * 依次查询基础币余额、矿币余额与初始利用率（用于播种双 EMA）。
   * 基础币不足时记录错误并等待 `funding_wait_ms` 后返回。
   */
  StartupStatus Prime();

  /// 执行一次提交节拍（测试可直接调用）。
  CycleOutcome RunSubmissionTick();

  /// 执行一次调参节拍（测试可直接调用）。
  BatchAdjustment RunRetuneTick();

  /**
   * @brief 预热并在 `io` 上挂载周期定时器
   *
   * 预热未就绪时返回 false，且不挂载任何定时器。
   */
  bool Start(boost::asio::io_context* io);

  /// 取消定时器（幂等）。
  void Stop();

  bool ticks_scheduled() const { return submit_timer_ != nullptr; }
  bool retune_scheduled() const { return retune_timer_ != nullptr; }
  const DualEmaEstimator& estimator() const { return estimator_; }
  const BatchSizeController& controller() const { return controller_; }
  const SubmissionGate& gate() const { return gate_; }
  const TokenIdentity& mine_token() const { return mine_token_; }

  /// 获取累计统计（进程生命周期内单调累加）。
  const MineStats& total_stats() const { return total_stats_; }
  /// 获取窗口统计并清零（用于周期状态日志）。
  MineStats ConsumeWindowStats();

 private:
  using Clock = std::chrono::steady_clock;

  bool QueryBalance(const TokenIdentity& token, double* out_balance,
                    std::string* out_error);
  void ReportMined(double previous, double current);
  void Count(std::uint64_t MineStats::*counter);
  void LogWindowStatus();

  void ArmSubmitTimer();
  void ArmRetuneTimer();
  void OnSubmitTimer(const boost::system::error_code& ec);
  void OnRetuneTimer(const boost::system::error_code& ec);

  MinerConfig config_;
  TokenIdentity mine_token_;
  EndpointPool* pool_{nullptr};  ///< 外部注入节点池（不拥有所有权）。
  UtilizationSampler sampler_;
  DualEmaEstimator estimator_;
  BatchSizeController controller_;
  SubmissionGate gate_;
  MineStats total_stats_;  ///< 全量累计统计。
  MineStats window_stats_;  ///< 自上次消费以来的窗口统计。

  std::unique_ptr<boost::asio::steady_timer> submit_timer_;
  std::unique_ptr<boost::asio::steady_timer> retune_timer_;
  Clock::time_point submit_deadline_{};
  Clock::time_point retune_deadline_{};
  bool stopped_{false};
};

}  // namespace eos_miner
