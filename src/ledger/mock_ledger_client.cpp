#include "ledger/mock_ledger_client.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace eos_miner {

MockLedgerClient::MockLedgerClient(std::string name, MockLedgerOptions options)
    : name_(std::move(name)), options_(options) {}

void MockLedgerClient::SetBalance(const std::string& symbol, double balance) {
  balance_by_symbol_[symbol] = balance;
}

void MockLedgerClient::QueueUtilization(double ratio) {
  scripted_utilization_.push_back(ratio);
}

void MockLedgerClient::QueueSubmitFailure(LedgerError error) {
  scripted_failures_.push_back(std::move(error));
}

bool MockLedgerClient::GetBalance(const std::string& account,
                                  const TokenIdentity& token,
                                  double* out_balance,
                                  std::string* out_error) {
  ++balance_queries_;
  if (failing_balance_queries_ > 0) {
    --failing_balance_queries_;
    if (out_error != nullptr) {
      *out_error = "mock 余额查询失败: account=" + account;
    }
    return false;
  }
  if (out_balance == nullptr) {
    return false;
  }
  const auto it = balance_by_symbol_.find(token.symbol);
  *out_balance = it == balance_by_symbol_.end() ? 0.0 : it->second;
  return true;
}

bool MockLedgerClient::GetAccountLimits(const std::string& account,
                                        AccountLimits* out_limits,
                                        std::string* out_error) {
  ++limit_queries_;
  if (failing_limit_queries_ > 0) {
    --failing_limit_queries_;
    if (out_error != nullptr) {
      *out_error = "mock 资源查询失败: account=" + account;
    }
    return false;
  }
  if (out_limits == nullptr) {
    return false;
  }
  out_limits->max = options_.cpu_max_us;
  if (!scripted_utilization_.empty()) {
    out_limits->used = scripted_utilization_.front() * options_.cpu_max_us;
    scripted_utilization_.pop_front();
    return true;
  }
  options_.cpu_used_us *= (1.0 - std::clamp(options_.cpu_recovery_ratio, 0.0, 1.0));
  out_limits->used = options_.cpu_used_us;
  return true;
}

bool MockLedgerClient::SubmitBatch(const std::vector<TransferAction>& actions,
                                   const SubmitPolicy& policy,
                                   SubmitReceipt* out_receipt,
                                   LedgerError* out_error) {
  ++submit_calls_;
  last_batch_size_ = actions.size();
  last_policy_ = policy;
  last_actions_ = actions;

  if (!scripted_failures_.empty()) {
    if (out_error != nullptr) {
      *out_error = scripted_failures_.front();
    }
    scripted_failures_.pop_front();
    return false;
  }

  const double cost = options_.cpu_us_per_action * static_cast<double>(actions.size());
  // 超出剩余配额时与真实链一致：整笔拒绝。
  if (options_.cpu_used_us + cost > options_.cpu_max_us) {
    if (out_error != nullptr) {
      *out_error = LedgerError{3080004, "tx_cpu_usage_exceeded",
                               "Transaction exceeded the current CPU usage limit "
                               "imposed on the transaction"};
    }
    return false;
  }
  options_.cpu_used_us += cost;

  std::string base_symbol;
  for (const auto& action : actions) {
    const std::size_t space = action.quantity.find(' ');
    if (space == std::string::npos) {
      continue;
    }
    base_symbol = action.quantity.substr(space + 1);
    balance_by_symbol_[base_symbol] -=
        std::strtod(action.quantity.substr(0, space).c_str(), nullptr);
  }
  for (auto& [symbol, balance] : balance_by_symbol_) {
    if (symbol != base_symbol) {
      balance += options_.reward_per_action * static_cast<double>(actions.size());
    }
  }

  if (out_receipt != nullptr) {
    ++tx_seq_;
    out_receipt->transaction_id = name_ + "-tx-" + std::to_string(tx_seq_);
    out_receipt->block_num = static_cast<std::int64_t>(tx_seq_);
    out_receipt->cpu_usage_us = static_cast<std::int64_t>(cost);
  }
  return true;
}

}  // namespace eos_miner
