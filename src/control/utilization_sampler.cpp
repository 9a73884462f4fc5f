#include "control/utilization_sampler.h"

#include <cmath>

namespace eos_miner {

bool UtilizationSampler::Sample(EndpointPool* pool,
                                UtilizationReading* out_reading,
                                std::string* out_error) const {
  if (out_reading == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_reading 为空";
    }
    return false;
  }
  LedgerClient* endpoint = pool == nullptr ? nullptr : pool->Select();
  if (endpoint == nullptr) {
    if (out_error != nullptr) {
      *out_error = "节点池为空";
    }
    return false;
  }

  AccountLimits limits;
  std::string query_error;
  if (!endpoint->GetAccountLimits(account_, &limits, &query_error)) {
    if (out_error != nullptr) {
      *out_error = endpoint->Name() + " 资源查询失败: " + query_error;
    }
    return false;
  }
  if (!(limits.max > 0.0) || !std::isfinite(limits.used)) {
    if (out_error != nullptr) {
      *out_error = endpoint->Name() + " 返回的 cpu_limit 非法: used=" +
                   std::to_string(limits.used) +
                   ", max=" + std::to_string(limits.max);
    }
    return false;
  }

  out_reading->ratio = limits.used / limits.max;
  out_reading->limits = limits;
  out_reading->endpoint = endpoint;
  return true;
}

}  // namespace eos_miner
