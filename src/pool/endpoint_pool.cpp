#include "pool/endpoint_pool.h"

#include <utility>

namespace eos_miner {

std::size_t UniformRandomSelector::Pick(std::size_t size) {
  if (size <= 1U) {
    return 0;
  }
  std::uniform_int_distribution<std::size_t> dist(0, size - 1U);
  return dist(rng_);
}

EndpointPool::EndpointPool(std::vector<std::unique_ptr<LedgerClient>> endpoints,
                           std::unique_ptr<EndpointSelector> selector)
    : endpoints_(std::move(endpoints)), selector_(std::move(selector)) {
  if (selector_ == nullptr) {
    selector_ = std::make_unique<UniformRandomSelector>();
  }
}

LedgerClient* EndpointPool::Select() {
  if (endpoints_.empty()) {
    return nullptr;
  }
  std::size_t index = selector_->Pick(endpoints_.size());
  if (index >= endpoints_.size()) {
    // 选择策略越界时回绕，保证结果始终落在池内。
    index %= endpoints_.size();
  }
  return endpoints_[index].get();
}

LedgerClient* EndpointPool::At(std::size_t index) const {
  if (index >= endpoints_.size()) {
    return nullptr;
  }
  return endpoints_[index].get();
}

}  // namespace eos_miner
