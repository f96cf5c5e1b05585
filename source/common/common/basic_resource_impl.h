#pragma once

#include <atomic>
#include <limits>

#include "relay/common/resource.h"

#include "source/common/common/assert.h"

namespace Relay {

/**
 * A handle to track some limited resource.
 *
 * NOTE:
 * This implementation makes some assumptions which favor simplicity over correctness. Though
 * atomics are used, it is possible for resources to temporarily go above the supplied maximums.
 * This should not effect overall behavior.
 */
class BasicResourceLimitImpl : public ResourceLimit {
public:
  explicit BasicResourceLimitImpl(uint64_t max) : max_(max) {}
  BasicResourceLimitImpl() : max_(std::numeric_limits<uint64_t>::max()) {}

  bool canCreate() override { return current_.load() < max(); }

  void inc() override { ++current_; }

  void dec() override { decBy(1); }

  void decBy(uint64_t amount) override {
    ASSERT(current_ >= amount);
    current_ -= amount;
  }

  uint64_t max() override { return max_.load(); }

  uint64_t count() const override { return current_.load(); }

  void setMax(uint64_t new_max) { max_ = new_max; }
  void resetMax() { max_ = std::numeric_limits<uint64_t>::max(); }

protected:
  std::atomic<uint64_t> current_{};

private:
  std::atomic<uint64_t> max_;
};

} // namespace Relay
