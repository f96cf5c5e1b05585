#include "source/common/common/assert.h"

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

namespace Relay {
namespace Assert {

class RelayBugState {
public:
  static RelayBugState& get() {
    static RelayBugState* state = new RelayBugState();
    return *state;
  }

  void clear() {
    absl::MutexLock lock(&mutex_);
    counters_.clear();
  }

  uint64_t inc(absl::string_view bug_name) {
    absl::MutexLock lock(&mutex_);
    return ++counters_[bug_name];
  }

private:
  absl::Mutex mutex_;
  absl::flat_hash_map<std::string, uint64_t> counters_ ABSL_GUARDED_BY(mutex_);
};

// Triggers RELAY_BUG logs and actions with exponential back-off per file and line.
class RelayBugRegistrationImpl : public ActionRegistration {
public:
  RelayBugRegistrationImpl(std::function<void(const char* location)> action) : action_(action) {
    next_action_ = relay_bug_failure_record_action_;
    relay_bug_failure_record_action_ = this;

    // Reset counters when a registration is added.
    RelayBugState::get().clear();
  }

  ~RelayBugRegistrationImpl() override {
    ASSERT(relay_bug_failure_record_action_ == this);
    relay_bug_failure_record_action_ = next_action_;
  }

  static bool shouldLogAndInvoke(absl::string_view bug_name) {
    const uint64_t counter_value = RelayBugState::get().inc(bug_name);

    // Power of two check.
    return (counter_value & (counter_value - 1)) == 0;
  }

  void invoke(const char* location) {
    action_(location);
    if (next_action_) {
      next_action_->invoke(location);
    }
  }

  static void invokeAction(const char* location) {
    if (relay_bug_failure_record_action_ != nullptr) {
      relay_bug_failure_record_action_->invoke(location);
    }
  }

  static void resetRelayBugCounters() { RelayBugState::get().clear(); }

private:
  std::function<void(const char* location)> action_;
  RelayBugRegistrationImpl* next_action_ = nullptr;

  // First action in the chain, or nullptr if no action is currently registered.
  static RelayBugRegistrationImpl* relay_bug_failure_record_action_;
};

RelayBugRegistrationImpl* RelayBugRegistrationImpl::relay_bug_failure_record_action_ = nullptr;

ActionRegistrationPtr
addRelayBugFailureRecordAction(const std::function<void(const char* location)>& action) {
  return std::make_unique<RelayBugRegistrationImpl>(action);
}

void invokeRelayBugFailureRecordActionForRelayBugMacroUseOnly(const char* location) {
  RelayBugRegistrationImpl::invokeAction(location);
}

bool shouldLogAndInvokeRelayBugForRelayBugMacroUseOnly(absl::string_view bug_name) {
  return RelayBugRegistrationImpl::shouldLogAndInvoke(bug_name);
}

void resetRelayBugCountersForTest() { RelayBugRegistrationImpl::resetRelayBugCounters(); }

} // namespace Assert
} // namespace Relay
