#pragma once

#include <functional>
#include <memory>
#include <string>

#include "source/common/common/logger.h"

namespace Relay {
namespace Assert {

class ActionRegistration {
public:
  virtual ~ActionRegistration() = default;
};
using ActionRegistrationPtr = std::unique_ptr<ActionRegistration>;

/**
 * Sets an action to be invoked when a RELAY_BUG failure is detected in a release build. This
 * action will be invoked each time a RELAY_BUG failure is logged, which happens with exponential
 * back-off per call site.
 *
 * @param action The action to take when a RELAY_BUG fails.
 * @return A registration object. The registration is removed when the object is destructed.
 */
ActionRegistrationPtr
addRelayBugFailureRecordAction(const std::function<void(const char* location)>& action);

/**
 * Invokes the action set by addRelayBugFailureRecordAction, or does nothing if
 * no action has been set.
 *
 * @param location Unique identifier for the RELAY_BUG.
 *
 * This should only be called by RELAY_BUG macros in this file.
 */
void invokeRelayBugFailureRecordActionForRelayBugMacroUseOnly(const char* location);

/**
 * Increments power of two counter for RELAY_BUG failure logging.
 *
 * @param bug_name Unique identifier for the RELAY_BUG.
 * @return true if the hit count for this bug is a power of two.
 *
 * This should only be called by RELAY_BUG macros in this file.
 */
bool shouldLogAndInvokeRelayBugForRelayBugMacroUseOnly(absl::string_view bug_name);

/**
 * Resets all counters for RELAY_BUG so that the next hit of each bug is logged.
 */
void resetRelayBugCountersForTest();

// CONDITION_STR is needed to prevent macros in condition from being expanded, which obfuscates
// the logged failure, e.g., "EAGAIN" vs "11".
#define _ASSERT_IMPL(CONDITION, CONDITION_STR, ACTION, DETAILS)                                    \
  do {                                                                                             \
    if (!(CONDITION)) {                                                                            \
      const std::string& details = (DETAILS);                                                      \
      RELAY_LOG_TO_LOGGER(Relay::Logger::Registry::getLog(Relay::Logger::Id::assert), critical,    \
                          "assert failure: {}.{}{}", CONDITION_STR,                                \
                          details.empty() ? "" : " Details: ", details);                           \
      ACTION;                                                                                      \
    }                                                                                              \
  } while (false)

// Ensures the argument is a valid boolean expression without evaluating it.
#define _NULL_ASSERT_IMPL(X, ...)                                                                  \
  do {                                                                                             \
    constexpr bool __assert_dummy_variable = false && static_cast<bool>(X);                        \
    (void)__assert_dummy_variable;                                                                 \
  } while (false)

/**
 * Assert that is compiled into every build. On failure the condition and details are logged at
 * critical level and the process aborts.
 */
#define RELEASE_ASSERT(X, DETAILS) _ASSERT_IMPL(X, #X, ::abort(), DETAILS)

#define _ASSERT_ORIGINAL(X) _ASSERT_IMPL(X, #X, ::abort(), "")
#define _ASSERT_VERBOSE(X, Y) _ASSERT_IMPL(X, #X, ::abort(), Y)
#define _ASSERT_SELECTOR(_1, _2, ASSERT_MACRO, ...) ASSERT_MACRO

// This is needed to work around MSVC's inability to expand __VA_ARGS__ correctly.
#define EXPAND(X) X

#if !defined(NDEBUG)
/**
 * Debug-only assert. Accepts either ASSERT(cond) or ASSERT(cond, "details").
 */
#define ASSERT(...)                                                                                \
  EXPAND(_ASSERT_SELECTOR(__VA_ARGS__, _ASSERT_VERBOSE, _ASSERT_ORIGINAL)(__VA_ARGS__))
#else
#define ASSERT _NULL_ASSERT_IMPL
#endif // !defined(NDEBUG)

/**
 * Indicate a panic situation and exit.
 */
#define PANIC(X)                                                                                   \
  do {                                                                                             \
    RELAY_LOG_TO_LOGGER(Relay::Logger::Registry::getLog(Relay::Logger::Id::assert), critical,      \
                        "panic: {}", X);                                                           \
    ::abort();                                                                                     \
  } while (false)

// These macros are needed to stringify __LINE__ correctly.
#define STRINGIFY(X) #X
#define TOSTRING(X) STRINGIFY(X)

#if !defined(NDEBUG) && !defined(RELAY_CONFIG_COVERAGE)
#define RELAY_BUG_ACTION ::abort()
#else
#define RELAY_BUG_ACTION                                                                           \
  Relay::Assert::invokeRelayBugFailureRecordActionForRelayBugMacroUseOnly(__FILE__                 \
                                                                          ":" TOSTRING(__LINE__))
#endif

// RELAY_BUG logging and actions are invoked only on power-of-two instances per log line.
#define _RELAY_BUG_IMPL(CONDITION, CONDITION_STR, ACTION, DETAILS)                                 \
  do {                                                                                             \
    if (!(CONDITION) && Relay::Assert::shouldLogAndInvokeRelayBugForRelayBugMacroUseOnly(          \
                            __FILE__ ":" TOSTRING(__LINE__))) {                                    \
      const std::string& details = (DETAILS);                                                      \
      RELAY_LOG_TO_LOGGER(Relay::Logger::Registry::getLog(Relay::Logger::Id::relay_bug), error,    \
                          "relay bug failure: {}.{}{}", CONDITION_STR,                             \
                          details.empty() ? "" : " Details: ", details);                           \
      ACTION;                                                                                      \
    }                                                                                              \
  } while (false)

#define _RELAY_BUG_VERBOSE(X, Y) _RELAY_BUG_IMPL(X, #X, RELAY_BUG_ACTION, Y)

#define PASS_ON(...) __VA_ARGS__

/**
 * Indicate a failure condition that should never be met in normal circumstances. Unlike ASSERT,
 * a RELAY_BUG is compiled into release builds, where it logs with exponential back-off per call
 * site instead of crashing. RELAY_BUG must be called with two arguments.
 */
#define RELAY_BUG(...) PASS_ON(PASS_ON(_RELAY_BUG_VERBOSE)(__VA_ARGS__))

// Always triggers RELAY_BUG. This is intended for paths that are not expected to be reached.
#define IS_RELAY_BUG(...) RELAY_BUG(false, __VA_ARGS__);

#define PANIC_DUE_TO_CORRUPT_ENUM PANIC("corrupted enum");

} // namespace Assert
} // namespace Relay
