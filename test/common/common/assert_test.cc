#include <string>

#include "source/common/common/assert.h"

#include "test/test_common/logging.h"
#include "test/test_common/utility.h"

#include "gtest/gtest.h"

namespace Relay {
namespace {

TEST(ReleaseAssertDeathTest, VariousLogs) {
  EXPECT_DEATH({ RELEASE_ASSERT(0, ""); }, ".*assert failure: 0.*");
  EXPECT_DEATH({ RELEASE_ASSERT(0, "With some logs"); },
               ".*assert failure: 0. Details: With some logs.*");
  EXPECT_DEATH({ RELEASE_ASSERT(0 == 1, std::string("With some logs")); },
               ".*assert failure: 0 == 1. Details: With some logs.*");
}

TEST(AssertDeathTest, VariousLogs) {
#ifndef NDEBUG
  EXPECT_DEATH({ ASSERT(0); }, ".*assert failure: 0.*");
  EXPECT_DEATH({ ASSERT(0, ""); }, ".*assert failure: 0.*");
  EXPECT_DEATH({ ASSERT(0, "With some logs"); }, ".*assert failure: 0. Details: With some logs.*");
#else
  // Compiled out.
  ASSERT(0);
  ASSERT(0, "With some logs");
#endif
}

TEST(PanicDeathTest, Message) {
  EXPECT_DEATH({ PANIC("panic with message"); }, ".*panic: panic with message.*");
  EXPECT_DEATH({ PANIC_DUE_TO_CORRUPT_ENUM; }, ".*panic: corrupted enum.*");
}

TEST(RelayBugDeathTest, VariousLogs) {
  int relay_bug_fail_count = 0;
  // Use 2 actions to test action linking.
  auto relay_bug_action_registration =
      Assert::addRelayBugFailureRecordAction([&](const char*) { relay_bug_fail_count++; });
  auto relay_bug_action_registration2 =
      Assert::addRelayBugFailureRecordAction([&](const char*) { relay_bug_fail_count++; });

  EXPECT_RELAY_BUG({ IS_RELAY_BUG("bug name"); }, "relay bug failure: false. Details: bug name");
  EXPECT_RELAY_BUG({ RELAY_BUG(false, ""); }, "relay bug failure: false.");
  EXPECT_RELAY_BUG({ RELAY_BUG(false, "With some logs"); },
                   "relay bug failure: false. Details: With some logs");

#if !defined(NDEBUG) && !defined(RELAY_CONFIG_COVERAGE)
  // Death tests run in a child process, so the counter is untouched here.
  EXPECT_EQ(0, relay_bug_fail_count);
#else
  // Each action is invoked once per logged bug.
  EXPECT_EQ(6, relay_bug_fail_count);
#endif
}

TEST(RelayBugDeathTest, PassingCondition) {
  EXPECT_NO_LOGS(RELAY_BUG(true, "never logged"));
}

#if defined(NDEBUG) || defined(RELAY_CONFIG_COVERAGE)
TEST(RelayBugTest, LogsWithExponentialBackoff) {
  Assert::resetRelayBugCountersForTest();
  int relay_bug_fail_count = 0;
  auto relay_bug_action_registration =
      Assert::addRelayBugFailureRecordAction([&](const char*) { relay_bug_fail_count++; });

  // Hits 1, 2 and 4 are logged.
  for (int i = 0; i < 5; i++) {
    RELAY_BUG(false, "back-off");
  }
  EXPECT_EQ(3, relay_bug_fail_count);

  Assert::resetRelayBugCountersForTest();
  RELAY_BUG(false, "back-off");
  EXPECT_EQ(4, relay_bug_fail_count);
}
#endif

} // namespace
} // namespace Relay
