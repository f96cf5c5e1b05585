#include <string>

#include "source/common/common/logger.h"
#include "source/common/common/thread.h"

#include "test/test_common/logging.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::HasSubstr;

namespace Relay {
namespace Logger {
namespace {

class TestConnection {
public:
  uint64_t id() const { return 7; }
};

class LoggerTestClass : public Loggable<Id::pool> {
public:
  void logMessage() { RELAY_LOG(debug, "fake message {}", 1); }
  void logConnection(const TestConnection& connection) {
    RELAY_CONN_LOG(debug, "connection message {}", connection, "extra");
  }
  void logStream(absl::string_view stream_id) {
    RELAY_STREAM_LOG(debug, "stream message", stream_id);
  }
  spdlog::logger& logger() { return RELAY_LOGGER(); }
};

TEST(LoggerTest, ClassLoggerUsesItsId) {
  LoggerTestClass test_class;
  EXPECT_EQ("pool", test_class.logger().name());
  EXPECT_LOG_CONTAINS("debug", "fake message 1", test_class.logMessage());
}

TEST(LoggerTest, ConnectionAndStreamPrefixes) {
  LoggerTestClass test_class;
  EXPECT_LOG_CONTAINS("debug", "[C7] connection message extra",
                      test_class.logConnection(TestConnection()));
  EXPECT_LOG_CONTAINS("debug", "[Ss1] stream message", test_class.logStream("s1"));
}

TEST(LoggerTest, MiscLogger) {
  EXPECT_LOG_CONTAINS("info", "misc message", RELAY_LOG_MISC(info, "misc message"));
}

TEST(LoggerTest, LevelFiltersMessages) {
  LoggerTestClass test_class;
  LogLevelSetter save_levels(spdlog::level::info);
  LogRecordingSink recorder(Registry::getSink());
  test_class.logMessage();
  EXPECT_TRUE(recorder.messages().empty());
}

TEST(LoggerTest, RegistryLookup) {
  ASSERT_NE(nullptr, Registry::logger("upstream"));
  EXPECT_EQ("upstream", Registry::logger("upstream")->name());
  EXPECT_EQ(nullptr, Registry::logger("nonexistent"));
  EXPECT_EQ("pool", Registry::getLog(Id::pool).name());
  EXPECT_TRUE(Registry::initialized());
}

TEST(LoggerTest, ChangeAllLogLevels) {
  LogLevelSetter save_levels(spdlog::level::info);
  Context::changeAllLogLevels(spdlog::level::err);
  for (Logger& logger : Registry::loggers()) {
    EXPECT_EQ(spdlog::level::err, logger.level());
  }
}

TEST(LoggerEscapeTest, LinuxEOL) {
  EXPECT_EQ("line 1 \\n line 2\n", DelegatingLogSink::escapeLogLine("line 1 \n line 2\n"));
}

TEST(LoggerEscapeTest, NoTrailingWhitespace) {
  EXPECT_EQ("line 1 \\n line 2", DelegatingLogSink::escapeLogLine("line 1 \n line 2"));
}

TEST(LoggerEscapeTest, NoWhitespace) {
  EXPECT_EQ("line1", DelegatingLogSink::escapeLogLine("line1"));
}

TEST(LoggerEscapeTest, AnyTrailingWhitespace) {
  EXPECT_EQ("line 1 \\t tab 1 \\n line 2\\t\\n",
            DelegatingLogSink::escapeLogLine("line 1 \t tab 1 \n line 2\t\n"));
}

TEST(LoggerEscapeTest, EmptyLine) { EXPECT_EQ("", DelegatingLogSink::escapeLogLine("")); }

TEST(LoggerContextTest, EscapingContext) {
  Thread::MutexBasicLockable lock;
  Context context(spdlog::level::trace, Logger::DEFAULT_LOG_FORMAT, lock, true);
  LogRecordingSink recorder(Registry::getSink());
  RELAY_LOG_MISC(info, "line 1 \n line 2");
  ASSERT_EQ(1, recorder.messages().size());
  EXPECT_THAT(recorder.messages()[0], HasSubstr("line 1 \\n line 2"));
}

TEST(LoggerContextTest, ContextSetsLogFormat) {
  Thread::MutexBasicLockable lock;
  {
    Context context(spdlog::level::trace, "[%n] %v", lock, false);
    LogRecordingSink recorder(Registry::getSink());
    RELAY_LOG_MISC(info, "formatted message");
    ASSERT_EQ(1, recorder.messages().size());
    EXPECT_THAT(recorder.messages()[0], testing::StartsWith("[misc] formatted message"));
  }

  // Leaving the context brings back the default format of the enclosing one.
  LogLevelSetter save_levels(spdlog::level::info);
  LogRecordingSink recorder(Registry::getSink());
  RELAY_LOG_MISC(info, "default message");
  ASSERT_EQ(1, recorder.messages().size());
  EXPECT_THAT(recorder.messages()[0], HasSubstr("[info][misc]"));
}

TEST(LoggerContextTest, SinkEscapingCanBeToggled) {
  LogLevelSetter save_levels(spdlog::level::info);
  LogRecordingSink recorder(Registry::getSink());

  Registry::getSink()->setShouldEscape(true);
  RELAY_LOG_MISC(info, "tab\there");
  Registry::getSink()->setShouldEscape(false);
  RELAY_LOG_MISC(info, "tab\there");

  ASSERT_EQ(2, recorder.messages().size());
  EXPECT_THAT(recorder.messages()[0], HasSubstr("tab\\there"));
  EXPECT_THAT(recorder.messages()[1], HasSubstr("tab\there"));
}

TEST(LoggerContextTest, NestedContextRestoresLevel) {
  Thread::MutexBasicLockable lock;
  {
    Context context(spdlog::level::err, Logger::DEFAULT_LOG_FORMAT, lock, false);
    EXPECT_EQ(spdlog::level::err, Registry::getLog(Id::pool).level());
  }
  // The context installed by the test main is active again.
  EXPECT_EQ(spdlog::level::warn, Registry::getLog(Id::pool).level());
}

} // namespace
} // namespace Logger
} // namespace Relay
