#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "relay/common/pure.h"
#include "relay/thread/thread.h"

#include "source/common/common/base_logger.h"
#include "source/common/common/fmt.h"
#include "source/common/common/macros.h"
#include "source/common/common/non_copyable.h"

#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/sink.h"
#include "spdlog/spdlog.h"

namespace Relay {
namespace Logger {

// Logger IDs
#define ALL_LOGGER_IDS(FUNCTION)                                                                   \
  FUNCTION(assert)                                                                                 \
  FUNCTION(client)                                                                                 \
  FUNCTION(config)                                                                                 \
  FUNCTION(connection)                                                                             \
  FUNCTION(http)                                                                                   \
  FUNCTION(http2)                                                                                  \
  FUNCTION(main)                                                                                   \
  FUNCTION(misc)                                                                                   \
  FUNCTION(pool)                                                                                   \
  FUNCTION(relay_bug)                                                                              \
  FUNCTION(testing)                                                                                \
  FUNCTION(upstream)

// clang-format off
enum class Id {
  ALL_LOGGER_IDS(GENERATE_ENUM)
};
// clang-format on

/**
 * Logger that uses the DelegatingLogSink.
 */
class StandardLogger : public Logger {
public:
  explicit StandardLogger(const std::string& name);
};

class DelegatingLogSink;
using DelegatingLogSinkSharedPtr = std::shared_ptr<DelegatingLogSink>;

/**
 * Captures a logging sink that can be delegated to for a bounded amount of time.
 * On destruction, logging is reverted to its previous state. SinkDelegates must
 * be allocated/freed as a stack.
 */
class SinkDelegate : NonCopyable {
public:
  explicit SinkDelegate(DelegatingLogSinkSharedPtr log_sink);
  virtual ~SinkDelegate();

  /**
   * Called to log a single log line.
   * @param msg the final, formatted message.
   * @param log_msg the original log message, including additional metadata.
   */
  virtual void log(absl::string_view msg, const spdlog::details::log_msg& log_msg) PURE;
  virtual void flush() PURE;

protected:
  // Swap the current log sink delegate for this one. This should be called by the derived class
  // constructor immediately before returning.
  void setDelegate();

  // Swap the current log sink (this) for the previous one. This must be called by the derived
  // class destructor so that no message is routed to a partially destructed sink.
  void restoreDelegate();

  SinkDelegate* previousDelegate() { return previous_delegate_; }

private:
  SinkDelegate* previous_delegate_{nullptr};
  DelegatingLogSinkSharedPtr log_sink_;
};

/**
 * SinkDelegate that writes log messages to stderr.
 */
class StderrSinkDelegate : public SinkDelegate {
public:
  explicit StderrSinkDelegate(DelegatingLogSinkSharedPtr log_sink);
  ~StderrSinkDelegate() override;

  // SinkDelegate
  void log(absl::string_view msg, const spdlog::details::log_msg& log_msg) override;
  void flush() override;

  bool hasLock() const { return lock_ != nullptr; }
  void setLock(Thread::BasicLockable& lock) { lock_ = &lock; }
  void clearLock() { lock_ = nullptr; }

private:
  Thread::BasicLockable* lock_{};
};

/**
 * Stacks logging sinks, so you can temporarily override the logging mechanism, restoring
 * the previous state when the DelegatingSink is destructed.
 */
class DelegatingLogSink : public spdlog::sinks::sink {
public:
  void setLock(Thread::BasicLockable& lock) { stderr_sink_->setLock(lock); }
  void clearLock() { stderr_sink_->clearLock(); }

  // spdlog::sinks::sink
  void log(const spdlog::details::log_msg& msg) override;
  void flush() override;
  void set_pattern(const std::string& pattern) override {
    set_formatter(spdlog::details::make_unique<spdlog::pattern_formatter>(pattern));
  }
  void set_formatter(std::unique_ptr<spdlog::formatter> formatter) override;
  void setShouldEscape(bool should_escape) { should_escape_ = should_escape; }

  /**
   * @return bool whether a lock has been established.
   */
  bool hasLock() const { return stderr_sink_->hasLock(); }

  /**
   * Constructs a new DelegatingLogSink, sets up the default sink to stderr,
   * and returns a shared_ptr to it. StderrSinkDelegate needs the shared_ptr rather than the raw
   * pointer, which only exists after construction.
   */
  static DelegatingLogSinkSharedPtr init();

  /**
   * Escapes all c-style escape sequences in a log line except the trailing end-of-line.
   *
   * @param source the log line with trailing whitespace
   * @return the escaped line.
   */
  static std::string escapeLogLine(absl::string_view source);

private:
  friend class SinkDelegate;

  DelegatingLogSink() = default;

  void setDelegate(SinkDelegate* sink) {
    absl::WriterMutexLock lock(&sink_mutex_);
    sink_ = sink;
  }
  SinkDelegate* delegate() {
    absl::ReaderMutexLock lock(&sink_mutex_);
    return sink_;
  }

  SinkDelegate* sink_ ABSL_GUARDED_BY(sink_mutex_){nullptr};
  absl::Mutex sink_mutex_;
  std::unique_ptr<StderrSinkDelegate> stderr_sink_; // Builtin sink to use as a last resort.
  std::unique_ptr<spdlog::formatter> formatter_ ABSL_GUARDED_BY(format_mutex_);
  absl::Mutex format_mutex_;
  bool should_escape_{false};
};

/**
 * Defines a scope for the logging system with the specified lock, log level and format.
 *
 * Contexts can be nested. When a nested context is destroyed, the previous
 * context is restored. When all contexts are destroyed, the lock is cleared,
 * and logging will remain unlocked.
 */
class Context {
public:
  Context(spdlog::level::level_enum log_level, const std::string& log_format,
          Thread::BasicLockable& lock, bool should_escape);
  ~Context();

  // Change the log level for all registered loggers.
  static void changeAllLogLevels(spdlog::level::level_enum level);

private:
  void activate();

  const spdlog::level::level_enum log_level_;
  const std::string log_format_;
  Thread::BasicLockable& lock_;
  bool should_escape_;
  Context* const save_context_;
};

#define GENERATE_LOGGER(X) StandardLogger(#X),

/**
 * A registry of all named loggers in relay. Usable for adjusting levels of each logger
 * individually.
 */
class Registry {
public:
  /**
   * @param id supplies the fixed ID of the logger to create.
   * @return spdlog::logger& a logger with system specified sinks for a given ID.
   */
  static spdlog::logger& getLog(Id id);

  /**
   * @return the singleton sink to use for all loggers.
   */
  static DelegatingLogSinkSharedPtr getSink() {
    static DelegatingLogSinkSharedPtr sink = DelegatingLogSink::init();
    return sink;
  }

  /**
   * Sets the minimum log severity required to print messages.
   * Messages below this loglevel will be suppressed.
   */
  static void setLogLevel(spdlog::level::level_enum log_level);

  /**
   * Sets the log format.
   */
  static void setLogFormat(const std::string& log_format);

  /**
   * @return std::vector<Logger>& the installed loggers.
   */
  static std::vector<Logger>& loggers() { return allLoggers(); }

  /**
   * @Return bool whether the registry has been initialized.
   */
  static bool initialized() { return getSink()->hasLock(); }

  /**
   * @return the logger with the given name, or nullptr if there is none.
   */
  static Logger* logger(const std::string& log_name);

private:
  static std::vector<Logger>& allLoggers();
};

/**
 * Mixin class that allows any class to perform logging with a logger of a particular ID.
 */
template <Id id> class Loggable {
protected:
  /**
   * Do not use this directly, use macros defined below.
   * @return spdlog::logger& the static log instance to use for class local logging.
   */
  static spdlog::logger& __log_do_not_use_read_comment() { // NOLINT(readability-identifier-naming)
    static spdlog::logger& instance = Registry::getLog(id);
    return instance;
  }
};

} // namespace Logger

// Convert the level macro to an spdlog level.
#define RELAY_SPDLOG_LEVEL(LEVEL)                                                                  \
  (static_cast<spdlog::level::level_enum>(Relay::Logger::Logger::LEVEL))

#define RELAY_LOG_COMP_LEVEL(LOGGER, LEVEL) (RELAY_SPDLOG_LEVEL(LEVEL) >= (LOGGER).level())

/**
 * Base logging macros. It is expected that users will use the convenience macros below rather
 * than invoke these directly.
 */
#define RELAY_LOG_TO_LOGGER(LOGGER, LEVEL, ...)                                                    \
  do {                                                                                             \
    if (RELAY_LOG_COMP_LEVEL(LOGGER, LEVEL)) {                                                     \
      (LOGGER).log(::spdlog::source_loc{__FILE__, __LINE__, __func__}, RELAY_SPDLOG_LEVEL(LEVEL),  \
                   __VA_ARGS__);                                                                   \
    }                                                                                              \
  } while (0)

/**
 * Convenience macro to log to the misc logger, which allows for logging without of direct access
 * to a logger.
 */
#define GET_MISC_LOGGER() ::Relay::Logger::Registry::getLog(::Relay::Logger::Id::misc)
#define RELAY_LOG_MISC(LEVEL, ...) RELAY_LOG_TO_LOGGER(GET_MISC_LOGGER(), LEVEL, ##__VA_ARGS__)

/**
 * Command line options for log macros: use the class local logger.
 */
#define RELAY_LOGGER() __log_do_not_use_read_comment()

/**
 * Convenience macro to log to the class' logger.
 */
#define RELAY_LOG(LEVEL, ...) RELAY_LOG_TO_LOGGER(RELAY_LOGGER(), LEVEL, ##__VA_ARGS__)

/**
 * Convenience macros for logging with connection ID.
 */
#define RELAY_CONN_LOG_TO_LOGGER(LOGGER, LEVEL, FORMAT, CONNECTION, ...)                           \
  RELAY_LOG_TO_LOGGER(LOGGER, LEVEL, "[C{}] " FORMAT, (CONNECTION).id(), ##__VA_ARGS__)

#define RELAY_CONN_LOG(LEVEL, FORMAT, CONNECTION, ...)                                             \
  RELAY_CONN_LOG_TO_LOGGER(RELAY_LOGGER(), LEVEL, FORMAT, CONNECTION, ##__VA_ARGS__)

/**
 * Convenience macros for logging with a stream ID.
 */
#define RELAY_STREAM_LOG(LEVEL, FORMAT, STREAM_ID, ...)                                            \
  RELAY_LOG_TO_LOGGER(RELAY_LOGGER(), LEVEL, "[S{}] " FORMAT, STREAM_ID, ##__VA_ARGS__)

} // namespace Relay
