#include "source/common/common/logger.h"

#include <atomic>
#include <cassert> // use direct system-assert to avoid cyclic dependency.
#include <iostream>
#include <string>
#include <vector>

#include "source/common/common/lock_guard.h"

#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"

namespace Relay {
namespace Logger {

StandardLogger::StandardLogger(const std::string& name)
    : Logger(std::make_shared<spdlog::logger>(name, Registry::getSink())) {}

SinkDelegate::SinkDelegate(DelegatingLogSinkSharedPtr log_sink) : log_sink_(log_sink) {}

SinkDelegate::~SinkDelegate() {
  // The previous delegate should have never been set or should have been reset by now via
  // restoreDelegate().
  assert(previous_delegate_ == nullptr);
}

void SinkDelegate::setDelegate() {
  // There should be no previous delegate before this call.
  assert(previous_delegate_ == nullptr);
  previous_delegate_ = log_sink_->delegate();
  log_sink_->setDelegate(this);
}

void SinkDelegate::restoreDelegate() {
  // Ensures stacked allocation of delegates.
  assert(log_sink_->delegate() == this);
  log_sink_->setDelegate(previous_delegate_);
  previous_delegate_ = nullptr;
}

StderrSinkDelegate::StderrSinkDelegate(DelegatingLogSinkSharedPtr log_sink)
    : SinkDelegate(log_sink) {
  setDelegate();
}

StderrSinkDelegate::~StderrSinkDelegate() { restoreDelegate(); }

void StderrSinkDelegate::log(absl::string_view msg, const spdlog::details::log_msg&) {
  Thread::OptionalLockGuard guard(lock_);
  std::cerr << msg;
}

void StderrSinkDelegate::flush() {
  Thread::OptionalLockGuard guard(lock_);
  std::cerr << std::flush;
}

void DelegatingLogSink::set_formatter(std::unique_ptr<spdlog::formatter> formatter) {
  absl::MutexLock lock(&format_mutex_);
  formatter_ = std::move(formatter);
}

void DelegatingLogSink::log(const spdlog::details::log_msg& msg) {
  absl::ReleasableMutexLock lock(&format_mutex_);
  absl::string_view msg_view = absl::string_view(msg.payload.data(), msg.payload.size());

  // The formatted buffer backs msg_view for the rest of the function.
  spdlog::memory_buf_t formatted;
  if (formatter_) {
    formatter_->format(msg, formatted);
    msg_view = absl::string_view(formatted.data(), formatted.size());
  }
  lock.Release();

  // Hold the sink mutex while logging so the sink cannot be swapped mid-line.
  absl::ReaderMutexLock sink_lock(&sink_mutex_);
  if (should_escape_) {
    sink_->log(escapeLogLine(msg_view), msg);
  } else {
    sink_->log(msg_view, msg);
  }
}

std::string DelegatingLogSink::escapeLogLine(absl::string_view msg_view) {
  absl::string_view eol = spdlog::details::os::default_eol;
  if (!absl::EndsWith(msg_view, eol)) {
    return absl::CEscape(msg_view);
  }

  absl::string_view msg_leading =
      absl::string_view(msg_view.data(), msg_view.size() - eol.length());
  return absl::StrCat(absl::CEscape(msg_leading), eol);
}

DelegatingLogSinkSharedPtr DelegatingLogSink::init() {
  DelegatingLogSinkSharedPtr delegating_sink(new DelegatingLogSink);
  delegating_sink->stderr_sink_ = std::make_unique<StderrSinkDelegate>(delegating_sink);
  return delegating_sink;
}

void DelegatingLogSink::flush() {
  absl::ReaderMutexLock lock(&sink_mutex_);
  sink_->flush();
}

static std::atomic<Context*> current_context = nullptr;

Context::Context(spdlog::level::level_enum log_level, const std::string& log_format,
                 Thread::BasicLockable& lock, bool should_escape)
    : log_level_(log_level), log_format_(log_format), lock_(lock), should_escape_(should_escape),
      save_context_(current_context) {
  current_context = this;
  activate();
}

Context::~Context() {
  current_context = save_context_;
  if (current_context != nullptr) {
    current_context.load()->activate();
  } else {
    Registry::getSink()->clearLock();
  }
}

void Context::activate() {
  Registry::getSink()->setLock(lock_);
  Registry::getSink()->setShouldEscape(should_escape_);
  Registry::setLogLevel(log_level_);
  Registry::setLogFormat(log_format_);
}

void Context::changeAllLogLevels(spdlog::level::level_enum level) {
  RELAY_LOG_MISC(info, "change all log levels: level='{}'",
                 spdlog::level::to_string_view(level));
  Registry::setLogLevel(level);
}

std::vector<Logger>& Registry::allLoggers() {
  static std::vector<Logger>* all_loggers =
      new std::vector<Logger>({ALL_LOGGER_IDS(GENERATE_LOGGER)});
  return *all_loggers;
}

spdlog::logger& Registry::getLog(Id id) { return allLoggers()[static_cast<int>(id)].getLogger(); }

void Registry::setLogLevel(spdlog::level::level_enum log_level) {
  for (Logger& logger : allLoggers()) {
    logger.setLevel(log_level);
  }
}

void Registry::setLogFormat(const std::string& log_format) {
  for (Logger& logger : allLoggers()) {
    logger.getLogger().set_pattern(log_format);
  }
}

Logger* Registry::logger(const std::string& log_name) {
  for (Logger& logger : loggers()) {
    if (logger.name() == log_name) {
      return &logger;
    }
  }
  return nullptr;
}

} // namespace Logger
} // namespace Relay
