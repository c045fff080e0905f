#include "cadence/logging/log_relay.hpp"

#include <exception>
#include <iostream>

namespace cadence {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "INFO";
}

LogRelay::LogRelay(const ITimeProvider& clock, Sink sink)
    : clock_(clock), sink_(std::move(sink)) {}

LogRelay::~LogRelay() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the consumer once; a stopped relay stays stopped
// -----------------------------------------------------------------------------
void LogRelay::start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (worker_.joinable() || queue_.closed()) {
    return;
  }
  worker_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): close, let the consumer drain, join
// -----------------------------------------------------------------------------
void LogRelay::stop() {
  std::lock_guard lock(lifecycle_mutex_);
  queue_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
  // Never started: the backlog is still queued.
  drainOnCaller();
}

void LogRelay::flush() {
  {
    std::lock_guard lock(lifecycle_mutex_);
    if (!worker_.joinable()) {
      drainOnCaller();
      return;
    }
  }
  std::unique_lock lock(pending_mutex_);
  pending_cv_.wait(lock, [this] { return pending_ == 0; });
}

void LogRelay::log(LogLevel level, std::string component,
                   std::string message) {
  LogRecord record;
  record.level = level;
  record.component = std::move(component);
  record.message = std::move(message);
  record.timestamp_ms = clock_.now_ms();

  {
    std::lock_guard lock(pending_mutex_);
    ++pending_;
  }
  if (!queue_.push(std::move(record))) {
    std::lock_guard lock(pending_mutex_);
    --pending_;
    ++dropped_;
  }
}

std::size_t LogRelay::dropped() const {
  std::lock_guard lock(pending_mutex_);
  return dropped_;
}

// -----------------------------------------------------------------------------
// run(): consumer loop, exits once the queue is closed and empty
// -----------------------------------------------------------------------------
void LogRelay::run() {
  while (auto record = queue_.pop()) {
    deliver(*record);
  }
}

void LogRelay::deliver(const LogRecord& record) {
  try {
    sink_(record);
  } catch (const std::exception& e) {
    std::cerr << "[LogRelay] sink failed on record from " << record.component
              << ": " << e.what() << "\n";
  }

  {
    std::lock_guard lock(pending_mutex_);
    --pending_;
  }
  pending_cv_.notify_all();
}

void LogRelay::drainOnCaller() {
  while (auto record = queue_.try_pop()) {
    deliver(*record);
  }
}

LogRelay::Sink LogRelay::consoleSink() {
  return [](const LogRecord& record) {
    std::ostream& out =
        (record.level == LogLevel::Warn || record.level == LogLevel::Error)
            ? std::cerr
            : std::cout;
    out << "[" << record.component << "] " << record.message << "\n";
  };
}

}  // namespace cadence
