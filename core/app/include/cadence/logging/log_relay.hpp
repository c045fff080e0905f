#pragma once

#include "cadence/concurrent/thread_safe_queue.hpp"
#include "cadence/time/i_time_provider.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace cadence {

enum class LogLevel { Debug, Info, Warn, Error };

const char* to_string(LogLevel level);

// -----------------------------------------------------------------------------
// LogRecord
// -----------------------------------------------------------------------------
// One log line, fully materialised at the call site. Every field is owned by
// the record, so the consumer thread never reads memory the producer might
// still modify.
// -----------------------------------------------------------------------------
struct LogRecord {
  LogLevel level{LogLevel::Info};
  std::string component;       // e.g. "ConditionPoller"
  std::string message;
  std::int64_t timestamp_ms{0};  // From the relay's clock at log() time
};

// -----------------------------------------------------------------------------
// LogRelay: queued logging transport
// -----------------------------------------------------------------------------
//
// @brief  Moves log records from any thread to a single consumer thread that
//         hands them to a sink.
//
// @details
// Producers call log() (or the info()/warn()/error() shorthands), which
// stamps the record with the relay's clock and pushes it into a
// ThreadSafeQueue<LogRecord>. The consumer thread pops records in FIFO order
// and calls the sink. The default sink writes the usual one-line format:
//
//   [ConditionPoller] task 'backup' fires
//
// Info and Debug go to std::cout, Warn and Error to std::cerr.
//
// Lifecycle:
//   - construct → start() → log()... → stop()
//   - start() is idempotent. Records logged before start() are kept and
//     delivered once the consumer runs.
//   - flush() blocks until every record logged so far has reached the sink.
//     Without a running consumer it delivers them on the calling thread.
//   - stop() closes the queue, lets the consumer drain it and joins. Any
//     backlog left without a consumer is delivered on the calling thread.
//     Records logged after stop() are counted in dropped() and discarded.
//   - The destructor calls stop().
//
// A sink that throws does not kill the consumer: the failure is reported on
// std::cerr and the relay carries on with the next record.
//
// Ownership:
//   Borrows the clock (must outlive the relay); owns queue, sink and thread.
// -----------------------------------------------------------------------------
class LogRelay {
 public:
  using Sink = std::function<void(const LogRecord&)>;

  explicit LogRelay(const ITimeProvider& clock, Sink sink = consoleSink());
  ~LogRelay();

  LogRelay(const LogRelay&) = delete;
  LogRelay& operator=(const LogRelay&) = delete;
  LogRelay(LogRelay&&) = delete;
  LogRelay& operator=(LogRelay&&) = delete;

  void start();
  void stop();
  void flush();

  void log(LogLevel level, std::string component, std::string message);

  void debug(std::string component, std::string message) {
    log(LogLevel::Debug, std::move(component), std::move(message));
  }
  void info(std::string component, std::string message) {
    log(LogLevel::Info, std::move(component), std::move(message));
  }
  void warn(std::string component, std::string message) {
    log(LogLevel::Warn, std::move(component), std::move(message));
  }
  void error(std::string component, std::string message) {
    log(LogLevel::Error, std::move(component), std::move(message));
  }

  // Records rejected because the relay was already stopped.
  std::size_t dropped() const;

  // "[component] message" on std::cout (Debug/Info) or std::cerr (Warn/Error).
  static Sink consoleSink();

 private:
  void run();
  void deliver(const LogRecord& record);
  void drainOnCaller();

  const ITimeProvider& clock_;
  Sink sink_;
  ThreadSafeQueue<LogRecord> queue_;

  // Records pushed but not yet handed to the sink. flush() waits on it.
  mutable std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  std::size_t pending_{0};
  std::size_t dropped_{0};

  // Serialises start()/stop() so two callers never race on worker_.
  std::mutex lifecycle_mutex_;
  std::thread worker_;
};

}  // namespace cadence
