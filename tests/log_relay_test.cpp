// =============================================================================
// log_relay_test.cpp
// =============================================================================
// Unit tests for cadence::LogRelay.
//
// Validates:
//   - Records reach the sink in log() order with the clock's timestamp
//   - flush() waits for the worker; without a worker it drains on the caller
//   - stop() drains the backlog and later records are dropped and counted
//   - A throwing sink does not stop delivery of later records
//   - Concurrent producers lose nothing
//
// Threading model:
//   The capturing sink guards its vector with a mutex; assertions read it
//   only after flush() or stop() has returned.
// =============================================================================

#include "cadence/logging/log_relay.hpp"
#include "cadence/time/simulation_time_provider.hpp"
#include "cadence/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class LogRelayTest : public ::testing::Test {
 protected:
  cadence::SimulationTimeProvider clock{cadence::utc_ms(2024, 1, 1, 12)};

  std::mutex mutex;
  std::vector<cadence::LogRecord> records;

  cadence::LogRelay::Sink capture() {
    return [this](const cadence::LogRecord& record) {
      std::lock_guard lock(mutex);
      records.push_back(record);
    };
  }

  std::vector<std::string> messages() {
    std::lock_guard lock(mutex);
    std::vector<std::string> out;
    for (const auto& r : records) {
      out.push_back(r.message);
    }
    return out;
  }
};

// -----------------------------------------------------------------------------
// 1. Records arrive in order with level, component and clock timestamp.
// -----------------------------------------------------------------------------
TEST_F(LogRelayTest, DeliversInOrderWithTimestamp) {
  cadence::LogRelay relay(clock, capture());
  relay.start();

  relay.info("Poller", "first");
  clock.advance_by(std::chrono::seconds(1));
  relay.error("Poller", "second");
  relay.flush();

  ASSERT_EQ(messages(), (std::vector<std::string>{"first", "second"}));
  EXPECT_EQ(records[0].level, cadence::LogLevel::Info);
  EXPECT_EQ(records[0].component, "Poller");
  EXPECT_EQ(records[0].timestamp_ms, cadence::utc_ms(2024, 1, 1, 12));
  EXPECT_EQ(records[1].level, cadence::LogLevel::Error);
  EXPECT_EQ(records[1].timestamp_ms, cadence::utc_ms(2024, 1, 1, 12, 0, 1));

  relay.stop();
}

// -----------------------------------------------------------------------------
// 2. Without a worker, flush() drains on the calling thread.
// Why: Tests and short-lived tools log without ever starting the relay.
// -----------------------------------------------------------------------------
TEST_F(LogRelayTest, FlushWithoutWorkerDrainsOnCaller) {
  cadence::LogRelay relay(clock, capture());

  relay.warn("Config", "queued");
  EXPECT_TRUE(messages().empty());

  relay.flush();
  EXPECT_EQ(messages(), std::vector<std::string>{"queued"});
}

// -----------------------------------------------------------------------------
// 3. stop() delivers the backlog; records after stop() are dropped.
// -----------------------------------------------------------------------------
TEST_F(LogRelayTest, StopDrainsThenDrops) {
  cadence::LogRelay relay(clock, capture());
  relay.debug("Demo", "before start");
  relay.start();
  relay.info("Demo", "running");
  relay.stop();

  EXPECT_EQ(messages(),
            (std::vector<std::string>{"before start", "running"}));

  relay.info("Demo", "too late");
  relay.start();  // A stopped relay stays stopped
  relay.flush();

  EXPECT_EQ(messages().size(), 2u);
  EXPECT_EQ(relay.dropped(), 1u);
}

// -----------------------------------------------------------------------------
// 4. A sink failure is contained to the record that caused it.
// -----------------------------------------------------------------------------
TEST_F(LogRelayTest, ThrowingSinkDoesNotStopDelivery) {
  std::vector<std::string> delivered;
  cadence::LogRelay relay(clock, [&delivered](const cadence::LogRecord& r) {
    if (r.message == "poison") {
      throw std::runtime_error("disk full");
    }
    delivered.push_back(r.message);
  });
  relay.start();

  relay.info("Demo", "a");
  relay.info("Demo", "poison");
  relay.info("Demo", "b");
  relay.stop();

  EXPECT_EQ(delivered, (std::vector<std::string>{"a", "b"}));
}

// -----------------------------------------------------------------------------
// 5. Concurrent producers: every record is delivered exactly once.
// -----------------------------------------------------------------------------
TEST_F(LogRelayTest, ConcurrentProducers) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 250;

  cadence::LogRelay relay(clock, capture());
  relay.start();

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&relay, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        relay.info("P" + std::to_string(p), std::to_string(i));
      }
    });
  }
  for (auto& t : producers) t.join();
  relay.stop();

  EXPECT_EQ(messages().size(),
            static_cast<std::size_t>(kProducers * kPerProducer));
  EXPECT_EQ(relay.dropped(), 0u);
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ(cadence::to_string(cadence::LogLevel::Debug), "DEBUG");
  EXPECT_STREQ(cadence::to_string(cadence::LogLevel::Info), "INFO");
  EXPECT_STREQ(cadence::to_string(cadence::LogLevel::Warn), "WARN");
  EXPECT_STREQ(cadence::to_string(cadence::LogLevel::Error), "ERROR");
}
